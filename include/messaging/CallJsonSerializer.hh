/** \file
 *
 * \brief Definition of JSON serializer for BidEngine::Call
 *
 * \page jsoncall Call JSON representation
 *
 * A BidEngine::Call is represented by a JSON string containing the call in
 * short notation: "P" for pass, and the level followed by the initial of the
 * strain for a bid, e.g. "2N" or "4D". The strain initials are "C", "D",
 * "H", "S" and "N".
 */

#ifndef MESSAGING_CALLJSONSERIALIZER_HH_
#define MESSAGING_CALLJSONSERIALIZER_HH_

#include "bridge/Call.hh"

#include <nlohmann/json.hpp>

namespace BidEngine {

/** \brief Convert Call to JSON
 */
void to_json(nlohmann::json& j, const Call& call);

/** \brief Convert JSON to Call
 *
 * \throw SerializationFailureException if the JSON is not a string in short
 * notation
 */
void from_json(const nlohmann::json& j, Call& call);

}

#endif // MESSAGING_CALLJSONSERIALIZER_HH_
