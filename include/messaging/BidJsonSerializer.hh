/** \file
 *
 * \brief Definition of JSON serializer for BidEngine::Bid
 *
 * \page jsonbid Bid JSON representation
 *
 * A BidEngine::Bid is represented by a JSON object consisting of the
 * following:
 *
 * \code{.json}
 * {
 *     { "level": <level> },
 *     { "strain": <strain> }
 * }
 * \endcode
 *
 * - &lt;level&gt; is an integer between 1…7 representing the level of the bid
 * - &lt;strain&gt; is a string representing the strain of the bid. It must be
 *   one of the following: "clubs", "diamonds", "hearts", "spades", "notrump".
 *
 * When deserializing, a JSON string containing the bid in short notation
 * (e.g. "4H") is also accepted.
 *
 * This representation is used for the final contract of an auction, see \ref
 * jsonauction. Calls in bidding systems use the short notation, see \ref
 * jsoncall.
 */

#ifndef MESSAGING_BIDJSONSERIALIZER_HH_
#define MESSAGING_BIDJSONSERIALIZER_HH_

#include <nlohmann/json.hpp>

#include <string>

namespace BidEngine {

struct Bid;

/** \brief Key for Bid::level in JSON object
 *
 * \sa \ref jsonbid
 */
extern const std::string BID_LEVEL_KEY;

/** \brief Key for Bid::strain in JSON object
 *
 * \sa \ref jsonbid
 */
extern const std::string BID_STRAIN_KEY;

/** \brief Convert Bid to JSON
 */
void to_json(nlohmann::json&, const Bid&);

/** \brief Convert JSON to Bid
 *
 * \throw SerializationFailureException if a string is not a bid in short
 * notation
 */
void from_json(const nlohmann::json&, Bid&);

}

#endif // MESSAGING_BIDJSONSERIALIZER_HH_
