/** \file
 *
 * \brief Definition of BidEngine::Messaging::JsonSerializer
 */

#ifndef MESSAGING_JSONSERIALIZER_HH_
#define MESSAGING_JSONSERIALIZER_HH_

#include "messaging/SerializationFailureException.hh"

#include <boost/format.hpp>
#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace BidEngine {
namespace Messaging {

/** \brief Conversions between objects and JSON documents
 *
 * Bidding systems, auctions and the types they are built from are converted
 * with the to_json() and from_json() overloads found by argument dependent
 * lookup.
 */
struct JsonSerializer {

    /** \brief Serialize object to string
     *
     * \param t the object to serialize
     * \param indent number of spaces to indent nested values, or negative for
     * a single line
     */
    template<typename T>
    static std::string serialize(const T& t, const int indent = -1)
    {
        return nlohmann::json(t).dump(indent);
    }

    /** \brief Deserialize string to object
     *
     * \param s the JSON document
     *
     * \throw SerializationFailureException if \p s is not valid JSON or does
     * not represent a \c T
     */
    template<typename T>
    static T deserialize(const std::string_view s)
    {
        try {
            return nlohmann::json::parse(s).template get<T>();
        } catch (const nlohmann::json::exception& e) {
            throw SerializationFailureException {
                boost::str(boost::format("Malformed JSON: %s") % e.what())};
        }
    }
};
}
}

#endif // MESSAGING_JSONSERIALIZER_HH_
