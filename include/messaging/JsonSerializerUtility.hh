/** \file
 *
 * \brief Definition of JSON conversions shared by the serializers
 */

#ifndef MESSAGING_JSONSERIALIZERUTILITY_HH_
#define MESSAGING_JSONSERIALIZERUTILITY_HH_

#include "messaging/SerializationFailureException.hh"

#include "enhanced_enum/enhanced_enum.hh"

#include <boost/format.hpp>
#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string_view>
#include <utility>

namespace nlohmann {

/** \brief JSON converter for optional types
 *
 * An empty optional is null. The final contract and declarer of a passed out
 * auction are represented this way.
 */
template<typename T>
struct adl_serializer<std::optional<T>>
{
    static void to_json(json& j, const std::optional<T>& t)
    {
        j = t ? json(*t) : json(nullptr);
    }

    static void from_json(const json& j, std::optional<T>& t)
    {
        t = j.is_null() ? std::nullopt : std::optional<T> {j.get<T>()};
    }
};

/** \brief JSON converter for enhanced enums
 *
 * Positions and strains are represented by their string values, e.g. "north"
 * or "notrump".
 */
template<typename Enum>
struct adl_serializer<
    Enum, std::enable_if_t<enhanced_enum::is_enhanced_enum_v<Enum>>>
{
    static void to_json(json& j, const Enum& e)
    {
        j = e.value();
    }

    static void from_json(const json& j, Enum& e)
    {
        const auto value = j.get<typename Enum::value_type>();
        if (const auto opt_e = Enum::from(value)) {
            e = *opt_e;
            return;
        }
        throw BidEngine::Messaging::SerializationFailureException {
            boost::str(boost::format("Invalid value “%s”") % value)};
    }
};

}

namespace BidEngine {
namespace Messaging {

/** \brief Check a deserialized value against a predicate
 *
 * \param t the deserialized value
 * \param pred predicate that \p t must satisfy
 * \param what description of \p t used in the error message
 *
 * \return \p t
 *
 * \throw SerializationFailureException if \p pred is false for \p t
 */
template<typename T, typename Pred>
T validate(T t, Pred&& pred, const std::string_view what)
{
    if (!std::invoke(std::forward<Pred>(pred), t)) {
        throw SerializationFailureException {
            boost::str(boost::format("Invalid %s: %s") % what % t)};
    }
    return t;
}

}
}

#endif // MESSAGING_JSONSERIALIZERUTILITY_HH_
