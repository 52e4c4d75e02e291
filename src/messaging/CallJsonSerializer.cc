#include "messaging/CallJsonSerializer.hh"

#include "messaging/SerializationFailureException.hh"

#include <boost/format.hpp>

using nlohmann::json;

namespace BidEngine {

void to_json(json& j, const Call& call)
{
    j = toShortString(call);
}

void from_json(const json& j, Call& call)
{
    const auto& str = j.get_ref<const json::string_t&>();
    if (const auto parsed_call = callFromString(str)) {
        call = *parsed_call;
    } else {
        throw Messaging::SerializationFailureException {
            boost::str(boost::format("Invalid call “%s”") % str)};
    }
}

}
