#include "messaging/BidJsonSerializer.hh"

#include "bridge/Bid.hh"
#include "messaging/JsonSerializerUtility.hh"
#include "messaging/SerializationFailureException.hh"

#include <boost/format.hpp>

using nlohmann::json;

namespace BidEngine {

const std::string BID_LEVEL_KEY {"level"};
const std::string BID_STRAIN_KEY {"strain"};

void to_json(json& j, const Bid& bid)
{
    j = json {
        {BID_LEVEL_KEY, bid.level},
        {BID_STRAIN_KEY, bid.strain},
    };
}

void from_json(const json& j, Bid& bid)
{
    if (j.is_string()) {
        const auto& str = j.get_ref<const json::string_t&>();
        if (const auto parsed_bid = bidFromString(str)) {
            bid = *parsed_bid;
            return;
        }
        throw Messaging::SerializationFailureException {
            boost::str(boost::format("Invalid bid “%s”") % str)};
    }
    const auto level = Messaging::validate(
        j.at(BID_LEVEL_KEY).get<int>(), Bid::levelValid, "bid level");
    bid = Bid {level, j.at(BID_STRAIN_KEY).get<Strain>()};
}

}
