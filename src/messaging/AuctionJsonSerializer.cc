#include "messaging/AuctionJsonSerializer.hh"

#include "bridge/Auction.hh"
#include "messaging/BidJsonSerializer.hh"
#include "messaging/CallJsonSerializer.hh"
#include "messaging/JsonSerializerUtility.hh"

#include <optional>

using nlohmann::json;

namespace BidEngine {

const std::string AUCTION_DEALER_KEY {"dealer"};
const std::string AUCTION_CALLS_KEY {"calls"};
const std::string AUCTION_CONTRACT_KEY {"contract"};
const std::string AUCTION_DECLARER_KEY {"declarer"};

void to_json(json& j, const Auction& auction)
{
    j = json::object();
    j.emplace(AUCTION_DEALER_KEY, auction.getDealer());
    j.emplace(AUCTION_CALLS_KEY, auction.getCalls());
    j.emplace(
        AUCTION_CONTRACT_KEY,
        auction.getFinalContract().value_or(std::optional<Bid> {}));
    j.emplace(
        AUCTION_DECLARER_KEY,
        auction.getDeclarerPosition().value_or(std::optional<Position> {}));
}

}
