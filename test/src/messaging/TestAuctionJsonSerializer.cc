#include "bridge/Auction.hh"
#include "messaging/AuctionJsonSerializer.hh"
#include "messaging/BidJsonSerializer.hh"
#include "messaging/JsonSerializer.hh"
#include "messaging/JsonSerializerUtility.hh"

#include <nlohmann/json.hpp>
#include <gtest/gtest.h>

using BidEngine::Auction;
using BidEngine::Bid;
using BidEngine::Pass;
using BidEngine::Messaging::JsonSerializer;

using nlohmann::json;

namespace Positions = BidEngine::Positions;
namespace Strains = BidEngine::Strains;

TEST(AuctionJsonSerializerTest, testOngoingAuction)
{
    auto auction = Auction {Positions::EAST};
    auction.addCall(Bid {1, Strains::CLUBS});
    const auto j = json::parse(JsonSerializer::serialize(auction));
    EXPECT_EQ(json("east"), j.at(BidEngine::AUCTION_DEALER_KEY));
    EXPECT_EQ(json::array({"1C"}), j.at(BidEngine::AUCTION_CALLS_KEY));
    EXPECT_TRUE(j.at(BidEngine::AUCTION_CONTRACT_KEY).is_null());
    EXPECT_TRUE(j.at(BidEngine::AUCTION_DECLARER_KEY).is_null());
}

TEST(AuctionJsonSerializerTest, testCompletedAuction)
{
    auto auction = Auction {Positions::NORTH};
    auction.addCall(Bid {2, Strains::NO_TRUMP});
    auction.addCall(Pass {});
    auction.addCall(Bid {3, Strains::NO_TRUMP});
    auction.allPass();
    const auto j = json::parse(JsonSerializer::serialize(auction));
    EXPECT_EQ(
        json::array({"2N", "P", "3N", "P", "P", "P"}),
        j.at(BidEngine::AUCTION_CALLS_KEY));
    EXPECT_EQ(
        json(Bid(3, Strains::NO_TRUMP)),
        j.at(BidEngine::AUCTION_CONTRACT_KEY));
    EXPECT_EQ(json("north"), j.at(BidEngine::AUCTION_DECLARER_KEY));
}
