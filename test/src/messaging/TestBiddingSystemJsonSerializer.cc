#include "engine/BiddingSystem.hh"
#include "messaging/BiddingSystemJsonSerializer.hh"
#include "messaging/JsonSerializer.hh"
#include "messaging/SerializationFailureException.hh"

#include <nlohmann/json.hpp>
#include <gtest/gtest.h>

#include <sstream>
#include <string>

using BidEngine::Bid;
using BidEngine::Pass;
using BidEngine::Rule;
using BidEngine::Engine::BidNode;
using BidEngine::Engine::BiddingSystem;
using BidEngine::Messaging::JsonSerializer;
using BidEngine::Messaging::SerializationFailureException;
using BidEngine::Messaging::biddingSystemFromPath;
using BidEngine::Messaging::biddingSystemFromStream;

using nlohmann::json;

namespace Strains = BidEngine::Strains;

namespace {

constexpr auto SYSTEM_DOCUMENT = R"EOF(
{
  "name": "test",
  "bids": [
    {
      "bid": "1N",
      "criteria": [
        { "criterion": "balanced" },
        { "criterion": "hcp", "min": 15, "max": 17 }
      ],
      "responses": [
        { "bid": "3N", "handoff": "confi",
          "criteria": [ { "criterion": "hcp", "min": 10 } ] },
        { "bid": "P", "criteria": [ { "criterion": "hcp", "max": 9 } ] }
      ]
    }
  ]
}
)EOF";

BiddingSystem expectedSystem()
{
    return BiddingSystem {
        "test", {
            BidNode {
                Bid {1, Strains::NO_TRUMP},
                {
                    Rule {"balanced", {}, {}},
                    Rule {"hcp", {{"min", "15"}, {"max", "17"}}, {}}},
                {
                    BidNode {
                        Bid {3, Strains::NO_TRUMP},
                        {Rule {"hcp", {{"min", "10"}}, {}}}, {}, "confi"},
                    BidNode {
                        Pass {}, {Rule {"hcp", {{"max", "9"}}, {}}}, {},
                        std::nullopt}},
                std::nullopt}}};
}

}

TEST(BiddingSystemJsonSerializerTest, testDeserialize)
{
    EXPECT_TRUE(
        expectedSystem() ==
        JsonSerializer::deserialize<BiddingSystem>(SYSTEM_DOCUMENT));
}

TEST(BiddingSystemJsonSerializerTest, testSerializeRoundTrip)
{
    const auto system = expectedSystem();
    EXPECT_TRUE(
        system == JsonSerializer::deserialize<BiddingSystem>(
            JsonSerializer::serialize(system)));
}

TEST(BiddingSystemJsonSerializerTest, testNodeWithoutCriteria)
{
    const auto node = JsonSerializer::deserialize<BidNode>(R"({"bid": "1C"})");
    EXPECT_TRUE(node.criteria.empty());
    EXPECT_TRUE(node.responses.empty());
    EXPECT_FALSE(node.handOff);
}

TEST(BiddingSystemJsonSerializerTest, testNodeWithoutBid)
{
    EXPECT_THROW(
        JsonSerializer::deserialize<BidNode>(R"({"criteria": []})"),
        SerializationFailureException);
}

TEST(BiddingSystemJsonSerializerTest, testNodeWithInvalidBid)
{
    EXPECT_THROW(
        JsonSerializer::deserialize<BidNode>(R"({"bid": "1NT"})"),
        SerializationFailureException);
}

TEST(BiddingSystemJsonSerializerTest, testSystemWithoutBids)
{
    EXPECT_THROW(
        JsonSerializer::deserialize<BiddingSystem>(R"({"name": "test"})"),
        SerializationFailureException);
}

TEST(BiddingSystemJsonSerializerTest, testFromStream)
{
    auto in = std::istringstream {SYSTEM_DOCUMENT};
    EXPECT_TRUE(expectedSystem() == biddingSystemFromStream(in));
}

TEST(BiddingSystemJsonSerializerTest, testFromMalformedStream)
{
    auto in = std::istringstream {"{ \"name\": "};
    EXPECT_THROW(biddingSystemFromStream(in), SerializationFailureException);
}

TEST(BiddingSystemJsonSerializerTest, testFromMissingFile)
{
    EXPECT_THROW(
        biddingSystemFromPath(BIDENGINE_SYSTEMS_DIR "/nonexistent.json"),
        SerializationFailureException);
}

TEST(BiddingSystemJsonSerializerTest, testFromPath)
{
    const auto system = biddingSystemFromPath(
        BIDENGINE_SYSTEMS_DIR "/kokish.json");
    EXPECT_EQ("kokish", system.name);
    ASSERT_EQ(1u, system.bids.size());
    const auto& opening = system.bids.front();
    EXPECT_EQ(3u, opening.criteria.size());
    ASSERT_EQ(1u, opening.responses.size());
    EXPECT_EQ(std::string {"confi"}, opening.responses.front().handOff);
}
