#include "bridge/Bid.hh"
#include "bridge/Call.hh"
#include "bridge/Position.hh"
#include "criteria/Rule.hh"
#include "messaging/BidJsonSerializer.hh"
#include "messaging/BiddingSystemJsonSerializer.hh"
#include "messaging/CallJsonSerializer.hh"
#include "messaging/JsonSerializer.hh"
#include "messaging/JsonSerializerUtility.hh"
#include "messaging/SerializationFailureException.hh"

#include <nlohmann/json.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>

using namespace BidEngine;
using namespace BidEngine::Messaging;

using nlohmann::json;

using namespace std::string_literals;

namespace {
constexpr auto BID = Bid {4, Strains::HEARTS};
}

class JsonSerializerTest : public testing::Test {
protected:

    template<typename T>
    void testHelper(const T& t, const json& j)
    {
        EXPECT_TRUE(j == json::parse(serializer.serialize(t)))
            << "Failed to serialize:\n" << j;
        EXPECT_TRUE(t == serializer.deserialize<T>(j.dump()))
            << "Failed to deserialize:\n" << j;
    }

    template<typename T>
    void testFailedDeserializationHelper(const json& j)
    {
        EXPECT_THROW(
            serializer.deserialize<T>(j.dump()),
            SerializationFailureException);
    }

private:
    JsonSerializer serializer;
};

TEST_F(JsonSerializerTest, testGeneral)
{
    const auto message = std::string {"hello"};
    testHelper(message, message);
}

TEST_F(JsonSerializerTest, testMalformedDocument)
{
    EXPECT_THROW(
        JsonSerializer::deserialize<std::string>("{"),
        SerializationFailureException);
}

TEST_F(JsonSerializerTest, testOptional)
{
    testHelper(std::optional<int> {3}, json(3));
    testHelper(std::optional<int> {}, json {});
}

TEST_F(JsonSerializerTest, testEnum)
{
    testHelper(Positions::EAST, json("east"));
}

TEST_F(JsonSerializerTest, testInvalidEnum)
{
    testFailedDeserializationHelper<Position>(json("center"));
}

TEST_F(JsonSerializerTest, testBid)
{
    const auto j = json {
        {BID_LEVEL_KEY, json(4)},
        {BID_STRAIN_KEY, Strains::HEARTS},
    };
    testHelper(BID, j);
}

TEST_F(JsonSerializerTest, testBidMissingLevel)
{
    const auto j = json {
        {BID_STRAIN_KEY, Strains::HEARTS},
    };
    testFailedDeserializationHelper<Bid>(j);
}

TEST_F(JsonSerializerTest, testBidLevelInvalid)
{
    const auto j = json {
        {BID_LEVEL_KEY, Bid::MAXIMUM_LEVEL + 1},
        {BID_STRAIN_KEY, Strains::HEARTS},
    };
    testFailedDeserializationHelper<Bid>(j);
}

TEST_F(JsonSerializerTest, testBidStrainInvalid)
{
    const auto j = json {
        {BID_LEVEL_KEY, 4},
        {BID_STRAIN_KEY, "bananas"},
    };
    testFailedDeserializationHelper<Bid>(j);
}

TEST_F(JsonSerializerTest, testBidFromShortNotation)
{
    EXPECT_EQ(BID, JsonSerializer::deserialize<Bid>(json("4H").dump()));
}

TEST_F(JsonSerializerTest, testBidFromInvalidShortNotation)
{
    testFailedDeserializationHelper<Bid>(json("P"));
    testFailedDeserializationHelper<Bid>(json("8C"));
}

TEST_F(JsonSerializerTest, testCallBid)
{
    testHelper(Call {BID}, json("4H"));
}

TEST_F(JsonSerializerTest, testCallPass)
{
    testHelper(Call {Pass {}}, json("P"));
}

TEST_F(JsonSerializerTest, testCallInvalid)
{
    testFailedDeserializationHelper<Call>(json("4X"));
}

TEST_F(JsonSerializerTest, testCallNotString)
{
    testFailedDeserializationHelper<Call>(json(4));
}

TEST_F(JsonSerializerTest, testRule)
{
    const auto rule = Rule {
        "or", {}, {
            Rule {"hcp", {{"min", "10"}}, {}},
            Rule {"shape", {{"pattern", "5+"}}, {}}}};
    const auto j = json {
        {RULE_CRITERION_KEY, "or"},
        {RULE_CHILDREN_KEY, json::array({
            json {{RULE_CRITERION_KEY, "hcp"}, {"min", "10"}},
            json {{RULE_CRITERION_KEY, "shape"}, {"pattern", "5+"}}})},
    };
    testHelper(rule, j);
}

TEST_F(JsonSerializerTest, testRuleNumericParameters)
{
    const auto j = json {
        {RULE_CRITERION_KEY, "hcp"}, {"min", 20}, {"strict", true}};
    const auto rule = JsonSerializer::deserialize<Rule>(j.dump());
    EXPECT_EQ(
        (Rule {"hcp", {{"min", "20"}, {"strict", "true"}}, {}}), rule);
}

TEST_F(JsonSerializerTest, testRuleMissingCriterion)
{
    testFailedDeserializationHelper<Rule>(json {{"min", 20}});
}

TEST_F(JsonSerializerTest, testRuleNotObject)
{
    testFailedDeserializationHelper<Rule>(json("hcp"));
}

TEST_F(JsonSerializerTest, testRuleParameterNotScalar)
{
    testFailedDeserializationHelper<Rule>(
        json {{RULE_CRITERION_KEY, "hcp"}, {"min", json::array({1, 2})}});
}
