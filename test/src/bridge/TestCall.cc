#include "bridge/Call.hh"

#include <gtest/gtest.h>

using BidEngine::Bid;
using BidEngine::Call;
using BidEngine::Pass;

namespace Strains = BidEngine::Strains;

TEST(CallTest, testGetBidFromBid)
{
    const auto call = Call {Bid {2, Strains::HEARTS}};
    const auto bid = getBid(call);
    ASSERT_TRUE(bid);
    EXPECT_EQ(Bid(2, Strains::HEARTS), *bid);
}

TEST(CallTest, testGetBidFromPass)
{
    EXPECT_FALSE(getBid(Call {Pass {}}));
}

TEST(CallTest, testShortStringOfBid)
{
    EXPECT_EQ("2N", toShortString(Bid {2, Strains::NO_TRUMP}));
    EXPECT_EQ("4D", toShortString(Bid {4, Strains::DIAMONDS}));
    EXPECT_EQ("7S", toShortString(Bid {7, Strains::SPADES}));
}

TEST(CallTest, testShortStringOfPass)
{
    EXPECT_EQ("P", toShortString(Pass {}));
}

TEST(CallTest, testCallFromString)
{
    EXPECT_EQ(Call {Bid(3, Strains::NO_TRUMP)}, BidEngine::callFromString("3N"));
    EXPECT_EQ(Call {Bid(5, Strains::CLUBS)}, BidEngine::callFromString("5c"));
    EXPECT_EQ(Call {Pass {}}, BidEngine::callFromString("P"));
}

TEST(CallTest, testCallFromInvalidString)
{
    EXPECT_FALSE(BidEngine::callFromString(""));
    EXPECT_FALSE(BidEngine::callFromString("8C"));
    EXPECT_FALSE(BidEngine::callFromString("0C"));
    EXPECT_FALSE(BidEngine::callFromString("2X"));
    EXPECT_FALSE(BidEngine::callFromString("2NT"));
    EXPECT_FALSE(BidEngine::callFromString("pass"));
}
