#include "bridge/Suit.hh"

#include <gtest/gtest.h>

#include <stdexcept>

using BidEngine::Suit;
using BidEngine::SuitLabel;
namespace Strains = BidEngine::Strains;
namespace Suits = BidEngine::Suits;

class SuitTest : public testing::TestWithParam<Suit> {};

TEST_P(SuitTest, testStrainForSuitRoundTrip)
{
    const auto suit = GetParam();
    EXPECT_EQ(suit, BidEngine::suitFor(BidEngine::strainFor(suit)));
}

TEST_P(SuitTest, testSuitFromInitial)
{
    const auto suit = GetParam();
    EXPECT_EQ(suit, BidEngine::suitFromLetter(suit.value().front()));
}

TEST_F(SuitTest, testNoTrumpHasNoSuit)
{
    EXPECT_FALSE(BidEngine::suitFor(Strains::NO_TRUMP));
}

TEST_F(SuitTest, testSuitFromLetter)
{
    EXPECT_EQ(Suits::SPADES, BidEngine::suitFromLetter('S'));
    EXPECT_EQ(Suits::HEARTS, BidEngine::suitFromLetter('h'));
    EXPECT_FALSE(BidEngine::suitFromLetter('N'));
    EXPECT_FALSE(BidEngine::suitFromLetter('x'));
}

TEST_F(SuitTest, testWritingOrder)
{
    EXPECT_EQ(Suits::SPADES, BidEngine::SUITS_IN_WRITING_ORDER.front());
    EXPECT_EQ(Suits::CLUBS, BidEngine::SUITS_IN_WRITING_ORDER.back());
}

TEST_F(SuitTest, testInvalidSuit)
{
    EXPECT_THROW(suitOrder(static_cast<SuitLabel>(-1)), std::invalid_argument);
}

INSTANTIATE_TEST_SUITE_P(
    Suits, SuitTest, testing::ValuesIn(Suit::begin(), Suit::end()));
