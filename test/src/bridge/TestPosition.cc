#include "bridge/BridgeConstants.hh"
#include "bridge/Position.hh"

#include <gtest/gtest.h>

#include <stdexcept>

using BidEngine::Position;
using BidEngine::PositionLabel;
namespace Positions = BidEngine::Positions;

class PositionTest : public testing::TestWithParam<Position> {};

TEST_P(PositionTest, testFullCircleReturnsToSamePosition)
{
    const auto position = GetParam();
    EXPECT_EQ(position, clockwise(position, BidEngine::N_PLAYERS));
    EXPECT_EQ(position, clockwise(position, -BidEngine::N_PLAYERS));
}

TEST_P(PositionTest, testPartnerOfPartnerIsSelf)
{
    const auto position = GetParam();
    EXPECT_NE(position, partnerFor(position));
    EXPECT_EQ(position, partnerFor(partnerFor(position)));
}

TEST_P(PositionTest, testPositionFromName)
{
    const auto position = GetParam();
    EXPECT_EQ(position, BidEngine::positionFromString(position.value()));
}

TEST_F(PositionTest, testClockwise)
{
    EXPECT_EQ(Positions::EAST, clockwise(Positions::NORTH));
    EXPECT_EQ(Positions::NORTH, clockwise(Positions::WEST));
    EXPECT_EQ(Positions::SOUTH, clockwise(Positions::EAST, 5));
    EXPECT_EQ(Positions::WEST, clockwise(Positions::NORTH, -1));
}

TEST_F(PositionTest, testPartner)
{
    EXPECT_EQ(Positions::SOUTH, partnerFor(Positions::NORTH));
    EXPECT_EQ(Positions::WEST, partnerFor(Positions::EAST));
}

TEST_F(PositionTest, testPositionFromAbbreviation)
{
    EXPECT_EQ(Positions::SOUTH, BidEngine::positionFromString("S"));
    EXPECT_EQ(Positions::WEST, BidEngine::positionFromString("West"));
    EXPECT_FALSE(BidEngine::positionFromString("northwest"));
    EXPECT_FALSE(BidEngine::positionFromString(""));
}

TEST_F(PositionTest, testInvalidPosition)
{
    EXPECT_THROW(
        positionOrder(static_cast<PositionLabel>(-1)), std::invalid_argument);
}

INSTANTIATE_TEST_SUITE_P(
    Positions, PositionTest,
    testing::ValuesIn(Position::begin(), Position::end()));
