#include "bridge/Auction.hh"
#include "bridge/Hand.hh"
#include "handoffs/ConfiHandOff.hh"
#include "Exceptions.hh"

#include <gtest/gtest.h>

#include <optional>
#include <sstream>
#include <string>
#include <vector>

using BidEngine::Auction;
using BidEngine::Bid;
using BidEngine::Call;
using BidEngine::Hand;
using BidEngine::Pass;
using BidEngine::handFromString;

namespace Positions = BidEngine::Positions;
namespace Strains = BidEngine::Strains;

class ConfiHandOffTest : public testing::Test {
protected:
    std::string bid(
        const std::string& opener, const std::string& responder,
        const std::vector<Call>& prefix = {
            Bid {2, Strains::NO_TRUMP}, Pass {},
            Bid {3, Strains::NO_TRUMP}, Pass {}})
    {
        north.emplace(handFromString(opener));
        south.emplace(handFromString(responder));
        auto hands = BidEngine::Hands {};
        hands[positionOrder(Positions::NORTH)] = &*north;
        hands[positionOrder(Positions::SOUTH)] = &*south;
        for (const auto& call : prefix) {
            auction.addCall(call);
        }
        handOff.bid(hands, auction);
        auto out = std::ostringstream {};
        out << auction;
        return out.str();
    }

    BidEngine::ConfiHandOff handOff;
    Auction auction {Positions::NORTH};
    std::optional<Hand> north;
    std::optional<Hand> south;
};

TEST_F(ConfiHandOffTest, testSignoffWithInsufficientControls)
{
    EXPECT_EQ(
        "2N P 3N P 4D P 4N P P P",
        bid("AQ3 AK3 J2 AQ652", "K9742 J2 QJ65 K3"));
}

TEST_F(ConfiHandOffTest, testSlamAfterFindingFit)
{
    EXPECT_EQ(
        "2N P 3N P 4D P 4S P 5C P 5D P 5S P 6S P P P",
        bid("AQ3 AK3 J2 AQ652", "K9742 J2 K865 K3"));
}

TEST_F(ConfiHandOffTest, testOpenerBidsSlamInLongSuit)
{
    EXPECT_EQ(
        "2N P 3N P 4S P 5H P 6C P P P",
        bid("AK Kx Ax AKQxxxx", "Qxxx Axxx Kxx xx"));
    EXPECT_TRUE(auction.hasEnded());
}

TEST_F(ConfiHandOffTest, testLongSuitIsCheckedInWritingOrder)
{
    EXPECT_EQ(
        "2N P 3N P 4S P 5D P 6S P P P",
        bid("AKQxxx Kx Ax AKx", "xxx Axxx Kxxx Kx"));
}

TEST_F(ConfiHandOffTest, testMinimumCorrectionSignsOff)
{
    EXPECT_EQ(
        "2N P 3N P 4C P 4S P 4N P P P",
        bid("KQJ KQJx KQJ KQJ", "Axxx Axx Axx xxx"));
}

TEST_F(ConfiHandOffTest, testMinimumCorrectionAfterFiveLevelCueBid)
{
    EXPECT_EQ(
        "2N P 3N P 4C P 5C P 5N P P P",
        bid("KQJ KQJx KQJ KQJ", "Axx Axx Axx xxxx"));
}

TEST_F(ConfiHandOffTest, testResponderSignsOffWithoutSuitToShow)
{
    EXPECT_EQ(
        "2N P 3N P 5D P 5N P P P",
        bid("AKx AKx AKx AKxx", "xxx xxx xxx xxxx"));
}

TEST_F(ConfiHandOffTest, testNoTrumpSignoffIsPassed)
{
    EXPECT_EQ(
        "2N P 3N P 5D P 5H P 5N P P P",
        bid("AKx AKx AKx AKxx", "Axxx Kxxx Kxx xx"));
}

TEST_F(ConfiHandOffTest, testControlStepNeedsBidToStepFrom)
{
    EXPECT_THROW(
        bid("AQ3 AK3 J2 AQ652", "K9742 J2 QJ65 K3", {}),
        BidEngine::NoCurrentBidException);
}

TEST_F(ConfiHandOffTest, testControlStepsBeyondSevenNoTrump)
{
    // North bids 7C, so the hand-off starts with South showing controls
    EXPECT_THROW(
        bid("xxx xxx xxx xxxx", "AKx AKx AKx AKxx",
            {Bid {7, Strains::CLUBS}, Pass {}}),
        BidEngine::BidSpaceExhaustedException);
}
