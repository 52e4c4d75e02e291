#include "bridge/Auction.hh"
#include "handoffs/HandOffRegistry.hh"
#include "Exceptions.hh"
#include "MockHandOff.hh"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

using BidEngine::HandOffRegistry;
using BidEngine::MockHandOff;

using testing::_;
using testing::Ref;

class HandOffRegistryTest : public testing::Test {
protected:
    virtual void SetUp()
    {
        registry.addHandOff("Mock", handOff);
    }

    std::shared_ptr<MockHandOff> handOff {std::make_shared<MockHandOff>()};
    HandOffRegistry registry;
};

TEST_F(HandOffRegistryTest, testNamesAreCaseInsensitive)
{
    EXPECT_TRUE(registry.containsHandOff("mock"));
    EXPECT_TRUE(registry.containsHandOff("MOCK"));
    EXPECT_EQ(handOff.get(), &registry.getHandOff("mOcK"));
}

TEST_F(HandOffRegistryTest, testUnknownHandOff)
{
    EXPECT_FALSE(registry.containsHandOff("confi"));
    EXPECT_THROW(
        registry.getHandOff("confi"), BidEngine::UnknownHandOffException);
}

TEST_F(HandOffRegistryTest, testDuplicateName)
{
    EXPECT_THROW(
        registry.addHandOff("MOCK", std::make_shared<MockHandOff>()),
        BidEngine::DuplicateNameException);
}

TEST_F(HandOffRegistryTest, testNullHandOff)
{
    EXPECT_THROW(registry.addHandOff("null", nullptr), std::invalid_argument);
}

TEST_F(HandOffRegistryTest, testBuiltinHandOffs)
{
    registerBuiltinHandOffs(registry);
    EXPECT_TRUE(registry.containsHandOff("CONFI"));
}

TEST_F(HandOffRegistryTest, testBidDelegatesToHandOff)
{
    auto hands = BidEngine::Hands {};
    auto auction = BidEngine::Auction {BidEngine::Positions::NORTH};
    EXPECT_CALL(*handOff, handleBid(Ref(hands), Ref(auction)));
    registry.getHandOff("mock").bid(hands, auction);
}
