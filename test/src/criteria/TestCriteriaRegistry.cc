#include "bridge/Auction.hh"
#include "bridge/Hand.hh"
#include "criteria/CriteriaRegistry.hh"
#include "Exceptions.hh"
#include "MockCriterion.hh"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <vector>

using BidEngine::Combinator;
using BidEngine::MockCriterion;
using BidEngine::Rule;

using testing::_;
using testing::Ref;
using testing::Return;
using testing::Throw;

namespace Positions = BidEngine::Positions;

class CriteriaRegistryTest : public testing::Test {
protected:
    virtual void SetUp()
    {
        registry.addCriterion("yes", yes);
        registry.addCriterion("no", no);
        ON_CALL(*yes, handleCheck(_, _, _, _)).WillByDefault(Return(true));
        ON_CALL(*no, handleCheck(_, _, _, _)).WillByDefault(Return(false));
    }

    bool check(
        const std::vector<Rule>& rules,
        Combinator combinator = Combinator::ALL)
    {
        return registry.check(rules, hand, auction, combinator);
    }

    std::shared_ptr<MockCriterion> yes {
        std::make_shared<testing::NiceMock<MockCriterion>>()};
    std::shared_ptr<MockCriterion> no {
        std::make_shared<testing::NiceMock<MockCriterion>>()};
    BidEngine::CriteriaRegistry registry;
    const BidEngine::Hand hand {
        BidEngine::handFromString("AQ3 AK3 J2 AQ652")};
    const BidEngine::Auction auction {Positions::NORTH};
};

TEST_F(CriteriaRegistryTest, testContainsCriterion)
{
    EXPECT_TRUE(registry.containsCriterion("yes"));
    EXPECT_FALSE(registry.containsCriterion("maybe"));
}

TEST_F(CriteriaRegistryTest, testGetCriterion)
{
    EXPECT_EQ(yes.get(), &registry.getCriterion("yes"));
}

TEST_F(CriteriaRegistryTest, testGetUnknownCriterion)
{
    EXPECT_THROW(
        registry.getCriterion("maybe"), BidEngine::UnknownCriterionException);
}

TEST_F(CriteriaRegistryTest, testDuplicateName)
{
    EXPECT_THROW(
        registry.addCriterion("yes", std::make_shared<MockCriterion>()),
        BidEngine::DuplicateNameException);
}

TEST_F(CriteriaRegistryTest, testNullCriterion)
{
    EXPECT_THROW(
        registry.addCriterion("null", nullptr), std::invalid_argument);
}

TEST_F(CriteriaRegistryTest, testCheckPassesArguments)
{
    const auto rule = Rule {"yes", {{"key", "value"}}, {}};
    EXPECT_CALL(*yes, handleCheck(rule, Ref(hand), Ref(auction), Ref(registry)))
        .WillOnce(Return(true));
    EXPECT_TRUE(check({rule}));
}

TEST_F(CriteriaRegistryTest, testEmptyConjunctionHolds)
{
    EXPECT_TRUE(check({}));
}

TEST_F(CriteriaRegistryTest, testEmptyDisjunctionFails)
{
    EXPECT_FALSE(check({}, Combinator::ANY));
}

TEST_F(CriteriaRegistryTest, testAllRulesMustHold)
{
    EXPECT_TRUE(check({Rule {"yes", {}, {}}, Rule {"yes", {}, {}}}));
    EXPECT_FALSE(check({Rule {"yes", {}, {}}, Rule {"no", {}, {}}}));
}

TEST_F(CriteriaRegistryTest, testAnyRuleMustHold)
{
    EXPECT_TRUE(
        check({Rule {"no", {}, {}}, Rule {"yes", {}, {}}}, Combinator::ANY));
    EXPECT_FALSE(
        check({Rule {"no", {}, {}}, Rule {"no", {}, {}}}, Combinator::ANY));
}

TEST_F(CriteriaRegistryTest, testCheckIsRepeatable)
{
    const auto rules = std::vector {Rule {"yes", {}, {}}};
    EXPECT_EQ(check(rules), check(rules));
}

TEST_F(CriteriaRegistryTest, testCheckUnknownCriterion)
{
    EXPECT_THROW(
        check({Rule {"maybe", {}, {}}}), BidEngine::UnknownCriterionException);
}

TEST_F(CriteriaRegistryTest, testValidateVisitsChildren)
{
    const auto child = Rule {"no", {}, {}};
    const auto rule = Rule {"yes", {}, {child}};
    EXPECT_CALL(*yes, handleValidate(rule));
    EXPECT_CALL(*no, handleValidate(child));
    registry.validate(rule);
}

TEST_F(CriteriaRegistryTest, testValidateUnknownChild)
{
    const auto rule = Rule {"yes", {}, {Rule {"maybe", {}, {}}}};
    EXPECT_THROW(
        registry.validate(rule), BidEngine::UnknownCriterionException);
}

TEST_F(CriteriaRegistryTest, testValidatePropagatesInvalidRule)
{
    const auto rule = Rule {"no", {}, {}};
    EXPECT_CALL(*no, handleValidate(rule))
        .WillOnce(Throw(BidEngine::InvalidRuleException {"invalid"}));
    EXPECT_THROW(registry.validate(rule), BidEngine::InvalidRuleException);
}
