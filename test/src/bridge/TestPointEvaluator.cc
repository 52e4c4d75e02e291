#include "bridge/Hand.hh"
#include "bridge/PointEvaluator.hh"

#include <gtest/gtest.h>

#include <stdexcept>

using BidEngine::CONTROL_EVALUATOR;
using BidEngine::HCP_EVALUATOR;
using BidEngine::PointEvaluator;
using BidEngine::handFromString;

TEST(PointEvaluatorTest, testHighCardPoints)
{
    EXPECT_EQ(24, HCP_EVALUATOR(handFromString("AKxxx AKx AKx QJ")));
    EXPECT_EQ(20, HCP_EVALUATOR(handFromString("AQ3 AK3 J2 AQ652")));
    EXPECT_EQ(0, HCP_EVALUATOR(handFromString("xxx xxx xxx xxxx")));
}

TEST(PointEvaluatorTest, testControls)
{
    EXPECT_EQ(9, CONTROL_EVALUATOR(handFromString("AKxxx AKx AKx QJ")));
    EXPECT_EQ(5, CONTROL_EVALUATOR(handFromString("KQJx KQxx KQx Ax")));
}

TEST(PointEvaluatorTest, testHolding)
{
    EXPECT_EQ(10, HCP_EVALUATOR("AKQJT98"));
    EXPECT_EQ(3, CONTROL_EVALUATOR("AKQJT98"));
    EXPECT_EQ(0, HCP_EVALUATOR(""));
}

TEST(PointEvaluatorTest, testSpotCardsAreWorthNothing)
{
    const auto evaluator = PointEvaluator {1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1};
    EXPECT_EQ(2, evaluator("AKx"));
}

TEST(PointEvaluatorTest, testTooManyWeights)
{
    EXPECT_THROW(
        (PointEvaluator {1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1}),
        std::invalid_argument);
}
