#include "criteria/BuiltinCriteria.hh"

#include "bridge/Auction.hh"
#include "bridge/Hand.hh"
#include "bridge/PointEvaluator.hh"
#include "criteria/CriteriaRegistry.hh"
#include "criteria/Rule.hh"
#include "criteria/ShapePattern.hh"
#include "Exceptions.hh"

#include <boost/format.hpp>

#include <algorithm>
#include <array>
#include <memory>

namespace BidEngine {

namespace {

using namespace std::string_view_literals;

constexpr auto PATTERN_PARAMETER = "pattern"sv;
constexpr auto MINIMUM_PARAMETER = "min"sv;
constexpr auto MAXIMUM_PARAMETER = "max"sv;

ShapePattern getPattern(const Rule& rule)
{
    const auto pattern = rule.getParameter(PATTERN_PARAMETER);
    if (!pattern) {
        throw InvalidRuleException {
            boost::str(
                boost::format("Rule “%s” is missing parameter “%s”")
                % rule.name % PATTERN_PARAMETER)};
    }
    return ShapePattern {*pattern};
}

}

bool OpeningCriterion::handleCheck(
    const Rule&, const Hand&, const Auction& auction,
    const CriteriaRegistry&) const
{
    return !auction.hasOpened();
}

bool ShapeCriterion::handleCheck(
    const Rule& rule, const Hand& hand, const Auction&,
    const CriteriaRegistry&) const
{
    return getPattern(rule).matches(hand);
}

void ShapeCriterion::handleValidate(const Rule& rule) const
{
    getPattern(rule);
}

bool BalancedCriterion::handleCheck(
    const Rule&, const Hand& hand, const Auction&,
    const CriteriaRegistry&) const
{
    static const auto BALANCED_PATTERNS = std::array {
        ShapePattern {"4,3,3,3"},
        ShapePattern {"4,4,3,2"},
        ShapePattern {"5,3,3,2"},
    };
    return std::any_of(
        BALANCED_PATTERNS.begin(), BALANCED_PATTERNS.end(),
        [&hand](const auto& pattern) { return pattern.matches(hand); });
}

bool HcpCriterion::handleCheck(
    const Rule& rule, const Hand& hand, const Auction&,
    const CriteriaRegistry&) const
{
    const auto hcp = HCP_EVALUATOR(hand);
    return rule.getIntParameter(MINIMUM_PARAMETER, DEFAULT_MINIMUM) <= hcp &&
        hcp <= rule.getIntParameter(MAXIMUM_PARAMETER, DEFAULT_MAXIMUM);
}

void HcpCriterion::handleValidate(const Rule& rule) const
{
    rule.getIntParameter(MINIMUM_PARAMETER, DEFAULT_MINIMUM);
    rule.getIntParameter(MAXIMUM_PARAMETER, DEFAULT_MAXIMUM);
}

bool OrCriterion::handleCheck(
    const Rule& rule, const Hand& hand, const Auction& auction,
    const CriteriaRegistry& registry) const
{
    return registry.check(rule.children, hand, auction, Combinator::ANY);
}

void registerBuiltinCriteria(CriteriaRegistry& registry)
{
    registry.addCriterion("opening", std::make_shared<OpeningCriterion>());
    registry.addCriterion("shape", std::make_shared<ShapeCriterion>());
    registry.addCriterion("balanced", std::make_shared<BalancedCriterion>());
    registry.addCriterion("hcp", std::make_shared<HcpCriterion>());
    registry.addCriterion("or", std::make_shared<OrCriterion>());
}

}
