#include "bridge/PointEvaluator.hh"

#include "bridge/Hand.hh"

#include <numeric>
#include <stdexcept>

namespace BidEngine {

namespace {

using namespace std::string_view_literals;

constexpr auto RANKS_FROM_ACE = "AKQJT98765432"sv;

}

const PointEvaluator HCP_EVALUATOR {4, 3, 2, 1};
const PointEvaluator CONTROL_EVALUATOR {2, 1};

PointEvaluator::PointEvaluator(std::initializer_list<int> weights) :
    weights(weights)
{
    if (this->weights.size() > RANKS_FROM_ACE.size()) {
        throw std::invalid_argument {"Too many weights"};
    }
    this->weights.resize(RANKS_FROM_ACE.size());
}

int PointEvaluator::operator()(const std::string_view holding) const
{
    auto points = 0;
    for (const auto symbol : holding) {
        const auto n = RANKS_FROM_ACE.find(symbol);
        if (n != std::string_view::npos) {
            points += weights[n];
        }
    }
    return points;
}

int PointEvaluator::operator()(const Hand& hand) const
{
    return std::accumulate(
        SUITS_IN_WRITING_ORDER.begin(), SUITS_IN_WRITING_ORDER.end(), 0,
        [this, &hand](const auto points, const auto suit)
        {
            return points + (*this)(hand.getHolding(suit));
        });
}

}
