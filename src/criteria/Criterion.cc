#include "criteria/Criterion.hh"

namespace BidEngine {

Criterion::~Criterion() = default;

bool Criterion::check(
    const Rule& rule, const Hand& hand, const Auction& auction,
    const CriteriaRegistry& registry) const
{
    return handleCheck(rule, hand, auction, registry);
}

void Criterion::validate(const Rule& rule) const
{
    handleValidate(rule);
}

void Criterion::handleValidate(const Rule&) const
{
}

}
