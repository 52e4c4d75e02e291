#include "criteria/CriteriaRegistry.hh"

#include "criteria/Criterion.hh"
#include "Exceptions.hh"
#include "Logging.hh"
#include "Utility.hh"

#include <boost/format.hpp>

#include <algorithm>
#include <utility>

namespace BidEngine {

void CriteriaRegistry::addCriterion(
    std::string name, std::shared_ptr<const Criterion> criterion)
{
    dereference(criterion);
    if (containsCriterion(name)) {
        throw DuplicateNameException {
            boost::str(
                boost::format("Criterion “%s” already registered") % name)};
    }
    log(LogLevel::DEBUG, "Registering criterion %s", name);
    criteria.emplace(std::move(name), std::move(criterion));
}

bool CriteriaRegistry::containsCriterion(const std::string_view name) const
{
    return criteria.find(name) != criteria.end();
}

const Criterion& CriteriaRegistry::getCriterion(
    const std::string_view name) const
{
    const auto iter = criteria.find(name);
    if (iter == criteria.end()) {
        throw UnknownCriterionException {
            boost::str(boost::format("Unknown criterion “%s”") % name)};
    }
    return *iter->second;
}

bool CriteriaRegistry::check(
    const std::vector<Rule>& rules, const Hand& hand, const Auction& auction,
    const Combinator combinator) const
{
    const auto holds = [this, &hand, &auction](const auto& rule)
    {
        const auto ret = getCriterion(rule.name).check(
            rule, hand, auction, *this);
        log(LogLevel::DEBUG, "Criterion %s: %s", rule.name,
            ret ? "holds" : "fails");
        return ret;
    };
    if (combinator == Combinator::ANY) {
        return std::any_of(rules.begin(), rules.end(), holds);
    }
    return std::all_of(rules.begin(), rules.end(), holds);
}

void CriteriaRegistry::validate(const Rule& rule) const
{
    getCriterion(rule.name).validate(rule);
    for (const auto& child : rule.children) {
        validate(child);
    }
}

}
