/** \file
 *
 * \brief Definition of BidEngine::CriteriaRegistry class
 */

#ifndef CRITERIA_CRITERIAREGISTRY_HH_
#define CRITERIA_CRITERIAREGISTRY_HH_

#include "criteria/Rule.hh"

#include <boost/core/noncopyable.hpp>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace BidEngine {

class Auction;
class Criterion;
class Hand;

/** \brief The way results of several rules are combined
 *
 * \sa CriteriaRegistry::check()
 */
enum class Combinator {
    ALL,  ///< All rules must hold
    ANY   ///< At least one rule must hold
};

/** \brief Registry of named criteria
 *
 * The registry resolves the names of the rules in a bidding system to the
 * criteria evaluating them. The registry is populated when the application
 * starts and only read afterwards.
 *
 * \sa registerBuiltinCriteria()
 */
class CriteriaRegistry : private boost::noncopyable {
public:

    /** \brief Register criterion
     *
     * \param name the name rules use to refer to the criterion
     * \param criterion the criterion
     *
     * \throw DuplicateNameException if a criterion with the same name is
     * already registered
     * \throw std::invalid_argument if \p criterion is null
     */
    void addCriterion(
        std::string name, std::shared_ptr<const Criterion> criterion);

    /** \brief Determine if a criterion is registered
     *
     * \param name the name of the criterion
     */
    bool containsCriterion(std::string_view name) const;

    /** \brief Retrieve a criterion
     *
     * \param name the name of the criterion
     *
     * \return the criterion registered under \p name
     *
     * \throw UnknownCriterionException if no criterion is registered under
     * \p name
     */
    const Criterion& getCriterion(std::string_view name) const;

    /** \brief Evaluate rules
     *
     * The rules are evaluated in order, and the evaluation stops as soon as
     * the result is known.
     *
     * \param rules the rules to evaluate
     * \param hand the hand of the player in turn
     * \param auction the auction so far
     * \param combinator determines whether all or any of \p rules need to hold
     *
     * \return true if the rules hold as determined by \p combinator, false
     * otherwise
     *
     * \throw UnknownCriterionException if a rule refers to an unknown
     * criterion
     * \throw InvalidRuleException if a rule is malformed
     */
    bool check(
        const std::vector<Rule>& rules, const Hand& hand,
        const Auction& auction, Combinator combinator = Combinator::ALL) const;

    /** \brief Validate a rule and its children
     *
     * \param rule the rule
     *
     * \throw UnknownCriterionException if \p rule or any of its descendants
     * refers to an unknown criterion
     * \throw InvalidRuleException if \p rule or any of its descendants is
     * malformed
     */
    void validate(const Rule& rule) const;

private:

    std::map<std::string, std::shared_ptr<const Criterion>, std::less<>>
        criteria;
};

}

#endif // CRITERIA_CRITERIAREGISTRY_HH_
