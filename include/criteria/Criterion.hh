/** \file
 *
 * \brief Definition of BidEngine::Criterion interface
 */

#ifndef CRITERIA_CRITERION_HH_
#define CRITERIA_CRITERION_HH_

namespace BidEngine {

class Auction;
class CriteriaRegistry;
class Hand;
struct Rule;

/** \brief Predicate deciding whether a rule holds
 *
 * A criterion evaluates a rule against the hand of the player in turn and the
 * auction so far. Criteria are stateless: evaluating the same rule against the
 * same hand and auction always gives the same result.
 *
 * Criteria are registered to a CriteriaRegistry under the name rules use to
 * refer to them.
 *
 * \sa CriteriaRegistry, Rule
 */
class Criterion {
public:

    virtual ~Criterion();

    /** \brief Determine if a rule holds
     *
     * \param rule the rule containing the parameters of the criterion
     * \param hand the hand of the player in turn
     * \param auction the auction so far
     * \param registry the registry used to evaluate the child rules of \p
     * rule, if any
     *
     * \return true if \p rule holds for \p hand and \p auction, false
     * otherwise
     *
     * \throw InvalidRuleException if \p rule is malformed
     */
    bool check(
        const Rule& rule, const Hand& hand, const Auction& auction,
        const CriteriaRegistry& registry) const;

    /** \brief Check that a rule is well formed
     *
     * This is called when a bidding system is taken into use, so that
     * malformed rules are detected before any auction is bid.
     *
     * \param rule the rule to validate
     *
     * \throw InvalidRuleException if \p rule is malformed
     */
    void validate(const Rule& rule) const;

private:

    /** \brief Handle for determining if a rule holds
     *
     * \sa check()
     */
    virtual bool handleCheck(
        const Rule& rule, const Hand& hand, const Auction& auction,
        const CriteriaRegistry& registry) const = 0;

    /** \brief Handle for checking that a rule is well formed
     *
     * The default implementation accepts all rules.
     *
     * \sa validate()
     */
    virtual void handleValidate(const Rule& rule) const;
};

}

#endif // CRITERIA_CRITERION_HH_
