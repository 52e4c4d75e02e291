/** \file
 *
 * \brief Definition of the built-in criteria
 *
 * The built-in criteria are registered under the following names:
 *
 * - “opening”: nobody has bid yet
 * - “shape”: the hand matches the ShapePattern given as parameter “pattern”
 * - “balanced”: the hand has 4333, 4432 or 5332 shape
 * - “hcp”: the high card points are between parameters “min” (default 0) and
 *   “max” (default 40)
 * - “or”: at least one of the child rules holds
 */

#ifndef CRITERIA_BUILTINCRITERIA_HH_
#define CRITERIA_BUILTINCRITERIA_HH_

#include "criteria/Criterion.hh"

namespace BidEngine {

/** \brief Criterion holding if the auction has not been opened
 */
class OpeningCriterion : public Criterion {
private:
    bool handleCheck(
        const Rule& rule, const Hand& hand, const Auction& auction,
        const CriteriaRegistry& registry) const override;
};

/** \brief Criterion holding if the hand matches a shape pattern
 */
class ShapeCriterion : public Criterion {
private:
    bool handleCheck(
        const Rule& rule, const Hand& hand, const Auction& auction,
        const CriteriaRegistry& registry) const override;
    void handleValidate(const Rule& rule) const override;
};

/** \brief Criterion holding if the hand is balanced
 */
class BalancedCriterion : public Criterion {
private:
    bool handleCheck(
        const Rule& rule, const Hand& hand, const Auction& auction,
        const CriteriaRegistry& registry) const override;
};

/** \brief Criterion holding if the high card points are within a range
 */
class HcpCriterion : public Criterion {
public:
    static constexpr int DEFAULT_MINIMUM = 0;   ///< \brief Default “min”
    static constexpr int DEFAULT_MAXIMUM = 40;  ///< \brief Default “max”

private:
    bool handleCheck(
        const Rule& rule, const Hand& hand, const Auction& auction,
        const CriteriaRegistry& registry) const override;
    void handleValidate(const Rule& rule) const override;
};

/** \brief Criterion holding if any of the child rules holds
 */
class OrCriterion : public Criterion {
private:
    bool handleCheck(
        const Rule& rule, const Hand& hand, const Auction& auction,
        const CriteriaRegistry& registry) const override;
};

/** \brief Register the built-in criteria
 *
 * \param registry the registry the criteria are added to
 *
 * \throw DuplicateNameException if \p registry already contains a criterion
 * with the name of a built-in criterion
 */
void registerBuiltinCriteria(CriteriaRegistry& registry);

}

#endif // CRITERIA_BUILTINCRITERIA_HH_
