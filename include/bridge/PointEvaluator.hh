/** \file
 *
 * \brief Definition of BidEngine::PointEvaluator class
 */

#ifndef POINTEVALUATOR_HH_
#define POINTEVALUATOR_HH_

#include <initializer_list>
#include <string_view>
#include <vector>

namespace BidEngine {

class Hand;

/** \brief Rank weighted point count
 *
 * A point evaluator assigns a weight to each rank and counts the sum of the
 * weights of the cards in a hand. The weights are given from the ace
 * downwards, and the ranks not given weight zero. Unspecified spot cards
 * (“x”) always weigh zero.
 *
 * \code{.cc}
 * PointEvaluator {4, 3, 2, 1} // high card points
 * PointEvaluator {2, 1}       // controls
 * \endcode
 */
class PointEvaluator {
public:

    /** \brief Create new evaluator
     *
     * \param weights the weights of ace, king, queen etc. in that order
     *
     * \throw std::invalid_argument if more than 13 weights are given
     */
    PointEvaluator(std::initializer_list<int> weights);

    /** \brief Evaluate a holding
     *
     * \param holding the rank symbols of the holding
     *
     * \return the sum of the weights of the ranks in \p holding
     */
    int operator()(std::string_view holding) const;

    /** \brief Evaluate a hand
     *
     * \param hand the hand
     *
     * \return the sum of the weights of the ranks in all holdings of \p hand
     */
    int operator()(const Hand& hand) const;

private:

    std::vector<int> weights;
};

/** \brief High card point evaluator (A=4, K=3, Q=2, J=1)
 */
extern const PointEvaluator HCP_EVALUATOR;

/** \brief Control evaluator (A=2, K=1)
 */
extern const PointEvaluator CONTROL_EVALUATOR;

}

#endif // POINTEVALUATOR_HH_
