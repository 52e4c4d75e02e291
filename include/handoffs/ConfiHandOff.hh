/** \file
 *
 * \brief Definition of BidEngine::ConfiHandOff class
 */

#ifndef HANDOFFS_CONFIHANDOFF_HH_
#define HANDOFFS_CONFIHANDOFF_HH_

#include "handoffs/HandOff.hh"

namespace BidEngine {

/** \brief The CONFI slam exploration convention
 *
 * CONFI (control‐fit) is played after the 2NT opening and the 3NT response
 * asking for controls (A=2, K=1). It proceeds in the following phases:
 *
 * 1. The opener shows the number of controls in steps above the asking bid,
 *    one step for \ref EXPECTED_MINIMUM_CONTROLS or fewer, and one more step
 *    for each additional control.
 * 2. Unless the partnership holds at least \ref SLAM_TRY_CONTROLS controls,
 *    the responder signs off in notrump.
 * 3. On the first rebid, an opener who showed the expected minimum without
 *    holding it signs off in notrump. The responder then continues only if
 *    the partnership holds at least \ref CORRECTED_SLAM_TRY_CONTROLS
 *    controls.
 * 4. An opener with a six card suit bids the slam in it.
 * 5. A player who finds a fit with a suit partner has shown (4‐4, 5‐3 or
 *    3‐5) bids the slam in it.
 * 6. Otherwise the player introduces suits up the line below the slam level:
 *    first four card suits, then unshown five card suits, and finally three
 *    cards in a suit partner has shown four of, if it can be done without
 *    raising the level. After a suit is shown the convention continues from
 *    phase 3.
 * 7. If no suit can be shown, the player signs off in notrump, or passes if
 *    notrump was just bid. After a notrump signoff the convention continues
 *    from phase 3.
 *
 * The opponents pass throughout.
 */
class ConfiHandOff : public HandOff {
public:

    /** \brief Number of controls the opener is expected to hold at least
     */
    static constexpr int EXPECTED_MINIMUM_CONTROLS = 6;

    /** \brief Controls needed by the partnership to explore slam
     */
    static constexpr int SLAM_TRY_CONTROLS = 10;

    /** \brief Controls needed to continue after the opener signs off
     */
    static constexpr int CORRECTED_SLAM_TRY_CONTROLS = 11;

    /** \brief The level of a slam bid, and the ceiling of suit showing
     */
    static constexpr int SLAM_LEVEL = 6;

private:

    void handleBid(const Hands& hands, Auction& auction) const override;
};

}

#endif // HANDOFFS_CONFIHANDOFF_HH_
