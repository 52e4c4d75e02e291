/** \file
 *
 * \brief Definition of BidEngine::HandOff interface
 */

#ifndef HANDOFFS_HANDOFF_HH_
#define HANDOFFS_HANDOFF_HH_

#include "bridge/Hand.hh"

namespace BidEngine {

class Auction;

/** \brief Convention taking over the auction
 *
 * A hand-off is a convention that, once a bidding system reaches a bid
 * flagged with it, makes all the remaining calls of the partnership by its
 * own logic instead of by the decision tree of the system. The hand-off
 * normally bids until the auction ends. Any state it needs to track the
 * information exchanged lives only for the duration of one call to bid().
 *
 * Hand-offs are registered to a HandOffRegistry under the name bidding
 * systems use to refer to them.
 *
 * \sa HandOffRegistry
 */
class HandOff {
public:

    virtual ~HandOff();

    /** \brief Bid the auction
     *
     * The player in turn when the method is called is the one who starts the
     * convention.
     *
     * \param hands the hands of the players
     * \param auction the auction, modified in place
     *
     * \throw InvariantViolationException if the convention fails to find a
     * call it requires
     */
    void bid(const Hands& hands, Auction& auction) const;

private:

    /** \brief Handle for bidding the auction
     *
     * \sa bid()
     */
    virtual void handleBid(const Hands& hands, Auction& auction) const = 0;
};

}

#endif // HANDOFFS_HANDOFF_HH_
