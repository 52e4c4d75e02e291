/** \file
 *
 * \brief Definition of BidEngine::Engine::Director class
 */

#ifndef ENGINE_DIRECTOR_HH_
#define ENGINE_DIRECTOR_HH_

#include "bridge/Call.hh"
#include "bridge/Hand.hh"
#include "bridge/Position.hh"

#include <boost/core/noncopyable.hpp>

#include <vector>

namespace BidEngine {

class Auction;
class CriteriaRegistry;
class HandOffRegistry;

namespace Engine {

struct BidNode;
struct BiddingSystem;

/** \brief Bids auctions according to a bidding system
 *
 * The director walks the decision tree of a bidding system. At each step it
 * makes the first call among the current nodes whose criteria hold for the
 * hand of the player in turn, and the opponent after the player passes. If
 * the node names a hand-off, the hand-off takes over. Otherwise the responses
 * of the node become the current nodes. If there are no current nodes, or
 * none of them applies, the auction is passed out.
 *
 * Only north and south bid. East and west always pass.
 *
 * The director borrows the bidding system and the registries. They must
 * outlive the director. Each auction is bid independently, so the same
 * director can be used to bid any number of auctions.
 */
class Director : private boost::noncopyable {
public:

    /** \brief Create new director
     *
     * The bidding system is validated against the registries when the
     * director is created.
     *
     * \param system the bidding system
     * \param criteria the registry used to evaluate the rules of \p system
     * \param handOffs the registry used to look up the hand-offs of \p system
     *
     * \throw MissingCriteriaException if a node of \p system has no criteria
     * \throw UnknownCriterionException if a rule of \p system refers to a
     * criterion not in \p criteria
     * \throw UnknownHandOffException if a node of \p system refers to a
     * hand-off not in \p handOffs
     * \throw InvalidRuleException if a rule of \p system is malformed
     */
    Director(
        const BiddingSystem& system, const CriteriaRegistry& criteria,
        const HandOffRegistry& handOffs);

    /** \brief Bid an auction
     *
     * \param north the hand of north
     * \param south the hand of south
     * \param dealer the dealer
     *
     * \return the calls of the completed auction, starting from the call of
     * \p dealer
     *
     * \throw InvariantViolationException if a hand-off fails
     */
    std::vector<Call> bid(
        const Hand& north, const Hand& south,
        Position dealer = Positions::NORTH) const;

    /** \brief Bid an auction in place
     *
     * Leading passes of the players that have no hand are made first. Then
     * the auction is bid from the openings of the system until it ends.
     *
     * \param hands the hands of the players, nullptr for the players that
     * only pass
     * \param auction the auction, modified in place
     *
     * \throw InvariantViolationException if a hand-off fails
     */
    void run(const Hands& hands, Auction& auction) const;

private:

    void validate(const std::vector<BidNode>& nodes) const;

    const BidNode* findNode(
        const std::vector<BidNode>& nodes, const Hand& hand,
        const Auction& auction) const;

    const BiddingSystem& system;
    const CriteriaRegistry& criteria;
    const HandOffRegistry& handOffs;
};

}
}

#endif // ENGINE_DIRECTOR_HH_
