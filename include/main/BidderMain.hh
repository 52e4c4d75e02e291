/** \file
 *
 * \brief Definition of BidEngine::Main::BidderMain class
 */

#ifndef MAIN_BIDDERMAIN_HH_
#define MAIN_BIDDERMAIN_HH_

#include "bridge/Call.hh"
#include "bridge/Position.hh"

#include <memory>
#include <vector>

namespace BidEngine {

class Auction;
class Hand;

namespace Engine {
struct BiddingSystem;
}

/** \brief The glue code and high level logic for the bidder
 */
namespace Main {

/** \brief Set up the bidding engine
 *
 * When constructed, BidderMain registers the built-in criteria and hand-offs,
 * takes the bidding system into use and validates it. After that any number
 * of auctions can be bid.
 */
class BidderMain {
public:

    /** \brief Create the bidding engine
     *
     * \param system the bidding system
     *
     * \throw ConfigurationException if \p system is not valid
     */
    explicit BidderMain(Engine::BiddingSystem system);

    ~BidderMain();

    /** \brief Bid an auction
     *
     * \param north the hand of north
     * \param south the hand of south
     * \param dealer the dealer
     *
     * \return the calls of the completed auction
     */
    std::vector<Call> bid(
        const Hand& north, const Hand& south,
        Position dealer = Positions::NORTH) const;

    /** \brief Bid an auction in place
     *
     * \param north the hand of north
     * \param south the hand of south
     * \param auction the auction, normally empty
     */
    void bid(const Hand& north, const Hand& south, Auction& auction) const;

    /** \brief Get the bidding system
     */
    const Engine::BiddingSystem& getSystem() const;

private:

    class Impl;
    const std::unique_ptr<const Impl> impl;
};

}
}

#endif // MAIN_BIDDERMAIN_HH_
