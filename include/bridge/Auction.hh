/** \file
 *
 * \brief Definition of BidEngine::Auction class
 */

#ifndef AUCTION_HH_
#define AUCTION_HH_

#include "bridge/Call.hh"
#include "bridge/Position.hh"

#include <boost/core/noncopyable.hpp>
#include <boost/iterator/counting_iterator.hpp>
#include <boost/iterator/transform_iterator.hpp>

#include <iosfwd>
#include <optional>
#include <utility>
#include <vector>

namespace BidEngine {

/** \brief State machine for a bridge auction
 *
 * Auction stores the calls made in the auction, starting from the call of
 * the dealer and proceeding clockwise. The calls are append only. The auction
 * ends after four initial passes, or after three consecutive passes following
 * a bid.
 *
 * An auction is owned by a single bidding run and is not shared between runs.
 */
class Auction : private boost::noncopyable {
public:

    /** \brief Create new auction
     *
     * \param dealer the position of the dealer, i.e. the first player to call
     */
    explicit Auction(Position dealer);

    /** \brief Add call to the auction
     *
     * The call is made by the position in turn.
     *
     * \param call the call to be made
     *
     * \throw AuctionAlreadyOverException if the auction has already ended
     * \throw InsufficientBidException if \p call is a bid lower than the
     * highest bid
     */
    void addCall(const Call& call);

    /** \brief Make the remaining players pass until the auction ends
     *
     * Does nothing if the auction has already ended.
     */
    void allPass();

    /** \brief Determine the dealer
     *
     * \return the position that made (or makes) the first call
     */
    Position getDealer() const;

    /** \brief Determine which position has the turn to call
     *
     * The position in turn is the dealer advanced clockwise by the number of
     * calls made. It is defined even after the auction has ended.
     *
     * \return the position in turn
     */
    Position getPositionInTurn() const;

    /** \brief Determine the number of calls made in the auction
     */
    int getNumberOfCalls() const;

    /** \brief Retrieve a call in the auction
     *
     * \param n the index of the call to retrieve
     *
     * \return nth call in the auction
     *
     * \throw std::out_of_range if n >= getNumberOfCalls()
     */
    const Call& getCall(int n) const;

    /** \brief Retrieve all calls made so far
     */
    const std::vector<Call>& getCalls() const;

    /** \brief Determine if somebody has made a bid
     *
     * \return true if at least one call in the auction is a bid, false
     * otherwise
     */
    bool hasOpened() const;

    /** \brief Determine if the auction has ended
     *
     * \return true if the auction was passed out or three passes followed
     * the last bid, false otherwise
     */
    bool hasEnded() const;

    /** \brief Determine the highest bid made so far
     *
     * \return the most recent bid in the auction, or none if nobody has bid
     */
    std::optional<Bid> getHighestBid() const;

    /** \brief Determine the final contract
     *
     * The outer optional is none if the auction is still ongoing. The inner
     * optional is none if the auction ended without any bids.
     *
     * \return the final contract, or none if the auction is ongoing
     */
    std::optional<std::optional<Bid>> getFinalContract() const;

    /** \brief Determine the declarer
     *
     * The declarer is the player of the partnership that made the final bid
     * who first bid the strain of the final contract.
     *
     * The outer optional is none if the auction is still ongoing. The inner
     * optional is none if the auction ended without any bids.
     *
     * \return the position of the declarer, or none if the auction is ongoing
     */
    std::optional<std::optional<Position>> getDeclarerPosition() const;

    /** \brief Get iterator to the beginning of calls
     *
     * \sa auctionCallIterator()
     */
    auto begin() const;

    /** \brief Get iterator to the end of calls
     *
     * \sa auctionCallIterator()
     */
    auto end() const;

private:

    const Position dealer;
    std::vector<Call> calls;
};

/** \brief Create iterator for iterating over calls in an auction
 *
 * \param auction the auction from which the calls are retrieved
 * \param n the index where iterating the calls begins
 *
 * \return Iterator that, when deferenced, returns a pair containing the
 * following:
 *   - Position who made call \p n
 *   - The call made
 */
inline auto auctionCallIterator(const Auction& auction, int n)
{
    return boost::make_transform_iterator(
        boost::make_counting_iterator(n),
        [&auction](const auto i)
        {
            const auto position = clockwise(auction.getDealer(), i);
            return std::make_pair(position, auction.getCall(i));
        });
}

inline auto Auction::begin() const
{
    return auctionCallIterator(*this, 0);
}

inline auto Auction::end() const
{
    return auctionCallIterator(*this, getNumberOfCalls());
}

/** \brief Output the calls of an auction to stream
 *
 * The calls are written in short notation separated by spaces, e.g. “2N P 3N
 * P”.
 *
 * \param os the output stream
 * \param auction the auction to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const Auction& auction);

}

#endif // AUCTION_HH_
