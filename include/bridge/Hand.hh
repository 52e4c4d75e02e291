/** \file
 *
 * \brief Definition of BidEngine::Hand class
 */

#ifndef HAND_HH_
#define HAND_HH_

#include "bridge/BridgeConstants.hh"
#include "bridge/Position.hh"
#include "bridge/Suit.hh"

#include <array>
#include <iosfwd>
#include <string>
#include <string_view>

namespace BidEngine {

/** \brief A bridge hand as seen by the bidding engine
 *
 * A hand consists of four holdings, one for each suit. A holding is a string
 * of rank symbols “AKQJT98765432” ordered from the highest rank down. A spot
 * card whose rank is irrelevant for bidding may be written as “x”.
 *
 * Hands are immutable once dealt.
 *
 * \sa handFromString()
 */
class Hand {
public:

    /** \brief Holding of a single suit
     */
    using Holding = std::string;

    /** \brief Holdings indexed by suitOrder()
     */
    using Holdings = std::array<Holding, N_SUITS>;

    /** \brief Suit lengths ordered from the longest to the shortest
     */
    using Shape = std::array<int, N_SUITS>;

    /** \brief Create new hand
     *
     * \param holdings the holdings, indexed by suitOrder()
     */
    explicit Hand(Holdings holdings);

    /** \brief Retrieve holding of a suit
     *
     * \param suit the suit
     *
     * \return the rank symbols of the cards in \p suit
     */
    const Holding& getHolding(Suit suit) const;

    /** \brief Determine the number of cards in a suit
     *
     * \param suit the suit
     *
     * \return the length of the holding in \p suit
     */
    int getLength(Suit suit) const;

    /** \brief Determine the shape of the hand
     *
     * \return the suit lengths sorted in descending order, e.g. {5, 3, 3, 2}
     */
    Shape getShape() const;

private:

    Holdings holdings;
};

/** \brief Hands of the players taking part in the auction
 *
 * The array is indexed by positionOrder(). The hands of the players that only
 * pass are nullptr.
 */
using Hands = std::array<const Hand*, N_PLAYERS>;

/** \brief Retrieve hand of a player
 *
 * \param hands the hands
 * \param position the position of the player
 *
 * \return reference to the hand of \p position
 *
 * \throw std::invalid_argument if \p position has no hand
 */
const Hand& handFor(const Hands& hands, Position position);

/** \brief Parse hand from text
 *
 * The text consists of four whitespace separated holdings in the order
 * spades, hearts, diamonds, clubs, for instance "AQ3 AK3 J2 AQ652". A void is
 * written as a lone hyphen. Rank symbols are case insensitive.
 *
 * \param str the text to parse
 *
 * \return the hand
 *
 * \throw std::invalid_argument if \p str does not contain four holdings, a
 * holding contains an unknown symbol or a repeated rank, or the hand does not
 * contain exactly 13 cards
 */
Hand handFromString(std::string_view str);

/** \brief Equality operator for hands
 */
bool operator==(const Hand&, const Hand&);

/** \brief Output a Hand to stream
 *
 * The hand is written in the same notation handFromString() accepts.
 *
 * \param os the output stream
 * \param hand the hand to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const Hand& hand);

}

#endif // HAND_HH_
