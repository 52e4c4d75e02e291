/** \file
 *
 * \brief Definition of fundamental bridge constants needed by several classes
 */

#ifndef BRIDGECONSTANTS_HH_
#define BRIDGECONSTANTS_HH_

/** \brief Top level namespace of the bidding engine
 *
 * The BidEngine namespace directly contains classes related to fundamental
 * concepts of contract bridge bidding. It also contains several subnamespaces
 * for clearly identifiable collections of higher level functionality.
 */
namespace BidEngine {

/** \brief Number of players in bridge game
 */
constexpr auto N_PLAYERS = 4;

/** \brief Number of suits in playing card deck
 */
constexpr auto N_SUITS = 4;

/** \brief Number of cards in playing card deck
 */
constexpr auto N_CARDS = 52;

/** \brief Number of cards per player (hand size) in bridge game
 */
constexpr auto N_CARDS_PER_PLAYER = N_CARDS / N_PLAYERS; // 13

/** \brief Number of consecutive passes that close an opened auction
 */
constexpr auto N_CLOSING_PASSES = N_PLAYERS - 1;

}

#endif // BRIDGECONSTANTS_HH_
