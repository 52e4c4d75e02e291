/** \file
 *
 * \brief Definition of BidEngine::Suit enum and related utilities
 */

#ifndef SUIT_HH_
#define SUIT_HH_

#include "bridge/Bid.hh"

#include "enhanced_enum/enhanced_enum.hh"

#include <array>
#include <iosfwd>
#include <optional>
#include <string_view>

namespace BidEngine {

/// \cond internal

/*[[[cog
import cog
import enumecg
import enum
class Suit(enum.Enum):
  CLUBS = "clubs"
  DIAMONDS = "diamonds"
  HEARTS = "hearts"
  SPADES = "spades"
cog.out(enumecg.generate(Suit, primary_type="enhanced"))
]]]*/
enum class SuitLabel {
    CLUBS,
    DIAMONDS,
    HEARTS,
    SPADES,
};

struct Suit : ::enhanced_enum::enum_base<Suit, SuitLabel, std::string_view> {
    using ::enhanced_enum::enum_base<Suit, SuitLabel, std::string_view>::enum_base;
    static constexpr std::array values {
        value_type { "clubs" },
        value_type { "diamonds" },
        value_type { "hearts" },
        value_type { "spades" },
    };
};

constexpr Suit enhance(SuitLabel e) noexcept
{
    return e;
}

namespace Suits {
inline constexpr const Suit::value_type& CLUBS_VALUE { std::get<0>(Suit::values) };
inline constexpr const Suit::value_type& DIAMONDS_VALUE { std::get<1>(Suit::values) };
inline constexpr const Suit::value_type& HEARTS_VALUE { std::get<2>(Suit::values) };
inline constexpr const Suit::value_type& SPADES_VALUE { std::get<3>(Suit::values) };
inline constexpr Suit CLUBS { SuitLabel::CLUBS };
inline constexpr Suit DIAMONDS { SuitLabel::DIAMONDS };
inline constexpr Suit HEARTS { SuitLabel::HEARTS };
inline constexpr Suit SPADES { SuitLabel::SPADES };
}
//[[[end]]]

/// \endcond

/** \brief Suits in the order their holdings are written
 *
 * Hands are written from the highest ranking suit down (spades, hearts,
 * diamonds, clubs). Conventions that examine suits in priority order also use
 * this order.
 */
inline constexpr auto SUITS_IN_WRITING_ORDER = std::array {
    Suits::SPADES, Suits::HEARTS, Suits::DIAMONDS, Suits::CLUBS };

/** \brief Return order of the suit
 *
 * \return order of \p suit from clubs (0) to spades (3)
 *
 * \throw std::invalid_argument if \p suit is not valid
 */
int suitOrder(Suit suit);

/** \brief Determine the strain corresponding to a suit
 *
 * \param suit the suit
 *
 * \return the (trump) strain of \p suit
 */
Strain strainFor(Suit suit);

/** \brief Determine the suit corresponding to a strain
 *
 * \param strain the strain
 *
 * \return the suit of \p strain, or none if \p strain is notrump
 */
std::optional<Suit> suitFor(Strain strain);

/** \brief Determine suit from its initial
 *
 * \param letter one of the letters S, H, D, C (case insensitive)
 *
 * \return the suit, or none if \p letter is not a suit initial
 */
std::optional<Suit> suitFromLetter(char letter);

/** \brief Output a Suit to stream
 *
 * \param os the output stream
 * \param suit the suit to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, Suit suit);

}

#endif // SUIT_HH_
