/** \file
 *
 * \brief Definition of BidEngine::Call variant and related concepts
 */

#ifndef CALL_HH_
#define CALL_HH_

// This is included for convenience, or otherwise using type Call will produce
// cryptic error messages if Bid is not available
#include "bridge/Bid.hh"

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace BidEngine {

/** \brief Tag for bridge call pass
 */
struct Pass {
    /// \brief Three‐way comparison
    constexpr auto operator<=>(const Pass&) const = default;
};

/** \brief Bridge call
 *
 * A variant object representing a call in the auction. A \ref Call object
 * wraps either Bid or the Pass tag. Doubles and redoubles are not part of the
 * bidding systems the engine plays.
 */
using Call = std::variant<Pass, Bid>;

/** \brief Determine if a call is a bid
 *
 * \param call the call
 *
 * \return pointer to the bid wrapped by \p call, or nullptr if \p call is
 * pass
 */
const Bid* getBid(const Call& call);

/** \brief Format call in short notation
 *
 * The short notation of pass is “P”. The short notation of a bid consists of
 * its level followed by one of the letters C, D, H, S, N representing the
 * strain, e.g. “2N” or “4D”.
 *
 * \param call the call
 *
 * \return \p call in short notation
 */
std::string toShortString(const Call& call);

/** \brief Parse call from short notation
 *
 * \param str the call in short notation (case insensitive)
 *
 * \return the call represented by \p str, or none if \p str is not valid
 * short notation
 *
 * \sa toShortString()
 */
std::optional<Call> callFromString(std::string_view str);

/** \brief Output pass to stream
 *
 * The representation of a Pass tag is just the string “Pass”.
 *
 * \note This function is required to generate proper streaming operator for the
 * variant type \ref Call.
 *
 * \param os the output stream
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, Pass);

}

#endif // CALL_HH_
