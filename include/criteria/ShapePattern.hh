/** \file
 *
 * \brief Definition of BidEngine::ShapePattern class
 */

#ifndef CRITERIA_SHAPEPATTERN_HH_
#define CRITERIA_SHAPEPATTERN_HH_

#include "bridge/Suit.hh"

#include <string_view>
#include <vector>

namespace BidEngine {

class Hand;

/** \brief Pattern over the suit lengths of a hand
 *
 * A shape pattern is a comma separated list of at most four terms. Each term
 * is an optional set of suit initials followed by a length specification:
 *
 * - “N”: exactly N cards
 * - “N+”: at least N cards
 * - “N-”: at most N cards
 * - “N-M”: between N and M cards
 *
 * A hand matches the pattern if the terms can be assigned to distinct suits
 * so that the length of each suit is within its term, and the suit is one of
 * the suits of the term (if the term names any). Suits not assigned to any
 * term can have any length.
 *
 * \code{.cc}
 * ShapePattern {"5,3,3,2"}       // 5332 in any order
 * ShapePattern {"5+,3-"}         // a 5+ card suit and a suit of 3 or fewer
 * ShapePattern {"5-6,S3,C3,1-2"} // 5332 or 6331 with three spades and clubs
 * ShapePattern {"CD5,4,2,2"}     // five clubs or diamonds, 422 otherwise
 * \endcode
 */
class ShapePattern {
public:

    /** \brief Term in a shape pattern
     */
    struct Term {
        std::vector<Suit> suits;  ///< \brief Allowed suits, empty if any
        int minimumLength;        ///< \brief Minimum length of the suit
        int maximumLength;        ///< \brief Maximum length of the suit

        /** \brief Determine if a suit satisfies the term
         *
         * \param suit the suit
         * \param length the length of the suit
         */
        bool satisfiedBy(Suit suit, int length) const;
    };

    /** \brief Parse pattern
     *
     * \param pattern the pattern
     *
     * \throw InvalidRuleException if \p pattern is malformed
     */
    explicit ShapePattern(std::string_view pattern);

    /** \brief Retrieve the terms of the pattern
     */
    const std::vector<Term>& getTerms() const;

    /** \brief Determine if a hand matches the pattern
     *
     * \param hand the hand
     *
     * \return true if the suit lengths of \p hand match the pattern, false
     * otherwise
     */
    bool matches(const Hand& hand) const;

private:

    std::vector<Term> terms;
};

}

#endif // CRITERIA_SHAPEPATTERN_HH_
