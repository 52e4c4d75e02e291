/** \file
 *
 * \brief Definition of BidEngine::Rule struct
 */

#ifndef CRITERIA_RULE_HH_
#define CRITERIA_RULE_HH_

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace BidEngine {

/** \brief Parametrized reference to a criterion
 *
 * A rule appears in a bidding system wherever the system needs to know
 * whether a bid applies. It names the criterion that evaluates it, and carries
 * the parameters and the child rules the criterion consumes. For instance the
 * rule “hcp” with parameters min=20 and max=21 holds for hands with 20 or 21
 * high card points.
 *
 * \sa Criterion
 */
struct Rule {

    /** \brief Parameters of the rule
     */
    using Parameters = std::map<std::string, std::string, std::less<>>;

    std::string name;            ///< \brief The name of the criterion
    Parameters parameters;       ///< \brief The parameters of the criterion
    std::vector<Rule> children;  ///< \brief The child rules

    /** \brief Retrieve parameter as string
     *
     * \param key the name of the parameter
     *
     * \return the value of the parameter, or none if the rule has no such
     * parameter
     */
    std::optional<std::string_view> getParameter(std::string_view key) const;

    /** \brief Retrieve integer parameter
     *
     * \param key the name of the parameter
     * \param fallback the value returned if the parameter is missing
     *
     * \return the value of the parameter converted to integer, or \p fallback
     * if the rule has no such parameter
     *
     * \throw InvalidRuleException if the parameter is not an integer
     */
    int getIntParameter(std::string_view key, int fallback) const;
};

/** \brief Equality operator for rules
 */
bool operator==(const Rule&, const Rule&);

}

#endif // CRITERIA_RULE_HH_
