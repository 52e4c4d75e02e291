/** \file
 *
 * \brief Definition of BidEngine::HandOffRegistry class
 */

#ifndef HANDOFFS_HANDOFFREGISTRY_HH_
#define HANDOFFS_HANDOFFREGISTRY_HH_

#include <boost/core/noncopyable.hpp>

#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace BidEngine {

class HandOff;

/** \brief Registry of named hand-offs
 *
 * Hand-off names are case insensitive: “CONFI” and “confi” refer to the same
 * hand-off. The registry is populated when the application starts and only
 * read afterwards.
 *
 * \sa registerBuiltinHandOffs()
 */
class HandOffRegistry : private boost::noncopyable {
public:

    /** \brief Register hand-off
     *
     * \param name the name bidding systems use to refer to the hand-off
     * \param handOff the hand-off
     *
     * \throw DuplicateNameException if a hand-off with the same name is
     * already registered
     * \throw std::invalid_argument if \p handOff is null
     */
    void addHandOff(std::string_view name, std::shared_ptr<const HandOff> handOff);

    /** \brief Determine if a hand-off is registered
     *
     * \param name the name of the hand-off
     */
    bool containsHandOff(std::string_view name) const;

    /** \brief Retrieve a hand-off
     *
     * \param name the name of the hand-off
     *
     * \return the hand-off registered under \p name
     *
     * \throw UnknownHandOffException if no hand-off is registered under \p
     * name
     */
    const HandOff& getHandOff(std::string_view name) const;

private:

    std::map<std::string, std::shared_ptr<const HandOff>> handOffs;
};

/** \brief Register the built-in hand-offs
 *
 * The CONFI convention is registered under the name “confi”.
 *
 * \param registry the registry the hand-offs are added to
 *
 * \throw DuplicateNameException if \p registry already contains a hand-off
 * with the name of a built-in hand-off
 */
void registerBuiltinHandOffs(HandOffRegistry& registry);

}

#endif // HANDOFFS_HANDOFFREGISTRY_HH_
