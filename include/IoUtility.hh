/** \file
 *
 * \brief Definition of stream utilities shared by the bidder
 *
 * The stream operators are needed to log optional bids and calls, which are
 * variants.
 */

#ifndef IOUTILITY_HH_
#define IOUTILITY_HH_

#include <fstream>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace BidEngine {

/** \brief Path that stands for the standard input
 */
inline constexpr std::string_view STDIN_PATH {"-"};

/** \brief Write an optional value, or “(none)” if it is empty
 */
template<typename T>
std::ostream& operator<<(std::ostream& os, const std::optional<T>& t)
{
    return t ? (os << *t) : (os << "(none)");
}

/** \brief Write the alternative held by a variant
 */
template<typename T, typename... Ts>
std::ostream& operator<<(std::ostream& os, const std::variant<T, Ts...>& t)
{
    std::visit([&os](const auto& v) { os << v; }, t);
    return os;
}

/** \brief Invoke a callback with the input stream named by a path
 *
 * \ref STDIN_PATH reads from \c std::cin. Any other path is opened as a file
 * for the duration of the call. A file that cannot be opened is passed in
 * failed state, and the callback decides how to report it.
 *
 * \param path a file path or \ref STDIN_PATH
 * \param callback a callable accepting \c std::istream&
 *
 * \return the value returned by \p callback
 */
template<typename Callable>
decltype(auto) processStreamFromPath(
    const std::string_view path, Callable&& callback)
{
    if (path == STDIN_PATH) {
        return std::invoke(std::forward<Callable>(callback), std::cin);
    }
    auto in = std::ifstream {std::string {path}};
    return std::invoke(std::forward<Callable>(callback), in);
}

}

#endif // IOUTILITY_HH_
