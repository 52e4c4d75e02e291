/** \file
 *
 * \brief Definition of BidEngine::Main::Config class
 */

#ifndef MAIN_CONFIG_HH_
#define MAIN_CONFIG_HH_

#include "bridge/Position.hh"
#include "Logging.hh"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string_view>

namespace BidEngine {
namespace Main {

/** \brief Configuration file processing utility
 *
 * The configuration file is a Lua script. The following global variables are
 * recognized after the script has been run:
 *
 * - \c system: the path of the bidding system file
 * - \c dealer: the dealer, either the name of a position or its initial
 *   (default north)
 * - \c log_level: the minimum logging level, e.g. "info" or "debug"
 *
 * \code{.lua}
 * system = "systems/kokish.json"
 * dealer = "south"
 * log_level = "info"
 * \endcode
 */
class Config {
public:

    /** \brief Create default configs
     */
    Config();

    /** \brief Create configuration from stream
     *
     * The constructor reads configuration script from stream \p in and
     * processes it. The processing involves reading the stream until EOF,
     * parsing the contents as Lua script and running the script.
     *
     * \throw std::runtime_error if reading the stream or processing the
     * script fails, or a variable has an invalid value
     */
    Config(std::istream& in);

    /** \brief Move constructor
     */
    Config(Config&&);

    ~Config();

    /** \brief Move assignment
     */
    Config& operator=(Config&&);

    /** \brief Get the path of the bidding system
     *
     * \return the path of the bidding system file, or none if the
     * configuration does not specify one
     */
    std::optional<std::string_view> getSystemPath() const;

    /** \brief Get the dealer
     */
    Position getDealer() const;

    /** \brief Get the logging level
     *
     * \return the logging level, or none if the configuration does not
     * specify one
     */
    std::optional<LogLevel> getLogLevel() const;

private:

    class Impl;
    std::unique_ptr<const Impl> impl;
};

/** \brief Create configuration from file
 *
 * Depending on the value the \p path, the function generates the config object
 * in different ways:
 * - If \p path is empty, default configuration is returned
 * - If \p path is hyphen (“-”), configuration is read from stdin
 * - Otherwise \p path is interpreted as path to the configuration file
 *
 * \param path the path of the configuration file
 *
 * \return config object based on the file
 *
 * \throw std::runtime_error if the configuration cannot be processed
 */
Config configFromPath(std::string_view path);

}
}

#endif // MAIN_CONFIG_HH_
