/** \file
 *
 * \brief Logging utilities
 */

#ifndef LOGGING_HH_
#define LOGGING_HH_

#include "IoUtility.hh"

#include <optional>
#include <ostream>
#include <string_view>

namespace BidEngine {

/** \brief Log level
 *
 * \sa setupLogging(), log()
 */
enum class LogLevel {
    NONE,     ///< No logging
    FATAL,    ///< Errors that terminate the bidder
    ERROR,    ///< Invalid input that is reported to the user
    WARNING,  ///< Unexpected concerning events
    INFO,     ///< Loaded systems and finished auctions
    DEBUG     ///< Every decision taken while bidding
};

/// \cond DOXYGEN_IGNORE
/// These are helpers for implementing log()

namespace Impl {

bool shouldLog(LogLevel level);
std::ostream& logStream();

inline void writeFormatted(std::ostream& os, std::string_view format)
{
    auto pos = format.find("%%");
    while (pos != std::string_view::npos) {
        os << format.substr(0, pos + 1);
        format.remove_prefix(pos + 2);
        pos = format.find("%%");
    }
    os << format;
}

template<typename First, typename... Rest>
void writeFormatted(
    std::ostream& os, const std::string_view format, const First& arg,
    const Rest&... rest)
{
    const auto pos = format.find('%');
    if (pos == std::string_view::npos || pos + 1 == format.size()) {
        os << format.substr(0, pos);
        return;
    }
    os << format.substr(0, pos);
    if (format[pos + 1] == '%') {
        os << '%';
        writeFormatted(os, format.substr(pos + 2), arg, rest...);
        return;
    }
    {
        // Optionals and variants from the std namespace are only found
        // through this declaration
        using BidEngine::operator<<;
        os << arg;
    }
    writeFormatted(os, format.substr(pos + 2), rest...);
}

}

/// \endcond

/** \brief Write a log record
 *
 * The record is written if \p level is enabled by setupLogging(). Each \c %
 * and the character following it in \p format is replaced by the next value
 * of \p ts written with \c operator<<, so \c %s and \c %d are interchangeable.
 * \c %% writes a literal percent sign. Values without a placeholder are
 * ignored.
 *
 * \note Not thread safe. The bidder logs from a single thread.
 *
 * \param level the logging level
 * \param format the formatting string
 * \param ts the values written to the placeholders in \p format
 */
template<typename... Ts>
void log(const LogLevel level, const std::string_view format, const Ts&... ts)
{
    if (Impl::shouldLog(level)) {
        auto& os = Impl::logStream();
        Impl::writeFormatted(os, format, ts...);
        os << '\n';
    }
}

/** \brief Map the number of -v options to a logging level
 *
 * \return LogLevel::WARNING for 0, LogLevel::INFO for 1 and LogLevel::DEBUG
 * for more
 */
LogLevel getLogLevel(int verbosity);

/** \brief Parse logging level from its name
 *
 * The names are the lowercase names of the enumerators, e.g. “warning” or
 * “debug”, as written in configuration files.
 *
 * \return the logging level, or none if \p name does not name a level
 */
std::optional<LogLevel> logLevelFromString(std::string_view name);

/** \brief Set the minimum logging level and the log stream
 *
 * Before the first call the level is LogLevel::WARNING and the stream is
 * std::cerr. The caller keeps \p stream alive until logging is redirected.
 *
 * \param level the minimum logging level that causes log to be output, or
 * LogLevel::NONE to disable logging
 * \param stream the output stream for log records
 */
void setupLogging(LogLevel level, std::ostream& stream);

}

#endif // LOGGING_HH_
