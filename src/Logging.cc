#include "Logging.hh"

#include <array>
#include <cctype>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <string>
#include <utility>

namespace BidEngine {

namespace {

using namespace std::string_view_literals;

// Indexed by LogLevel
constexpr auto LOG_LEVEL_NAMES = std::array {
    "none"sv, "fatal"sv, "error"sv, "warning"sv, "info"sv, "debug"sv,
};

auto globalLoggingStream = std::ref(std::cerr);
auto globalLoggingLevel = LogLevel::WARNING;

}

namespace Impl {

bool shouldLog(const LogLevel level)
{
    if (level == LogLevel::NONE || level > globalLoggingLevel) {
        return false;
    }
    const auto time = std::time(nullptr);
    auto name = std::string {
        LOG_LEVEL_NAMES[static_cast<std::size_t>(level)]};
    for (auto& c : name) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    logStream() << std::put_time(std::localtime(&time), "%F %T ")
        << std::left << std::setw(8) << name << std::right;
    return true;
}

std::ostream& logStream()
{
    return globalLoggingStream;
}

}

LogLevel getLogLevel(const int verbosity)
{
    if (verbosity >= 2) {
        return LogLevel::DEBUG;
    } else if (verbosity == 1) {
        return LogLevel::INFO;
    }
    return LogLevel::WARNING;
}

std::optional<LogLevel> logLevelFromString(const std::string_view name)
{
    for (auto n = std::size_t {}; n < LOG_LEVEL_NAMES.size(); ++n) {
        if (LOG_LEVEL_NAMES[n] == name) {
            return static_cast<LogLevel>(n);
        }
    }
    return std::nullopt;
}

void setupLogging(const LogLevel level, std::ostream& stream)
{
    globalLoggingLevel = level;
    globalLoggingStream = stream;
}

}
