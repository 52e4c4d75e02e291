#include "bridge/Auction.hh"
#include "bridge/Hand.hh"
#include "bridge/Position.hh"
#include "engine/BiddingSystem.hh"
#include "main/BidderMain.hh"
#include "main/Config.hh"
#include "messaging/AuctionJsonSerializer.hh"
#include "messaging/BiddingSystemJsonSerializer.hh"
#include "messaging/JsonSerializer.hh"
#include "Logging.hh"

#include <getopt.h>

#include <array>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace {

using namespace BidEngine;

constexpr auto USAGE =
    "usage: %s [-c CONFIG] [-s SYSTEM] [-d DEALER] [-j] [-v]... NORTH SOUTH\n";

struct Options {
    std::string configPath;
    std::optional<std::string> systemPath;
    std::optional<Position> dealer;
    bool json {false};
    int verbosity {0};
    std::string north;
    std::string south;
};

int usage(const char* program)
{
    std::fprintf(stderr, USAGE, program);
    return EXIT_FAILURE;
}

std::optional<Options> parseOptions(int argc, char* argv[])
{
    auto options = Options {};

    const auto short_opt = "c:s:d:jv";
    auto long_opt = std::array {
        option { "config", required_argument, 0, 'c' },
        option { "system", required_argument, 0, 's' },
        option { "dealer", required_argument, 0, 'd' },
        option { "json", no_argument, 0, 'j' },
        option { "verbose", no_argument, 0, 'v' },
        option { nullptr, 0, 0, 0 },
    };
    auto opt_index = 0;
    while (true) {
        auto c = getopt_long(
            argc, argv, short_opt, long_opt.data(), &opt_index);
        if (c == -1) {
            break;
        } else if (c == 'c') {
            options.configPath = optarg;
        } else if (c == 's') {
            options.systemPath = optarg;
        } else if (c == 'd') {
            options.dealer = positionFromString(optarg);
            if (!options.dealer) {
                std::cerr << argv[0] << ": invalid dealer: " << optarg
                          << std::endl;
                return std::nullopt;
            }
        } else if (c == 'j') {
            options.json = true;
        } else if (c == 'v') {
            ++options.verbosity;
        } else {
            return std::nullopt;
        }
    }

    if (argc - optind != 2) {
        return std::nullopt;
    }
    options.north = argv[optind];
    options.south = argv[optind + 1];
    return options;
}

}

int bidder_main(int argc, char* argv[])
{
    const auto options = parseOptions(argc, argv);
    if (!options) {
        return usage(argv[0]);
    }

    setupLogging(getLogLevel(options->verbosity), std::cerr);

    const auto config = Main::configFromPath(options->configPath);
    if (const auto level = config.getLogLevel();
        level && options->verbosity == 0) {
        setupLogging(*level, std::cerr);
    }

    const auto system_path = options->systemPath.value_or(
        std::string {config.getSystemPath().value_or(BIDENGINE_DEFAULT_SYSTEM)});
    const auto dealer = options->dealer.value_or(config.getDealer());

    auto north = std::optional<Hand> {};
    auto south = std::optional<Hand> {};
    try {
        north.emplace(handFromString(options->north));
        south.emplace(handFromString(options->south));
    } catch (const std::invalid_argument& e) {
        log(LogLevel::ERROR, "Invalid hand: %s", e.what());
        std::cerr << argv[0] << ": invalid hand: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    const auto app = Main::BidderMain {
        Messaging::biddingSystemFromPath(system_path)};
    auto auction = Auction {dealer};
    app.bid(*north, *south, auction);

    if (options->json) {
        std::cout << Messaging::JsonSerializer::serialize(auction, 4) << std::endl;
    } else {
        std::cout << auction << std::endl;
    }
    return EXIT_SUCCESS;
}
