#include "Exceptions.hh"
#include "Logging.hh"
#include "messaging/SerializationFailureException.hh"

#include <boost/core/demangle.hpp>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <typeinfo>

int bidder_main(int argc, char* argv[]);

int main(int argc, char* argv[])
{
    try {
        return bidder_main(argc, argv);
    } catch (const BidEngine::ConfigurationException& e) {
        log(BidEngine::LogLevel::ERROR, "Invalid bidding system: %s", e.what());
        std::cerr << argv[0] << ": " << e.what() << std::endl;
    } catch (const BidEngine::Messaging::SerializationFailureException& e) {
        log(BidEngine::LogLevel::ERROR, "Invalid bidding system file: %s",
            e.what());
        std::cerr << argv[0] << ": " << e.what() << std::endl;
    } catch (const std::exception& e) {
        log(
            BidEngine::LogLevel::FATAL,
            "%s terminated with exception of type %s: %s",
            argv[0], boost::core::demangle(typeid(e).name()), e.what());
    }
    return EXIT_FAILURE;
}
