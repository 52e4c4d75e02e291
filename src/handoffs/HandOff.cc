#include "handoffs/HandOff.hh"

#include "bridge/Auction.hh"
#include "Logging.hh"

namespace BidEngine {

HandOff::~HandOff() = default;

void HandOff::bid(const Hands& hands, Auction& auction) const
{
    log(LogLevel::DEBUG, "Hand-off starts after: %s", auction);
    handleBid(hands, auction);
    log(LogLevel::DEBUG, "Hand-off done: %s", auction);
}

}
