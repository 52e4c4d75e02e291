#include "bridge/Auction.hh"

#include "bridge/BridgeConstants.hh"
#include "Exceptions.hh"
#include "Logging.hh"
#include "Utility.hh"

#include <ostream>
#include <string_view>

namespace BidEngine {

Auction::Auction(const Position dealer) :
    dealer {dealer}
{
}

void Auction::addCall(const Call& call)
{
    if (hasEnded()) {
        throw AuctionAlreadyOverException {"Auction has already ended"};
    }
    if (const auto bid = getBid(call)) {
        const auto highest_bid = getHighestBid();
        if (highest_bid && *bid < *highest_bid) {
            throw InsufficientBidException {"Bid lower than the highest bid"};
        }
    }
    log(LogLevel::DEBUG, "Auction: %s calls %s", getPositionInTurn(),
        toShortString(call));
    calls.emplace_back(call);
}

void Auction::allPass()
{
    while (!hasEnded()) {
        addCall(Pass {});
    }
}

Position Auction::getDealer() const
{
    return dealer;
}

Position Auction::getPositionInTurn() const
{
    return clockwise(dealer, getNumberOfCalls());
}

int Auction::getNumberOfCalls() const
{
    return ssize(calls);
}

const Call& Auction::getCall(const int n) const
{
    return calls[checkIndex(n, ssize(calls))];
}

const std::vector<Call>& Auction::getCalls() const
{
    return calls;
}

bool Auction::hasOpened() const
{
    return static_cast<bool>(getHighestBid());
}

bool Auction::hasEnded() const
{
    const auto n_calls = getNumberOfCalls();
    if (n_calls < N_PLAYERS) {
        return false;
    }
    for (const auto n : from_to(n_calls - N_CLOSING_PASSES, n_calls)) {
        if (getBid(calls[n])) {
            return false;
        }
    }
    return true;
}

std::optional<Bid> Auction::getHighestBid() const
{
    for (auto iter = calls.rbegin(); iter != calls.rend(); ++iter) {
        if (const auto bid = getBid(*iter)) {
            return *bid;
        }
    }
    return std::nullopt;
}

std::optional<std::optional<Bid>> Auction::getFinalContract() const
{
    if (hasEnded()) {
        return getHighestBid();
    }
    return std::nullopt;
}

std::optional<std::optional<Position>> Auction::getDeclarerPosition() const
{
    if (!hasEnded()) {
        return std::nullopt;
    }
    const auto contract = getHighestBid();
    if (!contract) {
        return std::optional<Position> {};
    }
    auto contract_bidder = dealer;
    for (const auto& [position, call] : *this) {
        if (getBid(call)) {
            contract_bidder = position;
        }
    }
    // The declarer is the first player of the contract partnership who bid
    // the strain of the contract
    for (const auto& [position, call] : *this) {
        const auto bid = getBid(call);
        if (bid && bid->strain == contract->strain &&
            (position == contract_bidder ||
             position == partnerFor(contract_bidder))) {
            return std::optional<Position> {position};
        }
    }
    return std::optional<Position> {};
}

std::ostream& operator<<(std::ostream& os, const Auction& auction)
{
    using namespace std::string_view_literals;
    auto separator = ""sv;
    for (const auto& call : auction.getCalls()) {
        os << separator << toShortString(call);
        separator = " "sv;
    }
    return os;
}

}
