#include "handoffs/ConfiHandOff.hh"

#include "bridge/Auction.hh"
#include "bridge/BridgeConstants.hh"
#include "bridge/PointEvaluator.hh"
#include "bridge/Suit.hh"
#include "Exceptions.hh"
#include "Logging.hh"

#include <boost/statechart/custom_reaction.hpp>
#include <boost/statechart/event.hpp>
#include <boost/statechart/simple_state.hpp>
#include <boost/statechart/state_machine.hpp>

#include <algorithm>
#include <array>
#include <optional>
#include <utility>

namespace BidEngine {

namespace {

namespace sc = boost::statechart;

constexpr auto EXPECTED_MINIMUM_CONTROLS =
    ConfiHandOff::EXPECTED_MINIMUM_CONTROLS;
constexpr auto SLAM_TRY_CONTROLS = ConfiHandOff::SLAM_TRY_CONTROLS;
constexpr auto CORRECTED_SLAM_TRY_CONTROLS =
    ConfiHandOff::CORRECTED_SLAM_TRY_CONTROLS;
constexpr auto SLAM_LEVEL = ConfiHandOff::SLAM_LEVEL;
constexpr auto LONG_SUIT_LENGTH = 6;

////////////////////////////////////////////////////////////////////////////////
// Events
////////////////////////////////////////////////////////////////////////////////

// Each phase posts this to move to the next phase
class AdvanceEvent : public sc::event<AdvanceEvent> {};

////////////////////////////////////////////////////////////////////////////////
// Signaling state
////////////////////////////////////////////////////////////////////////////////

// Suit flags are indexed by suitOrder()
using SuitFlags = std::array<bool, N_SUITS>;

struct SeatSignals {
    SuitFlags deniedFour {};
    SuitFlags showedFour {};
    SuitFlags showedFive {};
    SuitFlags showedThree {};
};

////////////////////////////////////////////////////////////////////////////////
// ConfiMachine
////////////////////////////////////////////////////////////////////////////////

class ControlStep;

class ConfiMachine : public sc::state_machine<ConfiMachine, ControlStep> {
public:

    ConfiMachine(const Hands& hands, Auction& auction);

    Position getOpener() const;
    Position getBidder() const;
    bool isOpenersTurn() const;
    const Hand& getBidderHand() const;
    int getControls(Position position) const;
    int getPartnershipControls() const;
    SeatSignals& getSignals(Position position);
    bool takeOpenersFirstRebid();

    Bid getCurrentBid() const;
    Bid getSignoffBid() const;
    Bid getNextBid(const Bid& bid) const;

    void commit(const Bid& bid);
    void bidSlam(Suit suit);
    void passOut();

    template<typename Predicate>
    bool showSuit(bool sameLevelOnly, Predicate&& shouldShow);

private:

    const Hands& hands;
    Auction& auction;
    const Position opener;
    std::array<SeatSignals, 2> signals;
    bool openersFirstRebid {true};
};

ConfiMachine::ConfiMachine(const Hands& hands, Auction& auction) :
    hands {hands},
    auction {auction},
    opener {auction.getPositionInTurn()}
{
}

Position ConfiMachine::getOpener() const
{
    return opener;
}

Position ConfiMachine::getBidder() const
{
    return auction.getPositionInTurn();
}

bool ConfiMachine::isOpenersTurn() const
{
    return getBidder() == opener;
}

const Hand& ConfiMachine::getBidderHand() const
{
    return handFor(hands, getBidder());
}

int ConfiMachine::getControls(const Position position) const
{
    return CONTROL_EVALUATOR(handFor(hands, position));
}

int ConfiMachine::getPartnershipControls() const
{
    // The opener is assumed to hold at least the expected minimum until the
    // correction, so the step responses are interpreted the same way
    return std::max(getControls(opener), EXPECTED_MINIMUM_CONTROLS) +
        getControls(partnerFor(opener));
}

SeatSignals& ConfiMachine::getSignals(const Position position)
{
    return signals[position == opener ? 0 : 1];
}

bool ConfiMachine::takeOpenersFirstRebid()
{
    if (isOpenersTurn() && openersFirstRebid) {
        openersFirstRebid = false;
        return true;
    }
    return false;
}

Bid ConfiMachine::getCurrentBid() const
{
    const auto bid = auction.getHighestBid();
    if (!bid) {
        throw NoCurrentBidException {
            "CONFI cannot step from an auction without bids"};
    }
    return *bid;
}

Bid ConfiMachine::getSignoffBid() const
{
    const auto bid = auction.getHighestBid();
    if (!bid) {
        throw NoSignoffAvailableException {
            "CONFI cannot sign off in an auction without bids"};
    }
    return *bid;
}

Bid ConfiMachine::getNextBid(const Bid& bid) const
{
    const auto next_bid = nextHigherBid(bid);
    if (!next_bid) {
        throw BidSpaceExhaustedException {"No bid higher than 7NT"};
    }
    return *next_bid;
}

void ConfiMachine::commit(const Bid& bid)
{
    auction.addCall(bid);
    auction.addCall(Pass {});
}

void ConfiMachine::bidSlam(const Suit suit)
{
    log(LogLevel::DEBUG, "CONFI: %s bids slam in %s", getBidder(), suit);
    auction.addCall(Bid {SLAM_LEVEL, strainFor(suit)});
    passOut();
}

void ConfiMachine::passOut()
{
    auction.allPass();
}

// Scans the next four suit bids below the slam level and commits the first one
// the predicate accepts
template<typename Predicate>
bool ConfiMachine::showSuit(const bool sameLevelOnly, Predicate&& shouldShow)
{
    const auto current_bid = getCurrentBid();
    auto bid = current_bid;
    for (auto n = 0; n < N_SUITS; ++n) {
        bid = getNextBid(bid);
        if (bid.strain == Strains::NO_TRUMP) {
            bid = getNextBid(bid);
        }
        if (sameLevelOnly && bid.level > current_bid.level) {
            break;
        }
        if (bid.level >= SLAM_LEVEL) {
            break;
        }
        const auto suit = suitFor(bid.strain);
        if (suit && shouldShow(*suit)) {
            log(LogLevel::DEBUG, "CONFI: %s shows %s with %s", getBidder(),
                *suit, bid);
            commit(bid);
            return true;
        }
    }
    return false;
}

////////////////////////////////////////////////////////////////////////////////
// ControlStep
////////////////////////////////////////////////////////////////////////////////

class SufficiencyCheck;

class ControlStep : public sc::simple_state<ControlStep, ConfiMachine> {
public:
    using reactions = sc::custom_reaction<AdvanceEvent>;
    sc::result react(const AdvanceEvent&);
};

sc::result ControlStep::react(const AdvanceEvent&)
{
    auto& context = outermost_context();
    const auto controls = context.getControls(context.getOpener());
    const auto steps = std::max(controls - EXPECTED_MINIMUM_CONTROLS, 0) + 1;
    auto bid = context.getCurrentBid();
    for (auto n = 0; n < steps; ++n) {
        bid = context.getNextBid(bid);
    }
    log(LogLevel::DEBUG, "CONFI: %s has %d controls, shows them with %s",
        context.getOpener(), controls, bid);
    context.commit(bid);
    post_event(AdvanceEvent {});
    return transit<SufficiencyCheck>();
}

////////////////////////////////////////////////////////////////////////////////
// SufficiencyCheck
////////////////////////////////////////////////////////////////////////////////

class MinimumCorrection;

class SufficiencyCheck : public sc::simple_state<SufficiencyCheck, ConfiMachine> {
public:
    using reactions = sc::custom_reaction<AdvanceEvent>;
    sc::result react(const AdvanceEvent&);
};

sc::result SufficiencyCheck::react(const AdvanceEvent&)
{
    auto& context = outermost_context();
    const auto controls = context.getPartnershipControls();
    if (controls < SLAM_TRY_CONTROLS) {
        log(LogLevel::DEBUG, "CONFI: %d controls, signing off", controls);
        context.commit(cheapestNoTrumpFrom(context.getSignoffBid()));
        context.passOut();
        return terminate();
    }
    post_event(AdvanceEvent {});
    return transit<MinimumCorrection>();
}

////////////////////////////////////////////////////////////////////////////////
// MinimumCorrection
////////////////////////////////////////////////////////////////////////////////

class LongSuitCheck;

class MinimumCorrection :
    public sc::simple_state<MinimumCorrection, ConfiMachine> {
public:
    using reactions = sc::custom_reaction<AdvanceEvent>;
    sc::result react(const AdvanceEvent&);
};

sc::result MinimumCorrection::react(const AdvanceEvent&)
{
    auto& context = outermost_context();
    if (context.takeOpenersFirstRebid() &&
        context.getControls(context.getOpener()) < EXPECTED_MINIMUM_CONTROLS) {
        const auto current_bid = context.getCurrentBid();
        if (current_bid.strain == Strains::NO_TRUMP) {
            context.passOut();
            return terminate();
        }
        log(LogLevel::DEBUG, "CONFI: %s corrects the control count",
            context.getOpener());
        context.commit(cheapestNoTrumpFrom(current_bid));
        if (context.getPartnershipControls() < CORRECTED_SLAM_TRY_CONTROLS) {
            context.passOut();
            return terminate();
        }
    }
    post_event(AdvanceEvent {});
    return transit<LongSuitCheck>();
}

////////////////////////////////////////////////////////////////////////////////
// LongSuitCheck
////////////////////////////////////////////////////////////////////////////////

class FitSearch;

class LongSuitCheck : public sc::simple_state<LongSuitCheck, ConfiMachine> {
public:
    using reactions = sc::custom_reaction<AdvanceEvent>;
    sc::result react(const AdvanceEvent&);
};

sc::result LongSuitCheck::react(const AdvanceEvent&)
{
    auto& context = outermost_context();
    if (context.isOpenersTurn()) {
        const auto& hand = context.getBidderHand();
        for (const auto suit : SUITS_IN_WRITING_ORDER) {
            if (hand.getLength(suit) >= LONG_SUIT_LENGTH) {
                context.bidSlam(suit);
                return terminate();
            }
        }
    }
    post_event(AdvanceEvent {});
    return transit<FitSearch>();
}

////////////////////////////////////////////////////////////////////////////////
// FitSearch
////////////////////////////////////////////////////////////////////////////////

class SuitCascade;

class FitSearch : public sc::simple_state<FitSearch, ConfiMachine> {
public:
    using reactions = sc::custom_reaction<AdvanceEvent>;
    sc::result react(const AdvanceEvent&);
};

sc::result FitSearch::react(const AdvanceEvent&)
{
    auto& context = outermost_context();
    const auto& hand = context.getBidderHand();
    const auto& partner_signals =
        context.getSignals(partnerFor(context.getBidder()));
    // Fits are found in this order: partner's four card suit, partner's five
    // card suit, partner's three card support
    const auto fits = std::array {
        std::make_pair(&SeatSignals::showedFour, 4),
        std::make_pair(&SeatSignals::showedFive, 3),
        std::make_pair(&SeatSignals::showedThree, 5),
    };
    for (const auto& [flags, required_length] : fits) {
        for (const auto suit : SUITS_IN_WRITING_ORDER) {
            if ((partner_signals.*flags)[suitOrder(suit)] &&
                hand.getLength(suit) >= required_length) {
                context.bidSlam(suit);
                return terminate();
            }
        }
    }
    post_event(AdvanceEvent {});
    return transit<SuitCascade>();
}

////////////////////////////////////////////////////////////////////////////////
// SuitCascade
////////////////////////////////////////////////////////////////////////////////

class Signoff;

class SuitCascade : public sc::simple_state<SuitCascade, ConfiMachine> {
public:
    using reactions = sc::custom_reaction<AdvanceEvent>;
    sc::result react(const AdvanceEvent&);
};

sc::result SuitCascade::react(const AdvanceEvent&)
{
    auto& context = outermost_context();
    const auto bidder = context.getBidder();
    const auto& hand = context.getBidderHand();
    auto& signals = context.getSignals(bidder);
    const auto& partner_signals = context.getSignals(partnerFor(bidder));

    const auto show_four = [&](const auto suit)
    {
        const auto n = suitOrder(suit);
        if (hand.getLength(suit) < 4) {
            signals.deniedFour[n] = true;
            return false;
        }
        if (partner_signals.deniedFour[n] || signals.showedFour[n]) {
            return false;
        }
        signals.showedFour[n] = true;
        return true;
    };

    const auto show_five = [&](const auto suit)
    {
        const auto n = suitOrder(suit);
        if (hand.getLength(suit) < 5 || signals.showedFive[n]) {
            return false;
        }
        signals.showedFive[n] = true;
        return true;
    };

    const auto show_three = [&](const auto suit)
    {
        const auto n = suitOrder(suit);
        if (hand.getLength(suit) < 3 || signals.showedThree[n] ||
            !partner_signals.showedFour[n]) {
            return false;
        }
        signals.showedThree[n] = true;
        return true;
    };

    if (context.showSuit(false, show_four) ||
        context.showSuit(false, show_five) ||
        context.showSuit(true, show_three)) {
        post_event(AdvanceEvent {});
        return transit<MinimumCorrection>();
    }
    post_event(AdvanceEvent {});
    return transit<Signoff>();
}

////////////////////////////////////////////////////////////////////////////////
// Signoff
////////////////////////////////////////////////////////////////////////////////

class Signoff : public sc::simple_state<Signoff, ConfiMachine> {
public:
    using reactions = sc::custom_reaction<AdvanceEvent>;
    sc::result react(const AdvanceEvent&);
};

sc::result Signoff::react(const AdvanceEvent&)
{
    auto& context = outermost_context();
    const auto current_bid = context.getSignoffBid();
    if (current_bid.strain == Strains::NO_TRUMP) {
        log(LogLevel::DEBUG, "CONFI: %s passes %s", context.getBidder(),
            current_bid);
        context.passOut();
        return terminate();
    }
    log(LogLevel::DEBUG, "CONFI: %s signs off", context.getBidder());
    context.commit(cheapestNoTrumpFrom(current_bid));
    post_event(AdvanceEvent {});
    return transit<MinimumCorrection>();
}

}

void ConfiHandOff::handleBid(const Hands& hands, Auction& auction) const
{
    ConfiMachine machine {hands, auction};
    machine.initiate();
    machine.process_event(AdvanceEvent {});
}

}
