#include "engine/Director.hh"

#include "bridge/Auction.hh"
#include "criteria/CriteriaRegistry.hh"
#include "engine/BiddingSystem.hh"
#include "handoffs/HandOff.hh"
#include "handoffs/HandOffRegistry.hh"
#include "Exceptions.hh"
#include "Logging.hh"

#include <boost/format.hpp>

#include <algorithm>

namespace BidEngine {
namespace Engine {

Director::Director(
    const BiddingSystem& system, const CriteriaRegistry& criteria,
    const HandOffRegistry& handOffs) :
    system {system},
    criteria {criteria},
    handOffs {handOffs}
{
    validate(system.bids);
    log(LogLevel::DEBUG, "Director: bidding system %s validated", system.name);
}

std::vector<Call> Director::bid(
    const Hand& north, const Hand& south, const Position dealer) const
{
    auto hands = Hands {};
    hands[positionOrder(Positions::NORTH)] = &north;
    hands[positionOrder(Positions::SOUTH)] = &south;
    auto auction = Auction {dealer};
    run(hands, auction);
    log(LogLevel::INFO, "Auction: %s", auction);
    return auction.getCalls();
}

void Director::run(const Hands& hands, Auction& auction) const
{
    while (!auction.hasEnded() &&
           !hands[positionOrder(auction.getPositionInTurn())]) {
        auction.addCall(Pass {});
    }
    const auto* nodes = &system.bids;
    while (!auction.hasEnded()) {
        if (nodes->empty()) {
            log(LogLevel::DEBUG, "Director: end of bidding tree");
            auction.allPass();
            break;
        }
        const auto position = auction.getPositionInTurn();
        const auto node = findNode(*nodes, handFor(hands, position), auction);
        if (!node) {
            log(LogLevel::DEBUG, "Director: no bid applies for %s", position);
            auction.allPass();
            break;
        }
        log(LogLevel::DEBUG, "Director: %s bids %s", position,
            toShortString(node->call));
        auction.addCall(node->call);
        auction.addCall(Pass {});
        if (node->handOff) {
            handOffs.getHandOff(*node->handOff).bid(hands, auction);
        }
        nodes = &node->responses;
    }
}

void Director::validate(const std::vector<BidNode>& nodes) const
{
    for (const auto& node : nodes) {
        if (node.criteria.empty()) {
            throw MissingCriteriaException {
                boost::str(
                    boost::format("No criteria for %s in system “%s”")
                    % toShortString(node.call) % system.name)};
        }
        for (const auto& rule : node.criteria) {
            criteria.validate(rule);
        }
        if (node.handOff && !handOffs.containsHandOff(*node.handOff)) {
            throw UnknownHandOffException {
                boost::str(
                    boost::format("Unknown hand-off “%s” for %s")
                    % *node.handOff % toShortString(node.call))};
        }
        validate(node.responses);
    }
}

const BidNode* Director::findNode(
    const std::vector<BidNode>& nodes, const Hand& hand,
    const Auction& auction) const
{
    const auto iter = std::find_if(
        nodes.begin(), nodes.end(),
        [this, &hand, &auction](const auto& node)
        {
            return criteria.check(node.criteria, hand, auction);
        });
    return iter != nodes.end() ? &(*iter) : nullptr;
}

}
}
