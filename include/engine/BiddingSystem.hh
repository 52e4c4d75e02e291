/** \file
 *
 * \brief Definition of BidEngine::Engine::BidNode and
 * BidEngine::Engine::BiddingSystem structs
 */

#ifndef ENGINE_BIDDINGSYSTEM_HH_
#define ENGINE_BIDDINGSYSTEM_HH_

#include "bridge/Call.hh"
#include "criteria/Rule.hh"

#include <optional>
#include <string>
#include <vector>

namespace BidEngine {
namespace Engine {

/** \brief Node in the decision tree of a bidding system
 *
 * A node describes a call and the rules that must all hold for the hand of the
 * player in turn to make it. The responses are the nodes considered for the
 * partner after the call. If the node names a hand-off, the hand-off bids the
 * auction after the call is made.
 */
struct BidNode {
    Call call;                            ///< \brief The call
    std::vector<Rule> criteria;           ///< \brief Rules guarding the call
    std::vector<BidNode> responses;       ///< \brief Responses to the call
    std::optional<std::string> handOff;   ///< \brief Name of the hand-off
};

/** \brief Equality operator for bid nodes
 */
bool operator==(const BidNode&, const BidNode&);

/** \brief Bidding system
 *
 * A bidding system is a decision tree whose roots are the opening bids.
 */
struct BiddingSystem {
    std::string name;            ///< \brief The name of the system
    std::vector<BidNode> bids;   ///< \brief The opening bids
};

/** \brief Equality operator for bidding systems
 */
bool operator==(const BiddingSystem&, const BiddingSystem&);

}
}

#endif // ENGINE_BIDDINGSYSTEM_HH_
