#include "engine/BiddingSystem.hh"

#include <tuple>

namespace BidEngine {
namespace Engine {

bool operator==(const BidNode& lhs, const BidNode& rhs)
{
    return std::tie(lhs.call, lhs.criteria, lhs.responses, lhs.handOff) ==
        std::tie(rhs.call, rhs.criteria, rhs.responses, rhs.handOff);
}

bool operator==(const BiddingSystem& lhs, const BiddingSystem& rhs)
{
    return std::tie(lhs.name, lhs.bids) == std::tie(rhs.name, rhs.bids);
}

}
}
