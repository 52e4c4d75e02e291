#include "main/BidderMain.hh"

#include "bridge/Auction.hh"
#include "bridge/Hand.hh"
#include "criteria/BuiltinCriteria.hh"
#include "criteria/CriteriaRegistry.hh"
#include "engine/BiddingSystem.hh"
#include "engine/Director.hh"
#include "handoffs/HandOffRegistry.hh"
#include "Logging.hh"

#include <optional>
#include <utility>

namespace BidEngine {
namespace Main {

class BidderMain::Impl {
public:

    explicit Impl(Engine::BiddingSystem system);

    const Engine::Director& getDirector() const;
    const Engine::BiddingSystem& getSystem() const;

private:

    const Engine::BiddingSystem system;
    CriteriaRegistry criteria;
    HandOffRegistry handOffs;
    std::optional<Engine::Director> director;
};

BidderMain::Impl::Impl(Engine::BiddingSystem system) :
    system {std::move(system)}
{
    registerBuiltinCriteria(criteria);
    registerBuiltinHandOffs(handOffs);
    director.emplace(this->system, criteria, handOffs);
    log(LogLevel::INFO, "Bidding system %s in use", this->system.name);
}

const Engine::Director& BidderMain::Impl::getDirector() const
{
    return *director;
}

const Engine::BiddingSystem& BidderMain::Impl::getSystem() const
{
    return system;
}

BidderMain::BidderMain(Engine::BiddingSystem system) :
    impl {std::make_unique<Impl>(std::move(system))}
{
}

BidderMain::~BidderMain() = default;

std::vector<Call> BidderMain::bid(
    const Hand& north, const Hand& south, const Position dealer) const
{
    return impl->getDirector().bid(north, south, dealer);
}

void BidderMain::bid(
    const Hand& north, const Hand& south, Auction& auction) const
{
    auto hands = Hands {};
    hands[positionOrder(Positions::NORTH)] = &north;
    hands[positionOrder(Positions::SOUTH)] = &south;
    impl->getDirector().run(hands, auction);
    log(LogLevel::INFO, "Auction: %s", auction);
}

const Engine::BiddingSystem& BidderMain::getSystem() const
{
    return impl->getSystem();
}

}
}
