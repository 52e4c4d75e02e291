#include "bridge/Hand.hh"

#include "Utility.hh"

#include <algorithm>
#include <cctype>
#include <functional>
#include <numeric>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace BidEngine {

namespace {

using namespace std::string_view_literals;

constexpr auto RANK_SYMBOLS = "AKQJT98765432"sv;
constexpr auto SPOT_SYMBOL = 'x';
constexpr auto VOID_SYMBOL = "-"sv;

Hand::Holding parseHolding(const std::string_view str)
{
    if (str == VOID_SYMBOL) {
        return {};
    }
    auto holding = Hand::Holding {};
    for (const auto c : str) {
        const auto symbol = static_cast<char>(
            std::toupper(static_cast<unsigned char>(c)));
        if (symbol == std::toupper(SPOT_SYMBOL)) {
            holding += SPOT_SYMBOL;
        } else if (RANK_SYMBOLS.find(symbol) == std::string_view::npos) {
            throw std::invalid_argument {"Invalid rank symbol in holding"};
        } else if (holding.find(symbol) != Hand::Holding::npos) {
            throw std::invalid_argument {"Repeated rank in holding"};
        } else {
            holding += symbol;
        }
    }
    return holding;
}

}

Hand::Hand(Holdings holdings) :
    holdings {std::move(holdings)}
{
}

const Hand::Holding& Hand::getHolding(const Suit suit) const
{
    return holdings[suitOrder(suit)];
}

int Hand::getLength(const Suit suit) const
{
    return ssize(getHolding(suit));
}

Hand::Shape Hand::getShape() const
{
    auto shape = Shape {};
    std::transform(
        holdings.begin(), holdings.end(), shape.begin(),
        [](const auto& holding) { return ssize(holding); });
    std::sort(shape.begin(), shape.end(), std::greater<int> {});
    return shape;
}

const Hand& handFor(const Hands& hands, const Position position)
{
    return dereference(hands[positionOrder(position)]);
}

Hand handFromString(const std::string_view str)
{
    auto in = std::istringstream {std::string {str}};
    auto groups = std::vector<std::string> {};
    for (auto group = std::string {}; in >> group;) {
        groups.emplace_back(std::move(group));
    }
    if (groups.size() != SUITS_IN_WRITING_ORDER.size()) {
        throw std::invalid_argument {"Hand must contain four holdings"};
    }
    auto holdings = Hand::Holdings {};
    for (const auto n : to(N_SUITS)) {
        const auto suit = SUITS_IN_WRITING_ORDER[n];
        holdings[suitOrder(suit)] = parseHolding(groups[n]);
    }
    const auto n_cards = std::accumulate(
        holdings.begin(), holdings.end(), 0,
        [](const auto n, const auto& holding) { return n + static_cast<int>(holding.size()); });
    if (n_cards != N_CARDS_PER_PLAYER) {
        throw std::invalid_argument {"Hand must contain 13 cards"};
    }
    return Hand {std::move(holdings)};
}

bool operator==(const Hand& lhs, const Hand& rhs)
{
    return std::all_of(
        SUITS_IN_WRITING_ORDER.begin(), SUITS_IN_WRITING_ORDER.end(),
        [&lhs, &rhs](const auto suit)
        {
            return lhs.getHolding(suit) == rhs.getHolding(suit);
        });
}

std::ostream& operator<<(std::ostream& os, const Hand& hand)
{
    auto separator = ""sv;
    for (const auto suit : SUITS_IN_WRITING_ORDER) {
        const auto& holding = hand.getHolding(suit);
        os << separator;
        if (holding.empty()) {
            os << VOID_SYMBOL;
        } else {
            os << holding;
        }
        separator = " "sv;
    }
    return os;
}

}
