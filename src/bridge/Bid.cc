#include "bridge/Bid.hh"

#include <array>
#include <cctype>
#include <ostream>
#include <tuple>

namespace BidEngine {

namespace {

constexpr auto STRAIN_LETTERS = std::array {'C', 'D', 'H', 'S', 'N'};

}

const Bid Bid::HIGHEST_BID {Bid::MAXIMUM_LEVEL, Strains::NO_TRUMP};

std::optional<Bid> nextHigherBid(const Bid& bid)
{
    if (bid == Bid::HIGHEST_BID) {
        return std::nullopt;
    }
    if (bid.strain == Strains::NO_TRUMP) {
        return Bid {bid.level + 1, Strains::CLUBS};
    }
    // Strain labels are consecutive in bidding order
    const auto next = static_cast<int>(bid.strain.get()) + 1;
    return Bid {bid.level, static_cast<StrainLabel>(next)};
}

Bid cheapestNoTrumpFrom(const Bid& bid)
{
    return Bid {bid.level, Strains::NO_TRUMP};
}

char strainLetter(const Strain strain)
{
    return STRAIN_LETTERS.at(static_cast<std::size_t>(strain.get()));
}

std::optional<Strain> strainFromLetter(const char letter)
{
    const auto upper = std::toupper(static_cast<unsigned char>(letter));
    for (const auto strain : Strain::all()) {
        if (strainLetter(strain) == upper) {
            return strain;
        }
    }
    return std::nullopt;
}

std::string toShortString(const Bid& bid)
{
    auto ret = std::to_string(bid.level);
    ret += strainLetter(bid.strain);
    return ret;
}

std::optional<Bid> bidFromString(const std::string_view str)
{
    if (str.size() != 2 ||
        !std::isdigit(static_cast<unsigned char>(str[0]))) {
        return std::nullopt;
    }
    const auto level = str[0] - '0';
    const auto strain = strainFromLetter(str[1]);
    if (!Bid::levelValid(level) || !strain) {
        return std::nullopt;
    }
    return Bid {level, *strain};
}

bool operator==(const Bid& lhs, const Bid& rhs)
{
    return lhs.level == rhs.level && lhs.strain == rhs.strain;
}

bool operator<(const Bid& lhs, const Bid& rhs)
{
    return std::tie(lhs.level, lhs.strain) <
        std::tie(rhs.level, rhs.strain);
}

std::ostream& operator<<(std::ostream& os, const Strain strain)
{
    return os << strain.value();
}

std::ostream& operator<<(std::ostream& os, const Bid& bid)
{
    return os << bid.level << " " << bid.strain;
}

}
