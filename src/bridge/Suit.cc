#include "bridge/Suit.hh"

#include <cctype>
#include <ostream>
#include <stdexcept>

namespace BidEngine {

int suitOrder(const Suit suit)
{
    const auto n = static_cast<int>(suit.get());
    if (n < 0 || n >= Suit::ssize()) {
        throw std::invalid_argument {"Invalid suit"};
    }
    return n;
}

Strain strainFor(const Suit suit)
{
    // Safe because the suits are in the same order as the corresponding
    // strains
    return static_cast<StrainLabel>(suitOrder(suit));
}

std::optional<Suit> suitFor(const Strain strain)
{
    if (strain == Strains::NO_TRUMP) {
        return std::nullopt;
    }
    return static_cast<SuitLabel>(static_cast<int>(strain.get()));
}

std::optional<Suit> suitFromLetter(const char letter)
{
    const auto upper = std::toupper(static_cast<unsigned char>(letter));
    for (const auto suit : Suit::all()) {
        if (std::toupper(suit.value().front()) == upper) {
            return suit;
        }
    }
    return std::nullopt;
}

std::ostream& operator<<(std::ostream& os, const Suit suit)
{
    return os << suit.value();
}

}
