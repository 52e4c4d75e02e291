#include "criteria/ShapePattern.hh"

#include "bridge/BridgeConstants.hh"
#include "bridge/Hand.hh"
#include "Exceptions.hh"
#include "Utility.hh"

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/format.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <string>

namespace BidEngine {

namespace {

[[noreturn]] void throwInvalidPattern(const std::string_view pattern)
{
    throw InvalidRuleException {
        boost::str(boost::format("Invalid shape pattern “%s”") % pattern)};
}

// Parses a length at the beginning of str and removes it from str
std::optional<int> consumeLength(std::string_view& str)
{
    auto n = std::string_view::size_type {};
    auto length = 0;
    while (n < str.size() && std::isdigit(static_cast<unsigned char>(str[n]))) {
        length = 10 * length + (str[n] - '0');
        if (length > N_CARDS_PER_PLAYER) {
            return std::nullopt;
        }
        ++n;
    }
    if (n == 0) {
        return std::nullopt;
    }
    str.remove_prefix(n);
    return length;
}

std::optional<ShapePattern::Term> parseTerm(std::string_view str)
{
    auto term = ShapePattern::Term {{}, 0, N_CARDS_PER_PLAYER};
    while (!str.empty() && std::isalpha(static_cast<unsigned char>(str.front()))) {
        const auto suit = suitFromLetter(str.front());
        if (!suit ||
            std::find(term.suits.begin(), term.suits.end(), *suit) !=
            term.suits.end()) {
            return std::nullopt;
        }
        term.suits.emplace_back(*suit);
        str.remove_prefix(1);
    }
    const auto length = consumeLength(str);
    if (!length) {
        return std::nullopt;
    }
    term.minimumLength = *length;
    term.maximumLength = *length;
    if (str == "+") {
        term.maximumLength = N_CARDS_PER_PLAYER;
    } else if (str == "-") {
        term.minimumLength = 0;
    } else if (!str.empty()) {
        if (str.front() != '-') {
            return std::nullopt;
        }
        str.remove_prefix(1);
        const auto maximum_length = consumeLength(str);
        if (!maximum_length || !str.empty() || *maximum_length < *length) {
            return std::nullopt;
        }
        term.maximumLength = *maximum_length;
    }
    return term;
}

}

bool ShapePattern::Term::satisfiedBy(const Suit suit, const int length) const
{
    if (!suits.empty() &&
        std::find(suits.begin(), suits.end(), suit) == suits.end()) {
        return false;
    }
    return minimumLength <= length && length <= maximumLength;
}

ShapePattern::ShapePattern(const std::string_view pattern)
{
    const auto str = std::string {pattern};
    auto parts = std::vector<std::string> {};
    boost::algorithm::split(
        parts, str, [](const auto c) { return c == ','; });
    if (ssize(parts) > N_SUITS) {
        throwInvalidPattern(pattern);
    }
    for (auto& part : parts) {
        boost::algorithm::trim(part);
        auto term = parseTerm(part);
        if (!term) {
            throwInvalidPattern(pattern);
        }
        terms.emplace_back(std::move(*term));
    }
}

const std::vector<ShapePattern::Term>& ShapePattern::getTerms() const
{
    return terms;
}

bool ShapePattern::matches(const Hand& hand) const
{
    // Try every assignment of terms to suits. There are only 24 of them.
    auto suits = std::array {
        Suits::CLUBS, Suits::DIAMONDS, Suits::HEARTS, Suits::SPADES };
    do {
        auto satisfied = true;
        for (const auto n : to(ssize(terms))) {
            const auto suit = suits[n];
            if (!terms[n].satisfiedBy(suit, hand.getLength(suit))) {
                satisfied = false;
                break;
            }
        }
        if (satisfied) {
            return true;
        }
    } while (std::next_permutation(
                 suits.begin(), suits.end(),
                 [](const auto s1, const auto s2)
                 {
                     return suitOrder(s1) < suitOrder(s2);
                 }));
    return false;
}

}
