#include "bridge/Call.hh"

#include <cctype>
#include <ostream>

namespace BidEngine {

namespace {

constexpr auto PASS_LETTER = 'P';

}

const Bid* getBid(const Call& call)
{
    return std::get_if<Bid>(&call);
}

std::string toShortString(const Call& call)
{
    if (const auto bid = getBid(call)) {
        return toShortString(*bid);
    }
    return std::string(1, PASS_LETTER);
}

std::optional<Call> callFromString(const std::string_view str)
{
    if (str.size() == 1 &&
        std::toupper(static_cast<unsigned char>(str[0])) == PASS_LETTER) {
        return Pass {};
    }
    if (const auto bid = bidFromString(str)) {
        return *bid;
    }
    return std::nullopt;
}

std::ostream& operator<<(std::ostream& os, Pass)
{
    return os << "Pass";
}

}
