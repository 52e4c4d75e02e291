#include "bridge/Position.hh"

#include <boost/algorithm/string/case_conv.hpp>

#include <ostream>
#include <stdexcept>
#include <string>

namespace BidEngine {

int positionOrder(const Position position)
{
    const auto n = static_cast<int>(position.get());
    if (n < 0 || n >= Position::ssize()) {
        throw std::invalid_argument {"Invalid position"};
    }
    return n;
}

Position clockwise(const Position position, const int steps)
{
    const auto size = Position::ssize();
    const auto n = (positionOrder(position) + steps % size + size) % size;
    return static_cast<PositionLabel>(n);
}

Position partnerFor(Position position)
{
    return clockwise(position, 2);
}

std::optional<Position> positionFromString(const std::string_view str)
{
    const auto lower = boost::algorithm::to_lower_copy(std::string {str});
    for (const auto position : Position::all()) {
        const auto name = position.value();
        if (lower == name || (lower.size() == 1 && lower[0] == name.front())) {
            return position;
        }
    }
    return std::nullopt;
}

std::ostream& operator<<(std::ostream& os, const Position position)
{
    return os << position.value();
}

}
