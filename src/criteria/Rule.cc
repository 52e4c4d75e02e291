#include "criteria/Rule.hh"

#include "Exceptions.hh"

#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>

#include <tuple>

namespace BidEngine {

std::optional<std::string_view> Rule::getParameter(
    const std::string_view key) const
{
    const auto iter = parameters.find(key);
    if (iter == parameters.end()) {
        return std::nullopt;
    }
    return std::string_view {iter->second};
}

int Rule::getIntParameter(const std::string_view key, const int fallback) const
{
    const auto value = getParameter(key);
    if (!value) {
        return fallback;
    }
    try {
        return boost::lexical_cast<int>(*value);
    } catch (const boost::bad_lexical_cast&) {
        throw InvalidRuleException {
            boost::str(
                boost::format("Parameter “%s” of rule “%s” is not an integer: %s")
                % key % name % *value)};
    }
}

bool operator==(const Rule& lhs, const Rule& rhs)
{
    return std::tie(lhs.name, lhs.parameters, lhs.children) ==
        std::tie(rhs.name, rhs.parameters, rhs.children);
}

}
