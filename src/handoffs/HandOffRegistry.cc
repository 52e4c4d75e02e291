#include "handoffs/HandOffRegistry.hh"

#include "handoffs/ConfiHandOff.hh"
#include "Exceptions.hh"
#include "Logging.hh"
#include "Utility.hh"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/format.hpp>

#include <utility>

namespace BidEngine {

namespace {

std::string normalizeName(const std::string_view name)
{
    return boost::algorithm::to_lower_copy(std::string {name});
}

}

void HandOffRegistry::addHandOff(
    const std::string_view name, std::shared_ptr<const HandOff> handOff)
{
    dereference(handOff);
    auto key = normalizeName(name);
    if (handOffs.find(key) != handOffs.end()) {
        throw DuplicateNameException {
            boost::str(
                boost::format("Hand-off “%s” already registered") % name)};
    }
    log(LogLevel::DEBUG, "Registering hand-off %s", key);
    handOffs.emplace(std::move(key), std::move(handOff));
}

bool HandOffRegistry::containsHandOff(const std::string_view name) const
{
    return handOffs.find(normalizeName(name)) != handOffs.end();
}

const HandOff& HandOffRegistry::getHandOff(const std::string_view name) const
{
    const auto iter = handOffs.find(normalizeName(name));
    if (iter == handOffs.end()) {
        throw UnknownHandOffException {
            boost::str(boost::format("Unknown hand-off “%s”") % name)};
    }
    return *iter->second;
}

void registerBuiltinHandOffs(HandOffRegistry& registry)
{
    registry.addHandOff("confi", std::make_shared<ConfiHandOff>());
}

}
