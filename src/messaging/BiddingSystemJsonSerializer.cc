#include "messaging/BiddingSystemJsonSerializer.hh"

#include "criteria/Rule.hh"
#include "engine/BiddingSystem.hh"
#include "messaging/CallJsonSerializer.hh"
#include "messaging/JsonSerializer.hh"
#include "messaging/JsonSerializerUtility.hh"
#include "IoUtility.hh"
#include "Logging.hh"

#include <boost/format.hpp>

#include <istream>
#include <iterator>

using nlohmann::json;

namespace BidEngine {

const std::string RULE_CRITERION_KEY {"criterion"};
const std::string RULE_CHILDREN_KEY {"children"};

namespace {

std::string parameterFromJson(const std::string& key, const json& j)
{
    if (j.is_string()) {
        return j.get<std::string>();
    } else if (j.is_number() || j.is_boolean()) {
        return j.dump();
    }
    throw Messaging::SerializationFailureException {
        boost::str(boost::format("Invalid value for parameter “%s”") % key)};
}

template<typename T>
void getOptional(const json& j, const std::string& key, T& t)
{
    const auto iter = j.find(key);
    if (iter != j.end()) {
        t = iter->template get<T>();
    }
}

}

void to_json(json& j, const Rule& rule)
{
    j = json::object();
    j.emplace(RULE_CRITERION_KEY, rule.name);
    for (const auto& [key, value] : rule.parameters) {
        j.emplace(key, value);
    }
    if (!rule.children.empty()) {
        j.emplace(RULE_CHILDREN_KEY, rule.children);
    }
}

void from_json(const json& j, Rule& rule)
{
    if (!j.is_object()) {
        throw Messaging::SerializationFailureException {
            "Rule must be a JSON object"};
    }
    rule.name = j.at(RULE_CRITERION_KEY).get<std::string>();
    rule.parameters.clear();
    rule.children.clear();
    for (const auto& item : j.items()) {
        const auto& key = item.key();
        if (key == RULE_CHILDREN_KEY) {
            rule.children = item.value().get<std::vector<Rule>>();
        } else if (key != RULE_CRITERION_KEY) {
            rule.parameters.emplace(key, parameterFromJson(key, item.value()));
        }
    }
}

namespace Engine {

const std::string BID_NODE_BID_KEY {"bid"};
const std::string BID_NODE_CRITERIA_KEY {"criteria"};
const std::string BID_NODE_RESPONSES_KEY {"responses"};
const std::string BID_NODE_HANDOFF_KEY {"handoff"};
const std::string SYSTEM_NAME_KEY {"name"};
const std::string SYSTEM_BIDS_KEY {"bids"};

void to_json(json& j, const BidNode& node)
{
    j = json::object();
    j.emplace(BID_NODE_BID_KEY, node.call);
    j.emplace(BID_NODE_CRITERIA_KEY, node.criteria);
    if (!node.responses.empty()) {
        j.emplace(BID_NODE_RESPONSES_KEY, node.responses);
    }
    if (node.handOff) {
        j.emplace(BID_NODE_HANDOFF_KEY, *node.handOff);
    }
}

void from_json(const json& j, BidNode& node)
{
    node.call = j.at(BID_NODE_BID_KEY).get<Call>();
    node.criteria.clear();
    node.responses.clear();
    node.handOff.reset();
    getOptional(j, BID_NODE_CRITERIA_KEY, node.criteria);
    getOptional(j, BID_NODE_RESPONSES_KEY, node.responses);
    getOptional(j, BID_NODE_HANDOFF_KEY, node.handOff);
}

void to_json(json& j, const BiddingSystem& system)
{
    j = json::object();
    j.emplace(SYSTEM_NAME_KEY, system.name);
    j.emplace(SYSTEM_BIDS_KEY, system.bids);
}

void from_json(const json& j, BiddingSystem& system)
{
    system.name = j.at(SYSTEM_NAME_KEY).get<std::string>();
    system.bids = j.at(SYSTEM_BIDS_KEY).get<std::vector<BidNode>>();
}

}

namespace Messaging {

Engine::BiddingSystem biddingSystemFromStream(std::istream& in)
{
    const auto document = std::string(
        std::istreambuf_iterator<char> {in}, std::istreambuf_iterator<char> {});
    if (in.bad()) {
        throw SerializationFailureException {"Error reading bidding system"};
    }
    auto system = JsonSerializer::deserialize<Engine::BiddingSystem>(document);
    log(LogLevel::INFO, "Loaded bidding system %s with %d openings",
        system.name, system.bids.size());
    return system;
}

Engine::BiddingSystem biddingSystemFromPath(const std::string_view path)
{
    return processStreamFromPath(
        path,
        [path](auto& in)
        {
            if (!in) {
                throw SerializationFailureException {
                    boost::str(
                        boost::format("Unable to open bidding system %s")
                        % path)};
            }
            return biddingSystemFromStream(in);
        });
}

}

}
