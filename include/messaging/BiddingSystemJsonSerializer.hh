/** \file
 *
 * \brief Definition of JSON serializers for bidding systems
 *
 * \page jsonsystem Bidding system JSON representation
 *
 * A BidEngine::Engine::BiddingSystem is represented by a JSON object
 * consisting of the following:
 *
 * \code{.json}
 * {
 *     { "name": <name> },
 *     { "bids": [ <node>, ... ] }
 * }
 * \endcode
 *
 * - &lt;name&gt; is a string naming the system
 * - &lt;node&gt; is an opening bid represented as described below
 *
 * A BidEngine::Engine::BidNode is represented by a JSON object:
 *
 * \code{.json}
 * {
 *     { "bid": <call> },
 *     { "criteria": [ <rule>, ... ] },
 *     { "responses": [ <node>, ... ] },
 *     { "handoff": <handoff> }
 * }
 * \endcode
 *
 * - &lt;call&gt; is the call in short notation, see \ref jsoncall
 * - &lt;rule&gt; is a rule represented as described below
 * - &lt;handoff&gt; is a string naming the hand-off
 *
 * Only "bid" is mandatory. A node without criteria is accepted by the
 * deserializer but rejected when the system is taken into use.
 *
 * A BidEngine::Rule is represented by a JSON object:
 *
 * \code{.json}
 * {
 *     { "criterion": <criterion> },
 *     { "children": [ <rule>, ... ] },
 *     { <key>: <value> },
 *     ...
 * }
 * \endcode
 *
 * - &lt;criterion&gt; is a string naming the criterion
 * - the optional "children" contains the child rules
 * - every other member is a parameter. &lt;value&gt; is a string, number or
 *   boolean. Numbers and booleans are converted to strings.
 */

#ifndef MESSAGING_BIDDINGSYSTEMJSONSERIALIZER_HH_
#define MESSAGING_BIDDINGSYSTEMJSONSERIALIZER_HH_

#include <nlohmann/json.hpp>

#include <iosfwd>
#include <string>
#include <string_view>

namespace BidEngine {

struct Rule;

/** \brief Key for Rule::name in JSON object
 *
 * \sa \ref jsonsystem
 */
extern const std::string RULE_CRITERION_KEY;

/** \brief Key for Rule::children in JSON object
 *
 * \sa \ref jsonsystem
 */
extern const std::string RULE_CHILDREN_KEY;

/** \brief Convert Rule to JSON
 */
void to_json(nlohmann::json&, const Rule&);

/** \brief Convert JSON to Rule
 */
void from_json(const nlohmann::json&, Rule&);

namespace Engine {

struct BidNode;
struct BiddingSystem;

/** \brief Key for BidNode::call in JSON object
 *
 * \sa \ref jsonsystem
 */
extern const std::string BID_NODE_BID_KEY;

/** \brief Key for BidNode::criteria in JSON object
 *
 * \sa \ref jsonsystem
 */
extern const std::string BID_NODE_CRITERIA_KEY;

/** \brief Key for BidNode::responses in JSON object
 *
 * \sa \ref jsonsystem
 */
extern const std::string BID_NODE_RESPONSES_KEY;

/** \brief Key for BidNode::handOff in JSON object
 *
 * \sa \ref jsonsystem
 */
extern const std::string BID_NODE_HANDOFF_KEY;

/** \brief Key for BiddingSystem::name in JSON object
 *
 * \sa \ref jsonsystem
 */
extern const std::string SYSTEM_NAME_KEY;

/** \brief Key for BiddingSystem::bids in JSON object
 *
 * \sa \ref jsonsystem
 */
extern const std::string SYSTEM_BIDS_KEY;

/** \brief Convert BidNode to JSON
 */
void to_json(nlohmann::json&, const BidNode&);

/** \brief Convert JSON to BidNode
 */
void from_json(const nlohmann::json&, BidNode&);

/** \brief Convert BiddingSystem to JSON
 */
void to_json(nlohmann::json&, const BiddingSystem&);

/** \brief Convert JSON to BiddingSystem
 */
void from_json(const nlohmann::json&, BiddingSystem&);

}

namespace Messaging {

/** \brief Read bidding system from stream
 *
 * \param in the stream containing the JSON document
 *
 * \return the bidding system
 *
 * \throw SerializationFailureException if the stream cannot be read or does
 * not contain a valid bidding system
 */
Engine::BiddingSystem biddingSystemFromStream(std::istream& in);

/** \brief Read bidding system from file
 *
 * \param path the path of the file, or “-” for the standard input
 *
 * \return the bidding system
 *
 * \throw SerializationFailureException if the file cannot be read or does not
 * contain a valid bidding system
 */
Engine::BiddingSystem biddingSystemFromPath(std::string_view path);

}

}

#endif // MESSAGING_BIDDINGSYSTEMJSONSERIALIZER_HH_
