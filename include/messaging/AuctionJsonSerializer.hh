/** \file
 *
 * \brief Definition of JSON serializer for BidEngine::Auction
 *
 * \page jsonauction Auction JSON representation
 *
 * A BidEngine::Auction is represented by a JSON object consisting of the
 * following:
 *
 * \code{.json}
 * {
 *     { "dealer": <dealer> },
 *     { "calls": [ <call>, ... ] },
 *     { "contract": <contract> },
 *     { "declarer": <declarer> }
 * }
 * \endcode
 *
 * - &lt;dealer&gt; is the position of the dealer: "north", "east", "south"
 *   or "west"
 * - &lt;call&gt; is a call in short notation, see \ref jsoncall
 * - &lt;contract&gt; is the final contract, see \ref jsonbid, or null if the
 *   auction is ongoing or was passed out
 * - &lt;declarer&gt; is the position of the declarer, or null if there is no
 *   contract
 *
 * Auctions are only serialized. They are never read back.
 */

#ifndef MESSAGING_AUCTIONJSONSERIALIZER_HH_
#define MESSAGING_AUCTIONJSONSERIALIZER_HH_

#include <nlohmann/json.hpp>

#include <string>

namespace BidEngine {

class Auction;

/** \brief Key for the dealer in JSON object
 *
 * \sa \ref jsonauction
 */
extern const std::string AUCTION_DEALER_KEY;

/** \brief Key for the calls in JSON object
 *
 * \sa \ref jsonauction
 */
extern const std::string AUCTION_CALLS_KEY;

/** \brief Key for the final contract in JSON object
 *
 * \sa \ref jsonauction
 */
extern const std::string AUCTION_CONTRACT_KEY;

/** \brief Key for the declarer in JSON object
 *
 * \sa \ref jsonauction
 */
extern const std::string AUCTION_DECLARER_KEY;

/** \brief Convert Auction to JSON
 */
void to_json(nlohmann::json&, const Auction&);

}

#endif // MESSAGING_AUCTIONJSONSERIALIZER_HH_
