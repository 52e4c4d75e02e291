/** \file
 *
 * \brief Definition of the exceptions thrown by the bidding engine
 *
 * The bidding engine distinguishes two kinds of fatal errors:
 *
 * - Configuration errors, derived from ConfigurationException, are caused by
 *   an invalid bidding system or registry setup. They are detected when the
 *   system is loaded or first used.
 * - Invariant violations, derived from InvariantViolationException, indicate
 *   a logic defect in the engine or in a convention.
 *
 * Neither is recovered from during a bidding run. Auctions ending because the
 * bidding system has no continuation are not errors.
 */

#ifndef EXCEPTIONS_HH_
#define EXCEPTIONS_HH_

#include <stdexcept>

namespace BidEngine {

/** \brief Base class of configuration errors
 */
class ConfigurationException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** \brief A criterion or hand-off was registered twice under the same name
 */
class DuplicateNameException : public ConfigurationException {
public:
    using ConfigurationException::ConfigurationException;
};

/** \brief A node in a bidding system has no criteria
 */
class MissingCriteriaException : public ConfigurationException {
public:
    using ConfigurationException::ConfigurationException;
};

/** \brief A rule refers to a criterion that is not registered
 */
class UnknownCriterionException : public ConfigurationException {
public:
    using ConfigurationException::ConfigurationException;
};

/** \brief A node refers to a hand-off that is not registered
 */
class UnknownHandOffException : public ConfigurationException {
public:
    using ConfigurationException::ConfigurationException;
};

/** \brief A rule has a malformed parameter
 */
class InvalidRuleException : public ConfigurationException {
public:
    using ConfigurationException::ConfigurationException;
};

/** \brief Base class of invariant violations
 */
class InvariantViolationException : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/** \brief A call was added to an auction that has already ended
 */
class AuctionAlreadyOverException : public InvariantViolationException {
public:
    using InvariantViolationException::InvariantViolationException;
};

/** \brief A bid lower than the current highest bid was added to an auction
 */
class InsufficientBidException : public InvariantViolationException {
public:
    using InvariantViolationException::InvariantViolationException;
};

/** \brief A convention that builds on the current bid was started on an
 * auction without bids
 */
class NoCurrentBidException : public InvariantViolationException {
public:
    using InvariantViolationException::InvariantViolationException;
};

/** \brief A convention needed to sign off but had no bid to sign off from
 */
class NoSignoffAvailableException : public InvariantViolationException {
public:
    using InvariantViolationException::InvariantViolationException;
};

/** \brief A convention needed a bid above the highest possible bid
 */
class BidSpaceExhaustedException : public InvariantViolationException {
public:
    using InvariantViolationException::InvariantViolationException;
};

}

#endif // EXCEPTIONS_HH_
