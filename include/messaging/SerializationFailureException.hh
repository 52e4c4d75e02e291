/** \file
 *
 * \brief Definition of BidEngine::Messaging::SerializationFailureException class
 */

#ifndef MESSAGING_SERIALIZATIONFAILUREEXCEPTION_HH_
#define MESSAGING_SERIALIZATIONFAILUREEXCEPTION_HH_

#include <stdexcept>

namespace BidEngine {
namespace Messaging {

/** \brief Exception to indicate error in serialization or deserialization
 *
 * Thrown when a JSON document, such as a bidding system file, cannot be
 * converted to the object it should represent.
 */
class SerializationFailureException : public std::runtime_error {
public:

    using std::runtime_error::runtime_error;
};

}
}

#endif // MESSAGING_SERIALIZATIONFAILUREEXCEPTION_HH_
