#ifndef MOCKHANDOFF_HH_
#define MOCKHANDOFF_HH_

#include "handoffs/HandOff.hh"

#include <gmock/gmock.h>

namespace BidEngine {

class MockHandOff : public HandOff {
public:
    MOCK_CONST_METHOD2(handleBid, void(const Hands&, Auction&));
};

}

#endif // MOCKHANDOFF_HH_
