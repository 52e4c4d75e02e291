#ifndef MOCKCRITERION_HH_
#define MOCKCRITERION_HH_

#include "criteria/Criterion.hh"

#include <gmock/gmock.h>

namespace BidEngine {

class MockCriterion : public Criterion {
public:
    MOCK_CONST_METHOD4(
        handleCheck,
        bool(const Rule&, const Hand&, const Auction&, const CriteriaRegistry&));
    MOCK_CONST_METHOD1(handleValidate, void(const Rule&));
};

}

#endif // MOCKCRITERION_HH_
