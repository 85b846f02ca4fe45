#pragma once

#include <gmock/gmock.h>

#include "../../AwareCore/Core/IInterfaceConflictArbiter.hpp"

namespace AWR::Core::Mocks {

class MockInterfaceConflictArbiter : public IInterfaceConflictArbiter {
public:
    MOCK_METHOD(ConflictDecision, Decide, (const Session::ClientIdentity& requestor), (override));
    MOCK_METHOD(void, Reset, (), (override));
};

} // namespace AWR::Core::Mocks
