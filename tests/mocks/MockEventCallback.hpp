#pragma once

#include <gmock/gmock.h>

#include "../../AwareCore/Callbacks/IEventCallback.hpp"

namespace AWR::Callbacks::Mocks {

class MockEventCallback : public IEventCallback {
public:
    MOCK_METHOD(void, OnConnectSuccess, (ClientId clientId), (override));
    MOCK_METHOD(void, OnConnectFail, (NanStatus reason), (override));
    MOCK_METHOD(void, OnIdentityChanged, (const MacAddress& mac), (override));
    MOCK_METHOD(void, OnClusterIdChanged, (ClusterEventType eventType, const MacAddress& clusterId),
                (override));
    MOCK_METHOD(void, OnAttachTerminate, (), (override));
};

} // namespace AWR::Callbacks::Mocks
