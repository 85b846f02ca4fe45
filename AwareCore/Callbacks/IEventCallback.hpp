#pragma once

#include "../Common/Identifiers.hpp"
#include "../Common/MacAddress.hpp"
#include "../Common/StatusCodes.hpp"

namespace AWR::Callbacks {

// Per-client attach events. Invoked on the core event loop.
class IEventCallback {
public:
    virtual ~IEventCallback() = default;

    virtual void OnConnectSuccess(ClientId clientId) = 0;
    virtual void OnConnectFail(NanStatus reason) = 0;

    // Discovery interface MAC. All-zero when the client lacks location permission.
    virtual void OnIdentityChanged(const MacAddress& mac) = 0;
    virtual void OnClusterIdChanged(ClusterEventType eventType, const MacAddress& clusterId) = 0;

    virtual void OnAttachTerminate() = 0;
};

} // namespace AWR::Callbacks
