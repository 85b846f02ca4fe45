#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>

#include "DiscoverySession.hpp"
#include "../Callbacks/IEventCallback.hpp"
#include "../Config/ConfigRequest.hpp"

namespace AWR::Session {

struct ClientIdentity {
    ClientId clientId{0};
    int32_t uid{0};
    int32_t pid{0};
    std::string callingPackage;
    std::string callingFeatureId;
    int32_t callerType{0};
};

// One application attachment: its configuration request and discovery sessions.
class ClientState {
public:
    ClientState(ClientIdentity identity, std::shared_ptr<Callbacks::IEventCallback> callback,
                const Config::ConfigRequest& configRequest, bool notifyIdentityChange,
                bool locationPermitted, bool awareOffload, Scheduling::TimePoint creationTime);

    ClientState(const ClientState&) = delete;
    ClientState& operator=(const ClientState&) = delete;

    [[nodiscard]] ClientId GetClientId() const noexcept { return identity_.clientId; }
    [[nodiscard]] int32_t GetUid() const noexcept { return identity_.uid; }
    [[nodiscard]] int32_t GetPid() const noexcept { return identity_.pid; }
    [[nodiscard]] const std::string& GetCallingPackage() const noexcept {
        return identity_.callingPackage;
    }
    [[nodiscard]] const Config::ConfigRequest& GetConfigRequest() const noexcept {
        return configRequest_;
    }
    [[nodiscard]] bool GetNotifyIdentityChange() const noexcept { return notifyIdentityChange_; }
    [[nodiscard]] bool IsAwareOffload() const noexcept { return awareOffload_; }
    [[nodiscard]] Scheduling::TimePoint GetCreationTime() const noexcept { return creationTime_; }
    [[nodiscard]] Callbacks::IEventCallback* GetCallback() const noexcept {
        return callback_.get();
    }

    // Terminates every session and reports OnAttachTerminate.
    void Destroy(Hal::IAwareHal* hal);

    void AddSession(std::unique_ptr<DiscoverySession> session);
    // Drops the session without terminating it (already terminated by the HAL).
    void RemoveSession(SessionId sessionId);
    // Terminates and drops the session. Returns false for an unknown session.
    bool TerminateSession(SessionId sessionId, Hal::IAwareHal* hal);

    DiscoverySession* GetSession(SessionId sessionId);
    const DiscoverySession* GetSession(SessionId sessionId) const;
    DiscoverySession* GetSessionForPubSubId(PubSubId pubSubId);
    [[nodiscard]] const std::map<SessionId, std::unique_ptr<DiscoverySession>>& Sessions() const {
        return sessions_;
    }

    void OnInterfaceAddressChange(const MacAddress& mac);
    void OnClusterChange(ClusterEventType eventType, const MacAddress& clusterId,
                         const MacAddress& currentDiscoveryInterfaceMac);

    [[nodiscard]] bool IsRangingEnabled() const;
    // 5 GHz wins over 2.4 GHz across sessions.
    [[nodiscard]] Hal::InstantMode GetInstantMode(Scheduling::TimePoint now,
                                                  std::chrono::milliseconds duration) const;

private:
    [[nodiscard]] const MacAddress& Redact(const MacAddress& mac) const {
        return locationPermitted_ ? mac : kAllZeroMac;
    }

    ClientIdentity identity_;
    std::shared_ptr<Callbacks::IEventCallback> callback_;
    Config::ConfigRequest configRequest_;
    bool notifyIdentityChange_;
    bool locationPermitted_;
    bool awareOffload_;
    Scheduling::TimePoint creationTime_;

    MacAddress lastDiscoveryInterfaceMac_{kAllZeroMac};
    MacAddress lastClusterId_{kAllZeroMac};

    std::map<SessionId, std::unique_ptr<DiscoverySession>> sessions_;
};

} // namespace AWR::Session
