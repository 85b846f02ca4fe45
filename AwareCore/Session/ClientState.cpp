#include "ClientState.hpp"

#include "../Logging/Logging.hpp"
#include "../Logging/LogConfig.hpp"

namespace AWR::Session {

ClientState::ClientState(ClientIdentity identity,
                         std::shared_ptr<Callbacks::IEventCallback> callback,
                         const Config::ConfigRequest& configRequest, bool notifyIdentityChange,
                         bool locationPermitted, bool awareOffload,
                         Scheduling::TimePoint creationTime)
    : identity_(std::move(identity)),
      callback_(std::move(callback)),
      configRequest_(configRequest),
      notifyIdentityChange_(notifyIdentityChange),
      locationPermitted_(locationPermitted),
      awareOffload_(awareOffload),
      creationTime_(creationTime) {}

void ClientState::Destroy(Hal::IAwareHal* hal) {
    AWR_LOG_V1(Session, "Destroy clientId=%d sessions=%zu", identity_.clientId, sessions_.size());
    for (auto& [sessionId, session] : sessions_) {
        session->Terminate(hal);
    }
    sessions_.clear();

    if (callback_) {
        callback_->OnAttachTerminate();
    }
}

void ClientState::AddSession(std::unique_ptr<DiscoverySession> session) {
    const SessionId sessionId = session->GetSessionId();
    if (sessions_.contains(sessionId)) {
        AWR_LOG_ERROR(Session, "AddSession: sessionId=%d already exists for clientId=%d",
                      sessionId, identity_.clientId);
        return;
    }
    sessions_.emplace(sessionId, std::move(session));
}

void ClientState::RemoveSession(SessionId sessionId) {
    if (sessions_.erase(sessionId) == 0) {
        AWR_LOG_V1(Session, "RemoveSession: unknown sessionId=%d clientId=%d", sessionId,
                   identity_.clientId);
    }
}

bool ClientState::TerminateSession(SessionId sessionId, Hal::IAwareHal* hal) {
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) {
        AWR_LOG_V1(Session, "TerminateSession: unknown sessionId=%d clientId=%d", sessionId,
                   identity_.clientId);
        return false;
    }
    it->second->Terminate(hal);
    sessions_.erase(it);
    return true;
}

DiscoverySession* ClientState::GetSession(SessionId sessionId) {
    auto it = sessions_.find(sessionId);
    return it != sessions_.end() ? it->second.get() : nullptr;
}

const DiscoverySession* ClientState::GetSession(SessionId sessionId) const {
    auto it = sessions_.find(sessionId);
    return it != sessions_.end() ? it->second.get() : nullptr;
}

DiscoverySession* ClientState::GetSessionForPubSubId(PubSubId pubSubId) {
    for (auto& [sessionId, session] : sessions_) {
        if (session->IsPubSubIdSession(pubSubId)) {
            return session.get();
        }
    }
    return nullptr;
}

void ClientState::OnInterfaceAddressChange(const MacAddress& mac) {
    if (notifyIdentityChange_ && mac != lastDiscoveryInterfaceMac_ && callback_) {
        callback_->OnIdentityChanged(Redact(mac));
    }
    lastDiscoveryInterfaceMac_ = mac;
}

void ClientState::OnClusterChange(ClusterEventType eventType, const MacAddress& clusterId,
                                  const MacAddress& currentDiscoveryInterfaceMac) {
    if (!notifyIdentityChange_ || !callback_) {
        lastDiscoveryInterfaceMac_ = currentDiscoveryInterfaceMac;
        lastClusterId_ = clusterId;
        return;
    }

    if (currentDiscoveryInterfaceMac != lastDiscoveryInterfaceMac_) {
        callback_->OnIdentityChanged(Redact(currentDiscoveryInterfaceMac));
    }
    lastDiscoveryInterfaceMac_ = currentDiscoveryInterfaceMac;

    if (clusterId != lastClusterId_) {
        callback_->OnClusterIdChanged(eventType, Redact(clusterId));
    }
    lastClusterId_ = clusterId;
}

bool ClientState::IsRangingEnabled() const {
    for (const auto& [sessionId, session] : sessions_) {
        if (session->IsRangingEnabled()) {
            return true;
        }
    }
    return false;
}

Hal::InstantMode ClientState::GetInstantMode(Scheduling::TimePoint now,
                                             std::chrono::milliseconds duration) const {
    Hal::InstantMode mode = Hal::InstantMode::kDisabled;
    for (const auto& [sessionId, session] : sessions_) {
        const auto current = session->GetInstantMode(now, duration);
        if (current == Hal::InstantMode::k5GHz) {
            return current;
        }
        if (current == Hal::InstantMode::k24GHz) {
            mode = current;
        }
    }
    return mode;
}

} // namespace AWR::Session
