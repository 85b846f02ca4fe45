#include "AwareStateManager.hpp"

#include "../Logging/Logging.hpp"
#include "../Logging/LogConfig.hpp"

namespace AWR::Core {

void AwareStateManager::ProcessNotification(Notification notification) {
    std::visit([this](const auto& n) { OnNotification(n); }, notification);
}

// ============================================================================
// Identity / cluster
// ============================================================================

void AwareStateManager::OnNotification(const InterfaceAddressChangedNotification& notification) {
    AWR_LOG_V2(Core, "Discovery interface address changed");
    currentDiscoveryMac_ = notification.mac;
    for (auto& [clientId, client] : clients_) {
        client->OnInterfaceAddressChange(notification.mac);
    }
}

void AwareStateManager::OnNotification(const ClusterChangedNotification& notification) {
    AWR_LOG_V2(Core, "Cluster event %u", static_cast<unsigned>(notification.eventType));
    clusterEventType_ = notification.eventType;
    clusterId_ = notification.clusterId;
    for (auto& [clientId, client] : clients_) {
        client->OnClusterChange(notification.eventType, notification.clusterId,
                                currentDiscoveryMac_);
    }
}

// ============================================================================
// Discovery
// ============================================================================

void AwareStateManager::OnNotification(const Hal::MatchEvent& event) {
    auto [client, session] = FindSessionForPubSubId(event.pubSubId);
    if (session == nullptr) {
        AWR_LOG_ERROR(Session, "Match: no session for pubSubId=%d", event.pubSubId);
        return;
    }
    const PeerId peerId = session->OnMatch(event);
    AWR_LOG_PEER_DETAIL("Match: pubSubId=%d instanceId=%d -> peerId=%d", event.pubSubId,
                        event.requestorInstanceId, peerId);
}

void AwareStateManager::OnNotification(const MatchExpiredNotification& notification) {
    auto [client, session] = FindSessionForPubSubId(notification.pubSubId);
    if (session == nullptr) {
        AWR_LOG_ERROR(Session, "MatchExpired: no session for pubSubId=%d",
                      notification.pubSubId);
        return;
    }
    session->OnMatchExpired(notification.requestorInstanceId);
}

void AwareStateManager::OnNotification(const SessionTerminatedNotification& notification) {
    auto [client, session] = FindSessionForPubSubId(notification.pubSubId);
    if (session == nullptr) {
        AWR_LOG_ERROR(Session, "SessionTerminated: no session for pubSubId=%d",
                      notification.pubSubId);
        return;
    }

    AWR_LOG_V1(Session, "Session terminated by firmware: pubSubId=%d reason=%{public}s",
               notification.pubSubId, ToString(notification.reason).data());
    if (auto* callback = session->GetCallback()) {
        callback->OnSessionTerminated(notification.reason);
    }
    client->RemoveSession(session->GetSessionId());
    ReconfigureIfSessionNeedsChanged();
}

void AwareStateManager::OnNotification(const Hal::MessageReceivedEvent& event) {
    auto [client, session] = FindSessionForPubSubId(event.pubSubId);
    if (session == nullptr) {
        AWR_LOG_ERROR(Session, "MessageReceived: no session for pubSubId=%d", event.pubSubId);
        return;
    }
    AWR_LOG_HEX(Session, "MessageReceived: pubSubId=%d instanceId=%d len=%zu", event.pubSubId,
                event.requestorInstanceId, event.message.size());
    session->OnMessageReceived(event.requestorInstanceId, event.peerMac, event.message);
}

// ============================================================================
// Radio down
// ============================================================================

void AwareStateManager::OnNotification(const AwareDownNotification& notification) {
    AWR_LOG(Core, "Aware down: reason=%{public}s", ToString(notification.reason).data());
    OnAwareDownLocal();
}

void AwareStateManager::OnAwareDownLocal() {
    AWR_LOG_V1(Core, "OnAwareDownLocal: configured=%d clients=%zu", currentConfig_.has_value(),
               clients_.size());
    if (!currentConfig_) {
        return;
    }

    for (auto& [clientId, client] : clients_) {
        client->Destroy(HalInterface());
    }
    clients_.clear();

    pairingRequests_.Clear();
    pairingTimeouts_.Clear();
    bootstrappingRequests_.Clear();
    bootstrappingTimeouts_.Clear();
    bootstrappingComebacks_.Clear();

    currentConfig_.reset();
    instantModeReconfigure_.Cancel();

    sendQueue_.Clear();
    sendMessageTimeout_.Cancel();

    dataPaths_.OnAwareDown();
    dataPathTimeouts_.Clear();
    currentDiscoveryMac_ = kAllZeroMac;
    dataPaths_.DeleteAllInterfaces();
}

// ============================================================================
// Follow-on message delivery
// ============================================================================

void AwareStateManager::OnNotification(const MessageSendSuccessNotification& notification) {
    if (auto message = sendQueue_.TakeFirmwareQueued(notification.txid)) {
        UpdateSendMessageTimeout();
        ReportMessageSendSuccess(*message);
    } else {
        AWR_LOG_RL(Transport, "tx/unknown_success", 1000, OS_LOG_TYPE_ERROR,
                   "Send success for unknown txid=%u", notification.txid);
    }
    sendQueue_.Unblock();
    TransmitNextMessage();
}

void AwareStateManager::OnNotification(const MessageSendFailNotification& notification) {
    if (auto message = sendQueue_.TakeFirmwareQueued(notification.txid)) {
        UpdateSendMessageTimeout();
        if (SendMessageQueue::ShouldRetry(*message, notification.reason)) {
            --message->retryCount;
            AWR_LOG_SEND_QUEUE("Retrying messageId=%d: %d retries left", message->messageId,
                               message->retryCount);
            sendQueue_.Requeue(std::move(*message));
        } else {
            ReportMessageSendFail(*message, notification.reason);
        }
        sendQueue_.Unblock();
        TransmitNextMessage();
    } else {
        // Only a failure we can match frees a firmware slot.
        AWR_LOG_RL(Transport, "tx/unknown_fail", 1000, OS_LOG_TYPE_ERROR,
                   "Send failure for unknown txid=%u reason=%{public}s", notification.txid,
                   ToString(notification.reason).data());
    }
}

void AwareStateManager::UpdateSendMessageTimeout() {
    if (auto deadline = sendQueue_.NextDeadline(config_.sendMessageTimeout)) {
        sendMessageTimeout_.ScheduleAt(*deadline);
    } else {
        sendMessageTimeout_.Cancel();
    }
}

void AwareStateManager::OnSendMessageTimeout() {
    auto expired = sendQueue_.TakeExpired(loop_.GetClock().Now(), config_.sendMessageTimeout);
    AWR_LOG_V0(Transport, "Send timeout: %zu message(s) expired, %zu still in firmware",
               expired.size(), sendQueue_.FirmwareSize());
    for (const auto& message : expired) {
        ReportMessageSendFail(message, NanStatus::kInternalFailure);
    }

    UpdateSendMessageTimeout();
    sendQueue_.Unblock();
    TransmitNextMessage();
    PumpCommands();
}

void AwareStateManager::ReportMessageSendSuccess(const QueuedMessage& message) {
    Session::DiscoverySession* session =
        FindSession(message.clientId, message.sessionId, "MessageSendSuccess");
    if (session == nullptr) {
        return;
    }
    if (auto* callback = session->GetCallback()) {
        callback->OnMessageSendSuccess(message.messageId);
    }
}

void AwareStateManager::ReportMessageSendFail(const QueuedMessage& message, NanStatus reason) {
    Session::DiscoverySession* session =
        FindSession(message.clientId, message.sessionId, "MessageSendFail");
    if (session == nullptr) {
        return;
    }
    if (auto* callback = session->GetCallback()) {
        callback->OnMessageSendFail(message.messageId, reason);
    }
}

// ============================================================================
// Data paths
// ============================================================================

void AwareStateManager::OnNotification(const Hal::DataPathRequestEvent& event) {
    dataPaths_.OnRequest(event);
}

void AwareStateManager::OnNotification(const Hal::DataPathConfirmEvent& event) {
    if (dataPaths_.OnConfirm(event)) {
        dataPathTimeouts_.Cancel(event.ndpId);
    }
}

void AwareStateManager::OnNotification(const DataPathEndNotification& notification) {
    dataPathTimeouts_.Cancel(notification.ndpId);
    dataPaths_.OnEnd(notification.ndpId);
}

void AwareStateManager::OnNotification(const Hal::DataPathScheduleUpdateEvent& event) {
    dataPaths_.OnScheduleUpdate(event);
}

// ============================================================================
// Pairing / bootstrapping
// ============================================================================

void AwareStateManager::OnNotification(const Hal::PairingRequestEvent& event) {
    auto [client, session] = FindSessionForPubSubId(event.pubSubId);
    if (session == nullptr) {
        AWR_LOG_ERROR(Session, "PairingRequest: no session for pubSubId=%d", event.pubSubId);
        return;
    }

    if (event.requestType == Hal::PairingRequestType::kSetup) {
        session->OnPairingRequestReceived(event.requestorInstanceId, event.peerMac,
                                          event.pairingId);
        return;
    }

    // No cached pairing keys are kept, so verification cannot succeed.
    const PeerId peerId =
        session->Peers().GetPeerIdOrAddIfNew(event.requestorInstanceId, event.peerMac);
    AWR_LOG_V1(Session, "Rejecting pairing verification pairingId=%d peerId=%d",
               event.pairingId, peerId);
    QueueCommand(RespondToPairingCommand{
        .clientId = client->GetClientId(),
        .sessionId = session->GetSessionId(),
        .peerId = peerId,
        .pairingId = event.pairingId,
        .accept = false,
        .requestType = Hal::PairingRequestType::kVerification,
    });
}

void AwareStateManager::OnNotification(const Hal::PairingConfirmEvent& event) {
    DeliverPairingConfirm(event.pairingId, event.accept, event.reason, event.requestType);
}

bool AwareStateManager::DeliverPairingConfirm(PairingId pairingId, bool accept,
                                              NanStatus reason,
                                              Hal::PairingRequestType requestType) {
    pairingTimeouts_.Cancel(pairingId);
    auto record = pairingRequests_.Take(pairingId);
    if (!record) {
        AWR_LOG_ERROR(Session, "PairingConfirm: unknown pairingId=%d (type=%u)", pairingId,
                      static_cast<unsigned>(requestType));
        return false;
    }

    AWR_LOG_V1(Session, "PairingConfirm: pairingId=%d accept=%d reason=%{public}s", pairingId,
               accept, ToString(reason).data());
    Session::DiscoverySession* session =
        FindSession(record->clientId, record->sessionId, "PairingConfirm");
    if (session != nullptr) {
        session->OnPairingConfirmReceived(record->peerId, accept, record->alias,
                                          record->requestType);
    }
    return true;
}

void AwareStateManager::OnNotification(const Hal::BootstrappingRequestEvent& event) {
    auto [client, session] = FindSessionForPubSubId(event.pubSubId);
    if (session == nullptr) {
        AWR_LOG_ERROR(Session, "BootstrappingRequest: no session for pubSubId=%d",
                      event.pubSubId);
        return;
    }

    const PeerId peerId =
        session->Peers().GetPeerIdOrAddIfNew(event.requestorInstanceId, event.peerMac);
    const bool accept = session->AcceptsBootstrappingMethod(event.method);
    AWR_LOG_V1(Session, "BootstrappingRequest: id=%d method=0x%x accept=%d",
               event.bootstrappingId, event.method, accept);
    QueueCommand(RespondToBootstrappingCommand{
        .clientId = client->GetClientId(),
        .sessionId = session->GetSessionId(),
        .peerId = peerId,
        .bootstrappingId = event.bootstrappingId,
        .accept = accept,
        .method = event.method,
    });
}

void AwareStateManager::OnNotification(const Hal::BootstrappingConfirmEvent& event) {
    DeliverBootstrappingConfirm(event);
}

bool AwareStateManager::DeliverBootstrappingConfirm(const Hal::BootstrappingConfirmEvent& event) {
    bootstrappingTimeouts_.Cancel(event.bootstrappingId);
    auto record = bootstrappingRequests_.Take(event.bootstrappingId);
    if (!record) {
        AWR_LOG_ERROR(Session, "BootstrappingConfirm: unknown bootstrappingId=%d",
                      event.bootstrappingId);
        return false;
    }

    // A single comeback is honoured; a second one counts as a rejection.
    if (event.responseCode == Hal::BootstrappingResponseCode::kComeback &&
        event.comebackDelaySec > 0 && !record->isComeback) {
        AWR_LOG_V1(Session, "Bootstrapping comeback in %ds: bootstrappingId=%d",
                   event.comebackDelaySec, event.bootstrappingId);
        bootstrappingComebacks_.Schedule(
            event.bootstrappingId, std::chrono::seconds(event.comebackDelaySec),
            [this, record = *record, cookie = event.cookie](const BootstrappingId&) {
                QueueCommand(InitiateBootstrappingCommand{
                    .clientId = record.clientId,
                    .sessionId = record.sessionId,
                    .peerId = record.peerId,
                    .method = record.method,
                    .cookie = cookie,
                    .isComeback = true,
                });
                PumpCommands();
            });
        return true;
    }

    Session::DiscoverySession* session =
        FindSession(record->clientId, record->sessionId, "BootstrappingConfirm");
    if (session != nullptr) {
        session->OnBootstrappingConfirmReceived(
            record->peerId, event.responseCode == Hal::BootstrappingResponseCode::kAccept,
            record->method);
    }
    return true;
}

// ============================================================================
// Suspension
// ============================================================================

void AwareStateManager::OnNotification(const SuspensionModeChangedNotification& notification) {
    AWR_LOG_V1(Session, "Suspension mode changed: suspended=%d", notification.isSuspended);
    if (notification.isSuspended) {
        return;
    }
    for (auto& [clientId, client] : clients_) {
        for (const auto& [sessionId, session] : client->Sessions()) {
            if (session->IsSuspended()) {
                session->OnResumeSuccess();
            }
        }
    }
}

} // namespace AWR::Core
