#include "AwareStateManager.hpp"

#include "../Logging/Logging.hpp"
#include "../Logging/LogConfig.hpp"

namespace AWR::Core {

namespace {

Result<void> RequireHal(const Hal::IAwareHal* hal) {
    if (hal == nullptr) {
        return AWR_ERROR_NOT_READY("Aware interface not available");
    }
    return {};
}

} // namespace

// ============================================================================
// Attach
// ============================================================================

bool AwareStateManager::Execute(TransactionId txid, ConnectCommand& command) {
    if (awareIsDisabling_) {
        if (HasPendingDisable()) {
            AWR_LOG_V1(Core, "Connect clientId=%d deferred behind pending Disable",
                       command.identity.clientId);
            QueueCommand(std::move(command));
            return false;
        }
        AWR_LOG_FAULT(Core, "Disable flagged as pending but none is queued");
        awareIsDisabling_ = false;
    }

    if (!command.awareOffload && !command.conflictResolved && deps_.conflictArbiter) {
        const ConflictDecision decision = deps_.conflictArbiter->Decide(command.identity);
        AWR_LOG_V1(Core, "Connect clientId=%d: interface arbitration=%{public}s",
                   command.identity.clientId, ToString(decision).data());
        switch (decision) {
            case ConflictDecision::kExecute:
                break;
            case ConflictDecision::kAbort:
                command.callback->OnConnectFail(NanStatus::kNoResourcesAvailable);
                return false;
            case ConflictDecision::kWaitForUser:
                parkedConnect_ = std::move(command);
                stateMachine_.TransitionTo(DispatchState::kWaitingForInterfaceConflict,
                                           "interface conflict", NowTicks());
                return false;
        }
    }

    return ConnectLocal(txid, command);
}

bool AwareStateManager::ConnectLocal(TransactionId txid, ConnectCommand& command) {
    const ClientId clientId = command.identity.clientId;
    Callbacks::IEventCallback& callback = *command.callback;

    AWR_LOG_KV(Core, ConnectCommand::kName.data(), txid,
               "clientId=%d uid=%d notifyIdentity=%d offload=%d reEnable=%d", clientId,
               command.identity.uid, command.notifyIdentityChange, command.awareOffload,
               command.reEnableAware);

    if (!usageEnabled_) {
        AWR_LOG(Core, "Connect clientId=%d: usage disabled", clientId);
        callback.OnConnectFail(NanStatus::kInternalFailure);
        return false;
    }
    if (clients_.contains(clientId)) {
        AWR_LOG_ERROR(Core, "Connect: entry already exists for clientId=%d", clientId);
    }

    const auto merged = MergeWith(&command.config);
    if (!merged) {
        AWR_LOG_ERROR(Core, "Connect clientId=%d: configuration incompatible with attached clients",
                      clientId);
        callback.OnConnectFail(NanStatus::kInternalFailure);
        return false;
    }

    // Nothing to change in the HAL: attach immediately.
    if (currentConfig_ && *currentConfig_ == *merged &&
        (currentIdentityNotification_ || !command.notifyIdentityChange) &&
        !command.reEnableAware) {
        if (command.awareOffload && !IsAwareOffloading()) {
            AWR_LOG(Core, "Connect clientId=%d: offload attach while Aware is in regular use",
                    clientId);
            callback.OnConnectFail(NanStatus::kNoResourcesAvailable);
            return false;
        }

        auto client = std::make_unique<Session::ClientState>(
            command.identity, command.callback, command.config, command.notifyIdentityChange,
            command.locationPermitted, command.awareOffload, loop_.GetClock().Now());
        client->OnClusterChange(clusterEventType_, clusterId_, currentDiscoveryMac_);
        clients_.insert_or_assign(clientId, std::move(client));
        callback.OnConnectSuccess(clientId);
        return false;
    }

    const bool notifyIdentityChange =
        AnyClientNeedsIdentityNotification() || command.notifyIdentityChange;
    const bool initialConfiguration = !currentConfig_ || command.reEnableAware;

    if (!currentConfig_ && !interfaces_.Acquire()) {
        callback.OnConnectFail(NanStatus::kInternalFailure);
        return false;
    }

    Hal::IAwareHal* hal = HalInterface();
    auto result = RequireHal(hal).and_then([&] {
        return hal->EnableAndConfigure(
            txid, MakeEnableRequest(*merged, notifyIdentityChange, initialConfiguration));
    });
    if (!result) {
        result.error().Log();
        if (!currentConfig_) {
            interfaces_.Release();
        }
        callback.OnConnectFail(NanStatus::kInternalFailure);
        return false;
    }
    return true;
}

bool AwareStateManager::Execute(TransactionId txid, DisconnectCommand& command) {
    auto it = clients_.find(command.clientId);
    if (it == clients_.end()) {
        AWR_LOG_ERROR(Core, "Disconnect: no entry for clientId=%d", command.clientId);
        return false;
    }

    std::unique_ptr<Session::ClientState> client = std::move(it->second);
    clients_.erase(it);
    client->Destroy(HalInterface());

    if (clients_.empty()) {
        AWR_LOG_V1(Core, "Disconnect clientId=%d: last client gone, disabling",
                   command.clientId);
        currentConfig_.reset();
        pairingRequests_.Clear();
        pairingTimeouts_.Clear();
        bootstrappingRequests_.Clear();
        bootstrappingTimeouts_.Clear();
        bootstrappingComebacks_.Clear();
        dataPaths_.DeleteAllInterfaces();
        currentRangingEnabled_ = false;
        currentIdentityNotification_ = false;
        currentInstantMode_ = Hal::InstantMode::kDisabled;
        instantModeReconfigure_.Cancel();
        DeferDisable(true);
        return false;
    }

    const auto merged = MergeWith(nullptr);
    if (!merged) {
        AWR_LOG_FAULT(Core, "Disconnect: remaining configurations no longer merge");
        return false;
    }

    const bool notifyIdentityChange = AnyClientNeedsIdentityNotification();
    const bool rangingEnabled = AnyClientNeedsRanging();
    const Hal::InstantMode instantMode = AggregateInstantMode();
    if (merged == currentConfig_ && notifyIdentityChange == currentIdentityNotification_ &&
        rangingEnabled == currentRangingEnabled_ && instantMode == currentInstantMode_) {
        return false;
    }

    Hal::IAwareHal* hal = HalInterface();
    auto result = RequireHal(hal).and_then([&] {
        return hal->EnableAndConfigure(txid,
                                       MakeEnableRequest(*merged, notifyIdentityChange, false));
    });
    if (!result) {
        result.error().Log();
        return false;
    }
    return true;
}

bool AwareStateManager::Execute(TransactionId txid, DisableCommand& command) {
    awareIsDisabling_ = false;

    Hal::IAwareHal* hal = HalInterface();
    auto result = RequireHal(hal).and_then([&] { return hal->Disable(txid); });
    if (!result) {
        result.error().Log();
        OnDisableCompleted(command, FailureStatus(result));
        return false;
    }
    return true;
}

bool AwareStateManager::Execute(TransactionId txid, ReconfigureCommand&) {
    if (clients_.empty()) {
        AWR_LOG_V2(Core, "Reconfigure: no clients, Aware not enabled");
        return false;
    }

    const auto merged = MergeWith(nullptr);
    if (!merged) {
        AWR_LOG_FAULT(Core, "Reconfigure: attached configurations no longer merge");
        return false;
    }

    Hal::IAwareHal* hal = HalInterface();
    auto result = RequireHal(hal).and_then([&] {
        return hal->EnableAndConfigure(
            txid, MakeEnableRequest(*merged, AnyClientNeedsIdentityNotification(), false));
    });
    if (!result) {
        result.error().Log();
        return false;
    }
    return true;
}

void AwareStateManager::DeferDisable(bool releaseInterface) {
    awareIsDisabling_ = true;
    QueueCommand(DisableCommand{releaseInterface});
}

// ============================================================================
// Discovery
// ============================================================================

bool AwareStateManager::Execute(TransactionId, TerminateSessionCommand& command) {
    Session::ClientState* client = FindClient(command.clientId);
    if (client == nullptr) {
        AWR_LOG_ERROR(Session, "TerminateSession: no client exists for clientId=%d",
                      command.clientId);
        return false;
    }

    client->TerminateSession(command.sessionId, HalInterface());
    ReconfigureIfSessionNeedsChanged();
    return false;
}

bool AwareStateManager::Execute(TransactionId txid, PublishCommand& command) {
    Session::ClientState* client = FindClient(command.clientId);
    if (client == nullptr) {
        AWR_LOG_ERROR(Session, "Publish: no client exists for clientId=%d", command.clientId);
        command.callback->OnSessionConfigFail(NanStatus::kInternalFailure);
        return false;
    }

    Hal::IAwareHal* hal = HalInterface();
    auto result = RequireHal(hal).and_then([&] { return hal->Publish(txid, 0, command.config); });
    if (!result) {
        result.error().Log();
        command.callback->OnSessionConfigFail(FailureStatus(result));
        return false;
    }
    return true;
}

bool AwareStateManager::Execute(TransactionId txid, UpdatePublishCommand& command) {
    Session::DiscoverySession* session =
        FindSession(command.clientId, command.sessionId, "UpdatePublish");
    if (session == nullptr) {
        return false;
    }
    return session->UpdatePublish(HalInterface(), txid, command.config, loop_.GetClock().Now())
        .has_value();
}

bool AwareStateManager::Execute(TransactionId txid, SubscribeCommand& command) {
    Session::ClientState* client = FindClient(command.clientId);
    if (client == nullptr) {
        AWR_LOG_ERROR(Session, "Subscribe: no client exists for clientId=%d", command.clientId);
        command.callback->OnSessionConfigFail(NanStatus::kInternalFailure);
        return false;
    }

    Hal::IAwareHal* hal = HalInterface();
    auto result =
        RequireHal(hal).and_then([&] { return hal->Subscribe(txid, 0, command.config); });
    if (!result) {
        result.error().Log();
        command.callback->OnSessionConfigFail(FailureStatus(result));
        return false;
    }
    return true;
}

bool AwareStateManager::Execute(TransactionId txid, UpdateSubscribeCommand& command) {
    Session::DiscoverySession* session =
        FindSession(command.clientId, command.sessionId, "UpdateSubscribe");
    if (session == nullptr) {
        return false;
    }
    return session->UpdateSubscribe(HalInterface(), txid, command.config, loop_.GetClock().Now())
        .has_value();
}

bool AwareStateManager::Execute(TransactionId txid, SuspendSessionCommand& command) {
    Session::DiscoverySession* session =
        FindSession(command.clientId, command.sessionId, "SuspendSession");
    if (session == nullptr) {
        return false;
    }
    if (!session->IsSuspendable()) {
        session->OnSuspendFail(SuspendFailReason::kInvalidSession);
        return false;
    }
    if (session->IsSuspended()) {
        session->OnSuspendFail(SuspendFailReason::kRedundantRequest);
        return false;
    }
    return session->Suspend(HalInterface(), txid).has_value();
}

bool AwareStateManager::Execute(TransactionId txid, ResumeSessionCommand& command) {
    Session::DiscoverySession* session =
        FindSession(command.clientId, command.sessionId, "ResumeSession");
    if (session == nullptr) {
        return false;
    }
    if (!session->IsSuspendable()) {
        session->OnResumeFail(ResumeFailReason::kInvalidSession);
        return false;
    }
    if (!session->IsSuspended()) {
        session->OnResumeFail(ResumeFailReason::kRedundantRequest);
        return false;
    }
    return session->Resume(HalInterface(), txid).has_value();
}

// ============================================================================
// Follow-on messages
// ============================================================================

bool AwareStateManager::Execute(TransactionId, EnqueueSendMessageCommand& command) {
    QueuedMessage& message = command.message;
    if (sendQueue_.IsUidExceeded(message.uid)) {
        AWR_LOG_RL(Transport, "tx/uid_depth", 1000, OS_LOG_TYPE_ERROR,
                   "uid=%d exceeded %d queued messages: messageId=%d", message.uid,
                   config_.messageQueueDepthPerUid, message.messageId);
        ReportMessageSendFail(message, NanStatus::kInternalFailure);
        return false;
    }

    AWR_LOG_SEND_QUEUE("Enqueue messageId=%d uid=%d retries=%d host=%zu", message.messageId,
                       message.uid, message.retryCount, sendQueue_.HostSize());
    sendQueue_.Enqueue(std::move(message));
    if (!sendQueue_.IsBlocked()) {
        TransmitNextMessage();
    }
    return false;
}

bool AwareStateManager::Execute(TransactionId txid, TransmitNextMessageCommand& command) {
    auto next = sendQueue_.PopNextForTransmit();
    if (!next) {
        return false;
    }

    Session::DiscoverySession* session =
        FindSession(next->clientId, next->sessionId, "TransmitNextMessage");
    if (session == nullptr) {
        // Client or session went away while the message waited; it has no one to report to.
        TransmitNextMessage();
        return false;
    }

    auto result =
        session->SendMessage(HalInterface(), txid, next->peerId, next->payload, next->messageId);
    if (!result) {
        // The session has already reported the failure.
        result.error().Log();
        TransmitNextMessage();
        return false;
    }

    command.sent = std::move(next);
    return true;
}

// ============================================================================
// Pairing / bootstrapping
// ============================================================================

bool AwareStateManager::Execute(TransactionId txid, InitiatePairingCommand& command) {
    Session::DiscoverySession* session =
        FindSession(command.clientId, command.sessionId, "InitiatePairing");
    if (session == nullptr) {
        return false;
    }
    return session
        ->InitiatePairing(HalInterface(), txid, command.peerId, command.requestType,
                          command.security)
        .has_value();
}

bool AwareStateManager::Execute(TransactionId txid, RespondToPairingCommand& command) {
    Session::DiscoverySession* session =
        FindSession(command.clientId, command.sessionId, "RespondToPairing");
    if (session == nullptr) {
        return false;
    }
    return session
        ->RespondToPairingRequest(HalInterface(), txid, command.peerId, command.pairingId,
                                  command.accept, command.requestType, command.security)
        .has_value();
}

bool AwareStateManager::Execute(TransactionId txid, EndPairingCommand& command) {
    pairingTimeouts_.Cancel(command.pairingId);
    pairingRequests_.Take(command.pairingId);

    Hal::IAwareHal* hal = HalInterface();
    auto result = RequireHal(hal).and_then([&] { return hal->EndPairing(txid, command.pairingId); });
    if (!result) {
        result.error().Log();
        return false;
    }
    return true;
}

bool AwareStateManager::Execute(TransactionId txid, InitiateBootstrappingCommand& command) {
    Session::DiscoverySession* session =
        FindSession(command.clientId, command.sessionId, "InitiateBootstrapping");
    if (session == nullptr) {
        return false;
    }
    return session
        ->InitiateBootstrapping(HalInterface(), txid, command.peerId, command.method,
                                command.cookie, command.isComeback)
        .has_value();
}

bool AwareStateManager::Execute(TransactionId txid, RespondToBootstrappingCommand& command) {
    Session::DiscoverySession* session =
        FindSession(command.clientId, command.sessionId, "RespondToBootstrapping");
    if (session == nullptr) {
        return false;
    }
    auto result = session->RespondToBootstrapping(HalInterface(), txid, command.peerId,
                                                  command.bootstrappingId, command.accept,
                                                  command.method);
    if (!result) {
        result.error().Log();
        return false;
    }
    return true;
}

// ============================================================================
// Usage and interface
// ============================================================================

bool AwareStateManager::Execute(TransactionId, EnableUsageCommand&) {
    AWR_LOG(Core, "EnableUsage: usageEnabled=%d", usageEnabled_);
    usageEnabled_ = true;
    return false;
}

bool AwareStateManager::Execute(TransactionId, DisableUsageCommand& command) {
    DisableUsageLocal(command.markAsAvailable);
    return false;
}

void AwareStateManager::DisableUsageLocal(bool markAsAvailable) {
    AWR_LOG(Core, "DisableUsage: usageEnabled=%d markAsAvailable=%d", usageEnabled_,
            markAsAvailable);
    if (!usageEnabled_) {
        return;
    }

    OnAwareDownLocal();
    usageEnabled_ = markAsAvailable;
    currentRangingEnabled_ = false;
    currentIdentityNotification_ = false;
    currentInstantMode_ = Hal::InstantMode::kDisabled;
    DeferDisable(true);
}

bool AwareStateManager::Execute(TransactionId txid, GetCapabilitiesCommand&) {
    if (capabilities_) {
        return false;
    }

    Hal::IAwareHal* hal = HalInterface();
    auto result = RequireHal(hal).and_then([&] { return hal->GetCapabilities(txid); });
    if (!result) {
        result.error().Log();
        return false;
    }
    return true;
}

bool AwareStateManager::Execute(TransactionId, DelayedInitializationCommand&) {
    if (!capabilities_) {
        QueueCommand(GetInterfaceCommand{});
        QueueCommand(GetCapabilitiesCommand{});
        QueueCommand(ReleaseInterfaceCommand{});
    }
    return false;
}

bool AwareStateManager::Execute(TransactionId, GetInterfaceCommand&) {
    if (!interfaces_.Acquire()) {
        AWR_LOG_ERROR(Core, "GetInterface: no Aware interface available");
    }
    return false;
}

bool AwareStateManager::Execute(TransactionId, ReleaseInterfaceCommand&) {
    interfaces_.Release();
    return false;
}

// ============================================================================
// Data path
// ============================================================================

bool AwareStateManager::Execute(TransactionId txid, CreateDataInterfaceCommand& command) {
    Hal::IAwareHal* hal = HalInterface();
    auto result =
        RequireHal(hal).and_then([&] { return hal->CreateDataInterface(txid, command.name); });
    if (!result) {
        result.error().Log();
        dataPaths_.OnInterfaceCreateFailed(command.name);
        return false;
    }
    return true;
}

bool AwareStateManager::Execute(TransactionId txid, DeleteDataInterfaceCommand& command) {
    Hal::IAwareHal* hal = HalInterface();
    auto result =
        RequireHal(hal).and_then([&] { return hal->DeleteDataInterface(txid, command.name); });
    if (!result) {
        result.error().Log();
        // The interface went away with the HAL; forget it so it is created again.
        dataPaths_.OnInterfaceDeleted(command.name);
        return false;
    }
    return true;
}

bool AwareStateManager::Execute(TransactionId, DeleteAllDataInterfacesCommand&) {
    dataPaths_.DeleteAllInterfaces();
    return false;
}

bool AwareStateManager::Execute(TransactionId txid, InitiateDataPathCommand& command) {
    Hal::InitiateDataPathRequest& request = command.request;
    if (!request.isOutOfBand) {
        Session::DiscoverySession* session =
            FindSession(command.clientId, command.sessionId, "InitiateDataPath");
        if (session == nullptr) {
            dataPaths_.OnInitiateFail(command.requestId, NanStatus::kInvalidSessionId);
            return false;
        }
        request.pubSubId = session->GetPubSubId();
    }

    Hal::IAwareHal* hal = HalInterface();
    auto result = RequireHal(hal).and_then([&] { return hal->InitiateDataPath(txid, request); });
    if (!result) {
        result.error().Log();
        dataPaths_.OnInitiateFail(command.requestId, FailureStatus(result));
        return false;
    }
    return true;
}

bool AwareStateManager::Execute(TransactionId txid, RespondToDataPathCommand& command) {
    Hal::RespondToDataPathRequest& request = command.request;
    if (!request.isOutOfBand && request.accept) {
        Session::DiscoverySession* session =
            FindSession(command.clientId, command.sessionId, "RespondToDataPath");
        if (session == nullptr) {
            OnRespondToDataPathResult(command, false, NanStatus::kInvalidSessionId);
            return false;
        }
        request.pubSubId = session->GetPubSubId();
    }

    Hal::IAwareHal* hal = HalInterface();
    auto result =
        RequireHal(hal).and_then([&] { return hal->RespondToDataPathRequest(txid, request); });
    if (!result) {
        result.error().Log();
        OnRespondToDataPathResult(command, false, FailureStatus(result));
        return false;
    }
    return true;
}

bool AwareStateManager::Execute(TransactionId txid, EndDataPathCommand& command) {
    dataPathTimeouts_.Cancel(command.ndpId);

    Hal::IAwareHal* hal = HalInterface();
    auto result = RequireHal(hal).and_then([&] { return hal->EndDataPath(txid, command.ndpId); });
    if (!result) {
        result.error().Log();
        return false;
    }
    return true;
}

} // namespace AWR::Core
