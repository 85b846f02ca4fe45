#include "AwareStateManager.hpp"

#include "../Logging/Logging.hpp"
#include "../Logging/LogConfig.hpp"

namespace AWR::Core {

namespace {

int32_t DataInterfaceCount(const Config::CoreConfig& config, const Config::Capabilities& caps) {
    return config.maxDataInterfacesOverride > 0 ? config.maxDataInterfacesOverride
                                                : caps.maxNdiInterfaces;
}

} // namespace

// ============================================================================
// Enable / configure / disable
// ============================================================================

void AwareStateManager::OnResponse(const CapabilitiesResponse& response, Command&) {
    AWR_LOG_V1(Config,
               "Capabilities: publishes=%d subscribes=%d ndi=%d ndp=%d ssi=%d suspension=%d",
               response.capabilities.maxPublishes, response.capabilities.maxSubscribes,
               response.capabilities.maxNdiInterfaces, response.capabilities.maxNdpSessions,
               response.capabilities.maxServiceSpecificInfoLen,
               response.capabilities.isSuspensionSupported);

    capabilities_ = response.capabilities;
    characteristics_.reset();

    // Aware came up before the capabilities were known.
    if (currentConfig_ && dataPaths_.Interfaces().empty()) {
        dataPaths_.CreateAllInterfaces(DataInterfaceCount(config_, *capabilities_));
    }
}

void AwareStateManager::OnResponse(const ConfigResponse& response, Command& command) {
    if (response.success) {
        OnConfigCompleted(command);
    } else {
        OnConfigFailed(command, response.reason);
    }
}

void AwareStateManager::OnConfigCompleted(Command& command) {
    if (auto* connect = std::get_if<ConnectCommand>(&command)) {
        if (!currentConfig_) {
            QueueCommand(GetCapabilitiesCommand{});
            if (capabilities_) {
                dataPaths_.CreateAllInterfaces(DataInterfaceCount(config_, *capabilities_));
            }
        }

        const ClientId clientId = connect->identity.clientId;
        auto client = std::make_unique<Session::ClientState>(
            connect->identity, connect->callback, connect->config,
            connect->notifyIdentityChange, connect->locationPermitted, connect->awareOffload,
            loop_.GetClock().Now());
        Session::ClientState& attached = *client;
        clients_.insert_or_assign(clientId, std::move(client));
        connect->callback->OnConnectSuccess(clientId);
        attached.OnClusterChange(clusterEventType_, clusterId_, currentDiscoveryMac_);
    } else if (!std::holds_alternative<DisconnectCommand>(command) &&
               !std::holds_alternative<ReconfigureCommand>(command)) {
        AWR_LOG_FAULT(Core, "Config success for unexpected command %{public}s",
                      CommandName(command).data());
        return;
    }

    currentConfig_ = MergeWith(nullptr);
    currentIdentityNotification_ = AnyClientNeedsIdentityNotification();
    currentRangingEnabled_ = AnyClientNeedsRanging();
    currentInstantMode_ = AggregateInstantMode();
    if (currentInstantMode_ != Hal::InstantMode::kDisabled) {
        instantModeReconfigure_.ScheduleAfter(config_.instantModeDuration);
    }

    AWR_LOG_V2(Core, "Config applied: clients=%zu ranging=%d instantMode=%u identity=%d",
               clients_.size(), currentRangingEnabled_,
               static_cast<unsigned>(currentInstantMode_), currentIdentityNotification_);
}

void AwareStateManager::OnConfigFailed(Command& command, NanStatus reason) {
    if (auto* connect = std::get_if<ConnectCommand>(&command)) {
        AWR_LOG_ERROR(Core, "Connect clientId=%d failed: %{public}s",
                      connect->identity.clientId, ToString(reason).data());
        if (!currentConfig_) {
            interfaces_.Release();
        }
        connect->callback->OnConnectFail(reason);
        return;
    }

    // Disconnect and reconfigure failures leave the previous configuration in place.
    AWR_LOG_ERROR(Core, "%{public}s failed: %{public}s", CommandName(command).data(),
                  ToString(reason).data());
}

void AwareStateManager::OnResponse(const DisableResponse& response, Command& command) {
    if (auto* disable = std::get_if<DisableCommand>(&command)) {
        OnDisableCompleted(*disable, response.status);
    }
}

void AwareStateManager::OnDisableCompleted(const DisableCommand& command, NanStatus status) {
    if (status != NanStatus::kSuccess) {
        AWR_LOG_ERROR(Core, "Disable failed: %{public}s", ToString(status).data());
    }
    if (command.releaseInterface) {
        interfaces_.Release();
    }
}

// ============================================================================
// Discovery sessions
// ============================================================================

void AwareStateManager::OnResponse(const SessionConfigResponse& response, Command& command) {
    if (response.success) {
        OnSessionConfigSucceeded(command, response.isPublish, response.pubSubId);
    } else {
        OnSessionConfigFailed(command, response.isPublish, response.reason);
    }
}

void AwareStateManager::OnSessionConfigSucceeded(Command& command, bool isPublish,
                                                 PubSubId pubSubId) {
    const bool suspensionSupported = config_.suspensionFeatureEnabled && capabilities_ &&
                                     capabilities_->isSuspensionSupported;
    const auto now = loop_.GetClock().Now();

    std::visit(
        Overloaded{
            [&](PublishCommand& c) {
                Session::ClientState* client = FindClient(c.clientId);
                if (client == nullptr) {
                    AWR_LOG_ERROR(Session, "Publish success for departed clientId=%d",
                                  c.clientId);
                    return;
                }
                Session::DiscoverySessionParams params{
                    .sessionId = nextSessionId_++,
                    .pubSubId = pubSubId,
                    .isPublish = true,
                    .rangingEnabled = c.config.enableRanging,
                    .instantModeEnabled = c.config.enableInstantMode,
                    .instantModeBand = c.config.instantModeBand,
                    .suspendable = c.config.suspendable && suspensionSupported,
                    .pairingConfig = c.config.pairingConfig,
                };
                c.callback->OnSessionStarted(params.sessionId);
                client->AddSession(
                    std::make_unique<Session::DiscoverySession>(params, c.callback, now));
                AWR_LOG_V1(Session, "Publish started: clientId=%d sessionId=%d pubSubId=%d",
                           c.clientId, params.sessionId, pubSubId);
            },
            [&](SubscribeCommand& c) {
                Session::ClientState* client = FindClient(c.clientId);
                if (client == nullptr) {
                    AWR_LOG_ERROR(Session, "Subscribe success for departed clientId=%d",
                                  c.clientId);
                    return;
                }
                Session::DiscoverySessionParams params{
                    .sessionId = nextSessionId_++,
                    .pubSubId = pubSubId,
                    .isPublish = false,
                    .rangingEnabled = c.config.minDistanceMmSet || c.config.maxDistanceMmSet,
                    .instantModeEnabled = c.config.enableInstantMode,
                    .instantModeBand = c.config.instantModeBand,
                    .suspendable = c.config.suspendable && suspensionSupported,
                    .pairingConfig = c.config.pairingConfig,
                };
                c.callback->OnSessionStarted(params.sessionId);
                client->AddSession(
                    std::make_unique<Session::DiscoverySession>(params, c.callback, now));
                AWR_LOG_V1(Session, "Subscribe started: clientId=%d sessionId=%d pubSubId=%d",
                           c.clientId, params.sessionId, pubSubId);
            },
            [&](UpdatePublishCommand& c) {
                Session::DiscoverySession* session =
                    FindSession(c.clientId, c.sessionId, "UpdatePublish success");
                if (session == nullptr) {
                    return;
                }
                session->SetRangingEnabled(c.config.enableRanging);
                session->SetInstantModeEnabled(c.config.enableInstantMode);
                session->SetInstantModeBand(c.config.instantModeBand);
                if (auto* callback = session->GetCallback()) {
                    callback->OnSessionConfigSuccess();
                }
            },
            [&](UpdateSubscribeCommand& c) {
                Session::DiscoverySession* session =
                    FindSession(c.clientId, c.sessionId, "UpdateSubscribe success");
                if (session == nullptr) {
                    return;
                }
                session->SetRangingEnabled(c.config.minDistanceMmSet || c.config.maxDistanceMmSet);
                session->SetInstantModeEnabled(c.config.enableInstantMode);
                session->SetInstantModeBand(c.config.instantModeBand);
                if (auto* callback = session->GetCallback()) {
                    callback->OnSessionConfigSuccess();
                }
            },
            [&](auto& c) {
                AWR_LOG_FAULT(Session, "Session config success (isPublish=%d) for %{public}s",
                              isPublish, std::decay_t<decltype(c)>::kName.data());
            },
        },
        command);

    ReconfigureIfSessionNeedsChanged();
}

void AwareStateManager::OnSessionConfigFailed(Command& command, bool isPublish,
                                              NanStatus reason) {
    std::visit(
        Overloaded{
            [&](PublishCommand& c) { c.callback->OnSessionConfigFail(reason); },
            [&](SubscribeCommand& c) { c.callback->OnSessionConfigFail(reason); },
            [&](UpdatePublishCommand& c) {
                Session::ClientState* client = FindClient(c.clientId);
                Session::DiscoverySession* session =
                    FindSession(c.clientId, c.sessionId, "UpdatePublish failure");
                if (session == nullptr) {
                    return;
                }
                if (auto* callback = session->GetCallback()) {
                    callback->OnSessionConfigFail(reason);
                }
                // The firmware no longer knows this session.
                if (reason == NanStatus::kInvalidSessionId) {
                    client->RemoveSession(c.sessionId);
                    ReconfigureIfSessionNeedsChanged();
                }
            },
            [&](UpdateSubscribeCommand& c) {
                Session::ClientState* client = FindClient(c.clientId);
                Session::DiscoverySession* session =
                    FindSession(c.clientId, c.sessionId, "UpdateSubscribe failure");
                if (session == nullptr) {
                    return;
                }
                if (auto* callback = session->GetCallback()) {
                    callback->OnSessionConfigFail(reason);
                }
                if (reason == NanStatus::kInvalidSessionId) {
                    client->RemoveSession(c.sessionId);
                    ReconfigureIfSessionNeedsChanged();
                }
            },
            [&](auto& c) {
                AWR_LOG_FAULT(Session, "Session config failure (isPublish=%d) for %{public}s",
                              isPublish, std::decay_t<decltype(c)>::kName.data());
            },
        },
        command);
}

// ============================================================================
// Follow-on messages
// ============================================================================

void AwareStateManager::OnResponse(const MessageQueuedResponse& response, Command& command) {
    auto* transmit = std::get_if<TransmitNextMessageCommand>(&command);
    if (transmit == nullptr) {
        AWR_LOG_FAULT(Transport, "Message queued response for %{public}s",
                      CommandName(command).data());
        return;
    }
    if (response.success) {
        OnMessageQueued(*transmit, response.txid);
    } else {
        OnMessageQueueFailed(*transmit, response.reason);
    }
}

void AwareStateManager::OnMessageQueued(TransmitNextMessageCommand& command, TransactionId txid) {
    if (!command.sent) {
        return;
    }
    AWR_LOG_SEND_QUEUE("Queued in firmware: messageId=%d txid=%u firmware=%zu",
                       command.sent->messageId, txid, sendQueue_.FirmwareSize() + 1);
    sendQueue_.OnQueuedInFirmware(txid, std::move(*command.sent), loop_.GetClock().Now());
    command.sent.reset();
    UpdateSendMessageTimeout();
    if (!sendQueue_.IsBlocked()) {
        TransmitNextMessage();
    }
}

void AwareStateManager::OnMessageQueueFailed(TransmitNextMessageCommand& command,
                                             NanStatus reason) {
    if (!command.sent) {
        return;
    }
    if (reason == NanStatus::kFollowupTxQueueFull) {
        // Firmware queue is full: hold the message until a delivery result frees a slot.
        AWR_LOG_RL(Transport, "tx/queue_full", 1000, OS_LOG_TYPE_DEFAULT,
                   "Firmware queue full: holding messageId=%d firmware=%zu",
                   command.sent->messageId, sendQueue_.FirmwareSize());
        sendQueue_.Requeue(std::move(*command.sent));
        command.sent.reset();
        sendQueue_.Block();
        return;
    }

    ReportMessageSendFail(*command.sent, NanStatus::kInternalFailure);
    command.sent.reset();
    if (!sendQueue_.IsBlocked()) {
        TransmitNextMessage();
    }
}

// ============================================================================
// Data interfaces / data paths
// ============================================================================

void AwareStateManager::OnResponse(const DataInterfaceResponse& response, Command& command) {
    if (auto* create = std::get_if<CreateDataInterfaceCommand>(&command)) {
        if (response.success) {
            dataPaths_.OnInterfaceCreated(create->name);
        } else {
            AWR_LOG_ERROR(DataPath, "Create %{public}s failed: %{public}s",
                          create->name.c_str(), ToString(response.reason).data());
            dataPaths_.OnInterfaceCreateFailed(create->name);
        }
        return;
    }
    if (auto* remove = std::get_if<DeleteDataInterfaceCommand>(&command)) {
        if (!response.success) {
            AWR_LOG_ERROR(DataPath, "Delete %{public}s failed: %{public}s",
                          remove->name.c_str(), ToString(response.reason).data());
        }
        dataPaths_.OnInterfaceDeleted(remove->name);
    }
}

void AwareStateManager::OnResponse(const InitiateDataPathResponse& response, Command& command) {
    auto* initiate = std::get_if<InitiateDataPathCommand>(&command);
    if (initiate == nullptr) {
        return;
    }
    if (!response.success) {
        dataPaths_.OnInitiateFail(initiate->requestId, response.reason);
        return;
    }
    if (dataPaths_.OnInitiateSuccess(initiate->requestId, response.ndpId,
                                     initiate->request.peerMac,
                                     initiate->request.interfaceName)) {
        ArmDataPathTimeout(response.ndpId);
    }
}

void AwareStateManager::OnResponse(const RespondToDataPathResponse& response, Command& command) {
    if (auto* respond = std::get_if<RespondToDataPathCommand>(&command)) {
        OnRespondToDataPathResult(*respond, response.success, response.reason);
    }
}

void AwareStateManager::OnRespondToDataPathResult(const RespondToDataPathCommand& command,
                                                  bool success, NanStatus reason) {
    const auto& request = command.request;
    if (dataPaths_.OnRespondResult(request.ndpId, request.accept, request.interfaceName, success,
                                   reason)) {
        ArmDataPathTimeout(request.ndpId);
    }
}

void AwareStateManager::OnResponse(const EndDataPathResponse& response, Command&) {
    if (!response.success) {
        AWR_LOG_ERROR(DataPath, "EndDataPath failed: %{public}s",
                      ToString(response.reason).data());
    }
}

void AwareStateManager::ArmDataPathTimeout(NdpId ndpId) {
    dataPathTimeouts_.Schedule(ndpId, config_.dataPathConfirmTimeout, [this](const NdpId& id) {
        AWR_LOG_V0(DataPath, "ndpId=%d: no confirm within %lldms", id,
                   static_cast<long long>(config_.dataPathConfirmTimeout.count()));
        dataPaths_.OnConfirmTimeout(id);
        PumpCommands();
    });
}

// ============================================================================
// Pairing / bootstrapping
// ============================================================================

void AwareStateManager::OnResponse(const InitiatePairingResponse& response, Command& command) {
    auto* initiate = std::get_if<InitiatePairingCommand>(&command);
    if (initiate == nullptr) {
        return;
    }
    if (!response.success) {
        AWR_LOG_ERROR(Session, "InitiatePairing failed: %{public}s",
                      ToString(response.reason).data());
        OnInitiatePairingFailed(*initiate);
        return;
    }

    pairingRequests_.Add(response.pairingId,
                         Session::PairingRecord{initiate->clientId, initiate->sessionId,
                                                initiate->peerId, initiate->alias,
                                                initiate->requestType});
    ArmPairingTimeout(response.pairingId, initiate->requestType);
}

void AwareStateManager::OnInitiatePairingFailed(const InitiatePairingCommand& command) {
    if (command.requestType != Hal::PairingRequestType::kSetup) {
        return;
    }
    Session::DiscoverySession* session =
        FindSession(command.clientId, command.sessionId, "InitiatePairing failure");
    if (session != nullptr) {
        session->OnPairingConfirmReceived(command.peerId, false, command.alias,
                                          command.requestType);
    }
}

void AwareStateManager::OnResponse(const RespondToPairingResponse& response, Command& command) {
    auto* respond = std::get_if<RespondToPairingCommand>(&command);
    if (respond == nullptr) {
        return;
    }
    if (!response.success) {
        AWR_LOG_ERROR(Session, "RespondToPairing failed: %{public}s",
                      ToString(response.reason).data());
        OnRespondToPairingFailed(*respond);
        return;
    }
    if (!respond->accept) {
        return;
    }

    pairingRequests_.Add(respond->pairingId,
                         Session::PairingRecord{respond->clientId, respond->sessionId,
                                                respond->peerId, respond->alias,
                                                respond->requestType});
    ArmPairingTimeout(respond->pairingId, respond->requestType);
}

void AwareStateManager::OnRespondToPairingFailed(const RespondToPairingCommand& command) {
    if (command.requestType != Hal::PairingRequestType::kSetup) {
        return;
    }
    Session::DiscoverySession* session =
        FindSession(command.clientId, command.sessionId, "RespondToPairing failure");
    if (session != nullptr) {
        session->OnPairingConfirmReceived(command.peerId, false, command.alias,
                                          command.requestType);
    }
}

void AwareStateManager::OnResponse(const EndPairingResponse& response, Command&) {
    if (!response.success) {
        AWR_LOG_ERROR(Session, "EndPairing failed: %{public}s", ToString(response.reason).data());
    }
}

void AwareStateManager::ArmPairingTimeout(PairingId pairingId,
                                          Hal::PairingRequestType requestType) {
    pairingTimeouts_.Schedule(pairingId, config_.pairingConfirmTimeout,
                              [this, requestType](const PairingId& id) {
                                  AWR_LOG_V0(Session, "pairingId=%d: no confirm in time", id);
                                  QueueCommand(EndPairingCommand{id});
                                  DeliverPairingConfirm(id, false, NanStatus::kInternalFailure,
                                                        requestType);
                                  PumpCommands();
                              });
}

void AwareStateManager::OnResponse(const InitiateBootstrappingResponse& response,
                                   Command& command) {
    auto* initiate = std::get_if<InitiateBootstrappingCommand>(&command);
    if (initiate == nullptr) {
        return;
    }
    if (!response.success) {
        AWR_LOG_ERROR(Session, "InitiateBootstrapping failed: %{public}s",
                      ToString(response.reason).data());
        OnInitiateBootstrappingFailed(*initiate);
        return;
    }

    bootstrappingRequests_.Add(response.bootstrappingId,
                               Session::BootstrappingRecord{initiate->clientId,
                                                            initiate->sessionId, initiate->peerId,
                                                            initiate->method,
                                                            initiate->isComeback});
    ArmBootstrappingTimeout(response.bootstrappingId);
}

void AwareStateManager::OnInitiateBootstrappingFailed(const InitiateBootstrappingCommand& command) {
    Session::DiscoverySession* session =
        FindSession(command.clientId, command.sessionId, "InitiateBootstrapping failure");
    if (session != nullptr) {
        session->OnBootstrappingConfirmReceived(command.peerId, false, command.method);
    }
}

void AwareStateManager::OnResponse(const RespondToBootstrappingResponse& response,
                                   Command& command) {
    auto* respond = std::get_if<RespondToBootstrappingCommand>(&command);
    if (respond == nullptr) {
        return;
    }
    if (!response.success) {
        AWR_LOG_ERROR(Session, "RespondToBootstrapping failed: %{public}s",
                      ToString(response.reason).data());
        return;
    }
    if (!respond->accept) {
        return;
    }
    Session::DiscoverySession* session =
        FindSession(respond->clientId, respond->sessionId, "RespondToBootstrapping success");
    if (session != nullptr) {
        session->OnBootstrappingConfirmReceived(respond->peerId, true, respond->method);
    }
}

void AwareStateManager::ArmBootstrappingTimeout(BootstrappingId bootstrappingId) {
    bootstrappingTimeouts_.Schedule(
        bootstrappingId, config_.bootstrappingConfirmTimeout, [this](const BootstrappingId& id) {
            AWR_LOG_V0(Session, "bootstrappingId=%d: no confirm in time", id);
            DeliverBootstrappingConfirm(Hal::BootstrappingConfirmEvent{
                .bootstrappingId = id,
                .responseCode = Hal::BootstrappingResponseCode::kReject,
                .reason = NanStatus::kInternalFailure,
            });
            PumpCommands();
        });
}

// ============================================================================
// Suspension
// ============================================================================

void AwareStateManager::OnResponse(const SuspendResponse& response, Command& command) {
    auto* suspend = std::get_if<SuspendSessionCommand>(&command);
    if (suspend == nullptr) {
        return;
    }
    Session::DiscoverySession* session =
        FindSession(suspend->clientId, suspend->sessionId, "Suspend response");
    if (session == nullptr) {
        return;
    }
    if (response.status == NanStatus::kSuccess) {
        session->OnSuspendSuccess();
    } else {
        session->OnSuspendFail(ToSuspendFailReason(response.status));
    }
}

void AwareStateManager::OnResponse(const ResumeResponse& response, Command& command) {
    auto* resume = std::get_if<ResumeSessionCommand>(&command);
    if (resume == nullptr) {
        return;
    }
    // Success is reported once the firmware leaves suspension mode.
    if (response.status == NanStatus::kSuccess) {
        return;
    }
    Session::DiscoverySession* session =
        FindSession(resume->clientId, resume->sessionId, "Resume response");
    if (session != nullptr) {
        session->OnResumeFail(ToResumeFailReason(response.status));
    }
}

// ============================================================================
// Command timeout
// ============================================================================

void AwareStateManager::OnTimeout(Command& command) {
    std::visit(
        Overloaded{
            [&](ConnectCommand&) { OnConfigFailed(command, NanStatus::kInternalFailure); },
            [&](DisconnectCommand&) { OnConfigFailed(command, NanStatus::kInternalFailure); },
            [&](ReconfigureCommand&) { OnConfigFailed(command, NanStatus::kInternalFailure); },
            [&](DisableCommand& c) { OnDisableCompleted(c, NanStatus::kInternalFailure); },
            [&](PublishCommand&) {
                OnSessionConfigFailed(command, true, NanStatus::kInternalFailure);
            },
            [&](UpdatePublishCommand&) {
                OnSessionConfigFailed(command, true, NanStatus::kInternalFailure);
            },
            [&](SubscribeCommand&) {
                OnSessionConfigFailed(command, false, NanStatus::kInternalFailure);
            },
            [&](UpdateSubscribeCommand&) {
                OnSessionConfigFailed(command, false, NanStatus::kInternalFailure);
            },
            [&](TransmitNextMessageCommand& c) {
                if (c.sent) {
                    ReportMessageSendFail(*c.sent, NanStatus::kInternalFailure);
                    c.sent.reset();
                }
                sendQueue_.Unblock();
                TransmitNextMessage();
            },
            [&](InitiatePairingCommand& c) { OnInitiatePairingFailed(c); },
            [&](RespondToPairingCommand& c) { OnRespondToPairingFailed(c); },
            [&](InitiateBootstrappingCommand& c) { OnInitiateBootstrappingFailed(c); },
            [&](CreateDataInterfaceCommand& c) { dataPaths_.OnInterfaceCreateFailed(c.name); },
            [&](DeleteDataInterfaceCommand& c) { dataPaths_.OnInterfaceDeleted(c.name); },
            [&](InitiateDataPathCommand& c) {
                dataPaths_.OnInitiateFail(c.requestId, NanStatus::kInternalFailure);
            },
            [&](RespondToDataPathCommand& c) {
                OnRespondToDataPathResult(c, false, NanStatus::kInternalFailure);
            },
            [&](SuspendSessionCommand& c) {
                if (auto* session = FindSession(c.clientId, c.sessionId, "Suspend timeout")) {
                    session->OnSuspendFail(SuspendFailReason::kInternalError);
                }
            },
            [&](ResumeSessionCommand& c) {
                if (auto* session = FindSession(c.clientId, c.sessionId, "Resume timeout")) {
                    session->OnResumeFail(ResumeFailReason::kInternalError);
                }
            },
            [&](auto& c) {
                AWR_LOG_ERROR(Core, "%{public}s timed out; nothing to report",
                              std::decay_t<decltype(c)>::kName.data());
            },
        },
        command);
}

} // namespace AWR::Core
