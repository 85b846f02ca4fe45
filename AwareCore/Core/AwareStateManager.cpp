#include "AwareStateManager.hpp"

#include <algorithm>
#include <chrono>

#include "../Logging/Logging.hpp"
#include "../Logging/LogConfig.hpp"

namespace AWR::Core {

namespace {

Result<void> ValidateDiscoveryPayload(const std::optional<Config::Characteristics>& chars,
                                      const std::string& serviceName,
                                      const std::vector<uint8_t>& serviceSpecificInfo,
                                      const std::vector<uint8_t>& matchFilter) {
    if (serviceName.empty()) {
        return AWR_ERROR_INVALID("Service name must not be empty");
    }
    // Limits are enforced only once the HAL has reported them.
    if (!chars) {
        return {};
    }
    if (static_cast<int32_t>(serviceName.size()) > chars->maxServiceNameLength) {
        return AWR_ERROR_INVALID("Service name longer than supported");
    }
    if (static_cast<int32_t>(serviceSpecificInfo.size()) > chars->maxServiceSpecificInfoLength) {
        return AWR_ERROR_INVALID("Service specific info longer than supported");
    }
    if (static_cast<int32_t>(matchFilter.size()) > chars->maxMatchFilterLength) {
        return AWR_ERROR_INVALID("Match filter longer than supported");
    }
    return {};
}

} // namespace

AwareStateManager::AwareStateManager(const Config::CoreConfig& config,
                                     Scheduling::EventLoop& loop, Dependencies deps)
    : config_(config),
      loop_(loop),
      deps_(std::move(deps)),
      interfaces_(*deps_.interfaceProvider, *this, loop),
      dataPaths_(*this, config.dataInterfacePrefix),
      sendQueue_(static_cast<size_t>(std::max(config.messageQueueDepthPerUid, 1))),
      sendMessageTimeout_(loop, [this] { OnSendMessageTimeout(); }),
      instantModeReconfigure_(loop, [this] {
          QueueCommand(ReconfigureCommand{});
          PumpCommands();
      }),
      dataPathTimeouts_(loop),
      pairingTimeouts_(loop),
      bootstrappingTimeouts_(loop),
      bootstrappingComebacks_(loop),
      alive_(std::make_shared<bool>(true)) {
    interfaces_.SetDownHandler([this](bool markAsAvailable) {
        AWR_LOG(Core, "Aware interface down: markAsAvailable=%d", markAsAvailable);
        QueueCommand(DisableUsageCommand{markAsAvailable});
        PumpCommands();
    });
    dataPaths_.SetListener(deps_.dataPathListener);

    AWR_LOG_V1(Core, "AwareStateManager created: commandTimeout=%lldms sendTimeout=%lldms",
               static_cast<long long>(config_.commandTimeout.count()),
               static_cast<long long>(config_.sendMessageTimeout.count()));
}

AwareStateManager::~AwareStateManager() {
    // Runs after any work item already on the loop; later items see alive_ expired.
    loop_.DispatchSync([this] {
        alive_.reset();
        if (commandTimer_ != Scheduling::kInvalidTimer) {
            loop_.Cancel(commandTimer_);
            commandTimer_ = Scheduling::kInvalidTimer;
        }
        sendMessageTimeout_.Cancel();
        instantModeReconfigure_.Cancel();
        dataPathTimeouts_.Clear();
        pairingTimeouts_.Clear();
        bootstrappingTimeouts_.Clear();
        bootstrappingComebacks_.Clear();
    });
}

// ============================================================================
// Front door
// ============================================================================

void AwareStateManager::Start() {
    Post(DelayedInitializationCommand{});
}

void AwareStateManager::EnableUsage() {
    Post(EnableUsageCommand{});
}

void AwareStateManager::DisableUsage(bool markAsAvailable) {
    Post(DisableUsageCommand{markAsAvailable});
}

bool AwareStateManager::IsUsageEnabled() const {
    bool enabled = false;
    loop_.DispatchSync([&] { enabled = usageEnabled_; });
    return enabled;
}

Result<void> AwareStateManager::Connect(const Session::ClientIdentity& identity,
                                        std::shared_ptr<Callbacks::IEventCallback> callback,
                                        const Config::ConfigRequest& config,
                                        bool notifyIdentityChange, bool locationPermitted,
                                        bool awareOffload) {
    if (!callback) {
        return AWR_ERROR_INVALID("Connect without an event callback");
    }
    if (auto valid = config.Validate(); !valid) {
        valid.error().Log();
        return valid;
    }

    ConnectCommand command{
        .identity = identity,
        .callback = std::move(callback),
        .config = config,
        .notifyIdentityChange = notifyIdentityChange,
        .locationPermitted = locationPermitted,
        .awareOffload = awareOffload,
    };

    std::weak_ptr<bool> alive = alive_;
    loop_.DispatchAsync([this, alive, command = std::move(command)]() mutable {
        if (alive.expired()) {
            return;
        }

        // Firmware that cannot arbitrate between an offload user and a regular one
        // gets Aware disabled first; the interface is kept for the new attach.
        const bool offloading = IsAwareOffloading();
        if (!config_.offloadFirmwareHandlesPriority && offloading && !command.awareOffload) {
            AWR_LOG_V1(Core, "Connect clientId=%d: re-enabling Aware away from offload",
                       command.identity.clientId);
            DeferDisable(false);
            command.reEnableAware = true;
        }

        const bool regularAttach = !command.awareOffload;
        QueueCommand(std::move(command));

        // Offload clients leave once a regular attach is queued.
        if (regularAttach) {
            for (const auto& [clientId, client] : clients_) {
                if (client->IsAwareOffload()) {
                    QueueCommand(DisconnectCommand{clientId});
                }
            }
        }
        PumpCommands();
    });
    return {};
}

void AwareStateManager::Disconnect(ClientId clientId) {
    Post(DisconnectCommand{clientId});
}

void AwareStateManager::Reconfigure() {
    Post(ReconfigureCommand{});
}

void AwareStateManager::ResolveInterfaceConflict(bool approved) {
    std::weak_ptr<bool> alive = alive_;
    loop_.DispatchAsync([this, alive, approved] {
        if (alive.expired()) {
            return;
        }
        if (!stateMachine_.Is(DispatchState::kWaitingForInterfaceConflict) || !parkedConnect_) {
            AWR_LOG_ERROR(Core, "ResolveInterfaceConflict(%d): no attach is waiting", approved);
            return;
        }

        ConnectCommand command = std::move(*parkedConnect_);
        parkedConnect_.reset();
        stateMachine_.TransitionTo(DispatchState::kWait,
                                   approved ? "conflict approved" : "conflict rejected",
                                   NowTicks());
        if (deps_.conflictArbiter) {
            deps_.conflictArbiter->Reset();
        }

        if (approved) {
            command.conflictResolved = true;
            pending_.push_front(std::move(command));
        } else {
            AWR_LOG(Core, "Attach of clientId=%d rejected by the user",
                    command.identity.clientId);
            command.callback->OnConnectFail(NanStatus::kNoResourcesAvailable);
        }
        PumpCommands();
    });
}

Result<void> AwareStateManager::Publish(
    ClientId clientId, const Hal::PublishConfig& config,
    std::shared_ptr<Callbacks::IDiscoverySessionCallback> callback) {
    if (!callback) {
        return AWR_ERROR_INVALID("Publish without a session callback");
    }
    AWR_TRY(ValidateDiscoveryPayload(GetCharacteristics(), config.serviceName,
                                     config.serviceSpecificInfo, config.matchFilter));
    Post(PublishCommand{clientId, config, std::move(callback)});
    return {};
}

Result<void> AwareStateManager::UpdatePublish(ClientId clientId, SessionId sessionId,
                                              const Hal::PublishConfig& config) {
    AWR_TRY(ValidateDiscoveryPayload(GetCharacteristics(), config.serviceName,
                                     config.serviceSpecificInfo, config.matchFilter));
    Post(UpdatePublishCommand{clientId, sessionId, config});
    return {};
}

Result<void> AwareStateManager::Subscribe(
    ClientId clientId, const Hal::SubscribeConfig& config,
    std::shared_ptr<Callbacks::IDiscoverySessionCallback> callback) {
    if (!callback) {
        return AWR_ERROR_INVALID("Subscribe without a session callback");
    }
    AWR_TRY(ValidateDiscoveryPayload(GetCharacteristics(), config.serviceName,
                                     config.serviceSpecificInfo, config.matchFilter));
    Post(SubscribeCommand{clientId, config, std::move(callback)});
    return {};
}

Result<void> AwareStateManager::UpdateSubscribe(ClientId clientId, SessionId sessionId,
                                                const Hal::SubscribeConfig& config) {
    AWR_TRY(ValidateDiscoveryPayload(GetCharacteristics(), config.serviceName,
                                     config.serviceSpecificInfo, config.matchFilter));
    Post(UpdateSubscribeCommand{clientId, sessionId, config});
    return {};
}

void AwareStateManager::TerminateSession(ClientId clientId, SessionId sessionId) {
    Post(TerminateSessionCommand{clientId, sessionId});
}

Result<void> AwareStateManager::SendMessage(int32_t uid, ClientId clientId, SessionId sessionId,
                                            PeerId peerId, std::vector<uint8_t> message,
                                            int32_t messageId, int32_t retryCount) {
    if (retryCount < 0 || retryCount > kMaxSendRetryCount) {
        return AWR_ERROR_INVALID("Retry count out of range");
    }
    if (auto chars = GetCharacteristics();
        chars && static_cast<int32_t>(message.size()) > chars->maxServiceSpecificInfoLength) {
        return AWR_ERROR_INVALID("Message longer than supported");
    }

    QueuedMessage queued;
    queued.clientId = clientId;
    queued.sessionId = sessionId;
    queued.peerId = peerId;
    queued.payload = std::move(message);
    queued.messageId = messageId;
    queued.retryCount = retryCount;
    queued.uid = uid;
    Post(EnqueueSendMessageCommand{std::move(queued)});
    return {};
}

void AwareStateManager::Suspend(ClientId clientId, SessionId sessionId) {
    Post(SuspendSessionCommand{clientId, sessionId});
}

void AwareStateManager::Resume(ClientId clientId, SessionId sessionId) {
    Post(ResumeSessionCommand{clientId, sessionId});
}

Result<void> AwareStateManager::InitiatePairing(ClientId clientId, SessionId sessionId,
                                                PeerId peerId,
                                                Hal::PairingRequestType requestType,
                                                const Hal::PairingSecurity& security,
                                                std::string alias) {
    if (requestType == Hal::PairingRequestType::kSetup && alias.empty()) {
        return AWR_ERROR_INVALID("Pairing setup needs an alias");
    }
    Post(InitiatePairingCommand{clientId, sessionId, peerId, requestType, security,
                                std::move(alias)});
    return {};
}

Result<void> AwareStateManager::RespondToPairingRequest(ClientId clientId, SessionId sessionId,
                                                        PeerId peerId, PairingId pairingId,
                                                        bool accept,
                                                        Hal::PairingRequestType requestType,
                                                        const Hal::PairingSecurity& security,
                                                        std::string alias) {
    if (accept && requestType == Hal::PairingRequestType::kSetup && alias.empty()) {
        return AWR_ERROR_INVALID("Pairing setup needs an alias");
    }
    Post(RespondToPairingCommand{clientId, sessionId, peerId, pairingId, accept, requestType,
                                 security, std::move(alias)});
    return {};
}

void AwareStateManager::EndPairing(PairingId pairingId) {
    Post(EndPairingCommand{pairingId});
}

Result<void> AwareStateManager::InitiateBootstrapping(ClientId clientId, SessionId sessionId,
                                                      PeerId peerId, uint32_t method) {
    if (method == 0) {
        return AWR_ERROR_INVALID("Bootstrapping method must not be empty");
    }
    Post(InitiateBootstrappingCommand{clientId, sessionId, peerId, method, {}, false});
    return {};
}

void AwareStateManager::RespondToBootstrapping(ClientId clientId, SessionId sessionId,
                                               PeerId peerId, BootstrappingId bootstrappingId,
                                               bool accept, uint32_t method) {
    Post(RespondToBootstrappingCommand{clientId, sessionId, peerId, bootstrappingId, accept,
                                       method});
}

Result<void> AwareStateManager::InitiateDataPath(DataPath::DataPathRequestId requestId,
                                                 ClientId clientId, SessionId sessionId,
                                                 const Hal::InitiateDataPathRequest& request) {
    if (request.interfaceName.empty()) {
        return AWR_ERROR_INVALID("Data path needs a data interface");
    }
    Post(InitiateDataPathCommand{requestId, clientId, sessionId, request});
    return {};
}

Result<void> AwareStateManager::RespondToDataPathRequest(
    ClientId clientId, SessionId sessionId, const Hal::RespondToDataPathRequest& request) {
    if (request.accept && request.interfaceName.empty()) {
        return AWR_ERROR_INVALID("Accepted data path needs a data interface");
    }
    Post(RespondToDataPathCommand{clientId, sessionId, request});
    return {};
}

// Also reached from DataPathManager on a confirm timeout.
void AwareStateManager::EndDataPath(NdpId ndpId) {
    Post(EndDataPathCommand{ndpId});
}

void AwareStateManager::CreateDataInterface(const std::string& name) {
    QueueCommand(CreateDataInterfaceCommand{name});
}

void AwareStateManager::DeleteDataInterface(const std::string& name) {
    QueueCommand(DeleteDataInterfaceCommand{name});
}

// ============================================================================
// Queries
// ============================================================================

void AwareStateManager::TryToGetCapabilities() {
    std::weak_ptr<bool> alive = alive_;
    loop_.DispatchAsync([this, alive] {
        if (alive.expired()) {
            return;
        }
        if (capabilities_) {
            return;
        }
        QueueCommand(GetInterfaceCommand{});
        QueueCommand(GetCapabilitiesCommand{});
        QueueCommand(ReleaseInterfaceCommand{});
        PumpCommands();
    });
}

std::optional<Config::Capabilities> AwareStateManager::GetCapabilities() const {
    std::optional<Config::Capabilities> caps;
    loop_.DispatchSync([&] { caps = capabilities_; });
    return caps;
}

std::optional<Config::Characteristics> AwareStateManager::GetCharacteristics() const {
    std::optional<Config::Characteristics> chars;
    loop_.DispatchSync([&] {
        if (!capabilities_) {
            return;
        }
        if (!characteristics_) {
            characteristics_ =
                Config::ToCharacteristics(*capabilities_, config_.suspensionFeatureEnabled);
        }
        chars = characteristics_;
    });
    return chars;
}

std::optional<Config::AwareResources> AwareStateManager::GetAvailableResources() const {
    std::optional<Config::AwareResources> resources;
    loop_.DispatchSync([&] {
        if (!capabilities_) {
            return;
        }
        int32_t publishes = 0;
        int32_t subscribes = 0;
        for (const auto& [clientId, client] : clients_) {
            for (const auto& [sessionId, session] : client->Sessions()) {
                if (session->IsPublishSession()) {
                    ++publishes;
                } else {
                    ++subscribes;
                }
            }
        }
        resources = Config::ComputeAvailableResources(*capabilities_, dataPaths_.NumOfNdps(),
                                                      publishes, subscribes);
    });
    return resources;
}

std::map<PeerId, MacAddress> AwareStateManager::RequestMacAddresses(
    int32_t uid, const std::vector<PeerId>& peerIds) const {
    std::map<PeerId, MacAddress> macs;
    loop_.DispatchSync([&] {
        for (const auto& [clientId, client] : clients_) {
            if (client->GetUid() != uid) {
                continue;
            }
            for (const auto& [sessionId, session] : client->Sessions()) {
                for (PeerId peerId : peerIds) {
                    if (const auto* peer = session->Peers().Find(peerId)) {
                        macs[peerId] = peer->mac;
                    }
                }
            }
        }
    });
    return macs;
}

DispatchState AwareStateManager::CurrentDispatchState() const {
    DispatchState state = DispatchState::kWait;
    loop_.DispatchSync([&] { state = stateMachine_.CurrentState(); });
    return state;
}

std::optional<StateTransition> AwareStateManager::LastTransition() const {
    std::optional<StateTransition> last;
    loop_.DispatchSync([&] { last = stateMachine_.LastTransition(); });
    return last;
}

size_t AwareStateManager::ClientCount() const {
    size_t count = 0;
    loop_.DispatchSync([&] { count = clients_.size(); });
    return count;
}

// ============================================================================
// IAwareHalCallback: posted to the loop
// ============================================================================

void AwareStateManager::OnCapabilitiesUpdateResponse(TransactionId txid,
                                                     const Config::Capabilities& capabilities) {
    PostResponse(CapabilitiesResponse{txid, capabilities});
}

void AwareStateManager::OnConfigSuccessResponse(TransactionId txid) {
    PostResponse(ConfigResponse{txid, true, NanStatus::kSuccess});
}

void AwareStateManager::OnConfigFailedResponse(TransactionId txid, NanStatus reason) {
    PostResponse(ConfigResponse{txid, false, reason});
}

void AwareStateManager::OnDisableResponse(TransactionId txid, NanStatus status) {
    PostResponse(DisableResponse{txid, status});
}

void AwareStateManager::OnSessionConfigSuccessResponse(TransactionId txid, bool isPublish,
                                                       PubSubId pubSubId) {
    PostResponse(SessionConfigResponse{txid, true, isPublish, pubSubId, NanStatus::kSuccess});
}

void AwareStateManager::OnSessionConfigFailResponse(TransactionId txid, bool isPublish,
                                                    NanStatus reason) {
    PostResponse(SessionConfigResponse{txid, false, isPublish, 0, reason});
}

void AwareStateManager::OnMessageSendQueuedSuccessResponse(TransactionId txid) {
    PostResponse(MessageQueuedResponse{txid, true, NanStatus::kSuccess});
}

void AwareStateManager::OnMessageSendQueuedFailResponse(TransactionId txid, NanStatus reason) {
    PostResponse(MessageQueuedResponse{txid, false, reason});
}

void AwareStateManager::OnCreateDataInterfaceResponse(TransactionId txid, bool success,
                                                      NanStatus reason) {
    PostResponse(DataInterfaceResponse{txid, true, success, reason});
}

void AwareStateManager::OnDeleteDataInterfaceResponse(TransactionId txid, bool success,
                                                      NanStatus reason) {
    PostResponse(DataInterfaceResponse{txid, false, success, reason});
}

void AwareStateManager::OnInitiateDataPathResponse(TransactionId txid, bool success,
                                                   NanStatus reason, NdpId ndpId) {
    PostResponse(InitiateDataPathResponse{txid, success, reason, ndpId});
}

void AwareStateManager::OnRespondToDataPathRequestResponse(TransactionId txid, bool success,
                                                           NanStatus reason) {
    PostResponse(RespondToDataPathResponse{txid, success, reason});
}

void AwareStateManager::OnEndDataPathResponse(TransactionId txid, bool success,
                                              NanStatus reason) {
    PostResponse(EndDataPathResponse{txid, success, reason});
}

void AwareStateManager::OnInitiatePairingResponse(TransactionId txid, bool success,
                                                  NanStatus reason, PairingId pairingId) {
    PostResponse(InitiatePairingResponse{txid, success, reason, pairingId});
}

void AwareStateManager::OnRespondToPairingResponse(TransactionId txid, bool success,
                                                   NanStatus reason) {
    PostResponse(RespondToPairingResponse{txid, success, reason});
}

void AwareStateManager::OnEndPairingResponse(TransactionId txid, bool success,
                                             NanStatus reason) {
    PostResponse(EndPairingResponse{txid, success, reason});
}

void AwareStateManager::OnInitiateBootstrappingResponse(TransactionId txid, bool success,
                                                        NanStatus reason,
                                                        BootstrappingId bootstrappingId) {
    PostResponse(InitiateBootstrappingResponse{txid, success, reason, bootstrappingId});
}

void AwareStateManager::OnRespondToBootstrappingResponse(TransactionId txid, bool success,
                                                         NanStatus reason) {
    PostResponse(RespondToBootstrappingResponse{txid, success, reason});
}

void AwareStateManager::OnSuspendResponse(TransactionId txid, NanStatus status) {
    PostResponse(SuspendResponse{txid, status});
}

void AwareStateManager::OnResumeResponse(TransactionId txid, NanStatus status) {
    PostResponse(ResumeResponse{txid, status});
}

void AwareStateManager::OnInterfaceAddressChange(const MacAddress& mac) {
    PostNotification(InterfaceAddressChangedNotification{mac});
}

void AwareStateManager::OnClusterChange(ClusterEventType eventType, const MacAddress& clusterId) {
    PostNotification(ClusterChangedNotification{eventType, clusterId});
}

void AwareStateManager::OnMatch(const Hal::MatchEvent& event) {
    PostNotification(event);
}

void AwareStateManager::OnMatchExpired(PubSubId pubSubId, InstanceId requestorInstanceId) {
    PostNotification(MatchExpiredNotification{pubSubId, requestorInstanceId});
}

void AwareStateManager::OnSessionTerminated(PubSubId pubSubId, NanStatus reason,
                                            bool isPublish) {
    PostNotification(SessionTerminatedNotification{pubSubId, reason, isPublish});
}

void AwareStateManager::OnMessageReceived(const Hal::MessageReceivedEvent& event) {
    PostNotification(event);
}

void AwareStateManager::OnAwareDown(NanStatus reason) {
    PostNotification(AwareDownNotification{reason});
}

void AwareStateManager::OnMessageSendSuccess(TransactionId txid) {
    PostNotification(MessageSendSuccessNotification{txid});
}

void AwareStateManager::OnMessageSendFail(TransactionId txid, NanStatus reason) {
    PostNotification(MessageSendFailNotification{txid, reason});
}

void AwareStateManager::OnDataPathRequest(const Hal::DataPathRequestEvent& event) {
    PostNotification(event);
}

void AwareStateManager::OnDataPathConfirm(const Hal::DataPathConfirmEvent& event) {
    PostNotification(event);
}

void AwareStateManager::OnDataPathEnd(NdpId ndpId) {
    PostNotification(DataPathEndNotification{ndpId});
}

void AwareStateManager::OnDataPathScheduleUpdate(const Hal::DataPathScheduleUpdateEvent& event) {
    PostNotification(event);
}

void AwareStateManager::OnPairingRequest(const Hal::PairingRequestEvent& event) {
    PostNotification(event);
}

void AwareStateManager::OnPairingConfirm(const Hal::PairingConfirmEvent& event) {
    PostNotification(event);
}

void AwareStateManager::OnBootstrappingRequest(const Hal::BootstrappingRequestEvent& event) {
    PostNotification(event);
}

void AwareStateManager::OnBootstrappingConfirm(const Hal::BootstrappingConfirmEvent& event) {
    PostNotification(event);
}

void AwareStateManager::OnSuspensionModeChanged(bool isSuspended) {
    PostNotification(SuspensionModeChangedNotification{isSuspended});
}

// ============================================================================
// Dispatcher
// ============================================================================

void AwareStateManager::Post(Command command) {
    std::weak_ptr<bool> alive = alive_;
    loop_.DispatchAsync([this, alive, command = std::move(command)]() mutable {
        if (alive.expired()) {
            return;
        }
        QueueCommand(std::move(command));
        PumpCommands();
    });
}

void AwareStateManager::PostResponse(Response response) {
    std::weak_ptr<bool> alive = alive_;
    loop_.DispatchAsync([this, alive, response = std::move(response)]() mutable {
        if (alive.expired()) {
            return;
        }
        ProcessResponse(std::move(response));
    });
}

void AwareStateManager::PostNotification(Notification notification) {
    std::weak_ptr<bool> alive = alive_;
    loop_.DispatchAsync([this, alive, notification = std::move(notification)]() mutable {
        if (alive.expired()) {
            return;
        }
        ProcessNotification(std::move(notification));
        PumpCommands();
    });
}

void AwareStateManager::PumpCommands() {
    // Execute() may queue follow-up commands; the outer loop picks them up.
    if (pumping_) {
        return;
    }
    pumping_ = true;

    while (stateMachine_.Is(DispatchState::kWait) && !pending_.empty()) {
        Command command = std::move(pending_.front());
        pending_.pop_front();

        const TransactionId txid = txids_.Next();
        AWR_LOG_V3(Core, "Dispatch %{public}s txid=%u pending=%zu", CommandName(command).data(),
                   txid, pending_.size());

        const bool waitForResponse =
            std::visit([this, txid](auto& c) { return Execute(txid, c); }, command);
        if (waitForResponse) {
            BeginWait(txid, std::move(command));
        }
    }

    pumping_ = false;
}

void AwareStateManager::BeginWait(TransactionId txid, Command command) {
    const std::string_view name = CommandName(command);
    current_ = InFlight{txid, std::move(command), loop_.GetClock().Now()};
    stateMachine_.TransitionTo(DispatchState::kAwaitingResponse, name, NowTicks());

    commandTimer_ = loop_.DispatchAfter(config_.commandTimeout,
                                        [this, txid] { OnCommandTimeout(txid); });
    AWR_LOG_KV(Core, name.data(), txid, "awaiting response");
}

void AwareStateManager::EndWait(std::string_view reason) {
    if (commandTimer_ != Scheduling::kInvalidTimer) {
        loop_.Cancel(commandTimer_);
        commandTimer_ = Scheduling::kInvalidTimer;
    }
    stateMachine_.TransitionTo(DispatchState::kWait, reason, NowTicks());
}

void AwareStateManager::ProcessResponse(Response response) {
    const TransactionId txid = TransactionOf(response);
    if (!stateMachine_.Is(DispatchState::kAwaitingResponse) || !current_ ||
        current_->txid != txid) {
        AWR_LOG_RL(Core, "rx/stale_txid", 1000, OS_LOG_TYPE_ERROR,
                   "Dropping response txid=%u: state=%{public}s expected=%u", txid,
                   ToString(stateMachine_.CurrentState()).data(),
                   current_ ? current_->txid : kTransactionIdIgnore);
        return;
    }

    InFlight inFlight = std::move(*current_);
    current_.reset();

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        loop_.GetClock().Now() - inFlight.startTime);
    AWR_LOG_KV(Core, CommandName(inFlight.command).data(), txid, "response after %lldms",
               static_cast<long long>(elapsed.count()));

    EndWait("response");
    std::visit([this, &inFlight](const auto& r) { OnResponse(r, inFlight.command); }, response);
    PumpCommands();
}

void AwareStateManager::OnCommandTimeout(TransactionId txid) {
    commandTimer_ = Scheduling::kInvalidTimer;
    if (!current_ || current_->txid != txid) {
        return;
    }

    InFlight inFlight = std::move(*current_);
    current_.reset();

    AWR_LOG_V0(Core, "Command %{public}s txid=%u timed out", CommandName(inFlight.command).data(),
               txid);
    EndWait("timeout");
    OnTimeout(inFlight.command);
    PumpCommands();
}

uint64_t AwareStateManager::NowTicks() const {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                     loop_.GetClock().Now().time_since_epoch())
                                     .count());
}

// ============================================================================
// Helpers
// ============================================================================

Session::ClientState* AwareStateManager::FindClient(ClientId clientId) {
    auto it = clients_.find(clientId);
    return it == clients_.end() ? nullptr : it->second.get();
}

Session::DiscoverySession* AwareStateManager::FindSession(ClientId clientId, SessionId sessionId,
                                                          const char* caller) {
    Session::ClientState* client = FindClient(clientId);
    if (client == nullptr) {
        AWR_LOG_ERROR(Session, "%{public}s: no client exists for clientId=%d", caller, clientId);
        return nullptr;
    }
    Session::DiscoverySession* session = client->GetSession(sessionId);
    if (session == nullptr) {
        AWR_LOG_ERROR(Session, "%{public}s: no session exists for clientId=%d sessionId=%d",
                      caller, clientId, sessionId);
    }
    return session;
}

std::pair<Session::ClientState*, Session::DiscoverySession*>
AwareStateManager::FindSessionForPubSubId(PubSubId pubSubId) {
    for (auto& [clientId, client] : clients_) {
        if (auto* session = client->GetSessionForPubSubId(pubSubId)) {
            return {client.get(), session};
        }
    }
    return {nullptr, nullptr};
}

std::optional<Config::ConfigRequest> AwareStateManager::MergeWith(
    const Config::ConfigRequest* incoming) const {
    std::vector<const Config::ConfigRequest*> existing;
    existing.reserve(clients_.size());
    for (const auto& [clientId, client] : clients_) {
        existing.push_back(&client->GetConfigRequest());
    }
    return Config::MergeConfigRequests(existing, incoming);
}

bool AwareStateManager::AnyClientNeedsIdentityNotification() const {
    return std::any_of(clients_.begin(), clients_.end(), [](const auto& entry) {
        return entry.second->GetNotifyIdentityChange();
    });
}

bool AwareStateManager::AnyClientNeedsRanging() const {
    return std::any_of(clients_.begin(), clients_.end(),
                       [](const auto& entry) { return entry.second->IsRangingEnabled(); });
}

Hal::InstantMode AwareStateManager::AggregateInstantMode() const {
    const auto now = loop_.GetClock().Now();
    Hal::InstantMode mode = Hal::InstantMode::kDisabled;
    for (const auto& [clientId, client] : clients_) {
        const auto current = client->GetInstantMode(now, config_.instantModeDuration);
        if (current == Hal::InstantMode::k5GHz) {
            return current;
        }
        if (current == Hal::InstantMode::k24GHz) {
            mode = current;
        }
    }
    return mode;
}

int32_t AwareStateManager::InstantModeChannel(Hal::InstantMode mode) const {
    if (mode != Hal::InstantMode::k5GHz) {
        return config_.instantModeChannel24GHz;
    }
    return config_.instantModeChannel5GHz == 0 ? config_.instantModeChannel24GHz
                                               : config_.instantModeChannel5GHz;
}

Hal::EnableRequest AwareStateManager::MakeEnableRequest(const Config::ConfigRequest& merged,
                                                        bool notifyIdentityChange,
                                                        bool initialConfiguration) const {
    const Hal::InstantMode instantMode = AggregateInstantMode();

    Hal::EnableRequest request;
    request.config = merged;
    request.notifyIdentityChange = notifyIdentityChange;
    request.initialConfiguration = initialConfiguration;
    request.rangingEnabled = AnyClientNeedsRanging();
    request.instantModeEnabled = instantMode != Hal::InstantMode::kDisabled;
    request.instantModeChannel = request.instantModeEnabled ? InstantModeChannel(instantMode) : 0;
    request.clusterId = merged.clusterLow == merged.clusterHigh ? merged.clusterLow : 0;
    return request;
}

bool AwareStateManager::IsAwareOffloading() const {
    return std::any_of(clients_.begin(), clients_.end(),
                       [](const auto& entry) { return entry.second->IsAwareOffload(); });
}

bool AwareStateManager::HasPendingDisable() const {
    return std::any_of(pending_.begin(), pending_.end(), [](const Command& command) {
        return std::holds_alternative<DisableCommand>(command);
    });
}

void AwareStateManager::ReconfigureIfSessionNeedsChanged() {
    if (currentRangingEnabled_ != AnyClientNeedsRanging() ||
        currentInstantMode_ != AggregateInstantMode()) {
        AWR_LOG_V2(Core, "Session requirements changed: queueing reconfigure");
        QueueCommand(ReconfigureCommand{});
    }
}

} // namespace AWR::Core
