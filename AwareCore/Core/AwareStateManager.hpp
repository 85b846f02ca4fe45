#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "CommandStateMachine.hpp"
#include "IInterfaceConflictArbiter.hpp"
#include "Messages.hpp"
#include "SendMessageQueue.hpp"
#include "TransactionIdAllocator.hpp"
#include "../Common/Error.hpp"
#include "../Config/Capabilities.hpp"
#include "../Config/CoreConfig.hpp"
#include "../DataPath/DataPathManager.hpp"
#include "../Hal/IAwareHalCallback.hpp"
#include "../Hal/InterfaceManager.hpp"
#include "../Scheduling/EventLoop.hpp"
#include "../Scheduling/Timeout.hpp"
#include "../Session/ClientState.hpp"
#include "../Session/PendingRequests.hpp"

namespace AWR::Core {

/**
 * \brief Control plane of the Aware service.
 *
 * Serializes every client request into a command queue and runs at most one HAL
 * command at a time. A command that expects a HAL response moves the dispatcher to
 * kAwaitingResponse and arms the command timeout; the next command runs once the
 * response with the matching transaction ID arrives or the timeout fires. HAL
 * notifications are never deferred.
 *
 * \par Threading
 * Front-door methods may be called from any thread: they validate their arguments
 * and post to the event loop. Read-only queries run synchronously on the loop.
 * HAL callbacks may arrive on any thread and are posted to the loop as well.
 * Client and session callbacks are invoked on the loop.
 */
class AwareStateManager final : public Hal::IAwareHalCallback, public DataPath::IDataPathControl {
public:
    struct Dependencies {
        std::shared_ptr<Hal::IAwareInterfaceProvider> interfaceProvider;
        // Optional: without an arbiter every attach executes immediately.
        std::shared_ptr<IInterfaceConflictArbiter> conflictArbiter;
        std::shared_ptr<DataPath::IDataPathListener> dataPathListener;
    };

    static constexpr int32_t kMaxSendRetryCount = 5;

    AwareStateManager(const Config::CoreConfig& config, Scheduling::EventLoop& loop,
                      Dependencies deps);
    ~AwareStateManager() override;

    AwareStateManager(const AwareStateManager&) = delete;
    AwareStateManager& operator=(const AwareStateManager&) = delete;

    // Fetches capabilities once the host is up.
    void Start();

    void EnableUsage();
    void DisableUsage(bool markAsAvailable);
    [[nodiscard]] bool IsUsageEnabled() const;

    // ------------------------------------------------------------------------
    // Attach
    // ------------------------------------------------------------------------

    Result<void> Connect(const Session::ClientIdentity& identity,
                         std::shared_ptr<Callbacks::IEventCallback> callback,
                         const Config::ConfigRequest& config, bool notifyIdentityChange,
                         bool locationPermitted, bool awareOffload = false);
    void Disconnect(ClientId clientId);
    void Reconfigure();

    // Answers a WaitForUser decision of the conflict arbiter.
    void ResolveInterfaceConflict(bool approved);

    // ------------------------------------------------------------------------
    // Discovery
    // ------------------------------------------------------------------------

    Result<void> Publish(ClientId clientId, const Hal::PublishConfig& config,
                         std::shared_ptr<Callbacks::IDiscoverySessionCallback> callback);
    Result<void> UpdatePublish(ClientId clientId, SessionId sessionId,
                               const Hal::PublishConfig& config);
    Result<void> Subscribe(ClientId clientId, const Hal::SubscribeConfig& config,
                           std::shared_ptr<Callbacks::IDiscoverySessionCallback> callback);
    Result<void> UpdateSubscribe(ClientId clientId, SessionId sessionId,
                                 const Hal::SubscribeConfig& config);
    void TerminateSession(ClientId clientId, SessionId sessionId);

    Result<void> SendMessage(int32_t uid, ClientId clientId, SessionId sessionId, PeerId peerId,
                             std::vector<uint8_t> message, int32_t messageId,
                             int32_t retryCount);

    void Suspend(ClientId clientId, SessionId sessionId);
    void Resume(ClientId clientId, SessionId sessionId);

    // ------------------------------------------------------------------------
    // Pairing / bootstrapping
    // ------------------------------------------------------------------------

    Result<void> InitiatePairing(ClientId clientId, SessionId sessionId, PeerId peerId,
                                 Hal::PairingRequestType requestType,
                                 const Hal::PairingSecurity& security, std::string alias);
    Result<void> RespondToPairingRequest(ClientId clientId, SessionId sessionId, PeerId peerId,
                                         PairingId pairingId, bool accept,
                                         Hal::PairingRequestType requestType,
                                         const Hal::PairingSecurity& security,
                                         std::string alias);
    void EndPairing(PairingId pairingId);

    Result<void> InitiateBootstrapping(ClientId clientId, SessionId sessionId, PeerId peerId,
                                       uint32_t method);
    void RespondToBootstrapping(ClientId clientId, SessionId sessionId, PeerId peerId,
                                BootstrappingId bootstrappingId, bool accept, uint32_t method);

    // ------------------------------------------------------------------------
    // Data path
    // ------------------------------------------------------------------------

    // Out-of-band requests skip the session lookup; clientId/sessionId are ignored.
    Result<void> InitiateDataPath(DataPath::DataPathRequestId requestId, ClientId clientId,
                                  SessionId sessionId, const Hal::InitiateDataPathRequest& request);
    Result<void> RespondToDataPathRequest(ClientId clientId, SessionId sessionId,
                                          const Hal::RespondToDataPathRequest& request);
    void EndDataPath(NdpId ndpId) override;

    // ------------------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------------------

    // Acquires the interface only long enough to read capabilities, when unknown.
    void TryToGetCapabilities();

    [[nodiscard]] std::optional<Config::Capabilities> GetCapabilities() const;
    [[nodiscard]] std::optional<Config::Characteristics> GetCharacteristics() const;
    [[nodiscard]] std::optional<Config::AwareResources> GetAvailableResources() const;

    // Privileged lookup. Unknown handles, or handles of another uid, are left out.
    [[nodiscard]] std::map<PeerId, MacAddress> RequestMacAddresses(
        int32_t uid, const std::vector<PeerId>& peerIds) const;

    [[nodiscard]] DispatchState CurrentDispatchState() const;
    [[nodiscard]] std::optional<StateTransition> LastTransition() const;
    [[nodiscard]] size_t ClientCount() const;

    // ------------------------------------------------------------------------
    // IAwareHalCallback
    // ------------------------------------------------------------------------

    void OnCapabilitiesUpdateResponse(TransactionId txid,
                                      const Config::Capabilities& capabilities) override;
    void OnConfigSuccessResponse(TransactionId txid) override;
    void OnConfigFailedResponse(TransactionId txid, NanStatus reason) override;
    void OnDisableResponse(TransactionId txid, NanStatus status) override;
    void OnSessionConfigSuccessResponse(TransactionId txid, bool isPublish,
                                        PubSubId pubSubId) override;
    void OnSessionConfigFailResponse(TransactionId txid, bool isPublish,
                                     NanStatus reason) override;
    void OnMessageSendQueuedSuccessResponse(TransactionId txid) override;
    void OnMessageSendQueuedFailResponse(TransactionId txid, NanStatus reason) override;
    void OnCreateDataInterfaceResponse(TransactionId txid, bool success,
                                       NanStatus reason) override;
    void OnDeleteDataInterfaceResponse(TransactionId txid, bool success,
                                       NanStatus reason) override;
    void OnInitiateDataPathResponse(TransactionId txid, bool success, NanStatus reason,
                                    NdpId ndpId) override;
    void OnRespondToDataPathRequestResponse(TransactionId txid, bool success,
                                            NanStatus reason) override;
    void OnEndDataPathResponse(TransactionId txid, bool success, NanStatus reason) override;
    void OnInitiatePairingResponse(TransactionId txid, bool success, NanStatus reason,
                                   PairingId pairingId) override;
    void OnRespondToPairingResponse(TransactionId txid, bool success, NanStatus reason) override;
    void OnEndPairingResponse(TransactionId txid, bool success, NanStatus reason) override;
    void OnInitiateBootstrappingResponse(TransactionId txid, bool success, NanStatus reason,
                                         BootstrappingId bootstrappingId) override;
    void OnRespondToBootstrappingResponse(TransactionId txid, bool success,
                                          NanStatus reason) override;
    void OnSuspendResponse(TransactionId txid, NanStatus status) override;
    void OnResumeResponse(TransactionId txid, NanStatus status) override;

    void OnInterfaceAddressChange(const MacAddress& mac) override;
    void OnClusterChange(ClusterEventType eventType, const MacAddress& clusterId) override;
    void OnMatch(const Hal::MatchEvent& event) override;
    void OnMatchExpired(PubSubId pubSubId, InstanceId requestorInstanceId) override;
    void OnSessionTerminated(PubSubId pubSubId, NanStatus reason, bool isPublish) override;
    void OnMessageReceived(const Hal::MessageReceivedEvent& event) override;
    void OnAwareDown(NanStatus reason) override;
    void OnMessageSendSuccess(TransactionId txid) override;
    void OnMessageSendFail(TransactionId txid, NanStatus reason) override;
    void OnDataPathRequest(const Hal::DataPathRequestEvent& event) override;
    void OnDataPathConfirm(const Hal::DataPathConfirmEvent& event) override;
    void OnDataPathEnd(NdpId ndpId) override;
    void OnDataPathScheduleUpdate(const Hal::DataPathScheduleUpdateEvent& event) override;
    void OnPairingRequest(const Hal::PairingRequestEvent& event) override;
    void OnPairingConfirm(const Hal::PairingConfirmEvent& event) override;
    void OnBootstrappingRequest(const Hal::BootstrappingRequestEvent& event) override;
    void OnBootstrappingConfirm(const Hal::BootstrappingConfirmEvent& event) override;
    void OnSuspensionModeChanged(bool isSuspended) override;

private:
    struct InFlight {
        TransactionId txid{kTransactionIdIgnore};
        Command command;
        Scheduling::TimePoint startTime{};
    };

    // IDataPathControl: issued from the loop by DataPathManager.
    void CreateDataInterface(const std::string& name) override;
    void DeleteDataInterface(const std::string& name) override;

    // ---- Loop plumbing (AwareStateManager.cpp) ----
    void Post(Command command);
    void PostResponse(Response response);
    void PostNotification(Notification notification);
    void QueueCommand(Command command) { pending_.push_back(std::move(command)); }
    void PumpCommands();
    void BeginWait(TransactionId txid, Command command);
    void EndWait(std::string_view reason);
    void ProcessResponse(Response response);
    void OnCommandTimeout(TransactionId txid);
    [[nodiscard]] uint64_t NowTicks() const;

    // ---- Command execution (AwareStateManagerCommands.cpp) ----
    // Each returns true when the command now waits for a HAL response.
    bool Execute(TransactionId txid, ConnectCommand& command);
    bool Execute(TransactionId txid, DisconnectCommand& command);
    bool Execute(TransactionId txid, DisableCommand& command);
    bool Execute(TransactionId txid, ReconfigureCommand& command);
    bool Execute(TransactionId txid, TerminateSessionCommand& command);
    bool Execute(TransactionId txid, PublishCommand& command);
    bool Execute(TransactionId txid, UpdatePublishCommand& command);
    bool Execute(TransactionId txid, SubscribeCommand& command);
    bool Execute(TransactionId txid, UpdateSubscribeCommand& command);
    bool Execute(TransactionId txid, EnqueueSendMessageCommand& command);
    bool Execute(TransactionId txid, TransmitNextMessageCommand& command);
    bool Execute(TransactionId txid, InitiatePairingCommand& command);
    bool Execute(TransactionId txid, RespondToPairingCommand& command);
    bool Execute(TransactionId txid, EndPairingCommand& command);
    bool Execute(TransactionId txid, InitiateBootstrappingCommand& command);
    bool Execute(TransactionId txid, RespondToBootstrappingCommand& command);
    bool Execute(TransactionId txid, EnableUsageCommand& command);
    bool Execute(TransactionId txid, DisableUsageCommand& command);
    bool Execute(TransactionId txid, GetCapabilitiesCommand& command);
    bool Execute(TransactionId txid, CreateDataInterfaceCommand& command);
    bool Execute(TransactionId txid, DeleteDataInterfaceCommand& command);
    bool Execute(TransactionId txid, DeleteAllDataInterfacesCommand& command);
    bool Execute(TransactionId txid, InitiateDataPathCommand& command);
    bool Execute(TransactionId txid, RespondToDataPathCommand& command);
    bool Execute(TransactionId txid, EndDataPathCommand& command);
    bool Execute(TransactionId txid, DelayedInitializationCommand& command);
    bool Execute(TransactionId txid, GetInterfaceCommand& command);
    bool Execute(TransactionId txid, ReleaseInterfaceCommand& command);
    bool Execute(TransactionId txid, SuspendSessionCommand& command);
    bool Execute(TransactionId txid, ResumeSessionCommand& command);

    bool ConnectLocal(TransactionId txid, ConnectCommand& command);
    void DeferDisable(bool releaseInterface);
    void DisableUsageLocal(bool markAsAvailable);

    // ---- Responses and timeouts (AwareStateManagerResponses.cpp) ----
    void OnResponse(const CapabilitiesResponse& response, Command& command);
    void OnResponse(const ConfigResponse& response, Command& command);
    void OnResponse(const DisableResponse& response, Command& command);
    void OnResponse(const SessionConfigResponse& response, Command& command);
    void OnResponse(const MessageQueuedResponse& response, Command& command);
    void OnResponse(const DataInterfaceResponse& response, Command& command);
    void OnResponse(const InitiateDataPathResponse& response, Command& command);
    void OnResponse(const RespondToDataPathResponse& response, Command& command);
    void OnResponse(const EndDataPathResponse& response, Command& command);
    void OnResponse(const InitiatePairingResponse& response, Command& command);
    void OnResponse(const RespondToPairingResponse& response, Command& command);
    void OnResponse(const EndPairingResponse& response, Command& command);
    void OnResponse(const InitiateBootstrappingResponse& response, Command& command);
    void OnResponse(const RespondToBootstrappingResponse& response, Command& command);
    void OnResponse(const SuspendResponse& response, Command& command);
    void OnResponse(const ResumeResponse& response, Command& command);
    void OnTimeout(Command& command);

    void OnConfigCompleted(Command& command);
    void OnConfigFailed(Command& command, NanStatus reason);
    void OnDisableCompleted(const DisableCommand& command, NanStatus status);
    void OnSessionConfigSucceeded(Command& command, bool isPublish, PubSubId pubSubId);
    void OnSessionConfigFailed(Command& command, bool isPublish, NanStatus reason);
    void OnMessageQueued(TransmitNextMessageCommand& command, TransactionId txid);
    void OnMessageQueueFailed(TransmitNextMessageCommand& command, NanStatus reason);
    void OnInitiatePairingFailed(const InitiatePairingCommand& command);
    void OnRespondToPairingFailed(const RespondToPairingCommand& command);
    void OnInitiateBootstrappingFailed(const InitiateBootstrappingCommand& command);
    void OnRespondToDataPathResult(const RespondToDataPathCommand& command, bool success,
                                   NanStatus reason);

    void ArmDataPathTimeout(NdpId ndpId);
    void ArmPairingTimeout(PairingId pairingId, Hal::PairingRequestType requestType);
    void ArmBootstrappingTimeout(BootstrappingId bootstrappingId);

    // ---- Notifications (AwareStateManagerNotifications.cpp) ----
    void ProcessNotification(Notification notification);
    void OnNotification(const InterfaceAddressChangedNotification& notification);
    void OnNotification(const ClusterChangedNotification& notification);
    void OnNotification(const Hal::MatchEvent& event);
    void OnNotification(const MatchExpiredNotification& notification);
    void OnNotification(const SessionTerminatedNotification& notification);
    void OnNotification(const Hal::MessageReceivedEvent& event);
    void OnNotification(const AwareDownNotification& notification);
    void OnNotification(const MessageSendSuccessNotification& notification);
    void OnNotification(const MessageSendFailNotification& notification);
    void OnNotification(const Hal::DataPathRequestEvent& event);
    void OnNotification(const Hal::DataPathConfirmEvent& event);
    void OnNotification(const DataPathEndNotification& notification);
    void OnNotification(const Hal::DataPathScheduleUpdateEvent& event);
    void OnNotification(const Hal::PairingRequestEvent& event);
    void OnNotification(const Hal::PairingConfirmEvent& event);
    void OnNotification(const Hal::BootstrappingRequestEvent& event);
    void OnNotification(const Hal::BootstrappingConfirmEvent& event);
    void OnNotification(const SuspensionModeChangedNotification& notification);

    // Returns true when a pending pairing was consumed.
    bool DeliverPairingConfirm(PairingId pairingId, bool accept, NanStatus reason,
                               Hal::PairingRequestType requestType);
    bool DeliverBootstrappingConfirm(const Hal::BootstrappingConfirmEvent& event);
    void OnAwareDownLocal();

    // ---- Follow-on messages ----
    void TransmitNextMessage() { QueueCommand(TransmitNextMessageCommand{}); }
    void UpdateSendMessageTimeout();
    void OnSendMessageTimeout();
    void ReportMessageSendSuccess(const QueuedMessage& message);
    void ReportMessageSendFail(const QueuedMessage& message, NanStatus reason);

    // ---- Helpers ----
    [[nodiscard]] Hal::IAwareHal* HalInterface() const noexcept { return interfaces_.Interface(); }
    Session::ClientState* FindClient(ClientId clientId);
    Session::DiscoverySession* FindSession(ClientId clientId, SessionId sessionId,
                                           const char* caller);
    std::pair<Session::ClientState*, Session::DiscoverySession*> FindSessionForPubSubId(
        PubSubId pubSubId);

    [[nodiscard]] std::optional<Config::ConfigRequest> MergeWith(
        const Config::ConfigRequest* incoming) const;
    [[nodiscard]] bool AnyClientNeedsIdentityNotification() const;
    [[nodiscard]] bool AnyClientNeedsRanging() const;
    [[nodiscard]] Hal::InstantMode AggregateInstantMode() const;
    [[nodiscard]] int32_t InstantModeChannel(Hal::InstantMode mode) const;
    [[nodiscard]] Hal::EnableRequest MakeEnableRequest(const Config::ConfigRequest& merged,
                                                       bool notifyIdentityChange,
                                                       bool initialConfiguration) const;
    [[nodiscard]] bool IsAwareOffloading() const;
    [[nodiscard]] bool HasPendingDisable() const;
    // Queues a reconfigure when ranging or instant mode no longer match the clients.
    void ReconfigureIfSessionNeedsChanged();

    Config::CoreConfig config_;
    Scheduling::EventLoop& loop_;
    Dependencies deps_;

    Hal::InterfaceManager interfaces_;
    DataPath::DataPathManager dataPaths_;

    // Dispatcher
    CommandStateMachine stateMachine_;
    TransactionIdAllocator txids_;
    std::deque<Command> pending_;
    std::optional<InFlight> current_;
    Scheduling::TimerId commandTimer_{Scheduling::kInvalidTimer};
    std::optional<ConnectCommand> parkedConnect_;
    bool pumping_{false};

    // Clients
    std::map<ClientId, std::unique_ptr<Session::ClientState>> clients_;
    SessionId nextSessionId_{1};

    // Radio state
    bool usageEnabled_{false};
    bool awareIsDisabling_{false};
    std::optional<Config::ConfigRequest> currentConfig_;
    bool currentIdentityNotification_{false};
    bool currentRangingEnabled_{false};
    Hal::InstantMode currentInstantMode_{Hal::InstantMode::kDisabled};
    MacAddress currentDiscoveryMac_{kAllZeroMac};
    MacAddress clusterId_{kAllZeroMac};
    ClusterEventType clusterEventType_{ClusterEventType::kDiscoveryMacAddressChanged};
    std::optional<Config::Capabilities> capabilities_;
    mutable std::optional<Config::Characteristics> characteristics_;

    // Follow-on messages
    SendMessageQueue sendQueue_;
    Scheduling::Timeout sendMessageTimeout_;

    // Timers
    Scheduling::Timeout instantModeReconfigure_;
    Scheduling::KeyedTimeouts<NdpId> dataPathTimeouts_;
    Scheduling::KeyedTimeouts<PairingId> pairingTimeouts_;
    Scheduling::KeyedTimeouts<BootstrappingId> bootstrappingTimeouts_;
    // COMEBACK re-initiations, keyed by the bootstrapping ID that asked for them.
    Scheduling::KeyedTimeouts<BootstrappingId> bootstrappingComebacks_;

    Session::PairingRequests pairingRequests_;
    Session::BootstrappingRequests bootstrappingRequests_;

    std::shared_ptr<bool> alive_;
};

} // namespace AWR::Core
