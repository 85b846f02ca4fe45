#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include "SendMessageQueue.hpp"
#include "../Callbacks/IDiscoverySessionCallback.hpp"
#include "../Callbacks/IEventCallback.hpp"
#include "../Config/Capabilities.hpp"
#include "../Config/ConfigRequest.hpp"
#include "../DataPath/IDataPathListener.hpp"
#include "../Hal/HalTypes.hpp"
#include "../Session/ClientState.hpp"

namespace AWR::Core {

// std::visit helper: builds one visitor from a set of lambdas.
template <typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

// ============================================================================
// Commands: serialized, at most one waiting for a HAL response
// ============================================================================

struct ConnectCommand {
    static constexpr std::string_view kName = "Connect";
    Session::ClientIdentity identity;
    std::shared_ptr<Callbacks::IEventCallback> callback;
    Config::ConfigRequest config;
    bool notifyIdentityChange{false};
    bool locationPermitted{false};
    bool awareOffload{false};
    bool reEnableAware{false};
    // Set when replayed after the interface conflict prompt was approved.
    bool conflictResolved{false};
};

struct DisconnectCommand {
    static constexpr std::string_view kName = "Disconnect";
    ClientId clientId{0};
};

struct DisableCommand {
    static constexpr std::string_view kName = "Disable";
    bool releaseInterface{false};
};

struct ReconfigureCommand {
    static constexpr std::string_view kName = "Reconfigure";
};

struct TerminateSessionCommand {
    static constexpr std::string_view kName = "TerminateSession";
    ClientId clientId{0};
    SessionId sessionId{0};
};

struct PublishCommand {
    static constexpr std::string_view kName = "Publish";
    ClientId clientId{0};
    Hal::PublishConfig config;
    std::shared_ptr<Callbacks::IDiscoverySessionCallback> callback;
};

struct UpdatePublishCommand {
    static constexpr std::string_view kName = "UpdatePublish";
    ClientId clientId{0};
    SessionId sessionId{0};
    Hal::PublishConfig config;
};

struct SubscribeCommand {
    static constexpr std::string_view kName = "Subscribe";
    ClientId clientId{0};
    Hal::SubscribeConfig config;
    std::shared_ptr<Callbacks::IDiscoverySessionCallback> callback;
};

struct UpdateSubscribeCommand {
    static constexpr std::string_view kName = "UpdateSubscribe";
    ClientId clientId{0};
    SessionId sessionId{0};
    Hal::SubscribeConfig config;
};

struct EnqueueSendMessageCommand {
    static constexpr std::string_view kName = "EnqueueSendMessage";
    QueuedMessage message;
};

struct TransmitNextMessageCommand {
    static constexpr std::string_view kName = "TransmitNextMessage";
    // Filled when the command is dispatched.
    std::optional<QueuedMessage> sent;
};

struct InitiatePairingCommand {
    static constexpr std::string_view kName = "InitiatePairing";
    ClientId clientId{0};
    SessionId sessionId{0};
    PeerId peerId{0};
    Hal::PairingRequestType requestType{Hal::PairingRequestType::kSetup};
    Hal::PairingSecurity security;
    std::string alias;
};

struct RespondToPairingCommand {
    static constexpr std::string_view kName = "RespondToPairing";
    ClientId clientId{0};
    SessionId sessionId{0};
    PeerId peerId{0};
    PairingId pairingId{0};
    bool accept{false};
    Hal::PairingRequestType requestType{Hal::PairingRequestType::kSetup};
    Hal::PairingSecurity security;
    std::string alias;
};

struct EndPairingCommand {
    static constexpr std::string_view kName = "EndPairing";
    PairingId pairingId{0};
};

struct InitiateBootstrappingCommand {
    static constexpr std::string_view kName = "InitiateBootstrapping";
    ClientId clientId{0};
    SessionId sessionId{0};
    PeerId peerId{0};
    uint32_t method{0};
    std::vector<uint8_t> cookie;
    bool isComeback{false};
};

struct RespondToBootstrappingCommand {
    static constexpr std::string_view kName = "RespondToBootstrapping";
    ClientId clientId{0};
    SessionId sessionId{0};
    PeerId peerId{0};
    BootstrappingId bootstrappingId{0};
    bool accept{false};
    uint32_t method{0};
};

struct EnableUsageCommand {
    static constexpr std::string_view kName = "EnableUsage";
};

struct DisableUsageCommand {
    static constexpr std::string_view kName = "DisableUsage";
    bool markAsAvailable{false};
};

struct GetCapabilitiesCommand {
    static constexpr std::string_view kName = "GetCapabilities";
};

struct CreateDataInterfaceCommand {
    static constexpr std::string_view kName = "CreateDataInterface";
    std::string name;
};

struct DeleteDataInterfaceCommand {
    static constexpr std::string_view kName = "DeleteDataInterface";
    std::string name;
};

struct DeleteAllDataInterfacesCommand {
    static constexpr std::string_view kName = "DeleteAllDataInterfaces";
};

struct InitiateDataPathCommand {
    static constexpr std::string_view kName = "InitiateDataPath";
    DataPath::DataPathRequestId requestId{0};
    ClientId clientId{0};
    SessionId sessionId{0};
    // pubSubId is filled from the session unless out-of-band.
    Hal::InitiateDataPathRequest request;
};

struct RespondToDataPathCommand {
    static constexpr std::string_view kName = "RespondToDataPath";
    ClientId clientId{0};
    SessionId sessionId{0};
    Hal::RespondToDataPathRequest request;
};

struct EndDataPathCommand {
    static constexpr std::string_view kName = "EndDataPath";
    NdpId ndpId{0};
};

struct DelayedInitializationCommand {
    static constexpr std::string_view kName = "DelayedInitialization";
};

struct GetInterfaceCommand {
    static constexpr std::string_view kName = "GetInterface";
};

struct ReleaseInterfaceCommand {
    static constexpr std::string_view kName = "ReleaseInterface";
};

struct SuspendSessionCommand {
    static constexpr std::string_view kName = "SuspendSession";
    ClientId clientId{0};
    SessionId sessionId{0};
};

struct ResumeSessionCommand {
    static constexpr std::string_view kName = "ResumeSession";
    ClientId clientId{0};
    SessionId sessionId{0};
};

using Command = std::variant<
    ConnectCommand, DisconnectCommand, DisableCommand, ReconfigureCommand,
    TerminateSessionCommand, PublishCommand, UpdatePublishCommand, SubscribeCommand,
    UpdateSubscribeCommand, EnqueueSendMessageCommand, TransmitNextMessageCommand,
    InitiatePairingCommand, RespondToPairingCommand, EndPairingCommand,
    InitiateBootstrappingCommand, RespondToBootstrappingCommand, EnableUsageCommand,
    DisableUsageCommand, GetCapabilitiesCommand, CreateDataInterfaceCommand,
    DeleteDataInterfaceCommand, DeleteAllDataInterfacesCommand, InitiateDataPathCommand,
    RespondToDataPathCommand, EndDataPathCommand, DelayedInitializationCommand,
    GetInterfaceCommand, ReleaseInterfaceCommand, SuspendSessionCommand, ResumeSessionCommand>;

[[nodiscard]] inline std::string_view CommandName(const Command& command) {
    return std::visit([](const auto& c) { return std::decay_t<decltype(c)>::kName; }, command);
}

// ============================================================================
// Responses: correlated with the in-flight command by transaction ID
// ============================================================================

struct CapabilitiesResponse {
    TransactionId txid{kTransactionIdIgnore};
    Config::Capabilities capabilities;
};

struct ConfigResponse {
    TransactionId txid{kTransactionIdIgnore};
    bool success{false};
    NanStatus reason{NanStatus::kSuccess};
};

struct DisableResponse {
    TransactionId txid{kTransactionIdIgnore};
    NanStatus status{NanStatus::kSuccess};
};

struct SessionConfigResponse {
    TransactionId txid{kTransactionIdIgnore};
    bool success{false};
    bool isPublish{false};
    PubSubId pubSubId{0};
    NanStatus reason{NanStatus::kSuccess};
};

struct MessageQueuedResponse {
    TransactionId txid{kTransactionIdIgnore};
    bool success{false};
    NanStatus reason{NanStatus::kSuccess};
};

struct DataInterfaceResponse {
    TransactionId txid{kTransactionIdIgnore};
    bool create{false};
    bool success{false};
    NanStatus reason{NanStatus::kSuccess};
};

struct InitiateDataPathResponse {
    TransactionId txid{kTransactionIdIgnore};
    bool success{false};
    NanStatus reason{NanStatus::kSuccess};
    NdpId ndpId{0};
};

struct RespondToDataPathResponse {
    TransactionId txid{kTransactionIdIgnore};
    bool success{false};
    NanStatus reason{NanStatus::kSuccess};
};

struct EndDataPathResponse {
    TransactionId txid{kTransactionIdIgnore};
    bool success{false};
    NanStatus reason{NanStatus::kSuccess};
};

struct InitiatePairingResponse {
    TransactionId txid{kTransactionIdIgnore};
    bool success{false};
    NanStatus reason{NanStatus::kSuccess};
    PairingId pairingId{0};
};

struct RespondToPairingResponse {
    TransactionId txid{kTransactionIdIgnore};
    bool success{false};
    NanStatus reason{NanStatus::kSuccess};
};

struct EndPairingResponse {
    TransactionId txid{kTransactionIdIgnore};
    bool success{false};
    NanStatus reason{NanStatus::kSuccess};
};

struct InitiateBootstrappingResponse {
    TransactionId txid{kTransactionIdIgnore};
    bool success{false};
    NanStatus reason{NanStatus::kSuccess};
    BootstrappingId bootstrappingId{0};
};

struct RespondToBootstrappingResponse {
    TransactionId txid{kTransactionIdIgnore};
    bool success{false};
    NanStatus reason{NanStatus::kSuccess};
};

struct SuspendResponse {
    TransactionId txid{kTransactionIdIgnore};
    NanStatus status{NanStatus::kSuccess};
};

struct ResumeResponse {
    TransactionId txid{kTransactionIdIgnore};
    NanStatus status{NanStatus::kSuccess};
};

using Response = std::variant<
    CapabilitiesResponse, ConfigResponse, DisableResponse, SessionConfigResponse,
    MessageQueuedResponse, DataInterfaceResponse, InitiateDataPathResponse,
    RespondToDataPathResponse, EndDataPathResponse, InitiatePairingResponse,
    RespondToPairingResponse, EndPairingResponse, InitiateBootstrappingResponse,
    RespondToBootstrappingResponse, SuspendResponse, ResumeResponse>;

[[nodiscard]] inline TransactionId TransactionOf(const Response& response) {
    return std::visit([](const auto& r) { return r.txid; }, response);
}

// ============================================================================
// Notifications: never deferred
// ============================================================================

struct InterfaceAddressChangedNotification {
    MacAddress mac{};
};

struct ClusterChangedNotification {
    ClusterEventType eventType{ClusterEventType::kDiscoveryMacAddressChanged};
    MacAddress clusterId{};
};

struct MatchExpiredNotification {
    PubSubId pubSubId{0};
    InstanceId requestorInstanceId{0};
};

struct SessionTerminatedNotification {
    PubSubId pubSubId{0};
    NanStatus reason{NanStatus::kSuccess};
    bool isPublish{false};
};

struct AwareDownNotification {
    NanStatus reason{NanStatus::kSuccess};
};

struct MessageSendSuccessNotification {
    TransactionId txid{kTransactionIdIgnore};
};

struct MessageSendFailNotification {
    TransactionId txid{kTransactionIdIgnore};
    NanStatus reason{NanStatus::kSuccess};
};

struct DataPathEndNotification {
    NdpId ndpId{0};
};

struct SuspensionModeChangedNotification {
    bool isSuspended{false};
};

using Notification = std::variant<
    InterfaceAddressChangedNotification, ClusterChangedNotification, Hal::MatchEvent,
    MatchExpiredNotification, SessionTerminatedNotification, Hal::MessageReceivedEvent,
    AwareDownNotification, MessageSendSuccessNotification, MessageSendFailNotification,
    Hal::DataPathRequestEvent, Hal::DataPathConfirmEvent, DataPathEndNotification,
    Hal::DataPathScheduleUpdateEvent, Hal::PairingRequestEvent, Hal::PairingConfirmEvent,
    Hal::BootstrappingRequestEvent, Hal::BootstrappingConfirmEvent,
    SuspensionModeChangedNotification>;

} // namespace AWR::Core
