#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../Common/Identifiers.hpp"
#include "../Common/MacAddress.hpp"
#include "../Common/StatusCodes.hpp"
#include "../Config/ConfigRequest.hpp"

namespace AWR::Hal {

// ============================================================================
// Discovery configuration
// ============================================================================

enum class PublishType : uint8_t {
    kUnsolicited,
    kSolicited,
    kUnsolicitedSolicited,
};

enum class SubscribeType : uint8_t {
    kPassive,
    kActive,
};

enum class InstantModeBand : uint8_t {
    k24GHz,
    k5GHz,
};

// Aggregate instant communication request, ordered by precedence.
enum class InstantMode : uint8_t {
    kDisabled,
    k24GHz,
    k5GHz,
};

// Bootstrapping method bits.
namespace BootstrappingMethod {
inline constexpr uint32_t kOpportunistic    = 1u << 0;
inline constexpr uint32_t kPinCodeDisplay   = 1u << 1;
inline constexpr uint32_t kPassphraseDisplay = 1u << 2;
inline constexpr uint32_t kQrDisplay        = 1u << 3;
inline constexpr uint32_t kNfcTag           = 1u << 4;
inline constexpr uint32_t kPinCodeKeypad    = 1u << 5;
inline constexpr uint32_t kPassphraseKeypad = 1u << 6;
inline constexpr uint32_t kQrScan           = 1u << 7;
inline constexpr uint32_t kNfcReader        = 1u << 8;
inline constexpr uint32_t kServiceManaged   = 1u << 14;
inline constexpr uint32_t kHandshakeSkipped = 1u << 15;
} // namespace BootstrappingMethod

struct PairingConfig {
    bool setupEnabled{false};
    bool cacheEnabled{false};
    bool verificationEnabled{false};
    uint32_t bootstrappingMethods{0};

    bool operator==(const PairingConfig&) const = default;
};

struct PublishConfig {
    std::string serviceName;
    std::vector<uint8_t> serviceSpecificInfo;
    std::vector<uint8_t> matchFilter;
    PublishType publishType{PublishType::kUnsolicited};
    int32_t ttlSec{0};
    bool enableTerminateNotification{true};
    bool enableRanging{false};
    bool enableInstantMode{false};
    InstantModeBand instantModeBand{InstantModeBand::k24GHz};
    bool suspendable{false};
    std::optional<PairingConfig> pairingConfig;
};

struct SubscribeConfig {
    std::string serviceName;
    std::vector<uint8_t> serviceSpecificInfo;
    std::vector<uint8_t> matchFilter;
    SubscribeType subscribeType{SubscribeType::kPassive};
    int32_t ttlSec{0};
    bool enableTerminateNotification{true};
    bool minDistanceMmSet{false};
    int32_t minDistanceMm{0};
    bool maxDistanceMmSet{false};
    int32_t maxDistanceMm{0};
    bool enableInstantMode{false};
    InstantModeBand instantModeBand{InstantModeBand::k24GHz};
    bool suspendable{false};
    std::optional<PairingConfig> pairingConfig;
};

// ============================================================================
// Enable / configure
// ============================================================================

struct EnableRequest {
    Config::ConfigRequest config;
    bool notifyIdentityChange{false};
    bool initialConfiguration{false};
    bool rangingEnabled{false};
    bool instantModeEnabled{false};
    int32_t instantModeChannel{0};
    int32_t clusterId{0};
};

// ============================================================================
// Data path
// ============================================================================

enum class ChannelRequestType : uint8_t {
    kNotRequested,
    kRequested,
    kForceRequested,
};

struct DataPathSecurityConfig {
    uint32_t cipherSuite{0};
    std::vector<uint8_t> pmk;
    std::string passphrase;
    std::vector<uint8_t> pmkId;
};

struct ChannelInfo {
    int32_t channelFrequencyMhz{0};
    int32_t channelBandwidth{0};
    int32_t numSpatialStreams{0};

    bool operator==(const ChannelInfo&) const = default;
};

struct InitiateDataPathRequest {
    InstanceId peerInstanceId{0};
    ChannelRequestType channelRequestType{ChannelRequestType::kNotRequested};
    int32_t channel{0};
    MacAddress peerMac{};
    std::string interfaceName;
    bool isOutOfBand{false};
    std::vector<uint8_t> appInfo;
    DataPathSecurityConfig security;
    PubSubId pubSubId{0};
};

struct RespondToDataPathRequest {
    bool accept{false};
    NdpId ndpId{0};
    std::string interfaceName;
    std::vector<uint8_t> appInfo;
    bool isOutOfBand{false};
    DataPathSecurityConfig security;
    PubSubId pubSubId{0};
};

// ============================================================================
// Pairing / bootstrapping
// ============================================================================

enum class PairingRequestType : uint8_t {
    kSetup = 0,
    kVerification = 1,
};

enum class BootstrappingResponseCode : uint8_t {
    kAccept = 0,
    kReject = 1,
    kComeback = 2,
};

struct PairingSecurity {
    int32_t akm{0};
    int32_t cipherSuite{0};
    std::vector<uint8_t> pmk;
    std::string password;
};

struct InitiatePairingRequest {
    InstanceId peerInstanceId{0};
    MacAddress peerMac{};
    PairingRequestType requestType{PairingRequestType::kSetup};
    bool enableCache{false};
    PairingSecurity security;
};

struct RespondToPairingRequest {
    PairingId pairingId{0};
    bool accept{false};
    PairingRequestType requestType{PairingRequestType::kSetup};
    bool enableCache{false};
    PairingSecurity security;
};

struct InitiateBootstrappingRequest {
    InstanceId peerInstanceId{0};
    MacAddress peerMac{};
    uint32_t method{0};
    std::vector<uint8_t> cookie;
    PubSubId pubSubId{0};
    bool isComeback{false};
};

// ============================================================================
// Notification payloads
// ============================================================================

struct MatchEvent {
    PubSubId pubSubId{0};
    InstanceId requestorInstanceId{0};
    MacAddress peerMac{};
    std::vector<uint8_t> serviceSpecificInfo;
    std::vector<uint8_t> matchFilter;
    int32_t rangingIndication{0};
    int32_t rangeMm{0};
    int32_t cipherSuite{0};
    std::vector<uint8_t> scid;
    std::string pairingAlias;
    std::optional<PairingConfig> peerPairingConfig;
};

struct MessageReceivedEvent {
    PubSubId pubSubId{0};
    InstanceId requestorInstanceId{0};
    MacAddress peerMac{};
    std::vector<uint8_t> message;
};

struct DataPathRequestEvent {
    PubSubId pubSubId{0};
    MacAddress peerMac{};
    NdpId ndpId{0};
    std::vector<uint8_t> message;
};

struct DataPathConfirmEvent {
    NdpId ndpId{0};
    MacAddress peerMac{};
    bool accept{false};
    NanStatus reason{NanStatus::kSuccess};
    std::vector<uint8_t> message;
    std::vector<ChannelInfo> channelInfo;
};

struct DataPathScheduleUpdateEvent {
    MacAddress peerMac{};
    std::vector<NdpId> ndpIds;
    std::vector<ChannelInfo> channelInfo;
};

struct PairingRequestEvent {
    PubSubId pubSubId{0};
    InstanceId requestorInstanceId{0};
    MacAddress peerMac{};
    PairingId pairingId{0};
    PairingRequestType requestType{PairingRequestType::kSetup};
    bool enableCache{false};
};

struct PairingConfirmEvent {
    PairingId pairingId{0};
    bool accept{false};
    NanStatus reason{NanStatus::kSuccess};
    PairingRequestType requestType{PairingRequestType::kSetup};
    bool enableCache{false};
};

struct BootstrappingRequestEvent {
    PubSubId pubSubId{0};
    InstanceId requestorInstanceId{0};
    MacAddress peerMac{};
    BootstrappingId bootstrappingId{0};
    uint32_t method{0};
};

struct BootstrappingConfirmEvent {
    BootstrappingId bootstrappingId{0};
    BootstrappingResponseCode responseCode{BootstrappingResponseCode::kReject};
    NanStatus reason{NanStatus::kSuccess};
    int32_t comebackDelaySec{0};
    std::vector<uint8_t> cookie;
};

} // namespace AWR::Hal
