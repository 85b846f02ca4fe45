#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <span>
#include <string>

#include "PeerRegistry.hpp"
#include "../Callbacks/IDiscoverySessionCallback.hpp"
#include "../Common/Error.hpp"
#include "../Hal/HalTypes.hpp"
#include "../Hal/IAwareHal.hpp"
#include "../Scheduling/Clock.hpp"

namespace AWR::Session {

struct DiscoverySessionParams {
    SessionId sessionId{0};
    PubSubId pubSubId{0};
    bool isPublish{false};
    bool rangingEnabled{false};
    bool instantModeEnabled{false};
    Hal::InstantModeBand instantModeBand{Hal::InstantModeBand::k24GHz};
    bool suspendable{false};
    std::optional<Hal::PairingConfig> pairingConfig;
};

/**
 * @brief One live publish or subscribe session.
 *
 * Owns the session's peer registry and its callback. Request methods issue the HAL
 * call and, when it is rejected or cannot be issued, report the operation's
 * terminal failure to the callback themselves before returning the error. A
 * successful Result means a HAL response is pending.
 *
 * After Terminate() the callback is dropped; later events are logged and ignored.
 */
class DiscoverySession {
public:
    DiscoverySession(const DiscoverySessionParams& params,
                     std::shared_ptr<Callbacks::IDiscoverySessionCallback> callback,
                     Scheduling::TimePoint creationTime);

    DiscoverySession(const DiscoverySession&) = delete;
    DiscoverySession& operator=(const DiscoverySession&) = delete;

    [[nodiscard]] SessionId GetSessionId() const noexcept { return sessionId_; }
    [[nodiscard]] PubSubId GetPubSubId() const noexcept { return pubSubId_; }
    void SetPubSubId(PubSubId pubSubId) noexcept { pubSubId_ = pubSubId; }
    [[nodiscard]] bool IsPublishSession() const noexcept { return isPublish_; }
    [[nodiscard]] bool IsPubSubIdSession(PubSubId pubSubId) const noexcept {
        return pubSubId_ == pubSubId;
    }

    [[nodiscard]] bool IsRangingEnabled() const noexcept { return rangingEnabled_; }
    void SetRangingEnabled(bool enabled) noexcept { rangingEnabled_ = enabled; }
    void SetInstantModeEnabled(bool enabled) noexcept { instantModeEnabled_ = enabled; }
    void SetInstantModeBand(Hal::InstantModeBand band) noexcept { instantModeBand_ = band; }

    [[nodiscard]] bool IsSuspendable() const noexcept { return suspendable_; }
    [[nodiscard]] bool IsSuspended() const noexcept { return suspended_; }

    [[nodiscard]] Scheduling::TimePoint GetCreationTime() const noexcept { return creationTime_; }
    [[nodiscard]] const std::optional<Hal::PairingConfig>& GetPairingConfig() const noexcept {
        return pairingConfig_;
    }
    [[nodiscard]] bool AcceptsBootstrappingMethod(uint32_t method) const noexcept;

    // Disabled once `duration` has elapsed since the last update.
    [[nodiscard]] Hal::InstantMode GetInstantMode(Scheduling::TimePoint now,
                                                  std::chrono::milliseconds duration) const noexcept;

    [[nodiscard]] Callbacks::IDiscoverySessionCallback* GetCallback() const noexcept {
        return callback_.get();
    }

    [[nodiscard]] PeerRegistry& Peers() noexcept { return peers_; }
    [[nodiscard]] const PeerRegistry& Peers() const noexcept { return peers_; }

    // Reports OnSessionTerminated(SUCCESS) and stops the HAL session without
    // waiting for a response. hal may be null when the interface is already gone.
    void Terminate(Hal::IAwareHal* hal);

    Result<void> UpdatePublish(Hal::IAwareHal* hal, TransactionId txid,
                               const Hal::PublishConfig& config, Scheduling::TimePoint now);
    Result<void> UpdateSubscribe(Hal::IAwareHal* hal, TransactionId txid,
                                 const Hal::SubscribeConfig& config, Scheduling::TimePoint now);

    Result<void> SendMessage(Hal::IAwareHal* hal, TransactionId txid, PeerId peerId,
                             std::span<const uint8_t> message, int32_t messageId);

    Result<void> Suspend(Hal::IAwareHal* hal, TransactionId txid);
    void OnSuspendSuccess();
    void OnSuspendFail(SuspendFailReason reason);
    Result<void> Resume(Hal::IAwareHal* hal, TransactionId txid);
    void OnResumeSuccess();
    void OnResumeFail(ResumeFailReason reason);

    Result<void> InitiatePairing(Hal::IAwareHal* hal, TransactionId txid, PeerId peerId,
                                 Hal::PairingRequestType requestType,
                                 const Hal::PairingSecurity& security);
    Result<void> RespondToPairingRequest(Hal::IAwareHal* hal, TransactionId txid, PeerId peerId,
                                         PairingId pairingId, bool accept,
                                         Hal::PairingRequestType requestType,
                                         const Hal::PairingSecurity& security);

    Result<void> InitiateBootstrapping(Hal::IAwareHal* hal, TransactionId txid, PeerId peerId,
                                       uint32_t method, std::span<const uint8_t> cookie,
                                       bool isComeback);
    Result<void> RespondToBootstrapping(Hal::IAwareHal* hal, TransactionId txid, PeerId peerId,
                                        BootstrappingId bootstrappingId, bool accept,
                                        uint32_t method);

    // HAL events routed to this session
    PeerId OnMatch(const Hal::MatchEvent& event);
    void OnMatchExpired(InstanceId requestorInstanceId);
    void OnMessageReceived(InstanceId requestorInstanceId, const MacAddress& peerMac,
                           const std::vector<uint8_t>& message);
    PeerId OnPairingRequestReceived(InstanceId requestorInstanceId, const MacAddress& peerMac,
                                    PairingId pairingId);
    void OnPairingConfirmReceived(PeerId peerId, bool accept, const std::string& alias,
                                  Hal::PairingRequestType requestType);
    void OnBootstrappingConfirmReceived(PeerId peerId, bool accept, uint32_t method);

private:
    // Reports the setup failure unless this is a verification attempt.
    void ReportPairingSetupFailure(PeerId peerId, Hal::PairingRequestType requestType);

    SessionId sessionId_;
    PubSubId pubSubId_;
    bool isPublish_;
    bool rangingEnabled_;
    bool instantModeEnabled_;
    Hal::InstantModeBand instantModeBand_;
    bool suspendable_;
    bool suspended_{false};
    std::optional<Hal::PairingConfig> pairingConfig_;

    Scheduling::TimePoint creationTime_;
    Scheduling::TimePoint updateTime_;

    std::shared_ptr<Callbacks::IDiscoverySessionCallback> callback_;
    PeerRegistry peers_;
};

} // namespace AWR::Session
