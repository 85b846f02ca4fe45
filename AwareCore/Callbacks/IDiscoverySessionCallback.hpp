#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../Common/Identifiers.hpp"
#include "../Common/StatusCodes.hpp"
#include "../Hal/HalTypes.hpp"

namespace AWR::Callbacks {

/**
 * @brief Per-session events delivered to the owning client.
 *
 * Every asynchronous session operation ends in exactly one terminal callback:
 * publish/subscribe/update in OnSessionStarted, OnSessionConfigSuccess or
 * OnSessionConfigFail; a follow-on message in OnMessageSendSuccess or
 * OnMessageSendFail; suspend/resume in the matching Succeeded/Failed pair.
 * Peers are identified by peer handles, never by raw MAC addresses.
 */
class IDiscoverySessionCallback {
public:
    virtual ~IDiscoverySessionCallback() = default;

    // Session lifecycle
    virtual void OnSessionStarted(SessionId sessionId) = 0;
    virtual void OnSessionConfigSuccess() = 0;
    virtual void OnSessionConfigFail(NanStatus reason) = 0;
    virtual void OnSessionTerminated(NanStatus reason) = 0;

    // Discovery
    virtual void OnMatch(PeerId peerId, const std::vector<uint8_t>& serviceSpecificInfo,
                         const std::vector<uint8_t>& matchFilter, int32_t cipherSuite,
                         const std::vector<uint8_t>& scid, const std::string& pairingAlias,
                         const std::optional<Hal::PairingConfig>& peerPairingConfig) = 0;
    virtual void OnMatchWithDistance(PeerId peerId,
                                     const std::vector<uint8_t>& serviceSpecificInfo,
                                     const std::vector<uint8_t>& matchFilter,
                                     int32_t distanceMm, int32_t cipherSuite,
                                     const std::vector<uint8_t>& scid,
                                     const std::string& pairingAlias,
                                     const std::optional<Hal::PairingConfig>& peerPairingConfig) = 0;
    virtual void OnMatchExpired(PeerId peerId) = 0;

    // Follow-on messages
    virtual void OnMessageSendSuccess(int32_t messageId) = 0;
    virtual void OnMessageSendFail(int32_t messageId, NanStatus reason) = 0;
    virtual void OnMessageReceived(PeerId peerId, const std::vector<uint8_t>& message) = 0;

    // Pairing
    virtual void OnPairingSetupRequestReceived(PeerId peerId, PairingId requestId) = 0;
    virtual void OnPairingSetupConfirmed(PeerId peerId, bool accept, const std::string& alias) = 0;
    virtual void OnPairingVerificationConfirmed(PeerId peerId, bool accept,
                                                const std::string& alias) = 0;

    // Bootstrapping
    virtual void OnBootstrappingVerificationConfirmed(PeerId peerId, bool accept,
                                                      uint32_t method) = 0;

    // Suspension
    virtual void OnSuspendSucceeded() = 0;
    virtual void OnSuspendFailed(SuspendFailReason reason) = 0;
    virtual void OnResumeSucceeded() = 0;
    virtual void OnResumeFailed(ResumeFailReason reason) = 0;
};

} // namespace AWR::Callbacks
