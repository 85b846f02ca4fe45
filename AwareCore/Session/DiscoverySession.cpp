#include "DiscoverySession.hpp"

#include <vector>

#include "../Logging/Logging.hpp"
#include "../Logging/LogConfig.hpp"

namespace AWR::Session {

namespace {

Result<void> RequireHal(const Hal::IAwareHal* hal) {
    if (hal == nullptr) {
        return AWR_ERROR_NOT_READY("Aware interface not available");
    }
    return {};
}

} // namespace

DiscoverySession::DiscoverySession(const DiscoverySessionParams& params,
                                   std::shared_ptr<Callbacks::IDiscoverySessionCallback> callback,
                                   Scheduling::TimePoint creationTime)
    : sessionId_(params.sessionId),
      pubSubId_(params.pubSubId),
      isPublish_(params.isPublish),
      rangingEnabled_(params.rangingEnabled),
      instantModeEnabled_(params.instantModeEnabled),
      instantModeBand_(params.instantModeBand),
      suspendable_(params.suspendable),
      pairingConfig_(params.pairingConfig),
      creationTime_(creationTime),
      updateTime_(creationTime),
      callback_(std::move(callback)) {}

bool DiscoverySession::AcceptsBootstrappingMethod(uint32_t method) const noexcept {
    if (!pairingConfig_) {
        return false;
    }
    return (pairingConfig_->bootstrappingMethods & method) != 0;
}

Hal::InstantMode DiscoverySession::GetInstantMode(Scheduling::TimePoint now,
                                                  std::chrono::milliseconds duration) const noexcept {
    if (!instantModeEnabled_ || now - updateTime_ > duration) {
        return Hal::InstantMode::kDisabled;
    }
    return instantModeBand_ == Hal::InstantModeBand::k5GHz ? Hal::InstantMode::k5GHz
                                                           : Hal::InstantMode::k24GHz;
}

void DiscoverySession::Terminate(Hal::IAwareHal* hal) {
    if (callback_) {
        callback_->OnSessionTerminated(NanStatus::kSuccess);
    }
    callback_.reset();

    if (hal == nullptr) {
        AWR_LOG_V1(Session, "Terminate sessionId=%d: no interface, skipping stop", sessionId_);
        return;
    }

    auto result = isPublish_ ? hal->StopPublish(kTransactionIdIgnore, pubSubId_)
                             : hal->StopSubscribe(kTransactionIdIgnore, pubSubId_);
    if (!result) {
        result.error().Log();
    }
}

Result<void> DiscoverySession::UpdatePublish(Hal::IAwareHal* hal, TransactionId txid,
                                             const Hal::PublishConfig& config,
                                             Scheduling::TimePoint now) {
    if (!isPublish_) {
        AWR_LOG_ERROR(Session, "sessionId=%d: subscribe session used to publish", sessionId_);
        if (callback_) {
            callback_->OnSessionConfigFail(NanStatus::kInternalFailure);
        }
        return AWR_ERROR_INTERNAL("Publish update on a subscribe session");
    }

    updateTime_ = now;
    auto result = RequireHal(hal).and_then([&] { return hal->Publish(txid, pubSubId_, config); });
    if (!result) {
        if (callback_) {
            callback_->OnSessionConfigFail(NanStatus::kInternalFailure);
        }
        return result;
    }
    pairingConfig_ = config.pairingConfig;
    return {};
}

Result<void> DiscoverySession::UpdateSubscribe(Hal::IAwareHal* hal, TransactionId txid,
                                               const Hal::SubscribeConfig& config,
                                               Scheduling::TimePoint now) {
    if (isPublish_) {
        AWR_LOG_ERROR(Session, "sessionId=%d: publish session used to subscribe", sessionId_);
        if (callback_) {
            callback_->OnSessionConfigFail(NanStatus::kInternalFailure);
        }
        return AWR_ERROR_INTERNAL("Subscribe update on a publish session");
    }

    updateTime_ = now;
    auto result = RequireHal(hal).and_then([&] { return hal->Subscribe(txid, pubSubId_, config); });
    if (!result) {
        if (callback_) {
            callback_->OnSessionConfigFail(NanStatus::kInternalFailure);
        }
        return result;
    }
    pairingConfig_ = config.pairingConfig;
    return {};
}

Result<void> DiscoverySession::SendMessage(Hal::IAwareHal* hal, TransactionId txid, PeerId peerId,
                                           std::span<const uint8_t> message, int32_t messageId) {
    const PeerRecord* peer = peers_.Find(peerId);
    if (peer == nullptr) {
        AWR_LOG_ERROR(Session, "sendMessage: peerId=%d never matched sessionId=%d", peerId,
                      sessionId_);
        if (callback_) {
            callback_->OnMessageSendFail(messageId, NanStatus::kInternalFailure);
        }
        return AWR_ERROR_FATAL(NanStatus::kInvalidPeerId, "Unknown peer");
    }

    auto result = RequireHal(hal).and_then([&] {
        return hal->SendMessage(txid, pubSubId_, peer->instanceId, peer->mac, message, messageId);
    });
    if (!result) {
        if (callback_) {
            callback_->OnMessageSendFail(messageId, NanStatus::kInternalFailure);
        }
        return result;
    }
    AWR_LOG_HEX(Transport, "sendMessage txid=%u len=%zu messageId=%d", txid, message.size(),
                messageId);
    return {};
}

Result<void> DiscoverySession::Suspend(Hal::IAwareHal* hal, TransactionId txid) {
    auto result = RequireHal(hal).and_then([&] { return hal->Suspend(txid, pubSubId_); });
    if (!result) {
        OnSuspendFail(SuspendFailReason::kInternalError);
    }
    return result;
}

void DiscoverySession::OnSuspendSuccess() {
    suspended_ = true;
    if (callback_) {
        callback_->OnSuspendSucceeded();
    }
}

void DiscoverySession::OnSuspendFail(SuspendFailReason reason) {
    if (callback_) {
        callback_->OnSuspendFailed(reason);
    }
}

Result<void> DiscoverySession::Resume(Hal::IAwareHal* hal, TransactionId txid) {
    auto result = RequireHal(hal).and_then([&] { return hal->Resume(txid, pubSubId_); });
    if (!result) {
        OnResumeFail(ResumeFailReason::kInternalError);
    }
    return result;
}

void DiscoverySession::OnResumeSuccess() {
    suspended_ = false;
    if (callback_) {
        callback_->OnResumeSucceeded();
    }
}

void DiscoverySession::OnResumeFail(ResumeFailReason reason) {
    if (callback_) {
        callback_->OnResumeFailed(reason);
    }
}

void DiscoverySession::ReportPairingSetupFailure(PeerId peerId,
                                                 Hal::PairingRequestType requestType) {
    if (requestType == Hal::PairingRequestType::kVerification || !callback_) {
        return;
    }
    callback_->OnPairingSetupConfirmed(peerId, false, std::string{});
}

Result<void> DiscoverySession::InitiatePairing(Hal::IAwareHal* hal, TransactionId txid,
                                               PeerId peerId, Hal::PairingRequestType requestType,
                                               const Hal::PairingSecurity& security) {
    const PeerRecord* peer = peers_.Find(peerId);
    if (peer == nullptr) {
        AWR_LOG_ERROR(Session, "initiatePairing: peerId=%d never matched", peerId);
        ReportPairingSetupFailure(peerId, requestType);
        return AWR_ERROR_FATAL(NanStatus::kInvalidPeerId, "Unknown peer");
    }

    Hal::InitiatePairingRequest request{
        .peerInstanceId = peer->instanceId,
        .peerMac = peer->mac,
        .requestType = requestType,
        .enableCache = pairingConfig_ && pairingConfig_->cacheEnabled,
        .security = security,
    };
    auto result = RequireHal(hal).and_then([&] { return hal->InitiatePairing(txid, request); });
    if (!result) {
        ReportPairingSetupFailure(peerId, requestType);
    }
    return result;
}

Result<void> DiscoverySession::RespondToPairingRequest(Hal::IAwareHal* hal, TransactionId txid,
                                                       PeerId peerId, PairingId pairingId,
                                                       bool accept,
                                                       Hal::PairingRequestType requestType,
                                                       const Hal::PairingSecurity& security) {
    if (peers_.Find(peerId) == nullptr) {
        AWR_LOG_ERROR(Session, "respondToPairingRequest: peerId=%d never matched", peerId);
        ReportPairingSetupFailure(peerId, requestType);
        return AWR_ERROR_FATAL(NanStatus::kInvalidPeerId, "Unknown peer");
    }

    Hal::RespondToPairingRequest request{
        .pairingId = pairingId,
        .accept = accept,
        .requestType = requestType,
        .enableCache = pairingConfig_ && pairingConfig_->cacheEnabled,
        .security = security,
    };
    auto result =
        RequireHal(hal).and_then([&] { return hal->RespondToPairingRequest(txid, request); });
    if (!result) {
        ReportPairingSetupFailure(peerId, requestType);
    }
    return result;
}

Result<void> DiscoverySession::InitiateBootstrapping(Hal::IAwareHal* hal, TransactionId txid,
                                                     PeerId peerId, uint32_t method,
                                                     std::span<const uint8_t> cookie,
                                                     bool isComeback) {
    const PeerRecord* peer = peers_.Find(peerId);
    if (peer == nullptr) {
        AWR_LOG_ERROR(Session, "initiateBootstrapping: peerId=%d never matched", peerId);
        if (callback_) {
            callback_->OnBootstrappingVerificationConfirmed(peerId, false, method);
        }
        return AWR_ERROR_FATAL(NanStatus::kInvalidPeerId, "Unknown peer");
    }

    Hal::InitiateBootstrappingRequest request{
        .peerInstanceId = peer->instanceId,
        .peerMac = peer->mac,
        .method = method,
        .cookie = std::vector<uint8_t>(cookie.begin(), cookie.end()),
        .pubSubId = pubSubId_,
        .isComeback = isComeback,
    };
    auto result =
        RequireHal(hal).and_then([&] { return hal->InitiateBootstrapping(txid, request); });
    if (!result && callback_) {
        callback_->OnBootstrappingVerificationConfirmed(peerId, false, method);
    }
    return result;
}

Result<void> DiscoverySession::RespondToBootstrapping(Hal::IAwareHal* hal, TransactionId txid,
                                                      PeerId peerId,
                                                      BootstrappingId bootstrappingId,
                                                      bool accept, uint32_t method) {
    if (peers_.Find(peerId) == nullptr) {
        AWR_LOG_ERROR(Session, "respondToBootstrapping: peerId=%d never matched", peerId);
        if (callback_) {
            callback_->OnBootstrappingVerificationConfirmed(peerId, false, method);
        }
        return AWR_ERROR_FATAL(NanStatus::kInvalidPeerId, "Unknown peer");
    }
    return RequireHal(hal).and_then([&] {
        return hal->RespondToBootstrappingRequest(txid, bootstrappingId, accept, pubSubId_);
    });
}

PeerId DiscoverySession::OnMatch(const Hal::MatchEvent& event) {
    const PeerId peerId = peers_.GetPeerIdOrAddIfNew(event.requestorInstanceId, event.peerMac);
    if (!callback_) {
        AWR_LOG_V1(Session, "onMatch: sessionId=%d already terminated", sessionId_);
        return peerId;
    }

    if (event.rangingIndication == 0) {
        callback_->OnMatch(peerId, event.serviceSpecificInfo, event.matchFilter, event.cipherSuite,
                           event.scid, event.pairingAlias, event.peerPairingConfig);
    } else {
        callback_->OnMatchWithDistance(peerId, event.serviceSpecificInfo, event.matchFilter,
                                       event.rangeMm, event.cipherSuite, event.scid,
                                       event.pairingAlias, event.peerPairingConfig);
    }
    return peerId;
}

void DiscoverySession::OnMatchExpired(InstanceId requestorInstanceId) {
    auto peerId = peers_.RemoveFirstByInstanceId(requestorInstanceId);
    if (!peerId) {
        return;
    }
    AWR_LOG_PEER_DETAIL("onMatchExpired: sessionId=%d peerId=%d", sessionId_, *peerId);
    if (callback_) {
        callback_->OnMatchExpired(*peerId);
    }
}

void DiscoverySession::OnMessageReceived(InstanceId requestorInstanceId, const MacAddress& peerMac,
                                         const std::vector<uint8_t>& message) {
    const PeerId peerId = peers_.GetPeerIdOrAddIfNew(requestorInstanceId, peerMac);
    if (callback_) {
        callback_->OnMessageReceived(peerId, message);
    }
}

PeerId DiscoverySession::OnPairingRequestReceived(InstanceId requestorInstanceId,
                                                  const MacAddress& peerMac, PairingId pairingId) {
    const PeerId peerId = peers_.GetPeerIdOrAddIfNew(requestorInstanceId, peerMac);
    if (callback_) {
        callback_->OnPairingSetupRequestReceived(peerId, pairingId);
    }
    return peerId;
}

void DiscoverySession::OnPairingConfirmReceived(PeerId peerId, bool accept,
                                                const std::string& alias,
                                                Hal::PairingRequestType requestType) {
    if (!callback_) {
        return;
    }
    if (requestType == Hal::PairingRequestType::kSetup) {
        callback_->OnPairingSetupConfirmed(peerId, accept, alias);
    } else {
        callback_->OnPairingVerificationConfirmed(peerId, accept, alias);
    }
}

void DiscoverySession::OnBootstrappingConfirmReceived(PeerId peerId, bool accept, uint32_t method) {
    if (callback_) {
        callback_->OnBootstrappingVerificationConfirmed(peerId, accept, method);
    }
}

} // namespace AWR::Session
