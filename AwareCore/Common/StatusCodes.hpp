#pragma once

#include <cstdint>
#include <string_view>

namespace AWR {

// Status codes reported by the HAL and surfaced to client callbacks.
enum class NanStatus : int32_t {
    kSuccess = 0,
    kInternalFailure = 1,
    kProtocolFailure = 2,
    kInvalidSessionId = 3,
    kNoResourcesAvailable = 4,
    kInvalidArgs = 5,
    kInvalidPeerId = 6,
    kInvalidNdpId = 7,
    kNanNotAllowed = 8,
    kNoOtaAck = 9,
    kAlreadyEnabled = 10,
    kFollowupTxQueueFull = 11,
    kUnsupportedConcurrencyNanDisabled = 12,
    kRedundantRequest = 13,
    kNotSupported = 14,
    kNoConnection = 15,
};

[[nodiscard]] constexpr std::string_view ToString(NanStatus status) noexcept {
    switch (status) {
        case NanStatus::kSuccess:                            return "SUCCESS";
        case NanStatus::kInternalFailure:                    return "INTERNAL_FAILURE";
        case NanStatus::kProtocolFailure:                    return "PROTOCOL_FAILURE";
        case NanStatus::kInvalidSessionId:                   return "INVALID_SESSION_ID";
        case NanStatus::kNoResourcesAvailable:               return "NO_RESOURCES_AVAILABLE";
        case NanStatus::kInvalidArgs:                        return "INVALID_ARGS";
        case NanStatus::kInvalidPeerId:                      return "INVALID_PEER_ID";
        case NanStatus::kInvalidNdpId:                       return "INVALID_NDP_ID";
        case NanStatus::kNanNotAllowed:                      return "NAN_NOT_ALLOWED";
        case NanStatus::kNoOtaAck:                           return "NO_OTA_ACK";
        case NanStatus::kAlreadyEnabled:                     return "ALREADY_ENABLED";
        case NanStatus::kFollowupTxQueueFull:                return "FOLLOWUP_TX_QUEUE_FULL";
        case NanStatus::kUnsupportedConcurrencyNanDisabled: return "UNSUPPORTED_CONCURRENCY";
        case NanStatus::kRedundantRequest:                   return "REDUNDANT_REQUEST";
        case NanStatus::kNotSupported:                       return "NOT_SUPPORTED";
        case NanStatus::kNoConnection:                       return "NO_CONNECTION";
    }
    return "UNKNOWN";
}

// Failure reasons delivered to OnSuspendFailed.
enum class SuspendFailReason : uint8_t {
    kInternalError,
    kRedundantRequest,
    kInvalidSession,
    kCannotSuspend,
};

// Failure reasons delivered to OnResumeFailed.
enum class ResumeFailReason : uint8_t {
    kInternalError,
    kRedundantRequest,
    kInvalidSession,
};

// HAL status -> suspend failure reason.
[[nodiscard]] constexpr SuspendFailReason ToSuspendFailReason(NanStatus status) noexcept {
    switch (status) {
        case NanStatus::kRedundantRequest:      return SuspendFailReason::kRedundantRequest;
        case NanStatus::kNotSupported:          return SuspendFailReason::kInvalidSession;
        case NanStatus::kNoConnection:          return SuspendFailReason::kCannotSuspend;
        default:                                return SuspendFailReason::kInternalError;
    }
}

// HAL status -> resume failure reason.
[[nodiscard]] constexpr ResumeFailReason ToResumeFailReason(NanStatus status) noexcept {
    switch (status) {
        case NanStatus::kRedundantRequest:      return ResumeFailReason::kRedundantRequest;
        case NanStatus::kNotSupported:          return ResumeFailReason::kInvalidSession;
        default:                                return ResumeFailReason::kInternalError;
    }
}

// Cluster event types carried by cluster-change notifications.
enum class ClusterEventType : uint8_t {
    kDiscoveryMacAddressChanged = 0,
    kStartedCluster = 1,
    kJoinedCluster = 2,
};

} // namespace AWR
