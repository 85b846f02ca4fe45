#pragma once

#include <chrono>
#include <cstdint>
#include <list>
#include <map>
#include <optional>
#include <vector>

#include "../Common/Identifiers.hpp"
#include "../Common/StatusCodes.hpp"
#include "../Scheduling/Clock.hpp"

namespace AWR::Core {

struct QueuedMessage {
    ClientId clientId{0};
    SessionId sessionId{0};
    PeerId peerId{0};
    std::vector<uint8_t> payload;
    int32_t messageId{0};
    int32_t retryCount{0};
    int32_t uid{0};

    // Set by the queue.
    uint64_t arrivalSeq{0};
    Scheduling::TimePoint enqueueTime{};
};

/**
 * \brief Follow-on message bookkeeping between the host and the firmware.
 *
 * Messages wait in the host queue in arrival order until transmitted. Once the HAL
 * accepts a transmit, the message moves to the firmware queue keyed by the
 * transaction ID of the send, where it waits for the delivery notification.
 *
 * A FOLLOWUP_TX_QUEUE_FULL rejection blocks the host queue; any delivery result
 * or timeout unblocks it. Retried messages keep their arrival sequence and so
 * resume their original position.
 */
class SendMessageQueue {
public:
    explicit SendMessageQueue(size_t depthPerUid);

    // True when `uid` already holds `depthPerUid` messages in the host queue.
    [[nodiscard]] bool IsUidExceeded(int32_t uid) const;

    void Enqueue(QueuedMessage message);
    void Requeue(QueuedMessage message);

    // Oldest host message, or nullopt when blocked or empty.
    std::optional<QueuedMessage> PopNextForTransmit();

    void OnQueuedInFirmware(TransactionId txid, QueuedMessage message, Scheduling::TimePoint now);
    std::optional<QueuedMessage> TakeFirmwareQueued(TransactionId txid);

    // Deadline of the oldest firmware message, if any.
    [[nodiscard]] std::optional<Scheduling::TimePoint> NextDeadline(
        std::chrono::milliseconds timeout) const;

    // Removes every firmware message whose deadline has passed, and always at least
    // the oldest one.
    std::vector<QueuedMessage> TakeExpired(Scheduling::TimePoint now,
                                           std::chrono::milliseconds timeout);

    // NO_OTA_ACK with budget left is the only retryable delivery failure.
    [[nodiscard]] static bool ShouldRetry(const QueuedMessage& message, NanStatus reason) noexcept {
        return message.retryCount > 0 && reason == NanStatus::kNoOtaAck;
    }

    void Block() noexcept { blocked_ = true; }
    void Unblock() noexcept { blocked_ = false; }
    [[nodiscard]] bool IsBlocked() const noexcept { return blocked_; }

    [[nodiscard]] size_t HostSize() const noexcept { return host_.size(); }
    [[nodiscard]] size_t FirmwareSize() const noexcept { return firmware_.size(); }

    // Drops everything and unblocks. The arrival counter keeps running.
    void Clear();

private:
    size_t depthPerUid_;
    bool blocked_{false};
    uint64_t nextArrivalSeq_{0};

    std::map<uint64_t, QueuedMessage> host_;
    // Firmware order is enqueue order, so the front is always the oldest.
    std::list<std::pair<TransactionId, QueuedMessage>> firmware_;
};

} // namespace AWR::Core
