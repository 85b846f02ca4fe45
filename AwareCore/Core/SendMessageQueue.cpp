#include "SendMessageQueue.hpp"

#include <algorithm>

#include "../Logging/Logging.hpp"

namespace AWR::Core {

SendMessageQueue::SendMessageQueue(size_t depthPerUid) : depthPerUid_(depthPerUid) {}

bool SendMessageQueue::IsUidExceeded(int32_t uid) const {
    if (host_.size() < depthPerUid_) {
        return false;
    }
    size_t count = 0;
    for (const auto& [seq, message] : host_) {
        if (message.uid == uid && ++count >= depthPerUid_) {
            return true;
        }
    }
    return false;
}

void SendMessageQueue::Enqueue(QueuedMessage message) {
    message.arrivalSeq = nextArrivalSeq_++;
    AWR_LOG_SEND_QUEUE("Enqueue messageId=%d arrivalSeq=%llu host=%zu", message.messageId,
                       static_cast<unsigned long long>(message.arrivalSeq), host_.size());
    host_.emplace(message.arrivalSeq, std::move(message));
}

void SendMessageQueue::Requeue(QueuedMessage message) {
    const uint64_t seq = message.arrivalSeq;
    host_.insert_or_assign(seq, std::move(message));
}

std::optional<QueuedMessage> SendMessageQueue::PopNextForTransmit() {
    if (blocked_ || host_.empty()) {
        return std::nullopt;
    }
    auto first = host_.begin();
    QueuedMessage message = std::move(first->second);
    host_.erase(first);
    return message;
}

void SendMessageQueue::OnQueuedInFirmware(TransactionId txid, QueuedMessage message,
                                          Scheduling::TimePoint now) {
    message.enqueueTime = now;
    firmware_.emplace_back(txid, std::move(message));
}

std::optional<QueuedMessage> SendMessageQueue::TakeFirmwareQueued(TransactionId txid) {
    auto it = std::find_if(firmware_.begin(), firmware_.end(),
                           [txid](const auto& entry) { return entry.first == txid; });
    if (it == firmware_.end()) {
        return std::nullopt;
    }
    QueuedMessage message = std::move(it->second);
    firmware_.erase(it);
    return message;
}

std::optional<Scheduling::TimePoint> SendMessageQueue::NextDeadline(
    std::chrono::milliseconds timeout) const {
    if (firmware_.empty()) {
        return std::nullopt;
    }
    return firmware_.front().second.enqueueTime + timeout;
}

std::vector<QueuedMessage> SendMessageQueue::TakeExpired(Scheduling::TimePoint now,
                                                         std::chrono::milliseconds timeout) {
    std::vector<QueuedMessage> expired;
    while (!firmware_.empty()) {
        auto& [txid, message] = firmware_.front();
        if (!expired.empty() && message.enqueueTime + timeout > now) {
            break;
        }
        AWR_LOG_SEND_QUEUE("Expiring txid=%u messageId=%d", txid, message.messageId);
        expired.push_back(std::move(message));
        firmware_.pop_front();
    }
    return expired;
}

void SendMessageQueue::Clear() {
    blocked_ = false;
    host_.clear();
    firmware_.clear();
}

} // namespace AWR::Core
