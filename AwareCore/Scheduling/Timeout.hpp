#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <utility>

#include "EventLoop.hpp"

namespace AWR::Scheduling {

/**
 * \brief One re-armable timeout on an EventLoop.
 *
 * Schedule() replaces any pending deadline. The handler runs on the loop; the
 * timeout is already disarmed when it runs, so the handler may re-arm it.
 * Must be armed and cancelled from the loop.
 */
class Timeout {
public:
    Timeout(EventLoop& loop, std::function<void()> handler)
        : loop_(loop), handler_(std::move(handler)) {}

    ~Timeout() { Cancel(); }

    Timeout(const Timeout&) = delete;
    Timeout& operator=(const Timeout&) = delete;

    void ScheduleAt(TimePoint deadline) {
        Cancel();
        pending_ = loop_.DispatchAt(deadline, [this] {
            pending_ = kInvalidTimer;
            if (handler_) {
                handler_();
            }
        });
        deadline_ = deadline;
    }

    void ScheduleAfter(std::chrono::milliseconds delay) {
        ScheduleAt(loop_.GetClock().Now() + delay);
    }

    void Cancel() {
        if (pending_ != kInvalidTimer) {
            loop_.Cancel(pending_);
            pending_ = kInvalidTimer;
        }
    }

    [[nodiscard]] bool IsScheduled() const { return pending_ != kInvalidTimer; }
    [[nodiscard]] TimePoint Deadline() const { return deadline_; }

private:
    EventLoop& loop_;
    std::function<void()> handler_;
    TimerId pending_{kInvalidTimer};
    TimePoint deadline_{};
};

/**
 * \brief Timeouts keyed by an identifier (NDP ID, pairing ID, ...).
 *
 * Each key holds at most one pending timeout. A fired timeout is forgotten before
 * its handler runs.
 */
template <typename Key>
class KeyedTimeouts {
public:
    explicit KeyedTimeouts(EventLoop& loop) : loop_(loop) {}

    ~KeyedTimeouts() { Clear(); }

    KeyedTimeouts(const KeyedTimeouts&) = delete;
    KeyedTimeouts& operator=(const KeyedTimeouts&) = delete;

    void Schedule(const Key& key, std::chrono::milliseconds delay,
                  std::function<void(const Key&)> handler) {
        Cancel(key);
        const TimerId id = loop_.DispatchAfter(delay, [this, key, handler = std::move(handler)] {
            pending_.erase(key);
            handler(key);
        });
        pending_[key] = id;
    }

    // Returns true when a pending timeout was cancelled.
    bool Cancel(const Key& key) {
        auto it = pending_.find(key);
        if (it == pending_.end()) {
            return false;
        }
        loop_.Cancel(it->second);
        pending_.erase(it);
        return true;
    }

    [[nodiscard]] bool Contains(const Key& key) const { return pending_.contains(key); }
    [[nodiscard]] size_t Size() const { return pending_.size(); }

    void Clear() {
        for (const auto& [key, id] : pending_) {
            loop_.Cancel(id);
        }
        pending_.clear();
    }

private:
    EventLoop& loop_;
    std::map<Key, TimerId> pending_;
};

} // namespace AWR::Scheduling
