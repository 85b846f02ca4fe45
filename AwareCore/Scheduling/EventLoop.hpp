#pragma once

#include <dispatch/dispatch.h>

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>

#include "Clock.hpp"

namespace AWR::Scheduling {

using TimerId = uint64_t;
inline constexpr TimerId kInvalidTimer = 0;

/**
 * \brief Serial work queue with cancelable delayed work on a libdispatch queue.
 *
 * All core state is touched only from work items run by this loop. Any thread may
 * post; delayed work is keyed by a TimerId that can be cancelled until it runs.
 *
 * \par Threading
 * Start() creates a serial dispatch queue. Work is submitted with dispatch_async_f and
 * each delayed item is a one-shot dispatch timer source targeting that queue.
 * Until Start() nothing runs on its own: host tests drive queued work and due timers
 * with RunPending() from the test thread, together with a ManualClock, so no real
 * time passes.
 */
class EventLoop {
public:
    explicit EventLoop(const Clock& clock, const char* label = "com.awarecore.loop");
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    // Creates the dispatch queue and hands it any work and timers posted so far.
    void Start();
    // Cancels timer sources and waits for work already on the queue.
    void Stop();

    void DispatchAsync(std::function<void()> work);

    // Runs work on the loop and waits for it. Runs inline when called from the
    // loop itself or when the loop is not started.
    void DispatchSync(const std::function<void()>& work);

    [[nodiscard]] TimerId DispatchAt(TimePoint deadline, std::function<void()> work);
    [[nodiscard]] TimerId DispatchAfter(std::chrono::milliseconds delay, std::function<void()> work);

    // Returns false when the timer already ran or was never scheduled.
    bool Cancel(TimerId id);
    [[nodiscard]] bool IsScheduled(TimerId id) const;

    // Runs queued work and every timer due at Clock::Now() until idle.
    // Returns the number of work items executed. Only valid before Start().
    size_t RunPending();

    [[nodiscard]] bool IsStarted() const;
    [[nodiscard]] bool IsLoopThread() const;
    [[nodiscard]] const Clock& GetClock() const { return clock_; }
    [[nodiscard]] size_t PendingTimerCount() const;

private:
    struct TimerSource {
        dispatch_source_t source{nullptr};
        TimePoint deadline{};
        std::function<void()> work;
    };

    struct TimerContext {
        EventLoop* loop;
        TimerId id;
    };

    static void RunWork(void* context);
    static void RunSyncWork(void* context);
    static void FireTimer(void* context);
    static void ReleaseTimerContext(void* context);
    static void Noop(void*) {}

    void ArmSourceLocked(TimerId id, TimePoint deadline, std::function<void()> work);
    void OnTimerFired(TimerId id);

    // Pops the next runnable host-test item under the lock. Empty when idle.
    std::function<void()> TakeNextLocked();

    const Clock& clock_;
    const char* label_;

    mutable std::mutex mutex_;
    dispatch_queue_t queue_{nullptr};
    std::unordered_map<TimerId, TimerSource> sources_;
    TimerId nextTimerId_{1};

    // Held until Start(), or run by RunPending().
    using TimerKey = std::pair<TimePoint, TimerId>;
    std::deque<std::function<void()>> held_;
    std::map<TimerKey, std::function<void()>> heldTimers_;
    std::unordered_map<TimerId, TimePoint> heldIndex_;
    std::thread::id drivingThread_{};
};

} // namespace AWR::Scheduling
