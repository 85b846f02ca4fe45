#pragma once

#include <atomic>
#include <chrono>

namespace AWR::Scheduling {

using TimePoint = std::chrono::steady_clock::time_point;

// Monotonic time source. Injected so timeouts can be driven deterministically.
class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint Now() const = 0;
};

class SteadyClock final : public Clock {
public:
    TimePoint Now() const override { return std::chrono::steady_clock::now(); }
};

// Host-test clock: time only moves when told to.
class ManualClock final : public Clock {
public:
    ManualClock() : now_(TimePoint{} + std::chrono::hours(1)) {}

    TimePoint Now() const override { return now_.load(); }

    void Advance(std::chrono::milliseconds delta) { now_.store(now_.load() + delta); }
    void Set(TimePoint now) { now_.store(now); }

private:
    std::atomic<TimePoint> now_;
};

} // namespace AWR::Scheduling
