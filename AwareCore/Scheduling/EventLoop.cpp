#include "EventLoop.hpp"

#include <algorithm>
#include <memory>
#include <vector>

#include "../Logging/LogConfig.hpp"
#include "../Logging/Logging.hpp"

namespace AWR::Scheduling {

namespace {

// Tags the loop's dispatch queue so work can tell it is running there.
char kQueueKey;

constexpr uint64_t kTimerLeewayNs = NSEC_PER_MSEC;

} // namespace

EventLoop::EventLoop(const Clock& clock, const char* label) : clock_(clock), label_(label) {}

EventLoop::~EventLoop() {
    Stop();
}

void EventLoop::Start() {
    std::lock_guard lock(mutex_);
    if (queue_ != nullptr) {
        return;
    }

    queue_ = dispatch_queue_create(label_, DISPATCH_QUEUE_SERIAL);
    if (queue_ == nullptr) {
        AWR_LOG_FAULT(Core, "EventLoop: dispatch_queue_create(%{public}s) failed", label_);
        return;
    }
    dispatch_queue_set_specific(queue_, &kQueueKey, this, nullptr);

    for (auto& work : held_) {
        dispatch_async_f(queue_, new std::function<void()>(std::move(work)), &RunWork);
    }
    held_.clear();
    for (auto& [key, work] : heldTimers_) {
        ArmSourceLocked(key.second, key.first, std::move(work));
    }
    heldTimers_.clear();
    heldIndex_.clear();

    AWR_LOG_V2(Core, "EventLoop %{public}s started: %zu timer(s) armed", label_,
               sources_.size());
}

void EventLoop::Stop() {
    dispatch_queue_t queue = nullptr;
    std::vector<dispatch_source_t> sources;
    {
        std::lock_guard lock(mutex_);
        if (queue_ == nullptr) {
            return;
        }
        queue = queue_;
        queue_ = nullptr;

        // Pending timers survive a stop and are held like before Start().
        for (auto& [id, timer] : sources_) {
            sources.push_back(timer.source);
            heldTimers_.emplace(TimerKey{timer.deadline, id}, std::move(timer.work));
            heldIndex_.emplace(id, timer.deadline);
        }
        sources_.clear();
    }

    for (dispatch_source_t source : sources) {
        dispatch_source_cancel(source);
        dispatch_release(source);
    }

    if (dispatch_get_specific(&kQueueKey) == this) {
        AWR_LOG_ERROR(Core, "EventLoop::Stop called from the loop; queued work not awaited");
    } else {
        dispatch_sync_f(queue, nullptr, &Noop);
    }
    dispatch_release(queue);
}

bool EventLoop::IsStarted() const {
    std::lock_guard lock(mutex_);
    return queue_ != nullptr;
}

void EventLoop::DispatchAsync(std::function<void()> work) {
    if (!work) {
        return;
    }
    std::lock_guard lock(mutex_);
    if (queue_ == nullptr) {
        held_.push_back(std::move(work));
        return;
    }
    dispatch_async_f(queue_, new std::function<void()>(std::move(work)), &RunWork);
}

void EventLoop::DispatchSync(const std::function<void()>& work) {
    if (!work) {
        return;
    }

    dispatch_queue_t queue = nullptr;
    {
        std::lock_guard lock(mutex_);
        if (queue_ != nullptr && dispatch_get_specific(&kQueueKey) != this) {
            queue = queue_;
            dispatch_retain(queue);
        }
    }
    if (queue == nullptr) {
        work();
        return;
    }

    dispatch_sync_f(queue, const_cast<std::function<void()>*>(&work), &RunSyncWork);
    dispatch_release(queue);
}

TimerId EventLoop::DispatchAt(TimePoint deadline, std::function<void()> work) {
    if (!work) {
        return kInvalidTimer;
    }
    std::lock_guard lock(mutex_);
    const TimerId id = nextTimerId_++;
    if (queue_ == nullptr) {
        heldTimers_.emplace(TimerKey{deadline, id}, std::move(work));
        heldIndex_.emplace(id, deadline);
    } else {
        ArmSourceLocked(id, deadline, std::move(work));
    }
    return id;
}

TimerId EventLoop::DispatchAfter(std::chrono::milliseconds delay, std::function<void()> work) {
    return DispatchAt(clock_.Now() + delay, std::move(work));
}

bool EventLoop::Cancel(TimerId id) {
    if (id == kInvalidTimer) {
        return false;
    }

    dispatch_source_t source = nullptr;
    {
        std::lock_guard lock(mutex_);
        if (auto held = heldIndex_.find(id); held != heldIndex_.end()) {
            heldTimers_.erase(TimerKey{held->second, id});
            heldIndex_.erase(held);
            return true;
        }
        auto it = sources_.find(id);
        if (it == sources_.end()) {
            return false;
        }
        source = it->second.source;
        sources_.erase(it);
    }

    dispatch_source_cancel(source);
    dispatch_release(source);
    return true;
}

bool EventLoop::IsScheduled(TimerId id) const {
    std::lock_guard lock(mutex_);
    return heldIndex_.contains(id) || sources_.contains(id);
}

size_t EventLoop::PendingTimerCount() const {
    std::lock_guard lock(mutex_);
    return heldTimers_.size() + sources_.size();
}

bool EventLoop::IsLoopThread() const {
    std::lock_guard lock(mutex_);
    if (queue_ != nullptr) {
        return dispatch_get_specific(&kQueueKey) == this;
    }
    return std::this_thread::get_id() == drivingThread_;
}

void EventLoop::ArmSourceLocked(TimerId id, TimePoint deadline, std::function<void()> work) {
    dispatch_source_t source = dispatch_source_create(DISPATCH_SOURCE_TYPE_TIMER, 0, 0, queue_);
    if (source == nullptr) {
        AWR_LOG_FAULT(Core, "EventLoop: dispatch_source_create failed; timer %llu dropped",
                      static_cast<unsigned long long>(id));
        return;
    }

    const auto delay = std::max(deadline - clock_.Now(), TimePoint::duration::zero());
    const auto delayNs = std::chrono::duration_cast<std::chrono::nanoseconds>(delay).count();
    dispatch_source_set_timer(source, dispatch_time(DISPATCH_TIME_NOW, delayNs),
                              DISPATCH_TIME_FOREVER, kTimerLeewayNs);

    // The context must be in place before the handler is set; the finalizer frees it.
    dispatch_set_context(source, new TimerContext{this, id});
    dispatch_set_finalizer_f(source, &ReleaseTimerContext);
    dispatch_source_set_event_handler_f(source, &FireTimer);

    sources_.emplace(id, TimerSource{source, deadline, std::move(work)});
    dispatch_resume(source);
}

void EventLoop::OnTimerFired(TimerId id) {
    dispatch_source_t source = nullptr;
    std::function<void()> work;
    {
        std::lock_guard lock(mutex_);
        auto it = sources_.find(id);
        if (it == sources_.end()) {
            return;
        }
        source = it->second.source;
        work = std::move(it->second.work);
        sources_.erase(it);
    }

    dispatch_source_cancel(source);
    dispatch_release(source);
    work();
}

void EventLoop::RunWork(void* context) {
    std::unique_ptr<std::function<void()>> work(static_cast<std::function<void()>*>(context));
    (*work)();
}

void EventLoop::RunSyncWork(void* context) {
    (*static_cast<std::function<void()>*>(context))();
}

void EventLoop::FireTimer(void* context) {
    const auto* timer = static_cast<const TimerContext*>(context);
    EventLoop* loop = timer->loop;
    const TimerId id = timer->id;
    loop->OnTimerFired(id);
}

void EventLoop::ReleaseTimerContext(void* context) {
    delete static_cast<TimerContext*>(context);
}

std::function<void()> EventLoop::TakeNextLocked() {
    if (!held_.empty()) {
        auto work = std::move(held_.front());
        held_.pop_front();
        return work;
    }
    if (!heldTimers_.empty()) {
        auto first = heldTimers_.begin();
        if (first->first.first <= clock_.Now()) {
            auto work = std::move(first->second);
            heldIndex_.erase(first->first.second);
            heldTimers_.erase(first);
            return work;
        }
    }
    return {};
}

size_t EventLoop::RunPending() {
    {
        std::lock_guard lock(mutex_);
        if (queue_ != nullptr) {
            AWR_LOG_ERROR(Core, "EventLoop::RunPending called on a started loop");
            return 0;
        }
        drivingThread_ = std::this_thread::get_id();
    }

    size_t executed = 0;
    for (;;) {
        std::function<void()> work;
        {
            std::lock_guard lock(mutex_);
            work = TakeNextLocked();
        }
        if (!work) {
            break;
        }
        work();
        ++executed;
    }

    std::lock_guard lock(mutex_);
    drivingThread_ = std::thread::id{};
    return executed;
}

} // namespace AWR::Scheduling
