#include "InterfaceManager.hpp"

#include "../Logging/Logging.hpp"
#include "../Logging/LogConfig.hpp"
#include "../Scheduling/EventLoop.hpp"

namespace AWR::Hal {

InterfaceManager::InterfaceManager(IAwareInterfaceProvider& provider,
                                   IAwareHalCallback& callback,
                                   Scheduling::EventLoop& loop)
    : provider_(provider),
      callback_(callback),
      loop_(loop),
      alive_(std::make_shared<bool>(true)) {}

InterfaceManager::~InterfaceManager() {
    loop_.DispatchSync([this] {
        alive_.reset();
        if (hal_) {
            ++generation_;
            provider_.RemoveInterface(hal_);
            hal_.reset();
        }
    });
}

bool InterfaceManager::Acquire() {
    AWR_LOG_V2(Hal, "Acquire: hasInterface=%d referenceCount=%d", hal_ != nullptr,
               referenceCount_);

    if (hal_) {
        ++referenceCount_;
        return true;
    }

    const uint64_t generation = ++generation_;
    std::weak_ptr<bool> alive = alive_;
    auto iface = provider_.CreateInterface(callback_, [this, alive, generation] {
        loop_.DispatchAsync([this, alive, generation] {
            if (alive.expired()) {
                return;
            }
            OnInterfaceDestroyed(generation);
        });
    });

    if (!iface) {
        AWR_LOG_ERROR(Hal, "Acquire: unable to obtain an Aware interface");
        AwareIsDown(true);
        return false;
    }

    hal_ = std::move(iface);
    referenceCount_ = 1;
    AWR_LOG_V1(Hal, "Acquire: obtained Aware interface (generation=%llu)",
               static_cast<unsigned long long>(generation));
    return true;
}

void InterfaceManager::Release() {
    AWR_LOG_V2(Hal, "Release: hasInterface=%d referenceCount=%d", hal_ != nullptr,
               referenceCount_);

    if (!hal_) {
        return;
    }
    if (--referenceCount_ > 0) {
        return;
    }

    // Local removal: the destroyed notification that follows must not disable usage.
    ++generation_;
    provider_.RemoveInterface(hal_);
    hal_.reset();
    referenceCount_ = 0;
    AWR_LOG_V1(Hal, "Release: Aware interface removed");
}

void InterfaceManager::OnInterfaceDestroyed(uint64_t generation) {
    AWR_LOG(Hal, "Interface destroyed: generation=%llu current=%llu hasInterface=%d",
            static_cast<unsigned long long>(generation),
            static_cast<unsigned long long>(generation_), hal_ != nullptr);

    if (generation != generation_ || !hal_) {
        return;
    }
    AwareIsDown(true);
}

void InterfaceManager::AwareIsDown(bool markAsAvailable) {
    hal_.reset();
    referenceCount_ = 0;
    if (downHandler_) {
        downHandler_(markAsAvailable);
    }
}

} // namespace AWR::Hal
