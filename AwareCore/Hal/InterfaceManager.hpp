#pragma once

#include <cstdint>
#include <functional>
#include <memory>

#include "IAwareHal.hpp"
#include "IAwareHalCallback.hpp"

namespace AWR::Scheduling {
class EventLoop;
}

namespace AWR::Hal {

/**
 * @brief Creates and removes the Aware HAL interface on the radio chip.
 *
 * Implemented by the hosting daemon on top of its device manager. CreateInterface
 * registers \p callback with the new interface and returns null when no interface
 * can be created (chip busy, HAL missing). \p onDestroyed is invoked, from any
 * thread, when the interface is torn down by someone else.
 */
class IAwareInterfaceProvider {
public:
    virtual ~IAwareInterfaceProvider() = default;

    virtual std::shared_ptr<IAwareHal> CreateInterface(IAwareHalCallback& callback,
                                                       std::function<void()> onDestroyed) = 0;
    virtual void RemoveInterface(const std::shared_ptr<IAwareHal>& hal) = 0;
};

/**
 * @brief Reference-counted ownership of the HAL interface.
 *
 * Each Acquire() that succeeds must be balanced by a Release(); the interface is
 * removed when the count returns to zero. When the interface cannot be created,
 * or disappears underneath us, the registered down handler is told whether the
 * service should be marked available again.
 *
 * Loop-thread only, except for the provider's destroyed notification which is
 * marshalled onto the loop.
 */
class InterfaceManager {
public:
    using DownHandler = std::function<void(bool markAsAvailable)>;

    InterfaceManager(IAwareInterfaceProvider& provider, IAwareHalCallback& callback,
                     Scheduling::EventLoop& loop);
    ~InterfaceManager();

    InterfaceManager(const InterfaceManager&) = delete;
    InterfaceManager& operator=(const InterfaceManager&) = delete;

    void SetDownHandler(DownHandler handler) { downHandler_ = std::move(handler); }

    // Returns false when no interface could be obtained.
    bool Acquire();
    void Release();

    [[nodiscard]] IAwareHal* Interface() const noexcept { return hal_.get(); }
    [[nodiscard]] bool HasInterface() const noexcept { return hal_ != nullptr; }
    [[nodiscard]] int32_t ReferenceCount() const noexcept { return referenceCount_; }

private:
    void OnInterfaceDestroyed(uint64_t generation);
    void AwareIsDown(bool markAsAvailable);

    IAwareInterfaceProvider& provider_;
    IAwareHalCallback& callback_;
    Scheduling::EventLoop& loop_;
    DownHandler downHandler_;

    std::shared_ptr<IAwareHal> hal_;
    int32_t referenceCount_{0};
    // Bumped on every local removal so destroyed notifications for an interface
    // we already released are ignored.
    uint64_t generation_{0};
    std::shared_ptr<bool> alive_;
};

} // namespace AWR::Hal
