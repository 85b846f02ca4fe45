#pragma once

#include <functional>
#include <memory>

#include "MockAwareHal.hpp"
#include "../../AwareCore/Hal/InterfaceManager.hpp"

namespace AWR::Hal::Fakes {

// Hands out one NiceMock HAL per CreateInterface() and remembers the callback the
// core registered, so tests can play the HAL side.
class FakeInterfaceProvider : public IAwareInterfaceProvider {
public:
    using FakeHal = ::testing::NiceMock<Mocks::MockAwareHal>;

    // Called on each new interface before it is returned, to install expectations.
    std::function<void(FakeHal&)> onCreate;
    bool failCreate{false};

    std::shared_ptr<IAwareHal> CreateInterface(IAwareHalCallback& callback,
                                               std::function<void()> onDestroyed) override {
        ++createCount;
        if (failCreate) {
            return nullptr;
        }
        callback_ = &callback;
        onDestroyed_ = std::move(onDestroyed);
        hal_ = std::make_shared<FakeHal>();
        if (onCreate) {
            onCreate(*hal_);
        }
        return hal_;
    }

    void RemoveInterface(const std::shared_ptr<IAwareHal>& hal) override {
        ++removeCount;
        if (hal == hal_) {
            hal_.reset();
        }
    }

    // Someone else tore the interface down.
    void DestroyExternally() {
        hal_.reset();
        if (onDestroyed_) {
            onDestroyed_();
        }
    }

    [[nodiscard]] FakeHal* CurrentHal() const { return hal_.get(); }
    [[nodiscard]] IAwareHalCallback* Callback() const { return callback_; }

    int createCount{0};
    int removeCount{0};

private:
    std::shared_ptr<FakeHal> hal_;
    IAwareHalCallback* callback_{nullptr};
    std::function<void()> onDestroyed_;
};

} // namespace AWR::Hal::Fakes
