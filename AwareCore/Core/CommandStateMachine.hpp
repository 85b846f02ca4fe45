#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace AWR::Core {

enum class DispatchState : uint8_t {
    kWait,                         // idle, next queued command may run
    kAwaitingResponse,             // one HAL command in flight
    kWaitingForInterfaceConflict,  // connect parked on the conflict arbiter
};

struct StateTransition {
    DispatchState from{DispatchState::kWait};
    DispatchState to{DispatchState::kWait};
    std::string reason;
    uint64_t timestamp{0};
};

// Tracks the dispatcher state and the last transition, for diagnostics and tests.
class CommandStateMachine {
public:
    CommandStateMachine();

    DispatchState CurrentState() const;
    std::optional<StateTransition> LastTransition() const;

    [[nodiscard]] bool Is(DispatchState state) const { return state_ == state; }

    void Reset();
    void TransitionTo(DispatchState next, std::string_view reason, uint64_t now);

private:
    DispatchState state_;
    std::optional<StateTransition> last_;
};

std::string_view ToString(DispatchState state);

} // namespace AWR::Core
