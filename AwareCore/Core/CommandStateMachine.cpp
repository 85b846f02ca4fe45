#include "CommandStateMachine.hpp"

#include "../Logging/Logging.hpp"
#include "../Logging/LogConfig.hpp"

namespace AWR::Core {

namespace {
constexpr std::string_view kWaitStr{"Wait"};
constexpr std::string_view kAwaitingResponseStr{"AwaitingResponse"};
constexpr std::string_view kWaitingForInterfaceConflictStr{"WaitingForInterfaceConflict"};
} // namespace

CommandStateMachine::CommandStateMachine()
    : state_(DispatchState::kWait) {}

DispatchState CommandStateMachine::CurrentState() const {
    return state_;
}

std::optional<StateTransition> CommandStateMachine::LastTransition() const {
    return last_;
}

void CommandStateMachine::Reset() {
    state_ = DispatchState::kWait;
    last_.reset();
}

void CommandStateMachine::TransitionTo(DispatchState next, std::string_view reason, uint64_t now) {
    if (next != state_) {
        AWR_LOG_V2(Core, "%{public}s -> %{public}s (%{public}s)",
                   ToString(state_).data(), ToString(next).data(), std::string(reason).c_str());
    }
    StateTransition transition{state_, next, std::string(reason), now};
    last_ = transition;
    state_ = next;
}

std::string_view ToString(DispatchState state) {
    switch (state) {
    case DispatchState::kWait:
        return kWaitStr;
    case DispatchState::kAwaitingResponse:
        return kAwaitingResponseStr;
    case DispatchState::kWaitingForInterfaceConflict:
        return kWaitingForInterfaceConflictStr;
    }
    return kWaitStr;
}

} // namespace AWR::Core
