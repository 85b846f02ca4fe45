#include <gtest/gtest.h>

#include "../AwareCore/Core/CommandStateMachine.hpp"

using namespace AWR::Core;

// A fresh machine waits and has no history.
TEST(CommandStateMachine, InitialStateIsWait) {
    CommandStateMachine machine;
    EXPECT_EQ(machine.CurrentState(), DispatchState::kWait);
    EXPECT_TRUE(machine.Is(DispatchState::kWait));
    EXPECT_FALSE(machine.LastTransition().has_value());
}

// Transitions record source, target, reason and timestamp.
TEST(CommandStateMachine, TransitionRecordsHistory) {
    CommandStateMachine machine;
    machine.TransitionTo(DispatchState::kAwaitingResponse, "Connect sent", 42);

    EXPECT_TRUE(machine.Is(DispatchState::kAwaitingResponse));
    auto last = machine.LastTransition();
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->from, DispatchState::kWait);
    EXPECT_EQ(last->to, DispatchState::kAwaitingResponse);
    EXPECT_EQ(last->reason, "Connect sent");
    EXPECT_EQ(last->timestamp, 42u);
}

// Reset returns to Wait and forgets history.
TEST(CommandStateMachine, ResetClears) {
    CommandStateMachine machine;
    machine.TransitionTo(DispatchState::kWaitingForInterfaceConflict, "prompt", 1);
    machine.Reset();
    EXPECT_TRUE(machine.Is(DispatchState::kWait));
    EXPECT_FALSE(machine.LastTransition().has_value());
}

// State names are stable for logs.
TEST(CommandStateMachine, StateNames) {
    EXPECT_EQ(ToString(DispatchState::kWait), "Wait");
    EXPECT_EQ(ToString(DispatchState::kAwaitingResponse), "AwaitingResponse");
    EXPECT_EQ(ToString(DispatchState::kWaitingForInterfaceConflict),
              "WaitingForInterfaceConflict");
}
