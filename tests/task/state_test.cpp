#include "shareup/task/state.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using shareup::task::TaskState;
using shareup::task::TransferTaskState;

TEST(TransferTaskStateTest, StartsIdleAndRunsOnce) {
    TransferTaskState state;
    EXPECT_EQ(state.get(), TaskState::Idle);

    ASSERT_TRUE(state.start().is_ok());
    EXPECT_EQ(state.get(), TaskState::Running);

    auto again = state.start();
    EXPECT_TRUE(again.is_error());
}

TEST(TransferTaskStateTest, TerminalStatesAreFinal) {
    for (auto terminal : {TaskState::Completed, TaskState::Cancelled, TaskState::Failed}) {
        TransferTaskState state;
        ASSERT_TRUE(state.start().is_ok());
        EXPECT_TRUE(state.finish(terminal));
        EXPECT_EQ(state.get(), terminal);

        EXPECT_FALSE(state.finish(TaskState::Completed));
        EXPECT_FALSE(state.finish(TaskState::Cancelled));
        EXPECT_FALSE(state.finish(TaskState::Failed));
        EXPECT_TRUE(state.start().is_error());
        EXPECT_EQ(state.get(), terminal);
    }
}

TEST(TransferTaskStateTest, CannotFinishWithoutRunning) {
    TransferTaskState state;
    EXPECT_FALSE(state.finish(TaskState::Cancelled));
    EXPECT_EQ(state.get(), TaskState::Idle);
}

TEST(TransferTaskStateTest, FinishWithRunsActionOnlyOnWin) {
    TransferTaskState state;
    ASSERT_TRUE(state.start().is_ok());

    int calls = 0;
    EXPECT_TRUE(state.finish_with(TaskState::Cancelled, [&]() { ++calls; }));
    EXPECT_FALSE(state.finish_with(TaskState::Failed, [&]() { ++calls; }));
    EXPECT_EQ(calls, 1);
}

TEST(TransferTaskStateTest, RacingFinishersProduceOneWinner) {
    TransferTaskState state;
    ASSERT_TRUE(state.start().is_ok());

    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&state, &winners, i]() {
            const auto target = i % 2 == 0 ? TaskState::Completed : TaskState::Cancelled;
            if (state.finish(target)) {
                winners++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(winners.load(), 1);
    EXPECT_TRUE(shareup::task::is_terminal(state.get()));
}

TEST(TransferTaskStateTest, NamesStates) {
    EXPECT_STREQ(shareup::task::to_string(TaskState::Idle), "idle");
    EXPECT_STREQ(shareup::task::to_string(TaskState::Cancelled), "cancelled");
    EXPECT_FALSE(shareup::task::is_terminal(TaskState::Running));
}
