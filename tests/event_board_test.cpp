#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>
#include "core/event_board.hpp"

TEST(CompletionSignalTest, FirstResolutionWins)
{
    CompletionSignal signal;
    EXPECT_FALSE(signal.isResolved());

    EXPECT_TRUE(signal.fail("render failed"));
    EXPECT_FALSE(signal.set());
    EXPECT_EQ(signal.state(), SignalState::FAILED);
    EXPECT_EQ(signal.failureReason(), "render failed");
    EXPECT_FALSE(signal.isDone());
}

TEST(CompletionSignalTest, WaitForTimesOutWhilePending)
{
    CompletionSignal signal;
    EXPECT_EQ(signal.waitFor(std::chrono::milliseconds(20)), SignalState::PENDING);
    signal.set();
    EXPECT_EQ(signal.waitFor(std::chrono::milliseconds(20)), SignalState::DONE);
}

TEST(CompletionSignalTest, SetReleasesEveryWaiter)
{
    CompletionSignal signal;
    std::atomic<int> released{0};
    std::vector<std::thread> waiters;
    for (int i = 0; i < 4; ++i)
    {
        waiters.emplace_back([&]
                             {
            if (signal.wait() == SignalState::DONE)
            {
                released++;
            } });
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_EQ(released.load(), 0);
    signal.set();
    for (auto &waiter : waiters)
    {
        waiter.join();
    }
    EXPECT_EQ(released.load(), 4);

    // Stays resolved for late waiters
    EXPECT_EQ(signal.wait(), SignalState::DONE);
}

TEST(EventBoardTest, SignalsAreCreatedOnceAndQueriedWithoutBlocking)
{
    EventBoard board;
    TaskId first{0, ArtifactKind::FIRST_FRAME};
    TaskId video{0, ArtifactKind::SHOT_VIDEO};

    EXPECT_FALSE(board.isDone(first));
    EXPECT_EQ(board.find(first), nullptr);
    EXPECT_EQ(board.state(first), SignalState::PENDING);

    auto signal = board.signalFor(first);
    EXPECT_EQ(board.signalFor(first), signal);
    signal->set();
    board.signalFor(video)->fail("prerequisite failed");

    EXPECT_TRUE(board.isDone(first));
    EXPECT_EQ(board.state(video), SignalState::FAILED);
    EXPECT_EQ(board.resolvedTasks(SignalState::DONE), std::vector<TaskId>{first});
    EXPECT_EQ(board.resolvedTasks(SignalState::FAILED), std::vector<TaskId>{video});
    EXPECT_EQ(board.size(), 2u);
}
