#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <thread>
#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"

class ShutdownManagerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("WARN");
        ShutdownManager::getInstance().reset();
    }

    void TearDown() override
    {
        ShutdownManager::getInstance().reset();
    }
};

TEST_F(ShutdownManagerTest, RequestUnblocksWaiter)
{
    auto &mgr = ShutdownManager::getInstance();

    std::atomic<bool> unblocked{false};
    std::thread waiter([&]()
                       {
        mgr.waitForShutdown();
        unblocked.store(true); });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(unblocked.load());
    mgr.requestShutdown("user stop");

    waiter.join();
    EXPECT_TRUE(unblocked.load());
    EXPECT_TRUE(mgr.isShutdownRequested());
    EXPECT_EQ(mgr.getSignalNumber(), 0);
    EXPECT_EQ(mgr.interruptedExitCode(), 1);
}

TEST_F(ShutdownManagerTest, SignalNumberSetsExitCode)
{
    auto &mgr = ShutdownManager::getInstance();
    mgr.requestShutdown("SIGINT received", SIGINT);

    EXPECT_EQ(mgr.getSignalNumber(), SIGINT);
    EXPECT_EQ(mgr.getReason(), "SIGINT received");
    EXPECT_EQ(mgr.interruptedExitCode(), 128 + SIGINT);
}

TEST_F(ShutdownManagerTest, FirstRequestWins)
{
    auto &mgr = ShutdownManager::getInstance();
    mgr.requestShutdown("SIGTERM received", SIGTERM);
    mgr.requestShutdown("second request", SIGINT);

    EXPECT_EQ(mgr.getReason(), "SIGTERM received");
    EXPECT_EQ(mgr.getSignalNumber(), SIGTERM);
}

TEST_F(ShutdownManagerTest, StopHooksRunOnceOnRequest)
{
    auto &mgr = ShutdownManager::getInstance();
    std::atomic<int> stops{0};
    mgr.addStopHook([&]
                    { stops++; });

    mgr.requestShutdown("user stop");
    mgr.requestShutdown("user stop again");
    EXPECT_EQ(stops.load(), 1);
}

TEST_F(ShutdownManagerTest, RemovedHookDoesNotRun)
{
    auto &mgr = ShutdownManager::getInstance();
    std::atomic<int> stops{0};
    int id = mgr.addStopHook([&]
                             { stops++; });
    mgr.removeStopHook(id);

    mgr.requestShutdown("user stop");
    EXPECT_EQ(stops.load(), 0);
}

TEST_F(ShutdownManagerTest, LateHookRunsImmediately)
{
    auto &mgr = ShutdownManager::getInstance();
    mgr.requestShutdown("user stop");

    bool ran = false;
    mgr.addStopHook([&]
                    { ran = true; });
    EXPECT_TRUE(ran);
}

TEST_F(ShutdownManagerTest, ThrowingHookDoesNotBlockOthers)
{
    auto &mgr = ShutdownManager::getInstance();
    std::atomic<int> stops{0};
    mgr.addStopHook([]
                    { throw std::runtime_error("hook failed"); });
    mgr.addStopHook([&]
                    { stops++; });

    mgr.requestShutdown("user stop");
    EXPECT_EQ(stops.load(), 1);
}

TEST_F(ShutdownManagerTest, ResetClearsStateAndHooks)
{
    auto &mgr = ShutdownManager::getInstance();
    std::atomic<int> stops{0};
    mgr.addStopHook([&]
                    { stops++; });
    mgr.reset();

    EXPECT_FALSE(mgr.isShutdownRequested());
    EXPECT_EQ(mgr.getSignalNumber(), 0);
    mgr.requestShutdown("after reset");
    EXPECT_EQ(stops.load(), 0);
}

TEST_F(ShutdownManagerTest, RemoveWaitsForRunningHook)
{
    auto &mgr = ShutdownManager::getInstance();
    std::atomic<bool> started{false};
    std::atomic<bool> finished{false};
    int id = mgr.addStopHook([&]
                             {
        started.store(true);
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        finished.store(true); });

    std::thread requester([&]()
                          { mgr.requestShutdown("user stop"); });
    while (!started.load())
    {
        std::this_thread::yield();
    }

    mgr.removeStopHook(id);
    EXPECT_TRUE(finished.load());
    requester.join();
}

TEST_F(ShutdownManagerTest, HookMayRemoveItself)
{
    auto &mgr = ShutdownManager::getInstance();
    std::atomic<int> stops{0};
    int id = 0;
    id = mgr.addStopHook([&]
                         {
        stops++;
        mgr.removeStopHook(id); });

    mgr.requestShutdown("user stop");
    EXPECT_EQ(stops.load(), 1);
}

TEST_F(ShutdownManagerTest, FirstSignalRequestsGracefulStop)
{
    auto &mgr = ShutdownManager::getInstance();
    std::atomic<int> stops{0};
    mgr.addStopHook([&]
                    { stops++; });
    mgr.installSignalHandlers();

    std::raise(SIGINT);
    mgr.waitForShutdown();

    // Hooks run on the watcher thread right after waiters are released
    for (int i = 0; i < 200 && stops.load() == 0; ++i)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(mgr.getSignalNumber(), SIGINT);
    EXPECT_EQ(mgr.interruptedExitCode(), 128 + SIGINT);
    EXPECT_EQ(stops.load(), 1);
}

TEST_F(ShutdownManagerTest, SecondSignalTerminatesProcess)
{
    GTEST_FLAG_SET(death_test_style, "threadsafe");
    EXPECT_EXIT(
        {
            auto &mgr = ShutdownManager::getInstance();
            mgr.installSignalHandlers();
            std::raise(SIGINT);
            mgr.waitForShutdown();
            std::raise(SIGINT);
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
            std::exit(0);
        },
        ::testing::KilledBySignal(SIGINT), "");
}
