#include <gtest/gtest.h>
#include <atomic>
#include <csignal>
#include <thread>
#include "core/shutdown_manager.hpp"

class ShutdownManagerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ShutdownManager::getInstance().reset();
    }

    void TearDown() override
    {
        ShutdownManager::getInstance().reset();
    }
};

TEST_F(ShutdownManagerTest, ProgrammaticShutdownUnblocksWait)
{
    auto &mgr = ShutdownManager::getInstance();

    std::atomic<bool> unblocked{false};
    std::thread waiter([&]()
                       {
        mgr.waitForShutdown();
        unblocked.store(true); });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_FALSE(unblocked.load());
    mgr.requestShutdown("unit-test");

    waiter.join();
    ASSERT_TRUE(unblocked.load());
    ASSERT_TRUE(mgr.isShutdownRequested());
    ASSERT_EQ(mgr.getSignalNumber(), 0);
    ASSERT_EQ(mgr.getReason(), "unit-test");
}

TEST_F(ShutdownManagerTest, TimedWaitReportsTimeout)
{
    auto &mgr = ShutdownManager::getInstance();
    EXPECT_FALSE(mgr.waitForShutdownFor(std::chrono::milliseconds(50)));

    mgr.requestShutdown("done");
    EXPECT_TRUE(mgr.waitForShutdownFor(std::chrono::milliseconds(50)));
}

TEST_F(ShutdownManagerTest, FirstRequestWins)
{
    auto &mgr = ShutdownManager::getInstance();
    mgr.requestShutdown("first", SIGTERM);
    mgr.requestShutdown("second", SIGINT);

    EXPECT_EQ(mgr.getReason(), "first");
    EXPECT_EQ(mgr.getSignalNumber(), SIGTERM);
}

TEST_F(ShutdownManagerTest, DeliveredSignalTriggersShutdown)
{
    auto &mgr = ShutdownManager::getInstance();
    mgr.installSignalHandlers();

    ASSERT_FALSE(mgr.isShutdownRequested());
    std::raise(SIGTERM);

    ASSERT_TRUE(mgr.waitForShutdownFor(std::chrono::seconds(2)));
    EXPECT_EQ(mgr.getSignalNumber(), SIGTERM);
}
