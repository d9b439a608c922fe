/**
 * @file PeriodicTaskTest.cpp
 * @brief Unit tests for PeriodicTask
 */

#include <gtest/gtest.h>
#include "adapters/secondary/PeriodicTask.hpp"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace ledger::adapters::secondary;

class PeriodicTaskTest : public ::testing::Test {
protected:
    std::atomic<int> calls_{0};

    PeriodicTask::Job counting() {
        return [this]() { ++calls_; };
    }
};

TEST_F(PeriodicTaskTest, Construction_NotRunning) {
    PeriodicTask task("test", counting(), std::chrono::milliseconds{50});
    EXPECT_FALSE(task.isRunning());
    EXPECT_EQ(task.name(), "test");
    EXPECT_EQ(task.runCount(), 0u);
}

TEST_F(PeriodicTaskTest, StartStop_Basic) {
    PeriodicTask task("test", counting(), std::chrono::milliseconds{50});

    task.start();
    EXPECT_TRUE(task.isRunning());

    task.stop();
    EXPECT_FALSE(task.isRunning());
}

TEST_F(PeriodicTaskTest, Start_MultipleTimes_NoOp) {
    PeriodicTask task("test", counting(), std::chrono::milliseconds{50});

    task.start();
    task.start();  // Should be ignored

    EXPECT_TRUE(task.isRunning());
    task.stop();
}

TEST_F(PeriodicTaskTest, Stop_WhenNotRunning_NoOp) {
    PeriodicTask task("test", counting(), std::chrono::milliseconds{50});

    task.stop();  // Should be safe
    EXPECT_FALSE(task.isRunning());
}

TEST_F(PeriodicTaskTest, RunsRepeatedly) {
    PeriodicTask task("test", counting(), std::chrono::milliseconds{10});

    task.start();
    std::this_thread::sleep_for(std::chrono::milliseconds{100});
    task.stop();

    EXPECT_GT(calls_.load(), 1);
    EXPECT_EQ(task.runCount(), static_cast<uint64_t>(calls_.load()));
}

TEST_F(PeriodicTaskTest, Stop_InterruptsLongInterval) {
    PeriodicTask task("test", counting(), std::chrono::hours{1});

    task.start();
    std::this_thread::sleep_for(std::chrono::milliseconds{20});

    auto begin = std::chrono::steady_clock::now();
    task.stop();
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_LT(elapsed, std::chrono::seconds{1});
    EXPECT_EQ(calls_.load(), 1);
}

TEST_F(PeriodicTaskTest, RunOnce_FailureIsCountedAndSwallowed) {
    int attempt = 0;
    PeriodicTask task("flaky", [&attempt]() {
        if (++attempt == 1) {
            throw std::runtime_error("database unavailable");
        }
    }, std::chrono::milliseconds{50});

    EXPECT_NO_THROW(task.runOnce());
    EXPECT_NO_THROW(task.runOnce());

    EXPECT_EQ(task.runCount(), 2u);
    EXPECT_EQ(task.failureCount(), 1u);
}

TEST_F(PeriodicTaskTest, FailingJob_KeepsRunning) {
    PeriodicTask task("failing", [this]() {
        ++calls_;
        throw std::runtime_error("boom");
    }, std::chrono::milliseconds{10});

    task.start();
    std::this_thread::sleep_for(std::chrono::milliseconds{100});
    task.stop();

    EXPECT_GT(task.failureCount(), 1u);
    EXPECT_EQ(task.failureCount(), task.runCount());
}

TEST_F(PeriodicTaskTest, Destructor_StopsThread) {
    {
        PeriodicTask task("test", counting(), std::chrono::milliseconds{10});
        task.start();
    }
    // Should not hang or crash
    auto after = calls_.load();
    std::this_thread::sleep_for(std::chrono::milliseconds{30});
    EXPECT_EQ(calls_.load(), after);
}
