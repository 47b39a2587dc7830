/**
 * @file background_worker_tests.cpp
 * @brief Unit tests for the periodic worker and the deadline timer
 */

#include <gtest/gtest.h>
#include "crdtperf/core/background_worker.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

using namespace crdtperf;
using namespace crdtperf::core;
using namespace std::chrono_literals;

namespace {

template<typename Predicate>
bool wait_until(Predicate pred, Duration timeout = 2s) {
    const auto deadline = SteadyClock::now() + timeout;
    while (SteadyClock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

} // anonymous namespace

// ============================================================================
// BackgroundWorker Tests
// ============================================================================

TEST(BackgroundWorkerTest, TicksUntilStopped) {
    std::atomic<int> ticks{0};
    BackgroundWorker worker("test", 10ms, [&ticks]() { ++ticks; });

    EXPECT_FALSE(worker.is_running());
    EXPECT_EQ(worker.start(), Status::Success);
    EXPECT_TRUE(worker.is_running());

    EXPECT_TRUE(wait_until([&ticks]() { return ticks.load() >= 3; }));
    EXPECT_EQ(worker.stop(), Status::Success);
    EXPECT_FALSE(worker.is_running());

    const int after_stop = ticks.load();
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(ticks.load(), after_stop);
}

TEST(BackgroundWorkerTest, DoubleStartAndStop) {
    BackgroundWorker worker("test", 1s, []() {});

    EXPECT_EQ(worker.stop(), Status::NotRunning);
    EXPECT_EQ(worker.start(), Status::Success);
    EXPECT_EQ(worker.start(), Status::AlreadyRunning);
    EXPECT_EQ(worker.stop(), Status::Success);
    EXPECT_EQ(worker.stop(), Status::NotRunning);
}

TEST(BackgroundWorkerTest, Restart) {
    std::atomic<int> ticks{0};
    BackgroundWorker worker("test", 1s, [&ticks]() { ++ticks; });

    ASSERT_EQ(worker.start(), Status::Success);
    EXPECT_TRUE(wait_until([&ticks]() { return ticks.load() >= 1; }));
    ASSERT_EQ(worker.stop(), Status::Success);

    ASSERT_EQ(worker.start(), Status::Success);
    EXPECT_TRUE(wait_until([&ticks]() { return ticks.load() >= 2; }));
    EXPECT_EQ(worker.stop(), Status::Success);
}

TEST(BackgroundWorkerTest, WakeRunsTickEarly) {
    std::atomic<int> ticks{0};
    BackgroundWorker worker("test", 1h, [&ticks]() { ++ticks; });

    ASSERT_EQ(worker.start(), Status::Success);
    ASSERT_TRUE(wait_until([&ticks]() { return ticks.load() == 1; }));

    worker.wake();
    EXPECT_TRUE(wait_until([&ticks]() { return ticks.load() == 2; }));
    EXPECT_EQ(worker.stop(), Status::Success);
}

TEST(BackgroundWorkerTest, ThrowingTickKeepsLoopAlive) {
    std::atomic<int> ticks{0};
    BackgroundWorker worker("throwing", 5ms, [&ticks]() {
        ++ticks;
        throw std::runtime_error("tick failure");
    });

    ASSERT_EQ(worker.start(), Status::Success);
    EXPECT_TRUE(wait_until([&ticks]() { return ticks.load() >= 3; }));
    EXPECT_TRUE(worker.is_running());
    EXPECT_EQ(worker.stop(), Status::Success);
}

TEST(BackgroundWorkerTest, StopTimesOutOnStuckTick) {
    // Shared with the abandoned thread, which outlives this test body
    auto release = std::make_shared<std::atomic<bool>>(false);
    auto entered = std::make_shared<std::atomic<bool>>(false);
    auto worker = std::make_unique<BackgroundWorker>("stuck", 1ms, [release, entered]() {
        *entered = true;
        while (!release->load()) {
            std::this_thread::sleep_for(1ms);
        }
    });

    ASSERT_EQ(worker->start(), Status::Success);
    ASSERT_TRUE(wait_until([&entered]() { return entered->load(); }));

    EXPECT_EQ(worker->stop(50ms), Status::Timeout);
    EXPECT_FALSE(worker->is_running());
    *release = true;
    worker.reset();
}

TEST(BackgroundWorkerTest, AbandonedThreadDoesNotTickAfterRestart) {
    auto release = std::make_shared<std::atomic<bool>>(false);
    auto first = std::make_shared<std::atomic<bool>>(true);
    auto guard = std::make_shared<std::mutex>();
    auto callers = std::make_shared<std::multiset<std::thread::id>>();

    BackgroundWorker worker("restarted", 5ms, [=]() {
        {
            std::lock_guard<std::mutex> lock(*guard);
            callers->insert(std::this_thread::get_id());
        }
        if (first->exchange(false)) {
            while (!release->load()) {
                std::this_thread::sleep_for(1ms);
            }
        }
    });

    ASSERT_EQ(worker.start(), Status::Success);
    ASSERT_TRUE(wait_until([&first]() { return !first->load(); }));
    std::thread::id stuck_thread;
    {
        std::lock_guard<std::mutex> lock(*guard);
        stuck_thread = *callers->begin();
    }

    ASSERT_EQ(worker.stop(30ms), Status::Timeout);
    ASSERT_EQ(worker.start(), Status::Success);
    *release = true;

    EXPECT_TRUE(wait_until([&]() {
        std::lock_guard<std::mutex> lock(*guard);
        return callers->size() >= 4;
    }));
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(worker.stop(), Status::Success);

    std::lock_guard<std::mutex> lock(*guard);
    EXPECT_EQ(callers->count(stuck_thread), 1u);
}

// ============================================================================
// DeadlineTimer Tests
// ============================================================================

TEST(DeadlineTimerTest, FiresOnceWithToken) {
    std::atomic<UInt64> seen{0};
    std::atomic<int> fires{0};
    DeadlineTimer timer("deadline", [&](UInt64 token) {
        seen = token;
        ++fires;
    });

    ASSERT_EQ(timer.start(), Status::Success);
    timer.arm(20ms, 7);
    EXPECT_TRUE(timer.is_armed());

    EXPECT_TRUE(wait_until([&fires]() { return fires.load() == 1; }));
    EXPECT_EQ(seen.load(), 7u);
    EXPECT_FALSE(timer.is_armed());

    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(fires.load(), 1);
    EXPECT_EQ(timer.stop(), Status::Success);
}

TEST(DeadlineTimerTest, CancelPreventsFire) {
    std::atomic<int> fires{0};
    DeadlineTimer timer("deadline", [&fires](UInt64) { ++fires; });

    ASSERT_EQ(timer.start(), Status::Success);
    timer.arm(30ms, 1);
    timer.cancel();
    EXPECT_FALSE(timer.is_armed());

    std::this_thread::sleep_for(80ms);
    EXPECT_EQ(fires.load(), 0);
    EXPECT_EQ(timer.fire_count(), 0u);
}

TEST(DeadlineTimerTest, RearmReplacesDeadline) {
    std::atomic<UInt64> seen{0};
    std::atomic<int> fires{0};
    DeadlineTimer timer("deadline", [&](UInt64 token) {
        seen = token;
        ++fires;
    });

    ASSERT_EQ(timer.start(), Status::Success);
    timer.arm(1h, 1);
    timer.arm(10ms, 2);

    EXPECT_TRUE(wait_until([&fires]() { return fires.load() == 1; }));
    EXPECT_EQ(seen.load(), 2u);
}

TEST(DeadlineTimerTest, StopWhileArmed) {
    std::atomic<int> fires{0};
    DeadlineTimer timer("deadline", [&fires](UInt64) { ++fires; });

    ASSERT_EQ(timer.start(), Status::Success);
    timer.arm(1h, 1);
    EXPECT_EQ(timer.stop(), Status::Success);
    EXPECT_FALSE(timer.is_running());
    EXPECT_EQ(fires.load(), 0);
}

TEST(DeadlineTimerTest, ArmedWhileStoppedFiresAfterStart) {
    std::atomic<int> fires{0};
    DeadlineTimer timer("deadline", [&fires](UInt64) { ++fires; });

    timer.arm(10ms, 3);
    EXPECT_TRUE(timer.is_armed());
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(fires.load(), 0);

    ASSERT_EQ(timer.start(), Status::Success);
    EXPECT_TRUE(wait_until([&fires]() { return fires.load() == 1; }));
    EXPECT_EQ(timer.stop(), Status::Success);
}

TEST(DeadlineTimerTest, ArmDuringRestartCycles) {
    std::atomic<int> fires{0};
    DeadlineTimer timer("deadline", [&fires](UInt64) { ++fires; });
    std::atomic<bool> done{false};

    std::thread armer([&]() {
        UInt64 token = 0;
        while (!done.load()) {
            timer.arm(1ms, ++token);
            timer.is_running();
            timer.cancel();
        }
    });

    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(timer.start(), Status::Success);
        EXPECT_EQ(timer.stop(), Status::Success);
    }
    done = true;
    armer.join();

    EXPECT_FALSE(timer.is_running());
}
