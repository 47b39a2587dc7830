/**
 * @file conflict_batcher_tests.cpp
 * @brief Unit tests for batched conflict resolution
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "crdtperf/optimize/conflict_batcher.h"
#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace crdtperf;
using namespace crdtperf::optimize;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::MockFunction;

namespace {

ConflictRecord make_conflict(const std::string& id, const std::string& type,
                             WallClockTime detected = WallClock::now()) {
    ConflictRecord conflict;
    conflict.conflict_id = id;
    conflict.conflict_type = type;
    conflict.detected_at = detected;
    conflict.involved_peers = {"node-a", "node-b"};
    return conflict;
}

void resolve_all(const std::string&, std::vector<ConflictRecord>& group) {
    for (auto& conflict : group) {
        conflict.mark_resolved("last_writer_wins", true);
    }
}

template<typename Predicate>
bool wait_until(Predicate pred, Duration timeout = 3s) {
    const auto deadline = SteadyClock::now() + timeout;
    while (SteadyClock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

} // anonymous namespace

// ============================================================================
// Size Flush Tests
// ============================================================================

TEST(ConflictBatcherTest, FlushesExactlyOnceAtBatchSize) {
    ConflictBatchConfig config;
    config.batch_size = 3;
    config.timeout = 1h;
    ConflictBatcher batcher(config);

    std::vector<std::string> resolved_types;
    batcher.set_default_resolver([&](const std::string& type, std::vector<ConflictRecord>& group) {
        resolved_types.push_back(type);
        resolve_all(type, group);
    });

    std::vector<FlushTrigger> triggers;
    std::vector<ConflictRecord> flushed;
    batcher.set_batch_observer([&](FlushTrigger trigger, const std::vector<ConflictRecord>& records) {
        triggers.push_back(trigger);
        flushed.insert(flushed.end(), records.begin(), records.end());
    });

    batcher.add_conflict(make_conflict("c1", "concurrent_update"));
    batcher.add_conflict(make_conflict("c2", "delete_update"));
    EXPECT_EQ(batcher.pending_count(), 2u);
    EXPECT_TRUE(triggers.empty());

    batcher.add_conflict(make_conflict("c3", "concurrent_update"));
    EXPECT_EQ(batcher.pending_count(), 0u);

    ASSERT_EQ(triggers.size(), 1u);
    EXPECT_EQ(triggers[0], FlushTrigger::Size);
    EXPECT_EQ(flushed.size(), 3u);
    for (const auto& conflict : flushed) {
        EXPECT_TRUE(conflict.is_resolved());
    }

    // Two groups, visited in type order
    EXPECT_EQ(resolved_types, (std::vector<std::string>{"concurrent_update", "delete_update"}));

    auto stats = batcher.get_statistics();
    EXPECT_EQ(stats.flushes, 1u);
    EXPECT_EQ(stats.size_flushes, 1u);
    EXPECT_EQ(stats.conflicts_processed, 3u);
    EXPECT_EQ(stats.groups_resolved, 2u);
}

TEST(ConflictBatcherTest, ThreeConflictsOneFlushWithinTimeout) {
    ConflictBatchConfig config;
    config.batch_size = 3;
    config.timeout = 100ms;
    ConflictBatcher batcher(config);
    batcher.set_default_resolver(resolve_all);

    std::atomic<int> flushes{0};
    batcher.set_batch_observer([&flushes](FlushTrigger, const std::vector<ConflictRecord>&) { ++flushes; });

    for (int i = 0; i < 3; ++i) {
        batcher.add_conflict(make_conflict("c" + std::to_string(i), "concurrent_update"));
    }

    // Past the timeout, the cancelled deadline must not flush again
    std::this_thread::sleep_for(300ms);
    EXPECT_EQ(flushes.load(), 1);
    EXPECT_EQ(batcher.get_statistics().timeout_flushes, 0u);
}

// ============================================================================
// Timeout Flush Tests
// ============================================================================

TEST(ConflictBatcherTest, FlushesOnceAfterTimeout) {
    ConflictBatchConfig config;
    config.batch_size = 10;
    config.timeout = 50ms;
    ConflictBatcher batcher(config);
    batcher.set_default_resolver(resolve_all);

    std::atomic<int> flushes{0};
    std::atomic<SizeT> flushed_count{0};
    batcher.set_batch_observer([&](FlushTrigger trigger, const std::vector<ConflictRecord>& records) {
        EXPECT_EQ(trigger, FlushTrigger::Timeout);
        flushed_count += records.size();
        ++flushes;
    });

    batcher.add_conflict(make_conflict("c1", "concurrent_update"));
    batcher.add_conflict(make_conflict("c2", "concurrent_update"));

    EXPECT_TRUE(wait_until([&flushes]() { return flushes.load() == 1; }));
    std::this_thread::sleep_for(150ms);

    EXPECT_EQ(flushes.load(), 1);
    EXPECT_EQ(flushed_count.load(), 2u);
    EXPECT_EQ(batcher.pending_count(), 0u);
    EXPECT_EQ(batcher.get_statistics().timeout_flushes, 1u);
}

TEST(ConflictBatcherTest, DeadlineCountsFromFirstPendingConflict) {
    ConflictBatchConfig config;
    config.batch_size = 100;
    config.timeout = 200ms;
    ConflictBatcher batcher(config);
    batcher.set_default_resolver(resolve_all);

    std::atomic<int> flushes{0};
    batcher.set_batch_observer([&flushes](FlushTrigger, const std::vector<ConflictRecord>&) { ++flushes; });

    const auto start = SteadyClock::now();
    batcher.add_conflict(make_conflict("c1", "t"));
    std::this_thread::sleep_for(100ms);
    batcher.add_conflict(make_conflict("c2", "t"));

    ASSERT_TRUE(wait_until([&flushes]() { return flushes.load() == 1; }));
    const Real elapsed_ms = to_milliseconds(SteadyClock::now() - start);
    EXPECT_LT(elapsed_ms, 290.0);
}

// ============================================================================
// Manual / Shutdown Flush Tests
// ============================================================================

TEST(ConflictBatcherTest, ManualFlushCancelsDeadline) {
    ConflictBatchConfig config;
    config.timeout = 50ms;
    ConflictBatcher batcher(config);
    batcher.set_default_resolver(resolve_all);

    std::atomic<int> flushes{0};
    batcher.set_batch_observer([&flushes](FlushTrigger, const std::vector<ConflictRecord>&) { ++flushes; });

    batcher.add_conflict(make_conflict("c1", "t"));
    EXPECT_EQ(batcher.flush(), 1u);
    EXPECT_EQ(batcher.flush(), 0u);

    std::this_thread::sleep_for(150ms);
    EXPECT_EQ(flushes.load(), 1);
    EXPECT_EQ(batcher.get_statistics().manual_flushes, 1u);
}

TEST(ConflictBatcherTest, StopDrainsPending) {
    ConflictBatchConfig config;
    config.timeout = 1h;
    ConflictBatcher batcher(config);
    batcher.set_default_resolver(resolve_all);

    std::vector<FlushTrigger> triggers;
    batcher.set_batch_observer([&triggers](FlushTrigger trigger, const std::vector<ConflictRecord>&) {
        triggers.push_back(trigger);
    });

    batcher.add_conflict(make_conflict("c1", "t"));
    batcher.add_conflict(make_conflict("c2", "t"));
    EXPECT_EQ(batcher.stop(), Status::Success);
    EXPECT_FALSE(batcher.is_running());

    ASSERT_EQ(triggers.size(), 1u);
    EXPECT_EQ(triggers[0], FlushTrigger::Shutdown);
    EXPECT_EQ(batcher.pending_count(), 0u);
    EXPECT_EQ(batcher.stop(), Status::NotRunning);
}

TEST(ConflictBatcherTest, StopWithoutDrainKeepsPending) {
    ConflictBatchConfig config;
    config.timeout = 1h;
    config.flush_on_stop = false;
    ConflictBatcher batcher(config);

    batcher.add_conflict(make_conflict("c1", "t"));
    EXPECT_EQ(batcher.stop(), Status::Success);
    EXPECT_EQ(batcher.pending_count(), 1u);
}

TEST(ConflictBatcherTest, RestartRearmsDeadline) {
    ConflictBatchConfig config;
    config.timeout = 50ms;
    config.flush_on_stop = false;
    ConflictBatcher batcher(config);
    batcher.set_default_resolver(resolve_all);

    ASSERT_EQ(batcher.stop(), Status::Success);
    batcher.add_conflict(make_conflict("c1", "t"));
    ASSERT_EQ(batcher.start(), Status::Success);

    EXPECT_TRUE(wait_until([&batcher]() { return batcher.pending_count() == 0; }));
    EXPECT_EQ(batcher.get_statistics().timeout_flushes, 1u);
}

// ============================================================================
// Resolver Tests
// ============================================================================

TEST(ConflictBatcherTest, TypeResolverPreferredOverDefault) {
    ConflictBatchConfig config;
    config.batch_size = 2;
    ConflictBatcher batcher(config);

    MockFunction<void(const std::string&, std::vector<ConflictRecord>&)> typed;
    MockFunction<void(const std::string&, std::vector<ConflictRecord>&)> fallback;
    EXPECT_CALL(typed, Call("delete_update", _)).Times(1);
    EXPECT_CALL(fallback, Call("concurrent_update", _)).Times(1);

    batcher.register_resolver("delete_update", typed.AsStdFunction());
    batcher.set_default_resolver(fallback.AsStdFunction());

    batcher.add_conflict(make_conflict("c1", "delete_update"));
    batcher.add_conflict(make_conflict("c2", "concurrent_update"));
}

TEST(ConflictBatcherTest, GroupSortedByDetectionTime) {
    ConflictBatchConfig config;
    config.batch_size = 3;
    ConflictBatcher batcher(config);

    std::vector<ConflictId> order;
    batcher.set_default_resolver([&order](const std::string&, std::vector<ConflictRecord>& group) {
        for (const auto& conflict : group) {
            order.push_back(conflict.conflict_id);
        }
    });

    const auto now = WallClock::now();
    batcher.add_conflict(make_conflict("late", "t", now + 2s));
    batcher.add_conflict(make_conflict("early", "t", now));
    batcher.add_conflict(make_conflict("middle", "t", now + 1s));

    EXPECT_EQ(order, (std::vector<ConflictId>{"early", "middle", "late"}));
}

TEST(ConflictBatcherTest, ResolverFailureIsIsolated) {
    ConflictBatchConfig config;
    config.batch_size = 2;
    ConflictBatcher batcher(config);

    batcher.register_resolver("bad", [](const std::string&, std::vector<ConflictRecord>&) {
        throw std::runtime_error("resolver exploded");
    });
    batcher.register_resolver("good", resolve_all);

    std::vector<ConflictRecord> flushed;
    batcher.set_batch_observer([&flushed](FlushTrigger, const std::vector<ConflictRecord>& records) {
        flushed = records;
    });

    batcher.add_conflict(make_conflict("c1", "bad"));
    batcher.add_conflict(make_conflict("c2", "good"));

    ASSERT_EQ(flushed.size(), 2u);
    auto stats = batcher.get_statistics();
    EXPECT_EQ(stats.resolver_failures, 1u);
    EXPECT_EQ(stats.groups_resolved, 1u);

    for (const auto& conflict : flushed) {
        EXPECT_EQ(conflict.is_resolved(), conflict.conflict_type == "good");
    }
}

TEST(ConflictBatcherTest, NonStandardResolverExceptionIsIsolated) {
    ConflictBatchConfig config;
    config.batch_size = 2;
    ConflictBatcher batcher(config);

    int b_resolved = 0;
    batcher.register_resolver("a", [](const std::string&, std::vector<ConflictRecord>&) { throw 1; });
    batcher.register_resolver("b", [&b_resolved](const std::string& type,
                                                 std::vector<ConflictRecord>& group) {
        b_resolved += static_cast<int>(group.size());
        resolve_all(type, group);
    });

    std::vector<ConflictRecord> flushed;
    batcher.set_batch_observer([&flushed](FlushTrigger, const std::vector<ConflictRecord>& records) {
        flushed = records;
    });

    EXPECT_NO_THROW(batcher.add_conflict(make_conflict("c1", "a")));
    EXPECT_NO_THROW(batcher.add_conflict(make_conflict("c2", "b")));

    EXPECT_EQ(batcher.pending_count(), 0u);
    EXPECT_EQ(b_resolved, 1);
    EXPECT_EQ(flushed.size(), 2u);

    auto stats = batcher.get_statistics();
    EXPECT_EQ(stats.flushes, 1u);
    EXPECT_EQ(stats.resolver_failures, 1u);
    EXPECT_EQ(stats.groups_resolved, 1u);
    EXPECT_EQ(stats.conflicts_processed, 2u);
}

TEST(ConflictBatcherTest, NonStandardObserverExceptionKeepsStatistics) {
    ConflictBatchConfig config;
    config.batch_size = 1;
    ConflictBatcher batcher(config);
    batcher.set_default_resolver(resolve_all);
    batcher.set_batch_observer([](FlushTrigger, const std::vector<ConflictRecord>&) {
        throw std::string("dashboard offline");
    });

    EXPECT_NO_THROW(batcher.add_conflict(make_conflict("c1", "concurrent_update")));
    auto stats = batcher.get_statistics();
    EXPECT_EQ(stats.flushes, 1u);
    EXPECT_EQ(stats.conflicts_processed, 1u);
}

TEST(ConflictBatcherTest, MissingResolverLeavesGroupUnresolved) {
    ConflictBatchConfig config;
    config.batch_size = 1;
    ConflictBatcher batcher(config);

    batcher.add_conflict(make_conflict("c1", "orphan"));
    EXPECT_EQ(batcher.get_statistics().unhandled_groups, 1u);
    EXPECT_EQ(batcher.get_statistics().conflicts_processed, 1u);
}

TEST(ConflictBatcherTest, ConcurrentAddsProcessEachConflictOnce) {
    ConflictBatchConfig config;
    config.batch_size = 7;
    config.timeout = 20ms;
    ConflictBatcher batcher(config);
    batcher.set_default_resolver(resolve_all);

    std::mutex seen_mutex;
    std::vector<ConflictId> seen;
    batcher.set_batch_observer([&](FlushTrigger, const std::vector<ConflictRecord>& records) {
        std::lock_guard<std::mutex> lock(seen_mutex);
        for (const auto& record : records) {
            seen.push_back(record.conflict_id);
        }
    });

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&batcher, t]() {
            for (int i = 0; i < 50; ++i) {
                batcher.add_conflict(make_conflict(std::to_string(t) + "-" + std::to_string(i), "t"));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    batcher.flush();

    // A deadline flush may still be running on the timer thread
    EXPECT_TRUE(wait_until([&]() {
        std::lock_guard<std::mutex> lock(seen_mutex);
        return seen.size() >= 200u;
    }));

    std::lock_guard<std::mutex> lock(seen_mutex);
    EXPECT_EQ(seen.size(), 200u);
    std::sort(seen.begin(), seen.end());
    EXPECT_EQ(std::unique(seen.begin(), seen.end()), seen.end());
}

TEST(ConflictBatcherTest, InvalidConfigurationRejected) {
    ConflictBatchConfig config;
    config.batch_size = 0;
    ConflictBatcher batcher(config);
    batcher.stop();
    EXPECT_EQ(batcher.start(), Status::InvalidConfiguration);
}

TEST(ConflictBatcherTest, DestroyedWhileTimeoutFlushBlocked) {
    ConflictBatchConfig config;
    config.batch_size = 100;
    config.timeout = 10ms;
    config.stop_timeout = 30ms;

    // Shared with the abandoned timer thread
    auto entered = std::make_shared<std::atomic<bool>>(false);
    auto delivered = std::make_shared<std::atomic<SizeT>>(0);

    auto batcher = std::make_unique<ConflictBatcher>(config);
    batcher->set_default_resolver(resolve_all);
    batcher->set_batch_observer([entered, delivered](FlushTrigger trigger,
                                                     const std::vector<ConflictRecord>& records) {
        if (trigger != FlushTrigger::Timeout) return;
        *entered = true;
        std::this_thread::sleep_for(200ms);
        *delivered = records.size();
    });

    batcher->add_conflict(make_conflict("c1", "concurrent_update"));
    ASSERT_TRUE(wait_until([&entered]() { return entered->load(); }));

    batcher.reset();

    EXPECT_TRUE(wait_until([&delivered]() { return delivered->load() == 1u; }));
    std::this_thread::sleep_for(50ms);
}
