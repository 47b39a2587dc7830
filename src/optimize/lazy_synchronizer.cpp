/**
 * @file lazy_synchronizer.cpp
 * @brief Lazy synchronizer implementation
 */

#include "crdtperf/optimize/lazy_synchronizer.h"
#include "crdtperf/core/background_worker.h"
#include "crdtperf/core/logging.h"
#include <algorithm>
#include <cctype>
#include <mutex>
#include <queue>
#include <unordered_map>

namespace crdtperf::optimize {

// ============================================================================
// Sync Priority
// ============================================================================

const char* sync_priority_to_string(SyncPriority priority) {
    switch (priority) {
        case SyncPriority::Critical: return "critical";
        case SyncPriority::High: return "high";
        case SyncPriority::Normal: return "normal";
        case SyncPriority::Low: return "low";
        default: return "unknown";
    }
}

std::optional<SyncPriority> parse_sync_priority(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "critical") return SyncPriority::Critical;
    if (lower == "high") return SyncPriority::High;
    if (lower == "normal") return SyncPriority::Normal;
    if (lower == "low") return SyncPriority::Low;
    return std::nullopt;
}

Real priority_factor(SyncPriority priority) noexcept {
    switch (priority) {
        case SyncPriority::Critical: return 0.1;
        case SyncPriority::High: return 0.5;
        case SyncPriority::Normal: return 1.0;
        case SyncPriority::Low: return 2.0;
        default: return 1.0;
    }
}

// ============================================================================
// LazySynchronizer Implementation
// ============================================================================

namespace {

struct QueueEntry {
    SteadyTime due;
    UInt64 sequence;            ///< FIFO among equal due times
    PeerId peer;
    SyncPriority priority;
};

struct LaterFirst {
    bool operator()(const QueueEntry& a, const QueueEntry& b) const {
        if (a.due != b.due) return a.due > b.due;
        return a.sequence > b.sequence;
    }
};

} // anonymous namespace

struct LazySynchronizer::Impl {
    std::string node_id;
    LazySyncConfig config;

    mutable std::mutex mutex;
    std::priority_queue<QueueEntry, std::vector<QueueEntry>, LaterFirst> queue;
    std::unordered_map<PeerId, UInt64> activity;
    std::unordered_map<PeerId, WallClockTime> last_sync;
    UInt64 next_sequence{0};
    LazySyncStats stats;

    SyncCallback callback;
    SyncObserver observer;

    std::unique_ptr<core::BackgroundWorker> worker;
    std::shared_ptr<spdlog::logger> log{core::logging::get_logger("lazy_sync")};

    Impl(std::string id, LazySyncConfig cfg)
        : node_id(std::move(id)), config(cfg) {}

    Seconds interval_for(UInt64 activity_level, SyncPriority priority) const noexcept {
        Real base = config.base_interval.count();
        if (activity_level > config.high_activity_threshold) {
            base /= 4.0;
        } else if (activity_level > config.medium_activity_threshold) {
            base /= 2.0;
        } else if (activity_level < config.low_activity_threshold) {
            base *= 2.0;
        }

        const Real interval = base * priority_factor(priority);
        return Seconds(std::clamp(interval, config.min_interval.count(),
                                  config.max_interval.count()));
    }

    SteadyTime enqueue_locked(const PeerId& peer, SyncPriority priority, SteadyTime now) {
        auto it = activity.find(peer);
        const UInt64 level = (it != activity.end()) ? it->second : 0;
        const Seconds interval = interval_for(level, priority);
        const SteadyTime due = now + std::chrono::duration_cast<Duration>(interval);

        queue.push(QueueEntry{due, next_sequence++, peer, priority});
        log->debug("Scheduled sync with {} in {:.1f}s (activity {}, priority {})",
                   peer, interval.count(), level, sync_priority_to_string(priority));
        return due;
    }

    SyncAttempt execute(const QueueEntry& entry, const SyncCallback& cb) {
        SyncAttempt attempt;
        attempt.peer_id = entry.peer;

        const auto start = SteadyClock::now();
        SyncOutcome outcome;
        if (!cb) {
            outcome = SyncOutcome::failure("no sync callback installed");
        } else {
            try {
                outcome = cb(entry.peer, entry.priority);
            } catch (const std::exception& e) {
                outcome = SyncOutcome::failure(e.what());
            } catch (...) {
                outcome = SyncOutcome::failure("sync callback threw a non-standard exception");
            }
        }

        attempt.duration_ms = to_milliseconds(SteadyClock::now() - start);
        attempt.success = outcome.success;
        attempt.ops_sent = outcome.ops_sent;
        attempt.ops_received = outcome.ops_received;
        attempt.bandwidth_bytes = outcome.bandwidth_bytes;
        attempt.compression_ratio = outcome.compression_ratio;
        attempt.error = outcome.error;
        attempt.timestamp = WallClock::now();

        if (!attempt.success && !attempt.error) {
            attempt.error = "sync reported failure";
        }
        return attempt;
    }

    SizeT process_due(SteadyTime now) {
        std::vector<QueueEntry> due;
        SyncCallback cb;
        SyncObserver notify;
        {
            std::lock_guard<std::mutex> lock(mutex);
            while (!queue.empty() && queue.top().due <= now) {
                due.push_back(queue.top());
                queue.pop();
            }
            if (due.empty()) {
                return 0;
            }
            cb = callback;
            notify = observer;
        }

        for (const auto& entry : due) {
            SyncAttempt attempt = execute(entry, cb);

            {
                std::lock_guard<std::mutex> lock(mutex);
                activity[entry.peer] = 0;
                last_sync[entry.peer] = attempt.timestamp;
                ++stats.attempted;

                if (attempt.success) {
                    ++stats.succeeded;
                } else {
                    ++stats.failed;
                    log->warn("Sync with {} failed: {}", entry.peer,
                              attempt.error.value_or("unknown error"));
                    if (config.reschedule_on_failure) {
                        ++stats.rescheduled;
                        enqueue_locked(entry.peer, entry.priority, SteadyClock::now());
                    }
                }
            }

            if (notify) {
                try {
                    notify(attempt);
                } catch (const std::exception& e) {
                    log->error("Sync observer failed: {}", e.what());
                } catch (...) {
                    log->error("Sync observer failed with a non-standard exception");
                }
            }
        }

        return due.size();
    }
};

LazySynchronizer::LazySynchronizer(std::string node_id, LazySyncConfig config)
    : impl_(std::make_shared<Impl>(std::move(node_id), config)) {
    std::weak_ptr<Impl> weak = impl_;
    impl_->worker = std::make_unique<core::BackgroundWorker>(
        "lazy_sync", config.poll_interval,
        [weak]() {
            if (auto impl = weak.lock()) {
                impl->process_due(SteadyClock::now());
            }
        });
}

LazySynchronizer::~LazySynchronizer() {
    if (impl_ && impl_->worker) {
        impl_->worker->stop(impl_->config.stop_timeout);
    }
}

Status LazySynchronizer::start() {
    if (!impl_->config.is_valid()) {
        impl_->log->error("Invalid lazy sync configuration");
        return Status::InvalidConfiguration;
    }

    Status status = impl_->worker->start();
    if (succeeded(status)) {
        impl_->log->info("Lazy synchronizer started for node {}", impl_->node_id);
    }
    return status;
}

Status LazySynchronizer::stop() {
    Status status = impl_->worker->stop(impl_->config.stop_timeout);
    if (status == Status::Timeout) {
        impl_->log->warn("Scheduler loop did not exit within the stop timeout, abandoned");
    } else if (succeeded(status)) {
        impl_->log->info("Lazy synchronizer stopped");
    }
    return status;
}

bool LazySynchronizer::is_running() const {
    return impl_->worker->is_running();
}

void LazySynchronizer::set_sync_callback(SyncCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->callback = std::move(callback);
}

void LazySynchronizer::set_sync_observer(SyncObserver observer) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->observer = std::move(observer);
}

void LazySynchronizer::record_activity(const PeerId& peer, UInt64 count) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->activity[peer] += count;
}

UInt64 LazySynchronizer::activity_count(const PeerId& peer) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->activity.find(peer);
    return (it != impl_->activity.end()) ? it->second : 0;
}

Seconds LazySynchronizer::compute_interval(UInt64 activity, SyncPriority priority) const noexcept {
    return impl_->interval_for(activity, priority);
}

SteadyTime LazySynchronizer::schedule_sync(const PeerId& peer, SyncPriority priority) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    ++impl_->stats.scheduled;
    return impl_->enqueue_locked(peer, priority, SteadyClock::now());
}

SizeT LazySynchronizer::process_due(SteadyTime now) {
    return impl_->process_due(now);
}

SizeT LazySynchronizer::queue_depth() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->queue.size();
}

std::optional<SteadyTime> LazySynchronizer::next_due() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->queue.empty()) {
        return std::nullopt;
    }
    return impl_->queue.top().due;
}

std::optional<WallClockTime> LazySynchronizer::last_sync_time(const PeerId& peer) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->last_sync.find(peer);
    if (it == impl_->last_sync.end()) {
        return std::nullopt;
    }
    return it->second;
}

LazySyncStats LazySynchronizer::get_statistics() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->stats;
}

const std::string& LazySynchronizer::node_id() const {
    return impl_->node_id;
}

const LazySyncConfig& LazySynchronizer::config() const {
    return impl_->config;
}

} // namespace crdtperf::optimize
