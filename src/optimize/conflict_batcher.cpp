/**
 * @file conflict_batcher.cpp
 * @brief Conflict batcher implementation
 */

#include "crdtperf/optimize/conflict_batcher.h"
#include "crdtperf/core/background_worker.h"
#include "crdtperf/core/logging.h"
#include <algorithm>
#include <map>
#include <mutex>
#include <unordered_map>

namespace crdtperf::optimize {

const char* flush_trigger_to_string(FlushTrigger trigger) {
    switch (trigger) {
        case FlushTrigger::Size: return "size";
        case FlushTrigger::Timeout: return "timeout";
        case FlushTrigger::Manual: return "manual";
        case FlushTrigger::Shutdown: return "shutdown";
        default: return "unknown";
    }
}

// ============================================================================
// ConflictBatcher Implementation
// ============================================================================

struct ConflictBatcher::Impl {
    ConflictBatchConfig config;

    mutable std::mutex mutex;
    std::vector<ConflictRecord> pending;
    UInt64 generation{0};               ///< Bumped every time a batch is taken
    ConflictBatchStats stats;

    std::mutex resolver_mutex;
    std::unordered_map<std::string, ConflictGroupResolver> resolvers;
    ConflictGroupResolver default_resolver;
    BatchObserver observer;

    std::unique_ptr<core::DeadlineTimer> timer;
    std::shared_ptr<spdlog::logger> log{core::logging::get_logger("conflict_batcher")};

    explicit Impl(ConflictBatchConfig cfg) : config(cfg) {}

    // Caller holds `mutex`
    std::vector<ConflictRecord> take_locked() {
        std::vector<ConflictRecord> batch;
        batch.swap(pending);
        ++generation;
        timer->cancel();
        return batch;
    }

    void on_deadline(UInt64 token) {
        std::vector<ConflictRecord> batch;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (token != generation || pending.empty()) {
                return;     // batch already flushed
            }
            batch = take_locked();
        }
        process(std::move(batch), FlushTrigger::Timeout);
    }

    void process(std::vector<ConflictRecord> batch, FlushTrigger trigger) {
        if (batch.empty()) return;

        std::map<std::string, std::vector<ConflictRecord>> groups;
        for (auto& conflict : batch) {
            groups[conflict.conflict_type].push_back(std::move(conflict));
        }

        UInt64 resolved_groups = 0;
        UInt64 failures = 0;
        UInt64 unhandled = 0;
        std::vector<ConflictRecord> flushed;
        flushed.reserve(batch.size());

        for (auto& [type, group] : groups) {
            std::stable_sort(group.begin(), group.end(),
                             [](const ConflictRecord& a, const ConflictRecord& b) {
                                 return a.detected_at < b.detected_at;
                             });

            ConflictGroupResolver resolver;
            {
                std::lock_guard<std::mutex> lock(resolver_mutex);
                auto it = resolvers.find(type);
                resolver = (it != resolvers.end()) ? it->second : default_resolver;
            }

            if (!resolver) {
                ++unhandled;
                log->warn("No resolver for conflict type '{}', {} conflict(s) left unresolved",
                          type, group.size());
            } else {
                try {
                    resolver(type, group);
                    ++resolved_groups;
                } catch (const std::exception& e) {
                    ++failures;
                    log->error("Resolver for '{}' failed on {} conflict(s): {}",
                               type, group.size(), e.what());
                } catch (...) {
                    ++failures;
                    log->error("Resolver for '{}' failed on {} conflict(s) with a non-standard exception",
                               type, group.size());
                }
            }

            for (auto& conflict : group) {
                flushed.push_back(std::move(conflict));
            }
        }

        log->debug("Flushed {} conflict(s) in {} group(s) ({})",
                   flushed.size(), groups.size(), flush_trigger_to_string(trigger));

        BatchObserver notify;
        {
            std::lock_guard<std::mutex> lock(mutex);
            ++stats.flushes;
            switch (trigger) {
                case FlushTrigger::Size: ++stats.size_flushes; break;
                case FlushTrigger::Timeout: ++stats.timeout_flushes; break;
                case FlushTrigger::Manual: ++stats.manual_flushes; break;
                case FlushTrigger::Shutdown: ++stats.shutdown_flushes; break;
            }
            stats.conflicts_processed += flushed.size();
            stats.groups_resolved += resolved_groups;
            stats.resolver_failures += failures;
            stats.unhandled_groups += unhandled;
        }
        {
            std::lock_guard<std::mutex> lock(resolver_mutex);
            notify = observer;
        }

        if (notify) {
            try {
                notify(trigger, flushed);
            } catch (const std::exception& e) {
                log->error("Batch observer failed: {}", e.what());
            } catch (...) {
                log->error("Batch observer failed with a non-standard exception");
            }
        }
    }
};

ConflictBatcher::ConflictBatcher(ConflictBatchConfig config)
    : impl_(std::make_shared<Impl>(config)) {
    std::weak_ptr<Impl> weak = impl_;
    impl_->timer = std::make_unique<core::DeadlineTimer>(
        "conflict_batch", [weak](UInt64 token) {
            if (auto impl = weak.lock()) {
                impl->on_deadline(token);
            }
        });
    impl_->timer->start();
}

ConflictBatcher::~ConflictBatcher() {
    stop();
}

Status ConflictBatcher::start() {
    if (!impl_->config.is_valid()) {
        impl_->log->error("Invalid conflict batch configuration (batch_size {})",
                          impl_->config.batch_size);
        return Status::InvalidConfiguration;
    }

    Status status = impl_->timer->start();
    if (!succeeded(status)) {
        return status;
    }

    // Conflicts added while stopped get a fresh deadline
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->pending.empty()) {
        impl_->timer->arm(impl_->config.timeout, impl_->generation);
    }
    return Status::Success;
}

Status ConflictBatcher::stop() {
    if (!impl_->timer->is_running()) {
        return Status::NotRunning;
    }

    Status status = impl_->timer->stop(impl_->config.stop_timeout);
    if (status == Status::Timeout) {
        impl_->log->warn("Deadline timer did not exit within the stop timeout, abandoned");
    }

    if (impl_->config.flush_on_stop) {
        flush(FlushTrigger::Shutdown);
    }
    return status;
}

bool ConflictBatcher::is_running() const {
    return impl_->timer->is_running();
}

void ConflictBatcher::register_resolver(const std::string& conflict_type,
                                        ConflictGroupResolver resolver) {
    std::lock_guard<std::mutex> lock(impl_->resolver_mutex);
    impl_->resolvers[conflict_type] = std::move(resolver);
}

void ConflictBatcher::set_default_resolver(ConflictGroupResolver resolver) {
    std::lock_guard<std::mutex> lock(impl_->resolver_mutex);
    impl_->default_resolver = std::move(resolver);
}

void ConflictBatcher::set_batch_observer(BatchObserver observer) {
    std::lock_guard<std::mutex> lock(impl_->resolver_mutex);
    impl_->observer = std::move(observer);
}

void ConflictBatcher::add_conflict(ConflictRecord conflict) {
    std::vector<ConflictRecord> batch;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        ++impl_->stats.conflicts_received;
        const bool was_empty = impl_->pending.empty();
        impl_->pending.push_back(std::move(conflict));

        if (impl_->pending.size() >= impl_->config.batch_size) {
            batch = impl_->take_locked();
        } else if (was_empty) {
            impl_->timer->arm(impl_->config.timeout, impl_->generation);
        }
    }

    if (!batch.empty()) {
        impl_->process(std::move(batch), FlushTrigger::Size);
    }
}

SizeT ConflictBatcher::flush(FlushTrigger trigger) {
    std::vector<ConflictRecord> batch;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->pending.empty()) {
            return 0;
        }
        batch = impl_->take_locked();
    }

    const SizeT count = batch.size();
    impl_->process(std::move(batch), trigger);
    return count;
}

SizeT ConflictBatcher::pending_count() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->pending.size();
}

ConflictBatchStats ConflictBatcher::get_statistics() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->stats;
}

const ConflictBatchConfig& ConflictBatcher::config() const {
    return impl_->config;
}

} // namespace crdtperf::optimize
