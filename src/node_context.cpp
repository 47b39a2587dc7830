/**
 * @file node_context.cpp
 * @brief Node context implementation
 */

#include "crdtperf/node_context.h"
#include "crdtperf/core/logging.h"

namespace crdtperf {

namespace {

// Share of failed syncs in one sample above which the node reports "degraded"
constexpr Real DEGRADED_FAILURE_RATE = 0.5;

} // anonymous namespace

// ============================================================================
// NodeMetricsSource Implementation
// ============================================================================

NodeMetricsSource::NodeMetricsSource()
    : last_reading_(core::read_process_resources()) {}

void NodeMetricsSource::record_sync(const SyncAttempt& attempt) {
    std::lock_guard<std::mutex> lock(mutex_);
    peers_.insert(attempt.peer_id);
    operations_ += attempt.ops_sent + attempt.ops_received;
    if (attempt.success) {
        ++successful_syncs_;
    } else {
        ++failed_syncs_;
    }
    sync_time_total_ms_ += attempt.duration_ms;
}

void NodeMetricsSource::record_conflict_detected(UInt64 count) {
    std::lock_guard<std::mutex> lock(mutex_);
    conflicts_detected_ += count;
}

void NodeMetricsSource::record_conflicts_resolved(UInt64 count) {
    std::lock_guard<std::mutex> lock(mutex_);
    conflicts_resolved_ += count;
}

void NodeMetricsSource::set_engine_probe(EngineHealthProbe probe) {
    std::lock_guard<std::mutex> lock(mutex_);
    probe_ = std::move(probe);
}

void NodeMetricsSource::set_sync_active(bool active) {
    std::lock_guard<std::mutex> lock(mutex_);
    sync_active_ = active;
}

std::optional<HealthSample> NodeMetricsSource::collect_health_sample() {
    EngineHealthProbe probe;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        probe = probe_;
    }

    // Probe exceptions propagate; the coordinator skips the tick
    EngineHealth engine;
    if (probe) {
        engine = probe();
    }

    const core::ResourceReading reading = core::read_process_resources();

    std::lock_guard<std::mutex> lock(mutex_);
    HealthSample sample;
    sample.timestamp = WallClock::now();
    sample.active_peers = static_cast<UInt32>(peers_.size());
    sample.total_operations = engine.total_operations.value_or(operations_);
    sample.successful_syncs = successful_syncs_;
    sample.failed_syncs = failed_syncs_;
    sample.conflicts_detected = conflicts_detected_;
    sample.conflicts_resolved = conflicts_resolved_;

    const UInt64 syncs = successful_syncs_ + failed_syncs_;
    sample.average_sync_time_ms = syncs > 0 ? sync_time_total_ms_ / static_cast<Real>(syncs) : 0.0;
    sample.partition_resilience = engine.partition_resilience;
    sample.data_consistency_score = engine.data_consistency_score;
    sample.performance_impact_percent = core::cpu_percent_between(last_reading_, reading);

    if (!sync_active_) {
        sample.sync_status = "idle";
    } else if (sample.sync_failure_rate() > DEGRADED_FAILURE_RATE) {
        sample.sync_status = "degraded";
    } else {
        sample.sync_status = "active";
    }

    peers_.clear();
    operations_ = 0;
    successful_syncs_ = 0;
    failed_syncs_ = 0;
    conflicts_detected_ = 0;
    conflicts_resolved_ = 0;
    sync_time_total_ms_ = 0.0;
    last_reading_ = reading;
    return sample;
}

// ============================================================================
// NodeContext Implementation
// ============================================================================

NodeContext::NodeContext(config::NodeConfig config)
    : config_(std::move(config))
    , source_(std::make_shared<NodeMetricsSource>()) {
    if (!core::logging::configure(config_.logging)) {
        core::logging::get_logger("node")->warn("Log file sink unavailable, logging to console only");
    }

    monitoring_ = std::make_shared<monitor::MonitoringCoordinator>(config_.monitoring);
    optimizer_ = std::make_unique<optimize::PerformanceOptimizer>(config_.node_id, config_.optimizer);

    monitoring_->set_metrics_source(source_);

    // Observers may run on a sync thread abandoned by a timed-out shutdown
    std::weak_ptr<monitor::MonitoringCoordinator> monitoring = monitoring_;
    auto source = source_;

    optimizer_->set_sync_observer([monitoring, source](const SyncAttempt& attempt) {
        if (auto coordinator = monitoring.lock()) {
            coordinator->metrics().record_sync_attempt(attempt);
        }
        source->record_sync(attempt);
    });

    optimizer_->set_conflict_observer(
        [monitoring, source](optimize::FlushTrigger, const std::vector<ConflictRecord>& records) {
            auto coordinator = monitoring.lock();
            UInt64 resolved = 0;
            for (const auto& record : records) {
                if (coordinator) {
                    coordinator->metrics().record_conflict(record);
                }
                if (record.is_resolved() && record.success) {
                    ++resolved;
                }
            }
            source->record_conflicts_resolved(resolved);
        });

    core::logging::get_logger("node")->info("Node context '{}' created", config_.node_id);
}

NodeContext::~NodeContext() {
    if (running_) {
        shutdown();
    }
}

Status NodeContext::start() {
    if (running_) {
        return Status::AlreadyRunning;
    }

    Status status = optimizer_->start();
    if (!succeeded(status)) {
        return status;
    }

    status = monitoring_->start();
    if (!succeeded(status)) {
        optimizer_->stop();
        return status;
    }

    source_->set_sync_active(optimizer_->is_running());
    running_ = true;
    core::logging::get_logger("node")->info("Node '{}' started", config_.node_id);
    return Status::Success;
}

Status NodeContext::shutdown() {
    if (!running_) {
        return Status::NotRunning;
    }
    running_ = false;

    // Optimizer first so the drained conflict batch still reaches the collector
    const Status optimizer_status = optimizer_->stop();
    const Status monitoring_status = monitoring_->stop();
    source_->set_sync_active(false);
    core::logging::flush();

    core::logging::get_logger("node")->info("Node '{}' shut down", config_.node_id);
    if (optimizer_status == Status::Timeout || monitoring_status == Status::Timeout) {
        return Status::Timeout;
    }
    return Status::Success;
}

bool NodeContext::is_running() const {
    return running_;
}

void NodeContext::report_conflict(ConflictRecord conflict) {
    source_->record_conflict_detected();
    optimizer_->batch_conflict_resolution(std::move(conflict));
}

void NodeContext::set_engine_probe(EngineHealthProbe probe) {
    source_->set_engine_probe(std::move(probe));
}

optimize::PerformanceOptimizer& NodeContext::optimizer() {
    return *optimizer_;
}

monitor::MonitoringCoordinator& NodeContext::monitoring() {
    return *monitoring_;
}

const monitor::MonitoringCoordinator& NodeContext::monitoring() const {
    return *monitoring_;
}

NodeMetricsSource& NodeContext::metrics_source() {
    return *source_;
}

const config::NodeConfig& NodeContext::config() const {
    return config_;
}

} // namespace crdtperf
