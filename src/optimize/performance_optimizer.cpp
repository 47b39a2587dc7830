/**
 * @file performance_optimizer.cpp
 * @brief Performance optimizer facade implementation
 */

#include "crdtperf/optimize/performance_optimizer.h"
#include "crdtperf/core/logging.h"
#include <atomic>
#include <mutex>
#include <stdexcept>

namespace crdtperf::optimize {

namespace {

const char* const COMPRESSION_OPERATION = "delta_compression";
const char* const SYNC_OPERATION = "peer_sync";

} // anonymous namespace

nlohmann::json OptimizationStatus::to_json() const {
    return nlohmann::json{
        {"enabled", enabled},
        {"scheduler_active", scheduler_active},
        {"monitor_active", monitor_active},
        {"performance_summary", performance_summary.to_json()},
        {"queue_depth", queue_depth},
        {"pending_conflict_count", pending_conflict_count}
    };
}

SyncPriority activity_level_to_priority(std::string_view activity_level) noexcept {
    if (activity_level == "high") return SyncPriority::High;
    if (activity_level == "low") return SyncPriority::Low;
    return SyncPriority::Normal;
}

// ============================================================================
// PerformanceOptimizer Implementation
// ============================================================================

struct PerformanceOptimizer::Impl {
    std::string node_id;
    OptimizerConfig config;

    DeltaCompressor compressor;
    LazySynchronizer synchronizer;
    ConflictBatcher batcher;
    PerformanceMonitor monitor;

    mutable std::mutex callback_mutex;
    DeltaProvider delta_provider;
    TransmitFunction transmit;

    std::atomic<bool> running{false};
    std::shared_ptr<spdlog::logger> log{core::logging::get_logger("optimizer")};

    Impl(std::string id, const OptimizerConfig& cfg)
        : node_id(std::move(id))
        , config(cfg)
        , compressor(cfg.compression)
        , synchronizer(node_id, cfg.lazy_sync)
        , batcher(cfg.conflict_batch)
        , monitor(cfg.performance) {}

    Status prepare_payload(const nlohmann::json& delta, TransmissionPayload& payload) {
        payload = TransmissionPayload{};

        std::vector<UInt8> serialized;
        Status status = serialize_delta(delta, serialized);
        if (!succeeded(status)) {
            return status;
        }
        payload.original_size = static_cast<UInt64>(serialized.size());

        if (payload.original_size < config.compression_threshold_bytes) {
            payload.bytes = std::move(serialized);
            return Status::Success;
        }

        const CompressionAlgorithm requested = compressor.select_algorithm(payload.original_size);
        CompressionResult result;
        monitor.measure(COMPRESSION_OPERATION, [&]() {
            status = compressor.compress_bytes(serialized, requested, result);
        }, payload.original_size);

        if (!succeeded(status)) {
            return status;
        }

        if (result.algorithm == CompressionAlgorithm::None ||
            result.compressed_size >= result.original_size) {
            payload.bytes = std::move(serialized);
            payload.algorithm = CompressionAlgorithm::None;
            payload.compression_ratio = 1.0;
        } else {
            payload.bytes = std::move(result.data);
            payload.algorithm = result.algorithm;
            payload.compression_ratio = result.compression_ratio;
        }

        log->debug("Delta of {} bytes prepared as {} ({} bytes, ratio {:.2f})",
                   payload.original_size, compression_algorithm_to_string(payload.algorithm),
                   payload.bytes.size(), payload.compression_ratio);
        return Status::Success;
    }

    SyncOutcome execute_sync(const PeerId& peer) {
        DeltaProvider provider;
        TransmitFunction send;
        {
            std::lock_guard<std::mutex> lock(callback_mutex);
            provider = delta_provider;
            send = transmit;
        }

        if (!send) {
            return SyncOutcome::failure("no transport installed");
        }

        SyncOutcome outcome;
        monitor.measure(SYNC_OPERATION, [&]() {
            std::optional<nlohmann::json> delta;
            if (provider) {
                delta = provider(peer);
            }

            TransmissionPayload payload;
            if (delta) {
                Status status = prepare_payload(*delta, payload);
                if (!succeeded(status)) {
                    throw std::runtime_error(std::string("delta preparation failed: ") +
                                             status_to_string(status));
                }
                if (delta->is_array()) {
                    outcome.ops_sent = static_cast<UInt64>(delta->size());
                } else if (delta->contains("operations") && (*delta)["operations"].is_array()) {
                    outcome.ops_sent = static_cast<UInt64>((*delta)["operations"].size());
                }
            }

            if (!send(peer, payload.bytes, payload.algorithm)) {
                throw std::runtime_error("transport rejected sync with " + peer);
            }

            outcome.success = true;
            outcome.bandwidth_bytes = static_cast<UInt64>(payload.bytes.size());
            outcome.compression_ratio = payload.compression_ratio;
        });

        return outcome;
    }
};

PerformanceOptimizer::PerformanceOptimizer(std::string node_id, OptimizerConfig config)
    : impl_(std::make_shared<Impl>(std::move(node_id), config)) {
    std::weak_ptr<Impl> weak = impl_;
    impl_->synchronizer.set_sync_callback([weak](const PeerId& peer, SyncPriority) {
        if (auto impl = weak.lock()) {
            return impl->execute_sync(peer);
        }
        return SyncOutcome::failure("optimizer destroyed");
    });

    impl_->log->info("Performance optimizer created for node {} (enabled: {})",
                     impl_->node_id, impl_->config.enabled);
}

PerformanceOptimizer::~PerformanceOptimizer() {
    stop();
}

Status PerformanceOptimizer::start() {
    if (!impl_->config.enabled) {
        impl_->log->info("Optimization disabled, not starting background workers");
        return Status::Success;
    }
    if (impl_->running.load()) {
        return Status::AlreadyRunning;
    }

    Status status = impl_->synchronizer.start();
    if (!succeeded(status)) {
        impl_->log->error("Failed to start lazy synchronizer: {}", status_to_string(status));
        return status;
    }

    status = impl_->monitor.start();
    if (!succeeded(status) && status != Status::AlreadyRunning) {
        impl_->log->error("Failed to start performance sampler: {}", status_to_string(status));
        impl_->synchronizer.stop();
        return status;
    }

    // The batcher timer runs from construction; restart it after a stop()
    if (!impl_->batcher.is_running()) {
        status = impl_->batcher.start();
        if (!succeeded(status)) {
            impl_->log->error("Failed to start conflict batcher: {}", status_to_string(status));
            impl_->monitor.stop();
            impl_->synchronizer.stop();
            return status;
        }
    }

    impl_->running = true;
    impl_->log->info("Performance optimizer started");
    return Status::Success;
}

Status PerformanceOptimizer::stop() {
    if (!impl_->running.exchange(false)) {
        return Status::NotRunning;
    }

    Status result = Status::Success;
    for (Status status : {impl_->synchronizer.stop(), impl_->monitor.stop(), impl_->batcher.stop()}) {
        if (status == Status::Timeout) {
            result = Status::Timeout;
        }
    }

    impl_->log->info("Performance optimizer stopped");
    return result;
}

bool PerformanceOptimizer::is_running() const {
    return impl_->running.load();
}

bool PerformanceOptimizer::is_enabled() const {
    return impl_->config.enabled;
}

void PerformanceOptimizer::set_delta_provider(DeltaProvider provider) {
    std::lock_guard<std::mutex> lock(impl_->callback_mutex);
    impl_->delta_provider = std::move(provider);
}

void PerformanceOptimizer::set_transport(TransmitFunction transmit) {
    std::lock_guard<std::mutex> lock(impl_->callback_mutex);
    impl_->transmit = std::move(transmit);
}

void PerformanceOptimizer::set_sync_observer(SyncObserver observer) {
    impl_->synchronizer.set_sync_observer(std::move(observer));
}

void PerformanceOptimizer::set_conflict_observer(BatchObserver observer) {
    impl_->batcher.set_batch_observer(std::move(observer));
}

void PerformanceOptimizer::register_conflict_resolver(const std::string& conflict_type,
                                                      ConflictGroupResolver resolver) {
    impl_->batcher.register_resolver(conflict_type, std::move(resolver));
}

void PerformanceOptimizer::set_default_conflict_resolver(ConflictGroupResolver resolver) {
    impl_->batcher.set_default_resolver(std::move(resolver));
}

// ============================================================================
// Operations
// ============================================================================

Status PerformanceOptimizer::optimize_delta_for_transmission(const nlohmann::json& delta,
                                                             TransmissionPayload& payload) {
    return impl_->prepare_payload(delta, payload);
}

Status PerformanceOptimizer::decode_received_delta(const std::vector<UInt8>& bytes,
                                                   CompressionAlgorithm algorithm,
                                                   nlohmann::json& delta) {
    return impl_->compressor.decompress(bytes, algorithm, delta);
}

void PerformanceOptimizer::schedule_optimized_sync(const PeerId& peer, std::string_view activity_level) {
    impl_->synchronizer.schedule_sync(peer, activity_level_to_priority(activity_level));
}

void PerformanceOptimizer::record_peer_activity(const PeerId& peer, UInt64 count) {
    impl_->synchronizer.record_activity(peer, count);
}

void PerformanceOptimizer::batch_conflict_resolution(ConflictRecord conflict) {
    impl_->batcher.add_conflict(std::move(conflict));
}

OptimizationStatus PerformanceOptimizer::get_optimization_status() const {
    OptimizationStatus status;
    status.enabled = impl_->config.enabled;
    status.scheduler_active = impl_->synchronizer.is_running();
    status.monitor_active = impl_->monitor.is_running();
    status.performance_summary = impl_->monitor.summary();
    status.queue_depth = impl_->synchronizer.queue_depth();
    status.pending_conflict_count = impl_->batcher.pending_count();
    return status;
}

// ============================================================================
// Components
// ============================================================================

DeltaCompressor& PerformanceOptimizer::compressor() {
    return impl_->compressor;
}

LazySynchronizer& PerformanceOptimizer::synchronizer() {
    return impl_->synchronizer;
}

ConflictBatcher& PerformanceOptimizer::conflict_batcher() {
    return impl_->batcher;
}

PerformanceMonitor& PerformanceOptimizer::performance_monitor() {
    return impl_->monitor;
}

const PerformanceMonitor& PerformanceOptimizer::performance_monitor() const {
    return impl_->monitor;
}

const std::string& PerformanceOptimizer::node_id() const {
    return impl_->node_id;
}

const OptimizerConfig& PerformanceOptimizer::config() const {
    return impl_->config;
}

} // namespace crdtperf::optimize
