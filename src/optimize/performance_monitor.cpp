/**
 * @file performance_monitor.cpp
 * @brief Performance monitor implementation
 */

#include "crdtperf/optimize/performance_monitor.h"
#include "crdtperf/core/background_worker.h"
#include "crdtperf/core/bounded_history.h"
#include "crdtperf/core/logging.h"
#include <algorithm>
#include <mutex>
#include <numeric>

namespace crdtperf::optimize {

// ============================================================================
// Summary
// ============================================================================

nlohmann::json PerformanceSummary::to_json() const {
    if (!has_data) {
        return nlohmann::json{{"error", "No performance data available"}};
    }

    nlohmann::json j;
    if (operation_type) {
        j["operation_type"] = *operation_type;
    }
    j["total_operations"] = total_operations;
    j["success_rate"] = success_rate;
    j["latency_ms"] = {
        {"avg", latency_ms.average},
        {"min", latency_ms.min},
        {"max", latency_ms.max},
        {"p95", latency_ms.p95}
    };
    j["memory_usage_mb"] = {
        {"avg", memory_usage_mb.average},
        {"peak", memory_usage_mb.peak}
    };
    j["cpu_usage_percent"] = {
        {"avg", cpu_usage_percent.average},
        {"peak", cpu_usage_percent.peak}
    };
    return j;
}

PerformanceSummary summarize_samples(const std::vector<PerformanceSample>& samples) {
    PerformanceSummary summary;
    if (samples.empty()) {
        return summary;
    }

    const Real count = static_cast<Real>(samples.size());
    summary.has_data = true;
    summary.total_operations = static_cast<UInt64>(samples.size());

    std::vector<Real> latencies;
    latencies.reserve(samples.size());
    UInt64 successes = 0;
    Real memory_total = 0.0;
    Real cpu_total = 0.0;

    for (const auto& sample : samples) {
        latencies.push_back(sample.latency_ms);
        if (sample.success) ++successes;
        memory_total += sample.memory_usage_mb;
        cpu_total += sample.cpu_usage_percent;
        summary.memory_usage_mb.peak = std::max(summary.memory_usage_mb.peak, sample.memory_usage_mb);
        summary.cpu_usage_percent.peak = std::max(summary.cpu_usage_percent.peak, sample.cpu_usage_percent);
    }

    std::sort(latencies.begin(), latencies.end());
    summary.success_rate = static_cast<Real>(successes) / count;
    summary.latency_ms.average = std::accumulate(latencies.begin(), latencies.end(), 0.0) / count;
    summary.latency_ms.min = latencies.front();
    summary.latency_ms.max = latencies.back();
    summary.latency_ms.p95 = latencies[static_cast<SizeT>(count * 0.95)];
    summary.memory_usage_mb.average = memory_total / count;
    summary.cpu_usage_percent.average = cpu_total / count;
    return summary;
}

// ============================================================================
// PerformanceMonitor Implementation
// ============================================================================

struct PerformanceMonitor::Impl {
    PerformanceMonitorConfig config;
    core::BoundedHistory<PerformanceSample> samples;

    mutable std::mutex reading_mutex;
    core::ResourceReading previous_reading;
    core::ResourceReading latest_reading;

    std::unique_ptr<core::BackgroundWorker> sampler;
    std::shared_ptr<spdlog::logger> log{core::logging::get_logger("performance")};

    explicit Impl(PerformanceMonitorConfig cfg)
        : config(cfg)
        , samples(cfg.history_capacity) {
        latest_reading = core::read_process_resources();
        previous_reading = latest_reading;
    }

    void sample_resources() {
        const core::ResourceReading reading = core::read_process_resources();
        Real cpu = 0.0;
        {
            std::lock_guard<std::mutex> lock(reading_mutex);
            previous_reading = latest_reading;
            latest_reading = reading;
            cpu = core::cpu_percent_between(previous_reading, latest_reading);
        }
        log->debug("Process resources: {:.1f} MB resident, {:.1f}% CPU, {} samples recorded",
                   reading.resident_memory_mb, cpu, samples.size());
    }
};

PerformanceMonitor::PerformanceMonitor(PerformanceMonitorConfig config)
    : impl_(std::make_shared<Impl>(config)) {
    std::weak_ptr<Impl> weak = impl_;
    impl_->sampler = std::make_unique<core::BackgroundWorker>(
        "performance_sampler", config.sampling_interval,
        [weak]() {
            if (auto impl = weak.lock()) {
                impl->sample_resources();
            }
        });
}

PerformanceMonitor::~PerformanceMonitor() {
    if (impl_ && impl_->sampler) {
        impl_->sampler->stop(impl_->config.stop_timeout);
    }
}

void PerformanceMonitor::finish_operation(std::string_view operation_type,
                                          const core::ResourceReading& start,
                                          bool success, UInt64 payload_size_bytes) {
    const core::ResourceReading end = core::read_process_resources();

    PerformanceSample sample;
    sample.operation_type = std::string(operation_type);
    sample.latency_ms = to_milliseconds(end.taken_at - start.taken_at);
    sample.memory_usage_mb = core::memory_growth_mb(start, end);
    sample.cpu_usage_percent = core::cpu_percent_between(start, end);
    sample.timestamp = WallClock::now();
    sample.success = success;
    sample.payload_size_bytes = payload_size_bytes;

    if (!success) {
        impl_->log->debug("Operation {} failed after {:.3f} ms", sample.operation_type,
                          sample.latency_ms);
    }
    impl_->samples.push(std::move(sample));
}

void PerformanceMonitor::record_sample(PerformanceSample sample) {
    impl_->samples.push(std::move(sample));
}

PerformanceSummary PerformanceMonitor::summary(const std::optional<std::string>& operation_type) const {
    std::vector<PerformanceSample> selected;
    if (operation_type) {
        selected = impl_->samples.filter([&operation_type](const PerformanceSample& s) {
            return s.operation_type == *operation_type;
        });
    } else {
        selected = impl_->samples.snapshot();
    }

    PerformanceSummary summary = summarize_samples(selected);
    summary.operation_type = operation_type;
    return summary;
}

std::vector<PerformanceSample> PerformanceMonitor::history() const {
    return impl_->samples.snapshot();
}

SizeT PerformanceMonitor::sample_count() const {
    return impl_->samples.size();
}

Status PerformanceMonitor::start() {
    Status status = impl_->sampler->start();
    if (succeeded(status)) {
        impl_->log->info("Performance sampler started ({:.0f}s interval)",
                         to_seconds(impl_->config.sampling_interval));
    }
    return status;
}

Status PerformanceMonitor::stop() {
    return impl_->sampler->stop(impl_->config.stop_timeout);
}

bool PerformanceMonitor::is_running() const {
    return impl_->sampler->is_running();
}

core::ResourceReading PerformanceMonitor::last_reading() const {
    std::lock_guard<std::mutex> lock(impl_->reading_mutex);
    return impl_->latest_reading;
}

Real PerformanceMonitor::last_cpu_percent() const {
    std::lock_guard<std::mutex> lock(impl_->reading_mutex);
    return core::cpu_percent_between(impl_->previous_reading, impl_->latest_reading);
}

} // namespace crdtperf::optimize
