/**
 * @file monitoring_coordinator.cpp
 * @brief Monitoring coordinator implementation
 */

#include "crdtperf/monitor/monitoring_coordinator.h"
#include "crdtperf/monitor/metrics_export.h"
#include "crdtperf/core/background_worker.h"
#include "crdtperf/core/logging.h"
#include <mutex>

namespace crdtperf::monitor {

struct MonitoringCoordinator::Impl {
    MonitoringConfig config;
    MetricsCollector collector;
    AlertingEngine alerting;

    mutable std::mutex source_mutex;
    std::shared_ptr<IMetricsSource> source;

    std::unique_ptr<core::BackgroundWorker> sampler;
    std::shared_ptr<spdlog::logger> log{core::logging::get_logger("monitoring")};

    explicit Impl(const MonitoringConfig& cfg)
        : config(cfg)
        , collector(cfg.metrics)
        , alerting(cfg.alerting) {}

    std::shared_ptr<IMetricsSource> current_source() const {
        std::lock_guard<std::mutex> lock(source_mutex);
        return source;
    }

    Status sample_now(WallClockTime now) {
        auto current = current_source();
        if (!current) {
            log->debug("No metrics source attached, skipping sample");
            return Status::NoData;
        }

        std::optional<HealthSample> sample;
        try {
            sample = current->collect_health_sample();
        } catch (const std::exception& e) {
            log->error("Metrics collection failed: {}", e.what());
            return Status::CollectionFailed;
        } catch (...) {
            log->error("Metrics collection failed with a non-standard exception");
            return Status::CollectionFailed;
        }

        if (!sample) {
            log->warn("Metrics source returned no sample, skipping tick");
            return Status::CollectionFailed;
        }

        collector.record_health_sample(*sample);
        alerting.check_alerts(*sample, now);

        const Real score = collector.health_score(now);
        log->debug("CRDT health score: {:.1f}", score);
        return Status::Success;
    }
};

MonitoringCoordinator::MonitoringCoordinator(MonitoringConfig config)
    : impl_(std::make_shared<Impl>(config)) {
    std::weak_ptr<Impl> weak = impl_;
    impl_->sampler = std::make_unique<core::BackgroundWorker>(
        "monitoring_sampler", config.sampling_interval,
        [weak]() {
            if (auto impl = weak.lock()) {
                impl->sample_now(WallClock::now());
            }
        });
}

MonitoringCoordinator::~MonitoringCoordinator() {
    if (impl_ && impl_->sampler) {
        impl_->sampler->stop(impl_->config.stop_timeout);
    }
}

Status MonitoringCoordinator::start() {
    Status status = impl_->sampler->start();
    if (succeeded(status)) {
        impl_->log->info("CRDT monitoring started ({:.0f}s sampling, {} alert rules)",
                         to_seconds(impl_->config.sampling_interval),
                         impl_->alerting.rule_count());
    }
    return status;
}

Status MonitoringCoordinator::stop() {
    Status status = impl_->sampler->stop(impl_->config.stop_timeout);
    if (succeeded(status)) {
        impl_->log->info("CRDT monitoring stopped");
    } else if (status == Status::Timeout) {
        impl_->log->warn("Monitoring sampler did not exit within the stop timeout, abandoned");
    }
    return status;
}

bool MonitoringCoordinator::is_running() const {
    return impl_->sampler->is_running();
}

void MonitoringCoordinator::set_metrics_source(std::shared_ptr<IMetricsSource> source) {
    std::lock_guard<std::mutex> lock(impl_->source_mutex);
    impl_->source = std::move(source);
}

Status MonitoringCoordinator::sample_now(WallClockTime now) {
    return impl_->sample_now(now);
}

HealthReport MonitoringCoordinator::get_comprehensive_health_report(WallClockTime now) const {
    HealthReport report;
    report.timestamp = now;
    report.breakdown = impl_->collector.health_breakdown(now);
    report.overall_health_score = report.breakdown.overall;
    report.health_status = classify_health(report.overall_health_score);
    report.sync_performance = impl_->collector.sync_performance_trend(24.0, now);
    report.conflict_analysis = impl_->collector.conflict_analysis(24.0, now);
    report.recommendations = generate_recommendations(report.overall_health_score,
                                                      report.sync_performance,
                                                      report.conflict_analysis);
    report.alerting = impl_->alerting.summary(now);
    return report;
}

std::string MonitoringCoordinator::export_metrics(Real window_hours, WallClockTime now) const {
    return export_metrics_json(impl_->collector, window_hours, now);
}

std::string MonitoringCoordinator::export_metrics() const {
    return export_metrics(impl_->config.export_window_hours);
}

MetricsCollector& MonitoringCoordinator::metrics() {
    return impl_->collector;
}

const MetricsCollector& MonitoringCoordinator::metrics() const {
    return impl_->collector;
}

AlertingEngine& MonitoringCoordinator::alerting() {
    return impl_->alerting;
}

const AlertingEngine& MonitoringCoordinator::alerting() const {
    return impl_->alerting;
}

const MonitoringConfig& MonitoringCoordinator::config() const {
    return impl_->config;
}

} // namespace crdtperf::monitor
