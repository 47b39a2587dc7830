/**
 * @file metrics_collector.cpp
 * @brief Metrics collector and health score implementation
 */

#include "crdtperf/monitor/metrics_collector.h"
#include <algorithm>

namespace crdtperf::monitor {

WallClockTime window_start(Real hours, WallClockTime now) {
    const auto span = std::chrono::duration_cast<WallClock::duration>(
        std::chrono::duration<Real, std::ratio<3600>>(std::max(0.0, hours)));
    return now - span;
}

// ============================================================================
// Health Score Components
// ============================================================================

Real compute_sync_score(const std::vector<HealthSample>& samples) {
    UInt64 successful = 0;
    UInt64 total = 0;
    for (const auto& sample : samples) {
        successful += sample.successful_syncs;
        total += sample.successful_syncs + sample.failed_syncs;
    }
    if (total == 0) return 100.0;
    return static_cast<Real>(successful) / static_cast<Real>(total) * 100.0;
}

Real compute_conflict_score(const std::vector<ConflictRecord>& conflicts) {
    if (conflicts.empty()) return 100.0;

    UInt64 resolved = 0;
    UInt64 manual = 0;
    for (const auto& conflict : conflicts) {
        if (conflict.success) ++resolved;
        if (conflict.manual_intervention) ++manual;
    }

    const Real total = static_cast<Real>(conflicts.size());
    const Real rate = static_cast<Real>(resolved) / total * 100.0;
    const Real penalty = static_cast<Real>(manual) / total * MANUAL_INTERVENTION_PENALTY;
    return std::max(0.0, rate - penalty);
}

Real compute_performance_score(Real average_impact_percent) {
    if (average_impact_percent <= 5.0) return 100.0;
    if (average_impact_percent <= 15.0) return 90.0;
    if (average_impact_percent <= 30.0) return 75.0;
    return std::max(50.0, 100.0 - average_impact_percent);
}

Real compute_consistency_score(const std::vector<HealthSample>& samples) {
    if (samples.empty()) return 100.0;

    Real total = 0.0;
    for (const auto& sample : samples) {
        total += sample.data_consistency_score;
    }
    return total / static_cast<Real>(samples.size()) * 100.0;
}

nlohmann::json HealthBreakdown::to_json() const {
    return nlohmann::json{
        {"sync_score", sync_score},
        {"conflict_score", conflict_score},
        {"performance_score", performance_score},
        {"consistency_score", consistency_score},
        {"overall", overall},
        {"samples_considered", samples_considered}
    };
}

// ============================================================================
// Aggregations
// ============================================================================

SyncPerformanceTrend analyze_sync_attempts(const std::vector<SyncAttempt>& attempts) {
    SyncPerformanceTrend trend;
    if (attempts.empty()) {
        return trend;
    }

    trend.has_data = true;
    trend.total_syncs = static_cast<UInt64>(attempts.size());

    Real duration_total = 0.0;
    Real ratio_total = 0.0;
    UInt64 bandwidth_total = 0;
    for (const auto& attempt : attempts) {
        bandwidth_total += attempt.bandwidth_bytes;
        ratio_total += attempt.compression_ratio;
        if (attempt.success) {
            ++trend.successful_syncs;
            duration_total += attempt.duration_ms;
        }
    }

    trend.failed_syncs = trend.total_syncs - trend.successful_syncs;
    trend.success_rate = static_cast<Real>(trend.successful_syncs) /
                         static_cast<Real>(trend.total_syncs);
    if (trend.successful_syncs > 0) {
        trend.average_duration_ms = duration_total / static_cast<Real>(trend.successful_syncs);
    }
    // Every sync in the window counts, failed ones included
    trend.average_compression_ratio = ratio_total / static_cast<Real>(trend.total_syncs);
    trend.total_bandwidth_mb = static_cast<Real>(bandwidth_total) / (1024.0 * 1024.0);
    return trend;
}

nlohmann::json SyncPerformanceTrend::to_json() const {
    if (!has_data) {
        return nlohmann::json{{"error", "No sync data available"}};
    }
    return nlohmann::json{
        {"total_syncs", total_syncs},
        {"successful_syncs", successful_syncs},
        {"failed_syncs", failed_syncs},
        {"success_rate", success_rate},
        {"average_duration_ms", average_duration_ms},
        {"total_bandwidth_mb", total_bandwidth_mb},
        {"average_compression_ratio", average_compression_ratio}
    };
}

ConflictAnalysis analyze_conflicts(const std::vector<ConflictRecord>& conflicts) {
    ConflictAnalysis analysis;
    if (conflicts.empty()) {
        return analysis;
    }

    analysis.has_data = true;
    analysis.total_conflicts = static_cast<UInt64>(conflicts.size());

    Real resolution_total = 0.0;
    for (const auto& conflict : conflicts) {
        ++analysis.conflict_types[conflict.conflict_type];
        ++analysis.resolution_strategies[conflict.resolution_strategy];
        if (conflict.manual_intervention) {
            ++analysis.manual_interventions;
        }
        if (conflict.resolved_at && conflict.resolution_duration_ms) {
            ++analysis.resolved_conflicts;
            resolution_total += *conflict.resolution_duration_ms;
        }
    }

    analysis.resolution_rate = static_cast<Real>(analysis.resolved_conflicts) /
                               static_cast<Real>(analysis.total_conflicts);
    if (analysis.resolved_conflicts > 0) {
        analysis.average_resolution_time_ms =
            resolution_total / static_cast<Real>(analysis.resolved_conflicts);
    }
    return analysis;
}

nlohmann::json ConflictAnalysis::to_json() const {
    if (!has_data) {
        return nlohmann::json{
            {"total_conflicts", 0},
            {"conflict_types", nlohmann::json::object()},
            {"resolution_strategies", nlohmann::json::object()}
        };
    }
    return nlohmann::json{
        {"total_conflicts", total_conflicts},
        {"resolved_conflicts", resolved_conflicts},
        {"resolution_rate", resolution_rate},
        {"average_resolution_time_ms", average_resolution_time_ms},
        {"conflict_types", conflict_types},
        {"resolution_strategies", resolution_strategies},
        {"manual_interventions", manual_interventions}
    };
}

// ============================================================================
// MetricsCollector
// ============================================================================

MetricsCollector::MetricsCollector(MetricsConfig config)
    : config_(config)
    , health_(config.history_capacity)
    , syncs_(config.history_capacity)
    , conflicts_(config.history_capacity) {}

void MetricsCollector::record_health_sample(HealthSample sample) {
    health_.push(std::move(sample));
}

void MetricsCollector::record_sync_attempt(SyncAttempt attempt) {
    syncs_.push(std::move(attempt));
}

void MetricsCollector::record_conflict(ConflictRecord conflict) {
    conflicts_.push(std::move(conflict));
}

Real MetricsCollector::health_score(WallClockTime now) const {
    return health_breakdown(now).overall;
}

HealthBreakdown MetricsCollector::health_breakdown(WallClockTime now) const {
    HealthBreakdown breakdown;

    const std::vector<HealthSample> recent = health_.tail(config_.health_window_samples);
    if (recent.empty()) {
        return breakdown;
    }
    breakdown.samples_considered = recent.size();

    const WallClockTime cutoff = now - std::chrono::duration_cast<WallClock::duration>(
        config_.conflict_window);
    const std::vector<ConflictRecord> recent_conflicts = conflicts_since(cutoff);

    Real impact_total = 0.0;
    for (const auto& sample : recent) {
        impact_total += sample.performance_impact_percent;
    }

    breakdown.sync_score = compute_sync_score(recent);
    breakdown.conflict_score = compute_conflict_score(recent_conflicts);
    breakdown.performance_score =
        compute_performance_score(impact_total / static_cast<Real>(recent.size()));
    breakdown.consistency_score = compute_consistency_score(recent);

    const Real overall = breakdown.sync_score * SYNC_SCORE_WEIGHT +
                         breakdown.conflict_score * CONFLICT_SCORE_WEIGHT +
                         breakdown.performance_score * PERFORMANCE_SCORE_WEIGHT +
                         breakdown.consistency_score * CONSISTENCY_SCORE_WEIGHT;
    breakdown.overall = std::clamp(overall, 0.0, 100.0);
    return breakdown;
}

SyncPerformanceTrend MetricsCollector::sync_performance_trend(Real window_hours,
                                                              WallClockTime now) const {
    return analyze_sync_attempts(sync_attempts_since(window_start(window_hours, now)));
}

ConflictAnalysis MetricsCollector::conflict_analysis(Real window_hours, WallClockTime now) const {
    return analyze_conflicts(conflicts_since(window_start(window_hours, now)));
}

std::vector<HealthSample> MetricsCollector::health_samples_since(WallClockTime cutoff) const {
    return health_.filter([cutoff](const HealthSample& s) { return s.timestamp > cutoff; });
}

std::vector<SyncAttempt> MetricsCollector::sync_attempts_since(WallClockTime cutoff) const {
    return syncs_.filter([cutoff](const SyncAttempt& a) { return a.timestamp > cutoff; });
}

std::vector<ConflictRecord> MetricsCollector::conflicts_since(WallClockTime cutoff) const {
    return conflicts_.filter([cutoff](const ConflictRecord& c) { return c.detected_at > cutoff; });
}

SizeT MetricsCollector::health_sample_count() const {
    return health_.size();
}

SizeT MetricsCollector::sync_attempt_count() const {
    return syncs_.size();
}

SizeT MetricsCollector::conflict_count() const {
    return conflicts_.size();
}

} // namespace crdtperf::monitor
