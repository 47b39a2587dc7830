#pragma once
/**
 * @file metrics_collector.h
 * @brief Bounded metric histories and the composite health score
 *
 * The health score (0-100) combines four components over the most recent
 * health samples:
 *
 *   sync        30%  successful / total syncs
 *   conflict    20%  resolution rate of the last hour, minus up to 20 points
 *                    for the share of manual interventions
 *   performance 30%  average performance impact in bands (<=5, <=15, <=30 %)
 *   consistency 20%  average data consistency score
 */

#include "crdtperf/core/types.h"
#include "crdtperf/core/records.h"
#include "crdtperf/core/bounded_history.h"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace crdtperf::monitor {

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Metrics collector configuration
 */
struct MetricsConfig {
    SizeT history_capacity{1000};           ///< Entries kept per history
    SizeT health_window_samples{10};        ///< Samples used for the health score
    Duration conflict_window{std::chrono::hours(1)};  ///< Conflicts used for the health score

    /**
     * @brief Default configuration
     */
    static MetricsConfig default_config() noexcept {
        return MetricsConfig{};
    }
};

// ============================================================================
// Health Score Components
// ============================================================================

inline constexpr Real SYNC_SCORE_WEIGHT = 0.3;
inline constexpr Real CONFLICT_SCORE_WEIGHT = 0.2;
inline constexpr Real PERFORMANCE_SCORE_WEIGHT = 0.3;
inline constexpr Real CONSISTENCY_SCORE_WEIGHT = 0.2;

/// Points removed from the conflict score when every conflict needed manual intervention
inline constexpr Real MANUAL_INTERVENTION_PENALTY = 20.0;

/**
 * @brief The four component scores and their weighted total
 */
struct HealthBreakdown {
    Real sync_score{100.0};
    Real conflict_score{100.0};
    Real performance_score{100.0};
    Real consistency_score{100.0};
    Real overall{100.0};
    SizeT samples_considered{0};

    nlohmann::json to_json() const;
};

/**
 * @brief 100 * successful / (successful + failed), 100 when no syncs
 */
Real compute_sync_score(const std::vector<HealthSample>& samples);

/**
 * @brief Resolution rate minus the manual intervention penalty, floored at 0
 *
 * 100 * resolved / total - 20 * manual / total; 100 when no conflicts.
 */
Real compute_conflict_score(const std::vector<ConflictRecord>& conflicts);

/**
 * @brief Band score for the average performance impact percentage
 *
 * <=5 -> 100, <=15 -> 90, <=30 -> 75, else max(50, 100 - avg).
 */
Real compute_performance_score(Real average_impact_percent);

/**
 * @brief 100 * average data consistency score
 */
Real compute_consistency_score(const std::vector<HealthSample>& samples);

// ============================================================================
// Aggregations
// ============================================================================

/**
 * @brief Sync attempts aggregated over a time window
 *
 * `has_data` is false when the window holds no attempt.
 */
struct SyncPerformanceTrend {
    bool has_data{false};
    UInt64 total_syncs{0};
    UInt64 successful_syncs{0};
    UInt64 failed_syncs{0};
    Real success_rate{0.0};
    Real average_duration_ms{0.0};          ///< Over successful syncs only
    Real total_bandwidth_mb{0.0};
    Real average_compression_ratio{0.0};    ///< Over every sync in the window

    /**
     * @brief JSON view; `{"error": "No sync data available"}` without data
     */
    nlohmann::json to_json() const;
};

/**
 * @brief Conflicts aggregated over a time window
 */
struct ConflictAnalysis {
    bool has_data{false};
    UInt64 total_conflicts{0};
    UInt64 resolved_conflicts{0};
    Real resolution_rate{0.0};
    Real average_resolution_time_ms{0.0};
    std::map<std::string, UInt64> conflict_types;
    std::map<std::string, UInt64> resolution_strategies;
    UInt64 manual_interventions{0};

    nlohmann::json to_json() const;
};

SyncPerformanceTrend analyze_sync_attempts(const std::vector<SyncAttempt>& attempts);
ConflictAnalysis analyze_conflicts(const std::vector<ConflictRecord>& conflicts);

// ============================================================================
// Metrics Source
// ============================================================================

/**
 * @brief Supplies live health samples to the monitoring loop
 */
class IMetricsSource {
public:
    virtual ~IMetricsSource() = default;

    /**
     * @brief Take a health sample
     * @return std::nullopt if no sample could be collected this tick
     */
    virtual std::optional<HealthSample> collect_health_sample() = 0;
};

// ============================================================================
// Metrics Collector
// ============================================================================

/**
 * @brief Bounded histories of health samples, sync attempts and conflicts
 *
 * Thread-safe. All queries work on copies and never block the recorders
 * for longer than the copy.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(MetricsConfig config = MetricsConfig::default_config());

    // Non-copyable
    MetricsCollector(const MetricsCollector&) = delete;
    MetricsCollector& operator=(const MetricsCollector&) = delete;

    // ========================================================================
    // Recording
    // ========================================================================

    void record_health_sample(HealthSample sample);
    void record_sync_attempt(SyncAttempt attempt);
    void record_conflict(ConflictRecord conflict);

    // ========================================================================
    // Health Score
    // ========================================================================

    /**
     * @brief Composite health score in [0, 100]; 100 with no samples
     */
    Real health_score(WallClockTime now = WallClock::now()) const;

    /**
     * @brief Component scores behind health_score()
     */
    HealthBreakdown health_breakdown(WallClockTime now = WallClock::now()) const;

    // ========================================================================
    // Aggregations
    // ========================================================================

    /**
     * @brief Sync attempts of the last `window_hours`
     */
    SyncPerformanceTrend sync_performance_trend(Real window_hours = 24.0,
                                                WallClockTime now = WallClock::now()) const;

    /**
     * @brief Conflicts detected in the last `window_hours`
     */
    ConflictAnalysis conflict_analysis(Real window_hours = 24.0,
                                       WallClockTime now = WallClock::now()) const;

    // ========================================================================
    // Windowed Access
    // ========================================================================

    std::vector<HealthSample> health_samples_since(WallClockTime cutoff) const;
    std::vector<SyncAttempt> sync_attempts_since(WallClockTime cutoff) const;
    std::vector<ConflictRecord> conflicts_since(WallClockTime cutoff) const;

    SizeT health_sample_count() const;
    SizeT sync_attempt_count() const;
    SizeT conflict_count() const;

    const MetricsConfig& config() const noexcept { return config_; }

private:
    MetricsConfig config_;
    core::BoundedHistory<HealthSample> health_;
    core::BoundedHistory<SyncAttempt> syncs_;
    core::BoundedHistory<ConflictRecord> conflicts_;
};

/**
 * @brief Start of a window of `hours` ending at `now`
 */
WallClockTime window_start(Real hours, WallClockTime now);

} // namespace crdtperf::monitor
