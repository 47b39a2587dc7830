#pragma once
/**
 * @file alerting.h
 * @brief Rule-based alerting on health samples
 *
 * The AlertingEngine provides:
 * - Named rules evaluated against every health sample
 * - Per-rule cooldown so a persistent condition fires once per window
 * - Pluggable handlers (logging, dashboards, paging)
 * - Bounded alert history
 */

#include "crdtperf/core/types.h"
#include "crdtperf/core/status.h"
#include "crdtperf/core/records.h"
#include "crdtperf/core/bounded_history.h"
#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace crdtperf::monitor {

// ============================================================================
// Alert Types
// ============================================================================

/**
 * @brief Alert severity
 */
enum class AlertSeverity : UInt8 {
    Low = 0,
    Medium,
    High,
    Critical
};

/**
 * @brief Convert AlertSeverity to string ("low", "medium", "high", "critical")
 */
const char* alert_severity_to_string(AlertSeverity severity);

/**
 * @brief Parse a severity name
 */
std::optional<AlertSeverity> parse_alert_severity(std::string_view name);

/// Condition evaluated against a health sample
using AlertPredicate = std::function<bool(const HealthSample& sample)>;

/**
 * @brief A named alert condition
 */
struct AlertRule {
    std::string name;                   ///< Unique key
    AlertPredicate predicate;
    AlertSeverity severity{AlertSeverity::Medium};
    Duration cooldown{std::chrono::minutes(5)};  ///< Minimum time between two firings
};

/**
 * @brief A fired rule
 */
struct Alert {
    WallClockTime timestamp;
    std::string rule_name;
    AlertSeverity severity{AlertSeverity::Medium};
    HealthSample sample;                ///< Sample that triggered the rule
    std::string message;

    nlohmann::ordered_json to_json() const;
};

/// Receives every fired alert
using AlertHandler = std::function<void(const Alert& alert)>;

// ============================================================================
// Default Rules
// ============================================================================

/**
 * @brief Thresholds of the preset rules
 */
struct DefaultAlertThresholds {
    Real max_sync_failure_rate{0.2};            ///< high_sync_failure_rate, high, 10 min
    Real max_performance_impact_percent{25.0};  ///< performance_degradation, medium, 15 min
    Real min_data_consistency{0.9};             ///< data_consistency_low, high, 5 min
    UInt64 max_conflicts_detected{20};          ///< high_conflict_rate, medium, 30 min
};

/**
 * @brief Build the preset rules
 */
std::vector<AlertRule> default_alert_rules(const DefaultAlertThresholds& thresholds = {});

/**
 * @brief Handler writing alerts to the "alerting" logger
 *
 * Critical and high alerts are logged as errors, medium as warnings, low
 * as info.
 */
AlertHandler make_log_alert_handler();

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Alerting engine configuration
 */
struct AlertingConfig {
    SizeT history_capacity{1000};                   ///< Alerts kept
    Duration recent_window{std::chrono::hours(24)}; ///< Window of summary().recent_alerts
    bool install_default_rules{true};
    bool install_log_handler{true};
    DefaultAlertThresholds thresholds;

    /**
     * @brief Default configuration
     */
    static AlertingConfig default_config() noexcept {
        return AlertingConfig{};
    }

    /**
     * @brief No rules, no handlers
     */
    static AlertingConfig empty() noexcept {
        AlertingConfig config;
        config.install_default_rules = false;
        config.install_log_handler = false;
        return config;
    }
};

/**
 * @brief Alerting state summary
 */
struct AlertingSummary {
    SizeT active_rules{0};
    SizeT recent_alerts{0};
    std::map<std::string, UInt64> alerts_by_severity;  ///< Within the recent window
    UInt64 handler_failures{0};

    nlohmann::json to_json() const;
};

// ============================================================================
// Alerting Engine
// ============================================================================

/**
 * @brief Evaluates rules against health samples and dispatches alerts
 *
 * Usage:
 * @code
 * AlertingEngine alerting(AlertingConfig::empty());
 * alerting.add_rule("too_many_peers_down",
 *                   [](const HealthSample& s) { return s.active_peers < 2; },
 *                   AlertSeverity::Critical, std::chrono::minutes(1));
 * alerting.add_handler([](const Alert& a) { pager.notify(a.message); });
 *
 * alerting.check_alerts(sample);
 * @endcode
 *
 * Thread-safe. Predicates and handlers run on the calling thread without
 * the engine lock held. A throwing predicate counts as not triggered; a
 * throwing handler does not stop other handlers.
 */
class AlertingEngine {
public:
    explicit AlertingEngine(AlertingConfig config = AlertingConfig::default_config());

    // Non-copyable
    AlertingEngine(const AlertingEngine&) = delete;
    AlertingEngine& operator=(const AlertingEngine&) = delete;

    // ========================================================================
    // Rules
    // ========================================================================

    /**
     * @brief Add a rule, replacing any rule with the same name
     */
    void add_rule(std::string name, AlertPredicate predicate,
                  AlertSeverity severity, Duration cooldown);

    /**
     * @brief Add a rule, replacing any rule with the same name
     */
    void add_rule(AlertRule rule);

    /**
     * @brief Remove a rule and its cooldown state
     * @return Success or UnknownRule
     */
    Status remove_rule(const std::string& name);

    bool has_rule(const std::string& name) const;
    SizeT rule_count() const;

    /**
     * @brief Rule names in evaluation order
     */
    std::vector<std::string> rule_names() const;

    /**
     * @brief Install the preset rules
     */
    void install_default_rules(const DefaultAlertThresholds& thresholds = {});

    // ========================================================================
    // Handlers
    // ========================================================================

    void add_handler(AlertHandler handler);
    SizeT handler_count() const;

    // ========================================================================
    // Evaluation
    // ========================================================================

    /**
     * @brief Evaluate every rule against a sample
     * @param sample Health sample
     * @param now Evaluation time used for cooldowns and alert timestamps
     * @return Alerts fired by this call
     */
    std::vector<Alert> check_alerts(const HealthSample& sample,
                                    WallClockTime now = WallClock::now());

    /**
     * @brief Copy of the alert history, oldest first
     */
    std::vector<Alert> alert_history() const;

    /**
     * @brief Summary of rules and recent alerts
     */
    AlertingSummary summary(WallClockTime now = WallClock::now()) const;

private:
    bool try_fire(const std::string& rule_name, Duration cooldown, WallClockTime now);

    AlertingConfig config_;

    mutable std::mutex mutex_;
    std::vector<AlertRule> rules_;
    std::unordered_map<std::string, WallClockTime> last_fired_;
    std::vector<AlertHandler> handlers_;
    UInt64 handler_failures_{0};

    core::BoundedHistory<Alert> history_;
};

} // namespace crdtperf::monitor
