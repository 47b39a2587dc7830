/**
 * @file alerting.cpp
 * @brief Alerting engine implementation
 */

#include "crdtperf/monitor/alerting.h"
#include "crdtperf/core/logging.h"
#include <algorithm>
#include <cctype>

namespace crdtperf::monitor {

namespace {

std::shared_ptr<spdlog::logger> logger() {
    return core::logging::get_logger("alerting");
}

} // anonymous namespace

// ============================================================================
// Alert Types
// ============================================================================

const char* alert_severity_to_string(AlertSeverity severity) {
    switch (severity) {
        case AlertSeverity::Low: return "low";
        case AlertSeverity::Medium: return "medium";
        case AlertSeverity::High: return "high";
        case AlertSeverity::Critical: return "critical";
        default: return "unknown";
    }
}

std::optional<AlertSeverity> parse_alert_severity(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "low") return AlertSeverity::Low;
    if (lower == "medium") return AlertSeverity::Medium;
    if (lower == "high") return AlertSeverity::High;
    if (lower == "critical") return AlertSeverity::Critical;
    return std::nullopt;
}

nlohmann::ordered_json Alert::to_json() const {
    nlohmann::ordered_json j;
    j["timestamp"] = format_timestamp(timestamp);
    j["rule_name"] = rule_name;
    j["severity"] = alert_severity_to_string(severity);
    j["message"] = message;
    j["metrics"] = crdtperf::to_json(sample);
    return j;
}

nlohmann::json AlertingSummary::to_json() const {
    return nlohmann::json{
        {"active_rules", active_rules},
        {"recent_alerts", recent_alerts},
        {"alert_severities", alerts_by_severity},
        {"handler_failures", handler_failures}
    };
}

// ============================================================================
// Default Rules
// ============================================================================

std::vector<AlertRule> default_alert_rules(const DefaultAlertThresholds& thresholds) {
    using std::chrono::minutes;

    std::vector<AlertRule> rules;
    rules.push_back(AlertRule{
        "high_sync_failure_rate",
        [limit = thresholds.max_sync_failure_rate](const HealthSample& s) {
            return s.sync_failure_rate() > limit;
        },
        AlertSeverity::High, minutes(10)});
    rules.push_back(AlertRule{
        "performance_degradation",
        [limit = thresholds.max_performance_impact_percent](const HealthSample& s) {
            return s.performance_impact_percent > limit;
        },
        AlertSeverity::Medium, minutes(15)});
    rules.push_back(AlertRule{
        "data_consistency_low",
        [limit = thresholds.min_data_consistency](const HealthSample& s) {
            return s.data_consistency_score < limit;
        },
        AlertSeverity::High, minutes(5)});
    rules.push_back(AlertRule{
        "high_conflict_rate",
        [limit = thresholds.max_conflicts_detected](const HealthSample& s) {
            return s.conflicts_detected > limit;
        },
        AlertSeverity::Medium, minutes(30)});
    return rules;
}

AlertHandler make_log_alert_handler() {
    auto log = logger();
    return [log](const Alert& alert) {
        switch (alert.severity) {
            case AlertSeverity::Critical:
            case AlertSeverity::High:
                log->error("[{}] {}", alert_severity_to_string(alert.severity), alert.message);
                break;
            case AlertSeverity::Medium:
                log->warn("[{}] {}", alert_severity_to_string(alert.severity), alert.message);
                break;
            default:
                log->info("[{}] {}", alert_severity_to_string(alert.severity), alert.message);
                break;
        }
    };
}

// ============================================================================
// AlertingEngine
// ============================================================================

AlertingEngine::AlertingEngine(AlertingConfig config)
    : config_(config)
    , history_(config.history_capacity) {
    if (config_.install_default_rules) {
        install_default_rules(config_.thresholds);
    }
    if (config_.install_log_handler) {
        add_handler(make_log_alert_handler());
    }
}

void AlertingEngine::add_rule(std::string name, AlertPredicate predicate,
                              AlertSeverity severity, Duration cooldown) {
    add_rule(AlertRule{std::move(name), std::move(predicate), severity, cooldown});
}

void AlertingEngine::add_rule(AlertRule rule) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(rules_.begin(), rules_.end(),
                           [&rule](const AlertRule& r) { return r.name == rule.name; });
    if (it != rules_.end()) {
        *it = std::move(rule);
    } else {
        rules_.push_back(std::move(rule));
    }
}

Status AlertingEngine::remove_rule(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(rules_.begin(), rules_.end(),
                           [&name](const AlertRule& r) { return r.name == name; });
    if (it == rules_.end()) {
        return Status::UnknownRule;
    }
    rules_.erase(it);
    last_fired_.erase(name);
    return Status::Success;
}

bool AlertingEngine::has_rule(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(rules_.begin(), rules_.end(),
                       [&name](const AlertRule& r) { return r.name == name; });
}

SizeT AlertingEngine::rule_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rules_.size();
}

std::vector<std::string> AlertingEngine::rule_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(rules_.size());
    for (const auto& rule : rules_) {
        names.push_back(rule.name);
    }
    return names;
}

void AlertingEngine::install_default_rules(const DefaultAlertThresholds& thresholds) {
    for (auto& rule : default_alert_rules(thresholds)) {
        add_rule(std::move(rule));
    }
}

void AlertingEngine::add_handler(AlertHandler handler) {
    if (!handler) return;
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.push_back(std::move(handler));
}

SizeT AlertingEngine::handler_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.size();
}

bool AlertingEngine::try_fire(const std::string& rule_name, Duration cooldown, WallClockTime now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_fired_.find(rule_name);
    if (it != last_fired_.end() && now - it->second < cooldown) {
        return false;
    }
    last_fired_[rule_name] = now;
    return true;
}

std::vector<Alert> AlertingEngine::check_alerts(const HealthSample& sample, WallClockTime now) {
    std::vector<AlertRule> rules;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        rules = rules_;
    }

    std::vector<Alert> fired;
    for (const auto& rule : rules) {
        bool triggered = false;
        try {
            triggered = rule.predicate && rule.predicate(sample);
        } catch (const std::exception& e) {
            logger()->error("Alert rule '{}' failed to evaluate: {}", rule.name, e.what());
            continue;
        } catch (...) {
            logger()->error("Alert rule '{}' failed to evaluate: non-standard exception", rule.name);
            continue;
        }

        if (!triggered || !try_fire(rule.name, rule.cooldown, now)) {
            continue;
        }

        Alert alert;
        alert.timestamp = now;
        alert.rule_name = rule.name;
        alert.severity = rule.severity;
        alert.sample = sample;
        alert.message = "CRDT Alert: " + rule.name + " triggered";

        history_.push(alert);
        fired.push_back(std::move(alert));
    }

    if (fired.empty()) {
        return fired;
    }

    std::vector<AlertHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers = handlers_;
    }

    UInt64 failures = 0;
    for (const auto& alert : fired) {
        for (const auto& handler : handlers) {
            try {
                handler(alert);
            } catch (const std::exception& e) {
                ++failures;
                logger()->error("Alert handler failed for '{}': {}", alert.rule_name, e.what());
            } catch (...) {
                ++failures;
                logger()->error("Alert handler failed for '{}' with a non-standard exception",
                                alert.rule_name);
            }
        }
    }

    if (failures > 0) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_failures_ += failures;
    }
    return fired;
}

std::vector<Alert> AlertingEngine::alert_history() const {
    return history_.snapshot();
}

AlertingSummary AlertingEngine::summary(WallClockTime now) const {
    AlertingSummary result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.active_rules = rules_.size();
        result.handler_failures = handler_failures_;
    }

    const WallClockTime cutoff = now - std::chrono::duration_cast<WallClock::duration>(
        config_.recent_window);
    const std::vector<Alert> recent = history_.filter(
        [cutoff](const Alert& a) { return a.timestamp > cutoff; });

    result.recent_alerts = recent.size();
    for (const auto& alert : recent) {
        ++result.alerts_by_severity[alert_severity_to_string(alert.severity)];
    }
    return result;
}

} // namespace crdtperf::monitor
