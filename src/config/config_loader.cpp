/**
 * @file config_loader.cpp
 * @brief XML configuration loading implementation
 *
 * Loads node configuration (logging, optimizer, monitoring) using pugixml.
 * Missing elements keep their default values.
 */

#include "crdtperf/config/config.h"
#include <pugixml.hpp>
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace crdtperf::config {

namespace {

// ============================================================================
// Value Helpers
// ============================================================================

Duration seconds_to_duration(Real seconds) {
    return std::chrono::duration_cast<Duration>(Seconds(seconds));
}

Real parse_seconds(const pugi::xml_node& node, Real default_seconds,
                   const char* default_unit = "s") {
    if (!node) {
        return default_seconds;
    }
    std::string unit = node.attribute("unit").as_string(default_unit);
    return duration_to_seconds(node.text().as_double(default_seconds), unit);
}

Duration parse_duration(const pugi::xml_node& node, Duration fallback,
                        const char* default_unit = "s") {
    if (!node) {
        return fallback;
    }
    return seconds_to_duration(parse_seconds(node, to_seconds(fallback), default_unit));
}

UInt64 parse_uint64(const pugi::xml_node& node, UInt64 fallback) {
    return static_cast<UInt64>(node.text().as_ullong(fallback));
}

SizeT parse_size(const pugi::xml_node& node, SizeT fallback) {
    return static_cast<SizeT>(node.text().as_ullong(fallback));
}

void append_seconds(pugi::xml_node parent, const char* name, Real seconds) {
    auto node = parent.append_child(name);
    node.append_attribute("unit") = "s";
    node.text().set(seconds);
}

void append_duration(pugi::xml_node parent, const char* name, Duration value) {
    append_seconds(parent, name, to_seconds(value));
}

void append_uint64(pugi::xml_node parent, const char* name, UInt64 value) {
    parent.append_child(name).text().set(static_cast<unsigned long long>(value));
}

// ============================================================================
// Sections
// ============================================================================

void load_logging(const pugi::xml_node& node, core::logging::LoggingConfig& config) {
    if (auto level = node.child("level")) {
        config.level = core::logging::parse_log_level(level.text().as_string("info"));
    }
    config.console = node.child("console").text().as_bool(config.console);
    config.file_path = node.child("file").text().as_string(config.file_path.c_str());
    config.max_file_size_mb = parse_size(node.child("max_file_size_mb"), config.max_file_size_mb);
    config.max_files = parse_size(node.child("max_files"), config.max_files);
    if (auto pattern = node.child("pattern")) {
        config.pattern = pattern.text().as_string(config.pattern.c_str());
    }
}

void load_compression(const pugi::xml_node& node, optimize::CompressionConfig& config) {
    config.fast_threshold_bytes = parse_uint64(node.child("fast_threshold"), config.fast_threshold_bytes);
    config.high_ratio_threshold_bytes =
        parse_uint64(node.child("high_ratio_threshold"), config.high_ratio_threshold_bytes);
    config.enable_fast = node.child("enable_fast").text().as_bool(config.enable_fast);
    config.enable_high_ratio = node.child("enable_high_ratio").text().as_bool(config.enable_high_ratio);
    config.fast_level = node.child("fast_level").text().as_int(config.fast_level);
    config.high_ratio_level = node.child("high_ratio_level").text().as_int(config.high_ratio_level);
    config.max_decoded_bytes = parse_uint64(node.child("max_decoded_bytes"), config.max_decoded_bytes);
}

void load_lazy_sync(const pugi::xml_node& node, optimize::LazySyncConfig& config) {
    config.base_interval = Seconds(parse_seconds(node.child("base_interval"), config.base_interval.count()));
    config.min_interval = Seconds(parse_seconds(node.child("min_interval"), config.min_interval.count()));
    config.max_interval = Seconds(parse_seconds(node.child("max_interval"), config.max_interval.count()));
    config.high_activity_threshold =
        parse_uint64(node.child("high_activity_threshold"), config.high_activity_threshold);
    config.medium_activity_threshold =
        parse_uint64(node.child("medium_activity_threshold"), config.medium_activity_threshold);
    config.low_activity_threshold =
        parse_uint64(node.child("low_activity_threshold"), config.low_activity_threshold);
    config.poll_interval = parse_duration(node.child("poll_interval"), config.poll_interval);
    config.reschedule_on_failure =
        node.child("reschedule_on_failure").text().as_bool(config.reschedule_on_failure);
    config.stop_timeout = parse_duration(node.child("stop_timeout"), config.stop_timeout);
}

void load_conflict_batch(const pugi::xml_node& node, optimize::ConflictBatchConfig& config) {
    config.batch_size = parse_size(node.child("batch_size"), config.batch_size);
    config.timeout = parse_duration(node.child("timeout"), config.timeout);
    config.flush_on_stop = node.child("flush_on_stop").text().as_bool(config.flush_on_stop);
    config.stop_timeout = parse_duration(node.child("stop_timeout"), config.stop_timeout);
}

void load_performance(const pugi::xml_node& node, optimize::PerformanceMonitorConfig& config) {
    config.history_capacity = parse_size(node.child("history_capacity"), config.history_capacity);
    config.sampling_interval = parse_duration(node.child("sampling_interval"), config.sampling_interval);
    config.stop_timeout = parse_duration(node.child("stop_timeout"), config.stop_timeout);
}

void load_optimizer(const pugi::xml_node& node, optimize::OptimizerConfig& config) {
    config.enabled = node.attribute("enabled").as_bool(config.enabled);
    config.compression_threshold_bytes =
        parse_uint64(node.child("compression_threshold"), config.compression_threshold_bytes);

    if (auto compression = node.child("compression")) {
        load_compression(compression, config.compression);
    }
    if (auto lazy = node.child("lazy_sync")) {
        load_lazy_sync(lazy, config.lazy_sync);
    }
    if (auto batch = node.child("conflict_batch")) {
        load_conflict_batch(batch, config.conflict_batch);
    }
    if (auto performance = node.child("performance")) {
        load_performance(performance, config.performance);
    }
}

void load_alerting(const pugi::xml_node& node, monitor::AlertingConfig& config) {
    config.history_capacity = parse_size(node.child("history_capacity"), config.history_capacity);
    config.recent_window = parse_duration(node.child("recent_window"), config.recent_window, "h");
    config.install_default_rules =
        node.child("default_rules").text().as_bool(config.install_default_rules);
    config.install_log_handler = node.child("log_handler").text().as_bool(config.install_log_handler);

    if (auto thresholds = node.child("thresholds")) {
        auto& t = config.thresholds;
        t.max_sync_failure_rate =
            thresholds.child("max_sync_failure_rate").text().as_double(t.max_sync_failure_rate);
        t.max_performance_impact_percent =
            thresholds.child("max_performance_impact_percent").text().as_double(t.max_performance_impact_percent);
        t.min_data_consistency =
            thresholds.child("min_data_consistency").text().as_double(t.min_data_consistency);
        t.max_conflicts_detected =
            parse_uint64(thresholds.child("max_conflicts_detected"), t.max_conflicts_detected);
    }
}

void load_monitoring(const pugi::xml_node& node, monitor::MonitoringConfig& config) {
    config.sampling_interval = parse_duration(node.child("sampling_interval"), config.sampling_interval);
    config.stop_timeout = parse_duration(node.child("stop_timeout"), config.stop_timeout);
    config.export_window_hours =
        node.child("export_window_hours").text().as_double(config.export_window_hours);

    if (auto history = node.child("history")) {
        config.metrics.history_capacity = parse_size(history.child("capacity"), config.metrics.history_capacity);
        config.metrics.health_window_samples =
            parse_size(history.child("health_window_samples"), config.metrics.health_window_samples);
        config.metrics.conflict_window =
            parse_duration(history.child("conflict_window"), config.metrics.conflict_window, "h");
    }
    if (auto alerting = node.child("alerting")) {
        load_alerting(alerting, config.alerting);
    }
}

NodeConfig load_document(const pugi::xml_document& doc) {
    auto root = doc.child("crdtperf");
    if (!root) {
        root = doc.child("config");
    }
    if (!root) {
        throw std::runtime_error("Invalid node config XML: no <crdtperf> root element");
    }

    NodeConfig config = NodeConfig::defaults();
    config.node_id = root.attribute("node_id").as_string(config.node_id.c_str());

    if (auto logging = root.child("logging")) {
        load_logging(logging, config.logging);
    }
    if (auto optimizer = root.child("optimizer")) {
        load_optimizer(optimizer, config.optimizer);
    }
    if (auto monitoring = root.child("monitoring")) {
        load_monitoring(monitoring, config.monitoring);
    }
    return config;
}

void build_document(const NodeConfig& config, pugi::xml_document& doc) {
    auto decl = doc.prepend_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";

    auto root = doc.append_child("crdtperf");
    root.append_attribute("node_id") = config.node_id.c_str();

    // Logging
    auto logging = root.append_child("logging");
    logging.append_child("level").text().set(core::logging::log_level_to_string(config.logging.level));
    logging.append_child("console").text().set(config.logging.console);
    logging.append_child("file").text().set(config.logging.file_path.c_str());
    append_uint64(logging, "max_file_size_mb", config.logging.max_file_size_mb);
    append_uint64(logging, "max_files", config.logging.max_files);
    logging.append_child("pattern").text().set(config.logging.pattern.c_str());

    // Optimizer
    const auto& opt = config.optimizer;
    auto optimizer = root.append_child("optimizer");
    optimizer.append_attribute("enabled") = opt.enabled;
    append_uint64(optimizer, "compression_threshold", opt.compression_threshold_bytes);

    auto compression = optimizer.append_child("compression");
    append_uint64(compression, "fast_threshold", opt.compression.fast_threshold_bytes);
    append_uint64(compression, "high_ratio_threshold", opt.compression.high_ratio_threshold_bytes);
    compression.append_child("enable_fast").text().set(opt.compression.enable_fast);
    compression.append_child("enable_high_ratio").text().set(opt.compression.enable_high_ratio);
    compression.append_child("fast_level").text().set(opt.compression.fast_level);
    compression.append_child("high_ratio_level").text().set(opt.compression.high_ratio_level);
    append_uint64(compression, "max_decoded_bytes", opt.compression.max_decoded_bytes);

    auto lazy = optimizer.append_child("lazy_sync");
    append_seconds(lazy, "base_interval", opt.lazy_sync.base_interval.count());
    append_seconds(lazy, "min_interval", opt.lazy_sync.min_interval.count());
    append_seconds(lazy, "max_interval", opt.lazy_sync.max_interval.count());
    append_uint64(lazy, "high_activity_threshold", opt.lazy_sync.high_activity_threshold);
    append_uint64(lazy, "medium_activity_threshold", opt.lazy_sync.medium_activity_threshold);
    append_uint64(lazy, "low_activity_threshold", opt.lazy_sync.low_activity_threshold);
    append_duration(lazy, "poll_interval", opt.lazy_sync.poll_interval);
    lazy.append_child("reschedule_on_failure").text().set(opt.lazy_sync.reschedule_on_failure);
    append_duration(lazy, "stop_timeout", opt.lazy_sync.stop_timeout);

    auto batch = optimizer.append_child("conflict_batch");
    append_uint64(batch, "batch_size", opt.conflict_batch.batch_size);
    append_duration(batch, "timeout", opt.conflict_batch.timeout);
    batch.append_child("flush_on_stop").text().set(opt.conflict_batch.flush_on_stop);
    append_duration(batch, "stop_timeout", opt.conflict_batch.stop_timeout);

    auto performance = optimizer.append_child("performance");
    append_uint64(performance, "history_capacity", opt.performance.history_capacity);
    append_duration(performance, "sampling_interval", opt.performance.sampling_interval);
    append_duration(performance, "stop_timeout", opt.performance.stop_timeout);

    // Monitoring
    const auto& mon = config.monitoring;
    auto monitoring = root.append_child("monitoring");
    append_duration(monitoring, "sampling_interval", mon.sampling_interval);
    append_duration(monitoring, "stop_timeout", mon.stop_timeout);
    monitoring.append_child("export_window_hours").text().set(mon.export_window_hours);

    auto history = monitoring.append_child("history");
    append_uint64(history, "capacity", mon.metrics.history_capacity);
    append_uint64(history, "health_window_samples", mon.metrics.health_window_samples);
    append_duration(history, "conflict_window", mon.metrics.conflict_window);

    auto alerting = monitoring.append_child("alerting");
    append_uint64(alerting, "history_capacity", mon.alerting.history_capacity);
    append_duration(alerting, "recent_window", mon.alerting.recent_window);
    alerting.append_child("default_rules").text().set(mon.alerting.install_default_rules);
    alerting.append_child("log_handler").text().set(mon.alerting.install_log_handler);

    auto thresholds = alerting.append_child("thresholds");
    thresholds.append_child("max_sync_failure_rate").text().set(mon.alerting.thresholds.max_sync_failure_rate);
    thresholds.append_child("max_performance_impact_percent").text().set(
        mon.alerting.thresholds.max_performance_impact_percent);
    thresholds.append_child("min_data_consistency").text().set(mon.alerting.thresholds.min_data_consistency);
    append_uint64(thresholds, "max_conflicts_detected", mon.alerting.thresholds.max_conflicts_detected);
}

} // anonymous namespace

Real duration_to_seconds(Real value, const std::string& unit) {
    if (unit == "ms") return value / 1000.0;
    if (unit == "min") return value * 60.0;
    if (unit == "h") return value * 3600.0;
    // Default: seconds
    return value;
}

// ============================================================================
// NodeConfig Implementation
// ============================================================================

NodeConfig NodeConfig::load(const std::string& path) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());

    if (!result) {
        throw std::runtime_error("Failed to load config: " + std::string(result.description()));
    }
    return load_document(doc);
}

NodeConfig NodeConfig::parse(const std::string& xml) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_string(xml.c_str());

    if (!result) {
        throw std::runtime_error("Failed to parse config: " + std::string(result.description()));
    }
    return load_document(doc);
}

NodeConfig NodeConfig::defaults() {
    return NodeConfig{};
}

bool NodeConfig::save(const std::string& path) const {
    pugi::xml_document doc;
    build_document(*this, doc);
    return doc.save_file(path.c_str());
}

std::string NodeConfig::to_xml() const {
    pugi::xml_document doc;
    build_document(*this, doc);
    std::ostringstream out;
    doc.save(out);
    return out.str();
}

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::ConfigLoader() {
    // Add default search paths
    search_paths_.push_back(".");
    search_paths_.push_back("./config");
}

ConfigLoader::~ConfigLoader() = default;

NodeConfig ConfigLoader::load_node_config(const std::string& path) {
    std::string resolved = find_file(path);
    if (resolved.empty()) {
        throw std::runtime_error("Node config file not found: " + path);
    }
    return NodeConfig::load(resolved);
}

void ConfigLoader::add_search_path(const std::string& path) {
    search_paths_.push_back(path);
}

std::string ConfigLoader::find_file(const std::string& filename) const {
    if (std::filesystem::exists(filename)) {
        return filename;
    }

    for (const auto& search_path : search_paths_) {
        std::filesystem::path full_path = std::filesystem::path(search_path) / filename;
        if (std::filesystem::exists(full_path)) {
            return full_path.string();
        }
    }

    return "";
}

} // namespace crdtperf::config
