/**
 * @file logging.cpp
 * @brief spdlog sink management for component loggers
 */

#include "crdtperf/core/logging.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace crdtperf::core::logging {

namespace {

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Warning: return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off: return spdlog::level::off;
        default: return spdlog::level::info;
    }
}

struct SinkState {
    std::mutex mutex;
    LoggingConfig config;
    std::vector<spdlog::sink_ptr> sinks;
    std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    bool initialized{false};
};

SinkState& state() {
    static SinkState instance;
    return instance;
}

std::vector<spdlog::sink_ptr> build_sinks(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    if (!config.file_path.empty()) {
        std::filesystem::path log_path(config.file_path);
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path());
        }
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path,
            config.max_file_size_mb * 1024 * 1024,
            config.max_files));
    }

    return sinks;
}

void apply(spdlog::logger& logger, const SinkState& s) {
    logger.sinks() = s.sinks;
    logger.set_pattern(s.config.pattern);
    logger.set_level(to_spdlog_level(s.config.level));
    logger.flush_on(spdlog::level::warn);
}

// Called with the state mutex held
void ensure_initialized(SinkState& s) {
    if (s.initialized) return;
    s.sinks = build_sinks(s.config);
    s.initialized = true;
}

} // anonymous namespace

const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off: return "off";
        default: return "unknown";
    }
}

LogLevel parse_log_level(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    return LogLevel::Info;
}

bool configure(const LoggingConfig& config) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    bool ok = true;
    s.config = config;
    try {
        s.sinks = build_sinks(config);
    } catch (const std::exception& e) {
        std::cerr << "Failed to create log sinks: " << e.what() << std::endl;
        s.config.file_path.clear();
        s.sinks = build_sinks(s.config);
        ok = false;
    }
    s.initialized = true;

    for (auto& [name, logger] : s.loggers) {
        apply(*logger, s);
    }
    return ok;
}

std::shared_ptr<spdlog::logger> get_logger(const std::string& component) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    ensure_initialized(s);

    auto it = s.loggers.find(component);
    if (it != s.loggers.end()) {
        return it->second;
    }

    auto logger = std::make_shared<spdlog::logger>(component);
    apply(*logger, s);
    s.loggers.emplace(component, logger);
    return logger;
}

void flush() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    for (auto& [name, logger] : s.loggers) {
        logger->flush();
    }
}

} // namespace crdtperf::core::logging
