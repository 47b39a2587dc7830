#pragma once
/**
 * @file logging.h
 * @brief Component loggers backed by spdlog
 *
 * Every component logs through a named spdlog logger ("lazy_sync",
 * "conflict_batcher", "alerting", ...). All loggers share one sink set
 * (colored console and an optional rotating file) that is rebuilt by
 * configure() when the node configuration is loaded.
 */

#include "crdtperf/core/types.h"
#include <spdlog/logger.h>
#include <memory>
#include <string>
#include <string_view>

namespace crdtperf::core::logging {

/**
 * @brief Log severity levels
 */
enum class LogLevel : UInt8 {
    Trace = 0,
    Debug,
    Info,
    Warning,
    Error,
    Critical,
    Off
};

/**
 * @brief Convert LogLevel to string
 */
const char* log_level_to_string(LogLevel level);

/**
 * @brief Parse a level name ("debug", "warning", ...), falls back to Info
 */
LogLevel parse_log_level(std::string_view name);

/**
 * @brief Sink configuration shared by all component loggers
 */
struct LoggingConfig {
    LogLevel level{LogLevel::Info};
    bool console{true};                     ///< Log to stdout
    std::string file_path;                  ///< Rotating log file (empty = none)
    SizeT max_file_size_mb{10};             ///< Rotate after this size
    SizeT max_files{3};                     ///< Rotated files kept
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v"};
};

/**
 * @brief Rebuild the shared sinks and apply them to every component logger
 * @return false if a sink could not be created (console is kept)
 */
bool configure(const LoggingConfig& config);

/**
 * @brief Get (or create) the logger for a component
 */
std::shared_ptr<spdlog::logger> get_logger(const std::string& component);

/**
 * @brief Flush all component loggers
 */
void flush();

} // namespace crdtperf::core::logging
