#pragma once
/**
 * @file config.h
 * @brief Node configuration loading and management
 *
 * Example document (every element is optional):
 * @code
 * <crdtperf>
 *   <logging>
 *     <level>info</level>
 *     <file>logs/sync_node.log</file>
 *   </logging>
 *   <optimizer enabled="true">
 *     <compression_threshold unit="bytes">1024</compression_threshold>
 *     <lazy_sync>
 *       <base_interval unit="s">60</base_interval>
 *     </lazy_sync>
 *     <conflict_batch>
 *       <batch_size>10</batch_size>
 *       <timeout unit="ms">5000</timeout>
 *     </conflict_batch>
 *   </optimizer>
 *   <monitoring>
 *     <sampling_interval unit="s">30</sampling_interval>
 *   </monitoring>
 * </crdtperf>
 * @endcode
 */

#include "crdtperf/core/types.h"
#include "crdtperf/core/logging.h"
#include "crdtperf/optimize/performance_optimizer.h"
#include "crdtperf/monitor/monitoring_coordinator.h"
#include <string>
#include <vector>

namespace crdtperf::config {

/**
 * @brief Complete configuration of one replication node
 */
struct NodeConfig {
    std::string node_id{"node"};
    core::logging::LoggingConfig logging;
    optimize::OptimizerConfig optimizer;
    monitor::MonitoringConfig monitoring;

    /**
     * @brief Load configuration from XML file
     * @throws std::runtime_error if the file cannot be parsed or has no known root
     */
    static NodeConfig load(const std::string& path);

    /**
     * @brief Parse configuration from an XML string
     * @throws std::runtime_error on malformed XML
     */
    static NodeConfig parse(const std::string& xml);

    /**
     * @brief Create default configuration
     */
    static NodeConfig defaults();

    /**
     * @brief Save configuration to XML file
     */
    bool save(const std::string& path) const;

    /**
     * @brief Serialize configuration as an XML string
     */
    std::string to_xml() const;
};

/**
 * @brief Convert a value with a time unit ("ms", "s", "min", "h") to seconds
 *
 * Unknown or empty units are taken as seconds.
 */
Real duration_to_seconds(Real value, const std::string& unit);

/**
 * @brief Configuration loader service
 */
class ConfigLoader {
public:
    ConfigLoader();
    ~ConfigLoader();

    /**
     * @brief Load node configuration
     * @throws std::runtime_error if the file is not found in the search paths
     */
    NodeConfig load_node_config(const std::string& path);

    /**
     * @brief Add search path for configuration files
     */
    void add_search_path(const std::string& path);

    /**
     * @brief Find file in search paths
     * @return Resolved path, empty if not found
     */
    std::string find_file(const std::string& filename) const;

private:
    std::vector<std::string> search_paths_;
};

} // namespace crdtperf::config
