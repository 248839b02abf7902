/**
 * @file config.hpp
 * @brief Daemon configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "core/result.hpp"

namespace cluster_scaler {

/**
 * @brief Settings of the Rancher backend client.
 */
struct RancherConfig {
    std::string cluster_id;
    std::filesystem::path inventory_path;
    uint32_t cleanup_timeout_ms = 5000;
    std::vector<std::string> gpu_types;
};

/**
 * @brief Options of the scaling control loop that selects the provider.
 */
struct AutoscalingOptions {
    std::string cloud_provider = "rancher";
    uint32_t scan_interval_ms = 10000;
    uint64_t max_ticks = 0;              ///< 0 = run until signalled
    RancherConfig rancher;               ///< [rancher] section
};

/**
 * @brief How node groups are discovered.
 *
 * Each spec has the form "<min>:<max>:<pool id>". An empty list means every
 * pool reported by the backend is managed with its own bounds.
 */
struct NodeGroupDiscoveryOptions {
    std::vector<std::string> node_group_specs;
};

struct LimitsConfig {
    int64_t cores_min = 0;
    int64_t cores_max = 320000;
    int64_t memory_min_mb = 0;
    int64_t memory_max_mb = 6400000;
    int64_t nodes_min = 0;
    int64_t nodes_max = 1000;
};

struct TelemetryConfig {
    std::filesystem::path log_dir;       ///< Empty = log to stdout
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level daemon configuration.
 */
struct Config {
    AutoscalingOptions autoscaler;
    NodeGroupDiscoveryOptions discovery;
    LimitsConfig limits;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file. Missing keys keep defaults.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Parse configuration from TOML text.
 */
Result<Config> parse_config(std::string_view toml_text);

Config default_config();

}  // namespace cluster_scaler
