/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

namespace cluster_scaler {

namespace {

std::vector<std::string> string_array(toml::node_view<toml::node> node) {
    std::vector<std::string> out;
    if (auto* arr = node.as_array()) {
        for (const auto& elem : *arr) {
            if (auto value = elem.value<std::string>()) {
                out.push_back(*value);
            }
        }
    }
    return out;
}

Config from_table(toml::table& tbl) {
    Config config;

    // [autoscaler]
    if (auto autoscaler = tbl["autoscaler"]; autoscaler.is_table()) {
        config.autoscaler.cloud_provider =
            autoscaler["cloud_provider"].value_or(std::string{"rancher"});
        config.autoscaler.scan_interval_ms = static_cast<uint32_t>(
            autoscaler["scan_interval_ms"].value_or(int64_t{10000}));
        config.autoscaler.max_ticks = static_cast<uint64_t>(
            autoscaler["max_ticks"].value_or(int64_t{0}));
    }

    // [discovery]
    if (auto discovery = tbl["discovery"]; discovery.is_table()) {
        config.discovery.node_group_specs = string_array(discovery["node_group_specs"]);
    }

    // [limits]
    if (auto limits = tbl["limits"]; limits.is_table()) {
        config.limits.cores_min = limits["cores_min"].value_or(int64_t{0});
        config.limits.cores_max = limits["cores_max"].value_or(int64_t{320000});
        config.limits.memory_min_mb = limits["memory_min_mb"].value_or(int64_t{0});
        config.limits.memory_max_mb = limits["memory_max_mb"].value_or(int64_t{6400000});
        config.limits.nodes_min = limits["nodes_min"].value_or(int64_t{0});
        config.limits.nodes_max = limits["nodes_max"].value_or(int64_t{1000});
    }

    // [rancher]
    if (auto rancher = tbl["rancher"]; rancher.is_table()) {
        config.autoscaler.rancher.cluster_id = rancher["cluster_id"].value_or(std::string{});
        config.autoscaler.rancher.inventory_path = rancher["inventory_path"].value_or(std::string{});
        config.autoscaler.rancher.cleanup_timeout_ms = static_cast<uint32_t>(
            rancher["cleanup_timeout_ms"].value_or(int64_t{5000}));
        config.autoscaler.rancher.gpu_types = string_array(rancher["gpu_types"]);
    }

    // [telemetry]
    if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
        config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
        config.telemetry.max_file_size_mb = static_cast<uint32_t>(
            telemetry["max_file_size_mb"].value_or(int64_t{50}));
        config.telemetry.rotate_count = static_cast<uint32_t>(
            telemetry["rotate_count"].value_or(int64_t{5}));
        config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
    }

    return config;
}

}  // namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return config_error("Configuration file not found: " + path.string());
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return config_error(std::string{"TOML parse error: "} + std::string{err.description()});
    }
}

Result<Config> parse_config(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return config_error(std::string{"TOML parse error: "} + std::string{err.description()});
    }
}

Config default_config() {
    return Config{};
}

}  // namespace cluster_scaler
