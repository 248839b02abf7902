/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace cluster_scaler;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "cs_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.autoscaler.cloud_provider, "rancher");
    EXPECT_EQ(config.autoscaler.scan_interval_ms, 10000u);
    EXPECT_EQ(config.autoscaler.max_ticks, 0u);
    EXPECT_TRUE(config.discovery.node_group_specs.empty());
    EXPECT_EQ(config.autoscaler.rancher.cleanup_timeout_ms, 5000u);
    EXPECT_TRUE(config.autoscaler.rancher.inventory_path.empty());
    EXPECT_EQ(config.telemetry.log_level, "info");
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [autoscaler]
        cloud_provider = "rancher"
        scan_interval_ms = 2500
        max_ticks = 3

        [discovery]
        node_group_specs = ["1:10:pool-a", "0:3:pool-b"]

        [limits]
        cores_min = 4
        cores_max = 64
        memory_min_mb = 1024
        memory_max_mb = 65536
        nodes_max = 20

        [rancher]
        cluster_id = "c-abc"
        inventory_path = "/etc/cluster_scaler/inventory.toml"
        cleanup_timeout_ms = 750
        gpu_types = ["nvidia-tesla-t4", "nvidia-a100"]

        [telemetry]
        log_dir = "/tmp/cs_logs"
        log_level = "debug"
        rotate_count = 2
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_EQ(config.autoscaler.scan_interval_ms, 2500u);
    EXPECT_EQ(config.autoscaler.max_ticks, 3u);
    ASSERT_EQ(config.discovery.node_group_specs.size(), 2u);
    EXPECT_EQ(config.discovery.node_group_specs[0], "1:10:pool-a");
    EXPECT_EQ(config.limits.cores_min, 4);
    EXPECT_EQ(config.limits.cores_max, 64);
    EXPECT_EQ(config.limits.memory_max_mb, 65536);
    EXPECT_EQ(config.limits.nodes_max, 20);
    EXPECT_EQ(config.limits.nodes_min, 0);
    EXPECT_EQ(config.autoscaler.rancher.cluster_id, "c-abc");
    EXPECT_EQ(config.autoscaler.rancher.inventory_path.string(), "/etc/cluster_scaler/inventory.toml");
    EXPECT_EQ(config.autoscaler.rancher.cleanup_timeout_ms, 750u);
    ASSERT_EQ(config.autoscaler.rancher.gpu_types.size(), 2u);
    EXPECT_EQ(config.autoscaler.rancher.gpu_types[1], "nvidia-a100");
    EXPECT_EQ(config.telemetry.log_dir.string(), "/tmp/cs_logs");
    EXPECT_EQ(config.telemetry.log_level, "debug");
    EXPECT_EQ(config.telemetry.rotate_count, 2u);
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [rancher]
        inventory_path = "inv.toml"
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    EXPECT_EQ(result->autoscaler.rancher.inventory_path.string(), "inv.toml");
    EXPECT_EQ(result->autoscaler.cloud_provider, "rancher");
    EXPECT_EQ(result->autoscaler.rancher.cleanup_timeout_ms, 5000u);
    EXPECT_EQ(result->limits.nodes_max, 1000);
}

TEST_F(ConfigTest, ParseFromText) {
    auto result = parse_config(R"(
        [autoscaler]
        cloud_provider = "other"
    )");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->autoscaler.cloud_provider, "other");
}

TEST_F(ConfigTest, NonStringSpecsAreSkipped) {
    auto result = parse_config(R"(
        [discovery]
        node_group_specs = ["1:2:a", 7]
    )");
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->discovery.node_group_specs.size(), 1u);
    EXPECT_EQ(result->discovery.node_group_specs[0], "1:2:a");
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorKind::Config));
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorKind::Config));
}
