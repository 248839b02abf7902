/**
 * @file test_builder.cpp
 * @brief Tests for provider selection and construction.
 */

#include "cloudprovider/builder.hpp"
#include "rancher/mock_client.hpp"
#include "rancher/rancher_cloud_provider.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace cluster_scaler;

namespace {

class BuilderTest : public ::testing::Test {
protected:
    Logger logger_{std::make_unique<NullSink>()};
    std::shared_ptr<const ResourceLimiter> limiter_ = ResourceLimiter::from_config(LimitsConfig{});
    std::filesystem::path dir_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "cs_test_builder";
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::filesystem::path write_inventory() {
        auto path = dir_ / "inventory.toml";
        std::ofstream ofs(path);
        ofs << "[[pools]]\nid = \"pool-a\"\nmin_size = 1\nmax_size = 4\nquantity = 1\n"
            << "[[nodes]]\nid = \"n-1\"\nname = \"worker-1\"\npool_id = \"pool-a\"\n";
        return path;
    }
};

}  // namespace

TEST_F(BuilderTest, BuiltinRegistryKnowsRancher) {
    auto registry = ProviderRegistry::with_builtin_providers();
    EXPECT_TRUE(registry.contains("rancher"));
    EXPECT_FALSE(registry.contains("aws"));
    EXPECT_EQ(registry.names(), std::vector<std::string>{"rancher"});
}

TEST_F(BuilderTest, UnknownProviderIsConstructionError) {
    AutoscalingOptions options;
    options.cloud_provider = "gce";

    auto provider = build_cloud_provider(options, {}, limiter_, logger_);
    ASSERT_FALSE(provider.has_value());
    EXPECT_TRUE(provider.error().is(ErrorKind::Construction));
    EXPECT_NE(provider.error().message.find("gce"), std::string::npos);
    EXPECT_NE(provider.error().message.find("rancher"), std::string::npos);
}

TEST_F(BuilderTest, MissingInventoryPathIsConstructionError) {
    AutoscalingOptions options;
    auto provider = build_cloud_provider(options, {}, limiter_, logger_);
    ASSERT_FALSE(provider.has_value());
    EXPECT_TRUE(provider.error().is(ErrorKind::Construction));
    EXPECT_NE(provider.error().message.find("Failed to create Rancher Manager"), std::string::npos);
}

TEST_F(BuilderTest, UnreadableInventoryIsConstructionError) {
    AutoscalingOptions options;
    options.rancher.inventory_path = dir_ / "absent.toml";
    auto provider = build_cloud_provider(options, {}, limiter_, logger_);
    ASSERT_FALSE(provider.has_value());
    EXPECT_TRUE(provider.error().is(ErrorKind::Construction));
}

TEST_F(BuilderTest, InvalidDiscoverySpecIsConstructionError) {
    AutoscalingOptions options;
    options.rancher.inventory_path = write_inventory();
    NodeGroupDiscoveryOptions discovery;
    discovery.node_group_specs = {"10:1:pool-a"};

    auto provider = build_cloud_provider(options, discovery, limiter_, logger_);
    ASSERT_FALSE(provider.has_value());
    EXPECT_TRUE(provider.error().is(ErrorKind::Construction));
    EXPECT_NE(provider.error().message.find("invalid node group discovery options"), std::string::npos);
}

TEST_F(BuilderTest, NullClientIsConstructionError) {
    auto provider = build_rancher_with_client(nullptr, AutoscalingOptions{}, {}, limiter_, logger_);
    ASSERT_FALSE(provider.has_value());
    EXPECT_TRUE(provider.error().is(ErrorKind::Construction));
}

TEST_F(BuilderTest, MissingLimiterIsConstructionError) {
    auto client = std::make_unique<MockRancherClient>();
    auto provider = build_rancher_with_client(std::move(client), AutoscalingOptions{}, {}, nullptr, logger_);
    ASSERT_FALSE(provider.has_value());
    EXPECT_TRUE(provider.error().is(ErrorKind::Construction));
}

TEST_F(BuilderTest, BuildsRancherFromInventory) {
    AutoscalingOptions options;
    options.rancher.inventory_path = write_inventory();
    options.rancher.gpu_types = {"nvidia-tesla-t4"};
    NodeGroupDiscoveryOptions discovery;
    discovery.node_group_specs = {"0:8:pool-a"};

    auto provider = build_cloud_provider(options, discovery, limiter_, logger_);
    ASSERT_TRUE(provider.has_value()) << provider.error().message;
    auto& cp = **provider;

    EXPECT_EQ(cp.name(), "rancher");
    EXPECT_EQ(cp.available_gpu_types().count("nvidia-tesla-t4"), 1u);
    ASSERT_TRUE(cp.refresh().has_value());

    auto groups = cp.node_groups();
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0]->min_size(), 0);
    EXPECT_EQ(groups[0]->max_size(), 8);
    EXPECT_TRUE(cp.cleanup().has_value());
}

TEST_F(BuilderTest, CustomFactoryIsUsed) {
    auto registry = ProviderRegistry::with_builtin_providers();
    int calls = 0;
    registry.register_provider("scripted", [&](const AutoscalingOptions& options,
                                               const NodeGroupDiscoveryOptions& discovery,
                                               std::shared_ptr<const ResourceLimiter> limiter,
                                               Logger& logger) -> Result<std::unique_ptr<ICloudProvider>> {
        ++calls;
        return build_rancher_with_client(std::make_unique<MockRancherClient>(), options, discovery,
                                         std::move(limiter), logger);
    });

    AutoscalingOptions options;
    options.cloud_provider = "scripted";
    auto provider = registry.build(options, {}, limiter_, logger_);
    ASSERT_TRUE(provider.has_value()) << provider.error().message;
    EXPECT_EQ(calls, 1);
    EXPECT_EQ((*provider)->name(), "rancher");
}

TEST_F(BuilderTest, FactoryErrorsBecomeConstructionErrors) {
    ProviderRegistry registry;
    registry.register_provider("broken", [](const AutoscalingOptions&, const NodeGroupDiscoveryOptions&,
                                            std::shared_ptr<const ResourceLimiter>,
                                            Logger&) -> Result<std::unique_ptr<ICloudProvider>> {
        return Error{ErrorKind::Backend, "endpoint unreachable"};
    });
    registry.register_provider("empty", [](const AutoscalingOptions&, const NodeGroupDiscoveryOptions&,
                                           std::shared_ptr<const ResourceLimiter>,
                                           Logger&) -> Result<std::unique_ptr<ICloudProvider>> {
        return std::unique_ptr<ICloudProvider>{};
    });

    AutoscalingOptions options;
    options.cloud_provider = "broken";
    auto broken = registry.build(options, {}, limiter_, logger_);
    ASSERT_FALSE(broken.has_value());
    EXPECT_TRUE(broken.error().is(ErrorKind::Construction));
    EXPECT_EQ(broken.error().message, "endpoint unreachable");

    options.cloud_provider = "empty";
    auto empty = registry.build(options, {}, limiter_, logger_);
    ASSERT_FALSE(empty.has_value());
    EXPECT_TRUE(empty.error().is(ErrorKind::Construction));
}
