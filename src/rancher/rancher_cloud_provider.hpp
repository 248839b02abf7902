/**
 * @file rancher_cloud_provider.hpp
 * @brief ICloudProvider for Rancher-managed node pools.
 *
 * A thin adapter over RancherManager: reads go to the manager's cache,
 * refresh() and cleanup() are forwarded, optional capabilities report
 * CapabilityUnsupported.
 */

#pragma once

#include "cloudprovider/cloud_provider.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "rancher/rancher_client.hpp"
#include "rancher/rancher_manager.hpp"

#include <memory>
#include <string_view>

namespace cluster_scaler {

inline constexpr std::string_view kRancherProviderName = "rancher";

/// Label carried by nodes with GPU resources.
inline constexpr std::string_view kRancherGpuLabel = "nodes.pkds.it/gpu-node";

class RancherCloudProvider : public ICloudProvider {
public:
    RancherCloudProvider(std::shared_ptr<RancherManager> manager,
                         std::shared_ptr<const ResourceLimiter> resource_limiter,
                         GpuTypeSet gpu_types,
                         Logger& logger);

    [[nodiscard]] std::string_view name() const noexcept override { return kRancherProviderName; }

    [[nodiscard]] std::vector<NodeGroupPtr> node_groups() const override;
    [[nodiscard]] Result<NodeGroupPtr> node_group_for_node(const Node& node) const override;

    [[nodiscard]] Result<std::shared_ptr<IPricingModel>> pricing() const override;
    [[nodiscard]] Result<std::vector<std::string>> available_machine_types() const override;
    [[nodiscard]] Result<NodeGroupPtr> new_node_group(const NodeGroupTemplate& spec) override;

    [[nodiscard]] Result<std::shared_ptr<const ResourceLimiter>> get_resource_limiter() const override;

    [[nodiscard]] std::string_view gpu_label() const noexcept override { return kRancherGpuLabel; }
    [[nodiscard]] GpuTypeSet available_gpu_types() const override { return gpu_types_; }

    Status cleanup() override;
    Status refresh() override;

    [[nodiscard]] uint64_t generation() const noexcept override;

    [[nodiscard]] const std::shared_ptr<RancherManager>& manager() const noexcept { return manager_; }

private:
    std::shared_ptr<RancherManager> manager_;
    std::shared_ptr<const ResourceLimiter> resource_limiter_;
    GpuTypeSet gpu_types_;
    Logger& logger_;
};

/**
 * @brief Wrap an existing manager; fails when manager or limiter is missing.
 */
Result<std::unique_ptr<ICloudProvider>> build_rancher_cloud_provider(
    std::shared_ptr<RancherManager> manager,
    std::shared_ptr<const ResourceLimiter> resource_limiter,
    GpuTypeSet gpu_types,
    Logger& logger);

/**
 * @brief Build the provider around an explicit backend client.
 *
 * Parses the discovery specs and creates the manager. Every failure is a
 * Construction error; the caller decides whether to abort.
 */
Result<std::unique_ptr<ICloudProvider>> build_rancher_with_client(
    std::unique_ptr<IRancherClient> client,
    const AutoscalingOptions& options,
    const NodeGroupDiscoveryOptions& discovery,
    std::shared_ptr<const ResourceLimiter> resource_limiter,
    Logger& logger);

/**
 * @brief Build the provider from configuration, creating the client from
 *        options.rancher.inventory_path.
 */
Result<std::unique_ptr<ICloudProvider>> build_rancher(
    const AutoscalingOptions& options,
    const NodeGroupDiscoveryOptions& discovery,
    std::shared_ptr<const ResourceLimiter> resource_limiter,
    Logger& logger);

}  // namespace cluster_scaler
