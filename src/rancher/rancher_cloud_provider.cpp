/**
 * @file rancher_cloud_provider.cpp
 * @brief RancherCloudProvider and its builders.
 */

#include "rancher/rancher_cloud_provider.hpp"

#include "cloudprovider/node_group_spec.hpp"
#include "rancher/inventory_client.hpp"
#include "rancher/rancher_node_group.hpp"

namespace cluster_scaler {

namespace {

constexpr std::string_view kComponent = "cloudprovider";

}  // namespace

RancherCloudProvider::RancherCloudProvider(std::shared_ptr<RancherManager> manager,
                                           std::shared_ptr<const ResourceLimiter> resource_limiter,
                                           GpuTypeSet gpu_types,
                                           Logger& logger)
    : manager_(std::move(manager))
    , resource_limiter_(std::move(resource_limiter))
    , gpu_types_(std::move(gpu_types))
    , logger_(logger) {}

std::vector<NodeGroupPtr> RancherCloudProvider::node_groups() const {
    auto pools = manager_->list_node_groups();
    if (!pools) {
        // Degrade to an empty listing so the control loop keeps running.
        logger_.error(kComponent, "failed to get node pools: " + pools.error().message);
        return {};
    }

    std::vector<NodeGroupPtr> groups;
    groups.reserve(pools->size());
    for (const auto& pool : *pools) {
        groups.push_back(std::make_shared<RancherNodeGroup>(manager_, pool.id));
    }
    return groups;
}

Result<NodeGroupPtr> RancherCloudProvider::node_group_for_node(const Node& node) const {
    auto record = manager_->resolve_node(node.name);
    if (!record) return record.error();

    if (!record->has_value()) {
        return NodeGroupPtr{};
    }

    const auto& cached = **record;
    if (cached.pool_id.empty()) {
        return integrity_error("missing node pool name for node " + cached.name + " (" + cached.id + ")");
    }
    return NodeGroupPtr{std::make_shared<RancherNodeGroup>(manager_, cached.pool_id)};
}

Result<std::shared_ptr<IPricingModel>> RancherCloudProvider::pricing() const {
    return unsupported("Pricing");
}

Result<std::vector<std::string>> RancherCloudProvider::available_machine_types() const {
    return unsupported("GetAvailableMachineTypes");
}

Result<NodeGroupPtr> RancherCloudProvider::new_node_group(const NodeGroupTemplate& /*spec*/) {
    return unsupported("NewNodeGroup");
}

Result<std::shared_ptr<const ResourceLimiter>> RancherCloudProvider::get_resource_limiter() const {
    return resource_limiter_;
}

Status RancherCloudProvider::cleanup() {
    return manager_->cleanup();
}

Status RancherCloudProvider::refresh() {
    return manager_->refresh();
}

uint64_t RancherCloudProvider::generation() const noexcept {
    return manager_->generation();
}

// ─────────────────────────────────────────────
// Builders
// ─────────────────────────────────────────────

Result<std::unique_ptr<ICloudProvider>> build_rancher_cloud_provider(
    std::shared_ptr<RancherManager> manager,
    std::shared_ptr<const ResourceLimiter> resource_limiter,
    GpuTypeSet gpu_types,
    Logger& logger) {
    if (!manager) {
        return construction_error("Failed to create Rancher cloud provider: no manager");
    }
    if (!resource_limiter) {
        return construction_error("Failed to create Rancher cloud provider: no resource limiter");
    }
    return std::unique_ptr<ICloudProvider>{std::make_unique<RancherCloudProvider>(
        std::move(manager), std::move(resource_limiter), std::move(gpu_types), logger)};
}

Result<std::unique_ptr<ICloudProvider>> build_rancher_with_client(
    std::unique_ptr<IRancherClient> client,
    const AutoscalingOptions& options,
    const NodeGroupDiscoveryOptions& discovery,
    std::shared_ptr<const ResourceLimiter> resource_limiter,
    Logger& logger) {
    auto specs = parse_node_group_specs(discovery.node_group_specs);
    if (!specs) {
        return construction_error("invalid node group discovery options: " + specs.error().message);
    }

    auto manager = build_rancher_manager(std::move(client), std::move(*specs), logger,
                                         std::chrono::milliseconds{options.rancher.cleanup_timeout_ms});
    if (!manager) {
        return construction_error("Failed to create Rancher Manager: " + manager.error().message);
    }

    GpuTypeSet gpu_types(options.rancher.gpu_types.begin(), options.rancher.gpu_types.end());
    return build_rancher_cloud_provider(std::move(*manager), std::move(resource_limiter),
                                        std::move(gpu_types), logger);
}

Result<std::unique_ptr<ICloudProvider>> build_rancher(
    const AutoscalingOptions& options,
    const NodeGroupDiscoveryOptions& discovery,
    std::shared_ptr<const ResourceLimiter> resource_limiter,
    Logger& logger) {
    if (options.rancher.inventory_path.empty()) {
        return construction_error("Failed to create Rancher Manager: rancher.inventory_path is not set");
    }
    auto client = InventoryClient::open(options.rancher.inventory_path, options.rancher.cluster_id);
    if (!client) {
        return construction_error("Failed to create Rancher Manager: " + client.error().message);
    }
    return build_rancher_with_client(std::move(*client), options, discovery,
                                     std::move(resource_limiter), logger);
}

}  // namespace cluster_scaler
