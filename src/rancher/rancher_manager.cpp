/**
 * @file rancher_manager.cpp
 * @brief RancherManager implementation.
 */

#include "rancher/rancher_manager.hpp"

#include <string>

namespace cluster_scaler {

namespace {

constexpr std::string_view kComponent = "rancher_manager";

Error not_populated() {
    return Error{ErrorKind::Backend, "node pool cache is not populated"};
}

}  // namespace

RancherManager::RancherManager(std::unique_ptr<IRancherClient> client,
                               std::vector<NodeGroupSpec> specs,
                               Logger& logger,
                               std::chrono::milliseconds cleanup_timeout)
    : client_(std::move(client))
    , specs_(std::move(specs))
    , logger_(logger)
    , cleanup_timeout_(cleanup_timeout)
    , index_(std::make_shared<const PoolIndex>()) {}

RancherManager::~RancherManager() {
    if (cleaned_up_.load()) return;
    auto status = cleanup();
    if (!status) {
        logger_.warn(kComponent, "cleanup on destruction failed: " + status.error().message);
    }
}

Status RancherManager::refresh() {
    std::unique_lock lock(writer_mutex_);
    if (cleaned_up_.load()) {
        return Error{ErrorKind::Backend, "cannot refresh: manager has been cleaned up"};
    }

    auto inventory = client_->fetch_inventory();
    if (!inventory) {
        auto current = index_.load();
        logger_.warn(kComponent, "refresh from " + client_->endpoint() + " failed, keeping generation "
                     + std::to_string(current->generation()) + ": " + inventory.error().message);
        return refresh_error("failed to refresh node pools: " + inventory.error().message);
    }

    std::vector<std::string> warnings;
    auto next = std::make_shared<const PoolIndex>(
        PoolIndex::build(next_generation_, std::move(*inventory), specs_, warnings));
    for (const auto& warning : warnings) {
        logger_.warn(kComponent, warning);
    }

    index_.store(std::move(next));
    auto installed = index_.load();
    ++next_generation_;

    logger_.debug(kComponent, "installed generation " + std::to_string(installed->generation())
                  + ": " + std::to_string(installed->pools().size()) + " pools, "
                  + std::to_string(installed->node_count()) + " nodes");
    return ok();
}

Status RancherManager::cleanup() {
    if (cleaned_up_.load()) return ok();

    std::unique_lock lock(writer_mutex_, std::defer_lock);
    if (!lock.try_lock_for(cleanup_timeout_)) {
        return Error{ErrorKind::Backend, "cleanup timed out waiting for an in-flight refresh"};
    }
    if (cleaned_up_.load()) return ok();

    auto status = client_->close(cleanup_timeout_);
    cleaned_up_.store(true);
    // Readers see an empty cache, but the generation never goes backwards.
    index_.store(std::make_shared<const PoolIndex>(PoolIndex::emptied(index_.load()->generation())));

    if (!status) {
        return Error{ErrorKind::Backend, "failed to close rancher client: " + status.error().message};
    }
    logger_.info(kComponent, "released client " + client_->endpoint());
    return ok();
}

Result<std::vector<PoolInfo>> RancherManager::list_node_groups() const {
    auto index = index_.load();
    if (!index->populated()) return not_populated();
    return index->pools();
}

Result<std::optional<NodeRecord>> RancherManager::resolve_node(const NodeName& name) const {
    auto index = index_.load();
    if (!index->populated()) return not_populated();
    const auto* record = index->find_node(name);
    if (record == nullptr) return std::optional<NodeRecord>{};
    return std::optional<NodeRecord>{*record};
}

std::shared_ptr<const PoolIndex> RancherManager::snapshot() const noexcept {
    return index_.load();
}

uint64_t RancherManager::generation() const noexcept {
    return index_.load()->generation();
}

Status RancherManager::scale_pool(const PoolId& pool_id, int size) {
    std::unique_lock lock(writer_mutex_);
    if (cleaned_up_.load()) {
        return Error{ErrorKind::Backend, "cannot scale node pool " + pool_id + ": manager has been cleaned up"};
    }
    auto status = client_->scale_pool(pool_id, size);
    if (!status) {
        return Error{ErrorKind::Backend, "failed to scale node pool " + pool_id + " to "
                     + std::to_string(size) + ": " + status.error().message};
    }
    logger_.info(kComponent, "scaled node pool " + pool_id + " to " + std::to_string(size));
    return ok();
}

Status RancherManager::delete_node(const PoolId& pool_id, const NodeRecord& node) {
    std::unique_lock lock(writer_mutex_);
    if (cleaned_up_.load()) {
        return Error{ErrorKind::Backend, "cannot delete node " + node.name + ": manager has been cleaned up"};
    }
    auto status = client_->delete_node(pool_id, node.id);
    if (!status) {
        return Error{ErrorKind::Backend, "failed to delete node " + node.name + " (" + node.id
                     + ") from node pool " + pool_id + ": " + status.error().message};
    }
    logger_.info(kComponent, "deleted node " + node.name + " from node pool " + pool_id);
    return ok();
}

Result<std::shared_ptr<RancherManager>> build_rancher_manager(std::unique_ptr<IRancherClient> client,
                                                              std::vector<NodeGroupSpec> specs,
                                                              Logger& logger,
                                                              std::chrono::milliseconds cleanup_timeout) {
    if (!client) {
        return construction_error("cannot create Rancher manager without a backend client");
    }
    logger.info(kComponent, "using backend " + client->endpoint());
    return std::make_shared<RancherManager>(std::move(client), std::move(specs), logger, cleanup_timeout);
}

}  // namespace cluster_scaler
