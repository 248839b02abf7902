/**
 * @file rancher_node_group.cpp
 * @brief RancherNodeGroup implementation.
 */

#include "rancher/rancher_node_group.hpp"

#include <cstdint>
#include <unordered_set>

namespace cluster_scaler {

RancherNodeGroup::RancherNodeGroup(std::shared_ptr<RancherManager> manager, PoolId id)
    : manager_(std::move(manager)), id_(std::move(id)) {}

Error RancherNodeGroup::pool_missing() const {
    return Error{ErrorKind::Backend, "node pool " + id_ + " not found in cache generation "
                 + std::to_string(manager_->generation())};
}

std::string RancherNodeGroup::debug() const {
    auto index = manager_->snapshot();
    const auto* pool = index->find_pool(id_);
    int min = pool ? pool->min_size : 0;
    int max = pool ? pool->max_size : 0;
    return id_ + " (" + std::to_string(min) + ":" + std::to_string(max) + ")";
}

int RancherNodeGroup::min_size() const {
    auto index = manager_->snapshot();
    const auto* pool = index->find_pool(id_);
    return pool ? pool->min_size : 0;
}

int RancherNodeGroup::max_size() const {
    auto index = manager_->snapshot();
    const auto* pool = index->find_pool(id_);
    return pool ? pool->max_size : 0;
}

Result<int> RancherNodeGroup::target_size() const {
    auto index = manager_->snapshot();
    const auto* pool = index->find_pool(id_);
    if (!pool) return pool_missing();
    return pool->target_size;
}

Result<std::vector<Instance>> RancherNodeGroup::nodes() const {
    auto index = manager_->snapshot();
    if (!index->find_pool(id_)) return pool_missing();

    std::vector<Instance> instances;
    for (const auto& record : index->pool_nodes(id_)) {
        Instance instance;
        instance.id = record.provider_id.empty()
            ? std::string{kProviderIdPrefix} + record.id
            : record.provider_id;
        instances.push_back(std::move(instance));
    }
    return instances;
}

bool RancherNodeGroup::exist() const {
    return manager_->snapshot()->find_pool(id_) != nullptr;
}

Status RancherNodeGroup::increase_size(int delta) {
    if (delta <= 0) {
        return invalid_argument("size increase must be positive, got " + std::to_string(delta));
    }
    auto index = manager_->snapshot();
    const auto* pool = index->find_pool(id_);
    if (!pool) return pool_missing();

    // Widened so a huge delta cannot wrap around.
    int64_t desired = int64_t{pool->target_size} + delta;
    if (desired > pool->max_size) {
        return invalid_argument("size increase too large for node pool " + id_ + ": desired "
                                + std::to_string(desired) + " max " + std::to_string(pool->max_size));
    }
    return manager_->scale_pool(id_, static_cast<int>(desired));
}

Status RancherNodeGroup::decrease_target_size(int delta) {
    if (delta >= 0) {
        return invalid_argument("size decrease must be negative, got " + std::to_string(delta));
    }
    auto index = manager_->snapshot();
    const auto* pool = index->find_pool(id_);
    if (!pool) return pool_missing();

    int64_t desired = int64_t{pool->target_size} + delta;
    auto registered = static_cast<int64_t>(index->pool_nodes(id_).size());
    if (desired < registered) {
        return invalid_argument("attempt to delete existing nodes in node pool " + id_ + ": target size "
                                + std::to_string(pool->target_size) + " delta " + std::to_string(delta)
                                + " existing nodes " + std::to_string(registered));
    }
    if (desired < pool->min_size) {
        return invalid_argument("size decrease too large for node pool " + id_ + ": desired "
                                + std::to_string(desired) + " min " + std::to_string(pool->min_size));
    }
    return manager_->scale_pool(id_, static_cast<int>(desired));
}

Status RancherNodeGroup::delete_nodes(const std::vector<Node>& nodes) {
    if (nodes.empty()) return ok();

    auto index = manager_->snapshot();
    const auto* pool = index->find_pool(id_);
    if (!pool) return pool_missing();

    // Resolve and de-duplicate before sizing: a node listed twice is deleted once.
    std::vector<NodeRecord> records;
    std::unordered_set<NodeName> seen;
    records.reserve(nodes.size());
    for (const auto& node : nodes) {
        if (!seen.insert(node.name).second) continue;
        const auto* record = index->find_node(node.name);
        if (!record || record->pool_id != id_) {
            return invalid_argument("node " + node.name + " does not belong to node pool " + id_);
        }
        records.push_back(*record);
    }

    auto count = static_cast<int>(records.size());
    if (pool->target_size - count < pool->min_size) {
        return invalid_argument("node pool " + id_ + " min size reached: cannot delete "
                                + std::to_string(count) + " nodes from target size "
                                + std::to_string(pool->target_size));
    }

    int deleted = 0;
    for (const auto& record : records) {
        auto status = manager_->delete_node(id_, record);
        if (!status) {
            // Keep the target in step with the nodes that are already gone.
            std::string message = "deleted " + std::to_string(deleted) + " of " + std::to_string(count)
                                  + " nodes from node pool " + id_ + ": " + status.error().message;
            if (deleted > 0) {
                auto scaled = manager_->scale_pool(id_, pool->target_size - deleted);
                if (!scaled) message += "; " + scaled.error().message;
            }
            return Error{ErrorKind::Backend, std::move(message)};
        }
        ++deleted;
    }
    return manager_->scale_pool(id_, pool->target_size - count);
}

Result<std::shared_ptr<INodeGroup>> RancherNodeGroup::create() {
    return unsupported("NodeGroup::create");
}

Status RancherNodeGroup::destroy() {
    return unsupported("NodeGroup::destroy");
}

}  // namespace cluster_scaler
