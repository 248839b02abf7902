/**
 * @file pool_index.hpp
 * @brief Immutable node/pool index built from one backend listing.
 */

#pragma once

#include "cloudprovider/node_group_spec.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace cluster_scaler {

/**
 * @brief One cache generation.
 *
 * Built wholesale by RancherManager::refresh() and published as
 * shared_ptr<const PoolIndex>; never mutated after publication.
 */
class PoolIndex {
public:
    /// Empty generation-0 index, the state before any refresh.
    PoolIndex() = default;

    /**
     * @brief Build generation @p generation from @p inventory.
     *
     * When @p specs is non-empty only the listed pools are kept and their
     * bounds replace the backend's. Pools without an id and repeated ids are
     * dropped; a note for each goes to @p warnings. Nodes assigned to a pool
     * outside the managed set are left out, so they resolve as unmanaged.
     * Nodes with an empty pool id are kept: that is an integrity problem the
     * lookup must report.
     */
    static PoolIndex build(uint64_t generation,
                           Inventory inventory,
                           const std::vector<NodeGroupSpec>& specs,
                           std::vector<std::string>& warnings);

    /// Unpopulated index that keeps @p generation, published on cleanup.
    static PoolIndex emptied(uint64_t generation);

    [[nodiscard]] uint64_t generation() const noexcept { return generation_; }
    [[nodiscard]] Timestamp refreshed_at() const noexcept { return refreshed_at_; }
    [[nodiscard]] bool populated() const noexcept { return populated_; }

    /// Managed pools in backend order.
    [[nodiscard]] const std::vector<PoolInfo>& pools() const noexcept { return pools_; }
    [[nodiscard]] size_t node_count() const noexcept { return nodes_by_name_.size(); }

    [[nodiscard]] const PoolInfo* find_pool(const PoolId& id) const;
    [[nodiscard]] const NodeRecord* find_node(const NodeName& name) const;
    [[nodiscard]] std::vector<NodeRecord> pool_nodes(const PoolId& id) const;

private:
    uint64_t generation_{0};
    bool populated_{false};
    Timestamp refreshed_at_{};
    std::vector<PoolInfo> pools_;
    std::unordered_map<PoolId, size_t> pool_pos_;
    std::unordered_map<NodeName, NodeRecord> nodes_by_name_;
    std::unordered_map<PoolId, std::vector<NodeName>> nodes_by_pool_;
};

}  // namespace cluster_scaler
