/**
 * @file pool_index.cpp
 * @brief PoolIndex construction and lookups.
 */

#include "rancher/pool_index.hpp"

#include <algorithm>
#include <chrono>

namespace cluster_scaler {

PoolIndex PoolIndex::emptied(uint64_t generation) {
    PoolIndex index;
    index.generation_ = generation;
    return index;
}

PoolIndex PoolIndex::build(uint64_t generation,
                           Inventory inventory,
                           const std::vector<NodeGroupSpec>& specs,
                           std::vector<std::string>& warnings) {
    PoolIndex index;
    index.generation_ = generation;
    index.populated_ = true;
    index.refreshed_at_ = std::chrono::system_clock::now();

    std::unordered_map<PoolId, const NodeGroupSpec*> spec_by_id;
    for (const auto& spec : specs) {
        spec_by_id.emplace(spec.pool_id, &spec);
    }

    // ── Pools ────────────────────────────────
    for (auto& pool : inventory.pools) {
        if (pool.id.empty()) {
            warnings.push_back("dropping node pool \"" + pool.name + "\" without an id");
            continue;
        }
        if (index.pool_pos_.count(pool.id) > 0) {
            warnings.push_back("dropping duplicate node pool " + pool.id);
            continue;
        }
        if (!specs.empty()) {
            auto it = spec_by_id.find(pool.id);
            if (it == spec_by_id.end()) continue;
            pool.min_size = it->second->min_size;
            pool.max_size = it->second->max_size;
        }
        index.pool_pos_.emplace(pool.id, index.pools_.size());
        index.pools_.push_back(std::move(pool));
    }

    for (const auto& spec : specs) {
        if (index.pool_pos_.count(spec.pool_id) == 0) {
            warnings.push_back("node pool " + spec.pool_id + " from discovery options not reported by backend");
        }
    }

    // ── Nodes ────────────────────────────────
    for (auto& node : inventory.nodes) {
        if (node.name.empty()) {
            warnings.push_back("dropping backend node " + node.id + " without a node name");
            continue;
        }
        if (!node.pool_id.empty() && index.pool_pos_.count(node.pool_id) == 0) {
            continue;  // pool not managed here
        }
        if (index.nodes_by_name_.count(node.name) > 0) {
            warnings.push_back("duplicate backend node name " + node.name + ", keeping the last entry");
            auto& prev = index.nodes_by_name_[node.name];
            auto& names = index.nodes_by_pool_[prev.pool_id];
            names.erase(std::remove(names.begin(), names.end(), node.name), names.end());
        }
        index.nodes_by_pool_[node.pool_id].push_back(node.name);
        auto name = node.name;
        index.nodes_by_name_.insert_or_assign(std::move(name), std::move(node));
    }

    return index;
}

const PoolInfo* PoolIndex::find_pool(const PoolId& id) const {
    auto it = pool_pos_.find(id);
    return it == pool_pos_.end() ? nullptr : &pools_[it->second];
}

const NodeRecord* PoolIndex::find_node(const NodeName& name) const {
    auto it = nodes_by_name_.find(name);
    return it == nodes_by_name_.end() ? nullptr : &it->second;
}

std::vector<NodeRecord> PoolIndex::pool_nodes(const PoolId& id) const {
    std::vector<NodeRecord> out;
    if (id.empty()) return out;
    auto it = nodes_by_pool_.find(id);
    if (it == nodes_by_pool_.end()) return out;
    out.reserve(it->second.size());
    for (const auto& name : it->second) {
        out.push_back(nodes_by_name_.at(name));
    }
    return out;
}

}  // namespace cluster_scaler
