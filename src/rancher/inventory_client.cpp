/**
 * @file inventory_client.cpp
 * @brief TOML inventory parsing using toml++ and the InventoryClient overlay.
 */

#include "rancher/inventory_client.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <climits>
#include <cstdint>

namespace cluster_scaler {

namespace {

Result<int> read_size(const toml::table& pool, const PoolId& id, std::string_view key) {
    int64_t value = pool[key].value_or(int64_t{0});
    if (value < 0 || value > INT_MAX) {
        return config_error("inventory node pool \"" + id + "\": " + std::string{key} + " "
                            + std::to_string(value) + " out of range [0, " + std::to_string(INT_MAX) + "]");
    }
    return static_cast<int>(value);
}

Result<Inventory> from_table(const toml::table& tbl) {
    Inventory inventory;

    if (const auto* pools = tbl["pools"].as_array()) {
        for (const auto& elem : *pools) {
            const auto* pool = elem.as_table();
            if (pool == nullptr) continue;
            PoolInfo info;
            info.id = (*pool)["id"].value_or(std::string{});
            info.name = (*pool)["name"].value_or(std::string{info.id});

            auto min_size = read_size(*pool, info.id, "min_size");
            if (!min_size) return min_size.error();
            auto max_size = read_size(*pool, info.id, "max_size");
            if (!max_size) return max_size.error();
            auto quantity = read_size(*pool, info.id, "quantity");
            if (!quantity) return quantity.error();

            info.min_size = *min_size;
            info.max_size = *max_size;
            info.target_size = *quantity;
            inventory.pools.push_back(std::move(info));
        }
    }

    if (const auto* nodes = tbl["nodes"].as_array()) {
        for (const auto& elem : *nodes) {
            const auto* node = elem.as_table();
            if (node == nullptr) continue;
            NodeRecord record;
            record.id = (*node)["id"].value_or(std::string{});
            record.name = (*node)["name"].value_or(std::string{});
            record.pool_id = (*node)["pool_id"].value_or(std::string{});
            record.provider_id = (*node)["provider_id"].value_or(
                record.id.empty() ? std::string{} : std::string{kProviderIdPrefix} + record.id);
            inventory.nodes.push_back(std::move(record));
        }
    }

    return inventory;
}

}  // namespace

Result<Inventory> parse_inventory(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return config_error(std::string{"inventory parse error: "} + std::string{err.description()});
    }
}

Result<Inventory> load_inventory(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return config_error("inventory file not found: " + path.string());
    }
    try {
        auto tbl = toml::parse_file(path.string());
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return config_error("inventory parse error in " + path.string() + ": "
                            + std::string{err.description()});
    }
}

// ── InventoryClient ──────────────────────────

Result<std::unique_ptr<InventoryClient>> InventoryClient::open(const std::filesystem::path& path,
                                                               std::string cluster_id) {
    if (path.empty()) {
        return config_error("inventory path is empty");
    }
    if (!std::filesystem::exists(path)) {
        return config_error("inventory file not found: " + path.string());
    }
    return std::make_unique<InventoryClient>(path, std::move(cluster_id));
}

InventoryClient::InventoryClient(std::filesystem::path path, std::string cluster_id)
    : path_(std::move(path)), cluster_id_(std::move(cluster_id)) {}

bool InventoryClient::in_cluster(const PoolId& pool_id) const {
    if (cluster_id_.empty()) return true;
    return pool_id.size() > cluster_id_.size()
        && pool_id.compare(0, cluster_id_.size(), cluster_id_) == 0
        && pool_id[cluster_id_.size()] == ':';
}

Result<Inventory> InventoryClient::fetch_inventory() {
    std::lock_guard lock(mutex_);
    if (closed_) return Error{ErrorKind::Backend, "inventory client is closed"};

    auto inventory = load_inventory(path_);
    if (!inventory) return Error{ErrorKind::Backend, inventory.error().message};

    auto& pools = inventory->pools;
    pools.erase(std::remove_if(pools.begin(), pools.end(),
                               [this](const PoolInfo& p) { return !in_cluster(p.id); }),
                pools.end());
    for (auto& pool : pools) {
        if (auto it = size_overrides_.find(pool.id); it != size_overrides_.end()) {
            pool.target_size = it->second;
        }
    }
    auto& nodes = inventory->nodes;
    nodes.erase(std::remove_if(nodes.begin(), nodes.end(),
                               [this](const NodeRecord& n) {
                                   if (deleted_nodes_.count(n.id) > 0) return true;
                                   // Unassigned nodes stay so the lookup can report them.
                                   return !n.pool_id.empty() && !in_cluster(n.pool_id);
                               }),
                nodes.end());
    return std::move(*inventory);
}

Status InventoryClient::scale_pool(const PoolId& pool_id, int size) {
    std::lock_guard lock(mutex_);
    if (closed_) return Error{ErrorKind::Backend, "inventory client is closed"};
    if (size < 0) return invalid_argument("negative size for node pool " + pool_id);
    size_overrides_[pool_id] = size;
    return ok();
}

Status InventoryClient::delete_node(const PoolId& pool_id, const std::string& node_id) {
    std::lock_guard lock(mutex_);
    if (closed_) return Error{ErrorKind::Backend, "inventory client is closed"};
    if (node_id.empty()) return invalid_argument("empty node id for node pool " + pool_id);
    deleted_nodes_.insert(node_id);
    return ok();
}

Status InventoryClient::close(std::chrono::milliseconds /*timeout*/) {
    std::lock_guard lock(mutex_);
    closed_ = true;
    size_overrides_.clear();
    deleted_nodes_.clear();
    return ok();
}

std::string InventoryClient::endpoint() const {
    auto uri = "inventory://" + path_.string();
    if (!cluster_id_.empty()) uri += "?cluster=" + cluster_id_;
    return uri;
}

}  // namespace cluster_scaler
