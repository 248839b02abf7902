/**
 * @file inventory_client.hpp
 * @brief Backend client reading pool and node state from a TOML inventory.
 *
 * Used for offline and staging runs. The file is re-read on every fetch so
 * external edits show up on the next refresh; scale requests and node
 * deletions are kept in an in-memory overlay applied on top of the file.
 * When a cluster id is set only pools named "<cluster>:<pool>" are served,
 * the way Rancher scopes node pool ids to their cluster.
 *
 * Inventory format:
 *   [[pools]]
 *   id = "c-1:np-1"     name = "workers"
 *   min_size = 1        max_size = 10        quantity = 3
 *
 *   [[nodes]]
 *   id = "n-1"          name = "worker-1"
 *   pool_id = "c-1:np-1" provider_id = "rancher://n-1"
 */

#pragma once

#include "rancher/rancher_client.hpp"

#include <filesystem>
#include <string>
#include <memory>
#include <mutex>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace cluster_scaler {

/**
 * @brief Parse inventory TOML text.
 *
 * Sizes must fit in [0, INT_MAX]; anything else is a Config error naming
 * the pool and the key.
 */
Result<Inventory> parse_inventory(std::string_view toml_text);

/**
 * @brief Read and parse an inventory file.
 */
Result<Inventory> load_inventory(const std::filesystem::path& path);

class InventoryClient : public IRancherClient {
public:
    /// Client for @p path; fails if the file does not exist.
    static Result<std::unique_ptr<InventoryClient>> open(const std::filesystem::path& path,
                                                         std::string cluster_id = {});

    explicit InventoryClient(std::filesystem::path path, std::string cluster_id = {});

    Result<Inventory> fetch_inventory() override;
    Status scale_pool(const PoolId& pool_id, int size) override;
    Status delete_node(const PoolId& pool_id, const std::string& node_id) override;
    Status close(std::chrono::milliseconds timeout) override;
    [[nodiscard]] std::string endpoint() const override;

private:
    [[nodiscard]] bool in_cluster(const PoolId& pool_id) const;

    std::filesystem::path path_;
    std::string cluster_id_;
    std::mutex mutex_;
    std::unordered_map<PoolId, int> size_overrides_;
    std::unordered_set<std::string> deleted_nodes_;
    bool closed_{false};
};

}  // namespace cluster_scaler
