/**
 * @file rancher_manager.hpp
 * @brief Owner of the backend client and the generation-swapped pool cache.
 *
 * refresh() is the single writer: it fetches the backend inventory, builds a
 * new PoolIndex and publishes it with one atomic store. Readers load the
 * current pointer and keep that generation alive for as long as they use
 * it, so a lookup never mixes two generations and never waits on I/O.
 */

#pragma once

#include "cloudprovider/node_group_spec.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "rancher/pool_index.hpp"
#include "rancher/rancher_client.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace cluster_scaler {

class RancherManager {
public:
    RancherManager(std::unique_ptr<IRancherClient> client,
                   std::vector<NodeGroupSpec> specs,
                   Logger& logger,
                   std::chrono::milliseconds cleanup_timeout = std::chrono::milliseconds{5000});
    ~RancherManager();

    // Non-copyable, non-movable
    RancherManager(const RancherManager&) = delete;
    RancherManager& operator=(const RancherManager&) = delete;

    // ── Refresh cycle ────────────────────────

    /**
     * @brief Fetch backend state and publish it as the next generation.
     *
     * On failure the previous generation stays published and a Refresh
     * error is returned.
     */
    Status refresh();

    /**
     * @brief Close the client and drop the cache.
     *
     * The emptied cache keeps the last generation number.
     *
     * Waits at most cleanup_timeout for an in-flight refresh. Safe without
     * a prior refresh; calls after the first successful one return ok.
     */
    Status cleanup();

    // ── Reads (cache only) ───────────────────

    /// Pools of the current generation; Backend error before the first refresh.
    [[nodiscard]] Result<std::vector<PoolInfo>> list_node_groups() const;

    /**
     * @brief Cached record for node @p name.
     *
     * nullopt when the node is not managed by this backend.
     */
    [[nodiscard]] Result<std::optional<NodeRecord>> resolve_node(const NodeName& name) const;

    [[nodiscard]] std::shared_ptr<const PoolIndex> snapshot() const noexcept;
    [[nodiscard]] uint64_t generation() const noexcept;

    // ── Mutations (forwarded to the backend) ─

    Status scale_pool(const PoolId& pool_id, int size);
    Status delete_node(const PoolId& pool_id, const NodeRecord& node);

    [[nodiscard]] Logger& logger() const noexcept { return logger_; }
    [[nodiscard]] bool cleaned_up() const noexcept { return cleaned_up_.load(); }

private:
    std::unique_ptr<IRancherClient> client_;
    std::vector<NodeGroupSpec> specs_;
    Logger& logger_;
    std::chrono::milliseconds cleanup_timeout_;

    std::atomic<std::shared_ptr<const PoolIndex>> index_;

    // Serialises writers: refresh, mutations and cleanup.
    mutable std::timed_mutex writer_mutex_;
    uint64_t next_generation_{1};
    std::atomic<bool> cleaned_up_{false};
};

/**
 * @brief Build a manager around @p client; fails if the client is missing.
 */
Result<std::shared_ptr<RancherManager>> build_rancher_manager(std::unique_ptr<IRancherClient> client,
                                                              std::vector<NodeGroupSpec> specs,
                                                              Logger& logger,
                                                              std::chrono::milliseconds cleanup_timeout);

}  // namespace cluster_scaler
