/**
 * @file rancher_client.hpp
 * @brief Interface to the backend that owns node pools and their nodes.
 *
 * Only RancherManager talks to a client. Calls are issued from the refresh
 * path or from node-group mutations, serialised by the manager, so
 * implementations need not be reentrant.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace cluster_scaler {

class IRancherClient {
public:
    virtual ~IRancherClient() = default;

    /// Current pools and nodes, read as one consistent listing.
    virtual Result<Inventory> fetch_inventory() = 0;

    /// Request @p size nodes for pool @p pool_id.
    virtual Status scale_pool(const PoolId& pool_id, int size) = 0;

    /// Remove node @p node_id (backend id) from pool @p pool_id.
    virtual Status delete_node(const PoolId& pool_id, const std::string& node_id) = 0;

    /**
     * @brief Release connections and timers.
     *
     * Must return within @p timeout. Calls after the first are no-ops.
     */
    virtual Status close(std::chrono::milliseconds timeout) = 0;

    /// Where the client reads from, for log messages.
    [[nodiscard]] virtual std::string endpoint() const = 0;
};

}  // namespace cluster_scaler
