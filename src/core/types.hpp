/**
 * @file types.hpp
 * @brief Vocabulary types shared by the provider, manager and daemon.
 *
 * Node is what the control loop observes; NodeRecord and PoolInfo are what
 * the backend reports and the manager caches.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace cluster_scaler {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using NodeName = std::string;
using PoolId = std::string;
using Labels = std::map<std::string, std::string>;
using Timestamp = std::chrono::system_clock::time_point;

/// Prefix of provider ids handed out for backend nodes.
inline constexpr std::string_view kProviderIdPrefix = "rancher://";

// ─────────────────────────────────────────────
// Observed Node
// ─────────────────────────────────────────────

/**
 * @brief A cluster member as seen by the control loop.
 */
struct Node {
    NodeName name;
    std::string provider_id;     ///< Empty when the node is not backend-owned
    Labels labels;
};

// ─────────────────────────────────────────────
// Backend Records
// ─────────────────────────────────────────────

/**
 * @brief A node as reported by the backend.
 *
 * pool_id may be empty when the backend returned a malformed assignment.
 */
struct NodeRecord {
    std::string id;              ///< Backend node id
    NodeName name;               ///< Cluster node name
    PoolId pool_id;
    std::string provider_id;

    bool operator==(const NodeRecord&) const = default;
};

/**
 * @brief A node pool as reported by the backend.
 */
struct PoolInfo {
    PoolId id;
    std::string name;
    int min_size{0};
    int max_size{0};
    int target_size{0};          ///< Requested quantity

    bool operator==(const PoolInfo&) const = default;
};

/**
 * @brief Full backend state returned by one fetch.
 */
struct Inventory {
    std::vector<PoolInfo> pools;
    std::vector<NodeRecord> nodes;
};

// ─────────────────────────────────────────────
// Instances
// ─────────────────────────────────────────────

enum class InstanceState : uint8_t {
    Running,
    Creating,
    Deleting
};

[[nodiscard]] constexpr std::string_view to_string(InstanceState state) noexcept {
    switch (state) {
        case InstanceState::Running:  return "running";
        case InstanceState::Creating: return "creating";
        case InstanceState::Deleting: return "deleting";
    }
    return "unknown";
}

/**
 * @brief One machine belonging to a node group.
 */
struct Instance {
    std::string id;              ///< Provider id, e.g. "rancher://<node id>"
    InstanceState state{InstanceState::Running};
};

}  // namespace cluster_scaler
