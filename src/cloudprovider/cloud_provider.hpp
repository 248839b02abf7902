/**
 * @file cloud_provider.hpp
 * @brief Backend-independent contract between the scaling loop and a provider.
 *
 * The control loop holds one ICloudProvider for the life of the process.
 * refresh() is the only operation allowed to talk to the backend; every
 * read accessor works from the provider's cached snapshot and may be called
 * concurrently from several reader threads.
 *
 * Optional operations report ErrorKind::CapabilityUnsupported when a
 * backend does not implement them.
 */

#pragma once

#include "cloudprovider/resource_limiter.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace cluster_scaler {

// ─────────────────────────────────────────────
// Node Group
// ─────────────────────────────────────────────

/**
 * @brief A homogeneous, independently scalable set of nodes.
 *
 * Implementations are handles: each call consults the provider's current
 * cache instead of a copy taken when the handle was created.
 */
class INodeGroup {
public:
    virtual ~INodeGroup() = default;

    /// Backend pool id; never empty.
    [[nodiscard]] virtual const std::string& id() const noexcept = 0;
    [[nodiscard]] virtual std::string debug() const = 0;

    [[nodiscard]] virtual int min_size() const = 0;
    [[nodiscard]] virtual int max_size() const = 0;
    [[nodiscard]] virtual Result<int> target_size() const = 0;

    [[nodiscard]] virtual Result<std::vector<Instance>> nodes() const = 0;

    /// Pool is present in the current cache generation.
    [[nodiscard]] virtual bool exist() const = 0;

    virtual Status increase_size(int delta) = 0;
    virtual Status decrease_target_size(int delta) = 0;
    virtual Status delete_nodes(const std::vector<Node>& nodes) = 0;

    // ── Auto-provisioning (optional) ─────────
    virtual Result<std::shared_ptr<INodeGroup>> create() = 0;
    virtual Status destroy() = 0;
    [[nodiscard]] virtual bool autoprovisioned() const = 0;
};

using NodeGroupPtr = std::shared_ptr<INodeGroup>;

// ─────────────────────────────────────────────
// Optional capability types
// ─────────────────────────────────────────────

/**
 * @brief Price estimates for nodes; only some backends provide one.
 */
class IPricingModel {
public:
    virtual ~IPricingModel() = default;

    virtual Result<double> node_price(const Node& node, Timestamp start, Timestamp end) = 0;
};

struct Taint {
    std::string key;
    std::string value;
    std::string effect;
};

/**
 * @brief Shape of a node group the control loop would like to create.
 */
struct NodeGroupTemplate {
    std::string machine_type;
    Labels labels;
    Labels system_labels;
    std::vector<Taint> taints;
    ResourceList extra_resources;
};

using GpuTypeSet = std::unordered_set<std::string>;

// ─────────────────────────────────────────────
// Cloud Provider
// ─────────────────────────────────────────────

class ICloudProvider {
public:
    virtual ~ICloudProvider() = default;

    /// Backend kind, e.g. "rancher". Constant for the instance.
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /**
     * @brief All node groups of the current cache generation.
     *
     * A listing failure is logged and yields an empty vector, so callers
     * cannot tell "zero groups" from "listing failed this tick".
     */
    [[nodiscard]] virtual std::vector<NodeGroupPtr> node_groups() const = 0;

    /**
     * @brief Group owning @p node.
     *
     * Returns a group for managed nodes, nullptr for nodes this provider
     * does not manage, and a DataIntegrity error for cached nodes without
     * a pool assignment.
     */
    [[nodiscard]] virtual Result<NodeGroupPtr> node_group_for_node(const Node& node) const = 0;

    [[nodiscard]] virtual Result<std::shared_ptr<IPricingModel>> pricing() const = 0;
    [[nodiscard]] virtual Result<std::vector<std::string>> available_machine_types() const = 0;
    [[nodiscard]] virtual Result<NodeGroupPtr> new_node_group(const NodeGroupTemplate& spec) = 0;

    /// The limiter passed at construction, same instance.
    [[nodiscard]] virtual Result<std::shared_ptr<const ResourceLimiter>> get_resource_limiter() const = 0;

    [[nodiscard]] virtual std::string_view gpu_label() const noexcept = 0;
    [[nodiscard]] virtual GpuTypeSet available_gpu_types() const = 0;

    /// Release backend resources. A second call is a no-op.
    virtual Status cleanup() = 0;

    /// Pull backend state and install it as the next cache generation.
    virtual Status refresh() = 0;

    /// Generation visible to readers; 0 until the first successful refresh.
    /// Never decreases, cleanup included.
    [[nodiscard]] virtual uint64_t generation() const noexcept = 0;
};

}  // namespace cluster_scaler
