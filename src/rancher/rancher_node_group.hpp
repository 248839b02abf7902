/**
 * @file rancher_node_group.hpp
 * @brief Node group handle backed by the RancherManager cache.
 */

#pragma once

#include "cloudprovider/cloud_provider.hpp"
#include "rancher/rancher_manager.hpp"

#include <memory>
#include <string>

namespace cluster_scaler {

/**
 * @brief Handle {manager, pool id}. Holds no pool state of its own.
 */
class RancherNodeGroup : public INodeGroup {
public:
    RancherNodeGroup(std::shared_ptr<RancherManager> manager, PoolId id);

    [[nodiscard]] const std::string& id() const noexcept override { return id_; }
    [[nodiscard]] std::string debug() const override;

    [[nodiscard]] int min_size() const override;
    [[nodiscard]] int max_size() const override;
    [[nodiscard]] Result<int> target_size() const override;
    [[nodiscard]] Result<std::vector<Instance>> nodes() const override;
    [[nodiscard]] bool exist() const override;

    Status increase_size(int delta) override;
    Status decrease_target_size(int delta) override;
    Status delete_nodes(const std::vector<Node>& nodes) override;

    Result<std::shared_ptr<INodeGroup>> create() override;
    Status destroy() override;
    [[nodiscard]] bool autoprovisioned() const override { return false; }

private:
    [[nodiscard]] Error pool_missing() const;

    std::shared_ptr<RancherManager> manager_;
    PoolId id_;
};

}  // namespace cluster_scaler
