/**
 * @file mock_client.hpp
 * @brief Scripted IRancherClient for tests and simulation.
 *
 * Returns a static inventory, or a queue of inventories consumed one per
 * fetch. Failures can be injected for the next N fetches, for every
 * mutation, or for the deletion of one node. All calls are recorded. The
 * state lives behind a shared handle so a test can keep steering the client
 * after handing it to a manager.
 */

#pragma once

#include "rancher/rancher_client.hpp"

#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cluster_scaler {

class MockRancherClient : public IRancherClient {
public:
    struct State {
        mutable std::mutex mutex;

        Inventory static_inventory;
        std::deque<Inventory> sequence;
        int failures_remaining{0};
        std::string failure_message{"backend unavailable"};
        std::optional<std::string> mutation_failure;
        std::map<std::string, std::string> delete_failures;  ///< node id -> message
        std::chrono::milliseconds fetch_delay{0};

        size_t fetch_count{0};
        size_t close_count{0};
        bool closed{false};
        std::vector<std::pair<PoolId, int>> scale_calls;
        std::vector<std::pair<PoolId, std::string>> delete_calls;
    };

    MockRancherClient();
    explicit MockRancherClient(Inventory static_inventory);

    Result<Inventory> fetch_inventory() override;
    Status scale_pool(const PoolId& pool_id, int size) override;
    Status delete_node(const PoolId& pool_id, const std::string& node_id) override;
    Status close(std::chrono::milliseconds timeout) override;
    [[nodiscard]] std::string endpoint() const override { return "mock://rancher"; }

    [[nodiscard]] std::shared_ptr<State> state() const { return state_; }

    // Test helpers
    void set_static_inventory(Inventory inventory);
    void push_inventory(Inventory inventory);
    void fail_next_fetches(int count, std::string message = "backend unavailable");
    void fail_mutations(std::string message);
    void fail_delete_of(std::string node_id, std::string message);
    void set_fetch_delay(std::chrono::milliseconds delay);

private:
    std::shared_ptr<State> state_;
};

}  // namespace cluster_scaler
