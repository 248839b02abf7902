/**
 * @file mock_client.cpp
 * @brief MockRancherClient implementation.
 */

#include "rancher/mock_client.hpp"

#include <algorithm>
#include <thread>

namespace cluster_scaler {

MockRancherClient::MockRancherClient() : state_(std::make_shared<State>()) {}

MockRancherClient::MockRancherClient(Inventory static_inventory) : MockRancherClient() {
    state_->static_inventory = std::move(static_inventory);
}

Result<Inventory> MockRancherClient::fetch_inventory() {
    std::chrono::milliseconds delay;
    {
        std::lock_guard lock(state_->mutex);
        delay = state_->fetch_delay;
    }
    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }

    std::lock_guard lock(state_->mutex);
    ++state_->fetch_count;
    if (state_->closed) return Error{ErrorKind::Backend, "mock client is closed"};
    if (state_->failures_remaining > 0) {
        --state_->failures_remaining;
        return Error{ErrorKind::Backend, state_->failure_message};
    }
    if (!state_->sequence.empty()) {
        auto next = std::move(state_->sequence.front());
        state_->sequence.pop_front();
        return next;
    }
    return state_->static_inventory;
}

Status MockRancherClient::scale_pool(const PoolId& pool_id, int size) {
    std::lock_guard lock(state_->mutex);
    state_->scale_calls.emplace_back(pool_id, size);
    if (state_->mutation_failure) return Error{ErrorKind::Backend, *state_->mutation_failure};

    auto& pools = state_->static_inventory.pools;
    auto it = std::find_if(pools.begin(), pools.end(),
                           [&](const PoolInfo& p) { return p.id == pool_id; });
    if (it != pools.end()) it->target_size = size;
    return ok();
}

Status MockRancherClient::delete_node(const PoolId& pool_id, const std::string& node_id) {
    std::lock_guard lock(state_->mutex);
    state_->delete_calls.emplace_back(pool_id, node_id);
    if (state_->mutation_failure) return Error{ErrorKind::Backend, *state_->mutation_failure};
    if (auto it = state_->delete_failures.find(node_id); it != state_->delete_failures.end()) {
        return Error{ErrorKind::Backend, it->second};
    }

    auto& nodes = state_->static_inventory.nodes;
    nodes.erase(std::remove_if(nodes.begin(), nodes.end(),
                               [&](const NodeRecord& n) { return n.id == node_id; }),
                nodes.end());
    return ok();
}

Status MockRancherClient::close(std::chrono::milliseconds /*timeout*/) {
    std::lock_guard lock(state_->mutex);
    ++state_->close_count;
    state_->closed = true;
    return ok();
}

void MockRancherClient::set_static_inventory(Inventory inventory) {
    std::lock_guard lock(state_->mutex);
    state_->static_inventory = std::move(inventory);
}

void MockRancherClient::push_inventory(Inventory inventory) {
    std::lock_guard lock(state_->mutex);
    state_->sequence.push_back(std::move(inventory));
}

void MockRancherClient::fail_next_fetches(int count, std::string message) {
    std::lock_guard lock(state_->mutex);
    state_->failures_remaining = count;
    state_->failure_message = std::move(message);
}

void MockRancherClient::fail_mutations(std::string message) {
    std::lock_guard lock(state_->mutex);
    state_->mutation_failure = std::move(message);
}

void MockRancherClient::fail_delete_of(std::string node_id, std::string message) {
    std::lock_guard lock(state_->mutex);
    state_->delete_failures.insert_or_assign(std::move(node_id), std::move(message));
}

void MockRancherClient::set_fetch_delay(std::chrono::milliseconds delay) {
    std::lock_guard lock(state_->mutex);
    state_->fetch_delay = delay;
}

}  // namespace cluster_scaler
