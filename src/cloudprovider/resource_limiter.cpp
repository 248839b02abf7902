/**
 * @file resource_limiter.cpp
 * @brief ResourceLimiter implementation.
 */

#include "cloudprovider/resource_limiter.hpp"

#include <limits>
#include <set>
#include <sstream>

namespace cluster_scaler {

ResourceLimiter::ResourceLimiter(ResourceList min_limits, ResourceList max_limits)
    : min_limits_(std::move(min_limits)), max_limits_(std::move(max_limits)) {}

std::shared_ptr<const ResourceLimiter> ResourceLimiter::from_config(const LimitsConfig& limits) {
    constexpr int64_t kMiB = 1024 * 1024;
    ResourceList min_limits{
        {std::string{kResourceCores}, limits.cores_min},
        {std::string{kResourceMemory}, limits.memory_min_mb * kMiB},
        {std::string{kResourceNodes}, limits.nodes_min},
    };
    ResourceList max_limits{
        {std::string{kResourceCores}, limits.cores_max},
        {std::string{kResourceMemory}, limits.memory_max_mb * kMiB},
        {std::string{kResourceNodes}, limits.nodes_max},
    };
    return std::make_shared<const ResourceLimiter>(std::move(min_limits), std::move(max_limits));
}

int64_t ResourceLimiter::min(std::string_view resource) const {
    auto it = min_limits_.find(std::string{resource});
    return it == min_limits_.end() ? 0 : it->second;
}

int64_t ResourceLimiter::max(std::string_view resource) const {
    auto it = max_limits_.find(std::string{resource});
    return it == max_limits_.end() ? std::numeric_limits<int64_t>::max() : it->second;
}

bool ResourceLimiter::has_limit(std::string_view resource) const {
    std::string key{resource};
    return min_limits_.count(key) > 0 || max_limits_.count(key) > 0;
}

std::vector<std::string> ResourceLimiter::resources() const {
    std::set<std::string> names;
    for (const auto& [name, _] : min_limits_) names.insert(name);
    for (const auto& [name, _] : max_limits_) names.insert(name);
    return {names.begin(), names.end()};
}

std::string ResourceLimiter::to_string() const {
    std::ostringstream oss;
    bool first = true;
    for (const auto& name : resources()) {
        if (!first) oss << ", ";
        first = false;
        oss << '{' << name << " : " << min(name) << " - " << max(name) << '}';
    }
    return oss.str();
}

}  // namespace cluster_scaler
