/**
 * @file resource_limiter.hpp
 * @brief Immutable cluster-wide minimum and maximum resource bounds.
 */

#pragma once

#include "core/config.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace cluster_scaler {

using ResourceList = std::map<std::string, int64_t>;

inline constexpr std::string_view kResourceCores = "cpu";
inline constexpr std::string_view kResourceMemory = "memory";
inline constexpr std::string_view kResourceNodes = "nodes";

/**
 * @brief Bounds on aggregate cluster resources.
 *
 * Built once at startup and shared by pointer; the provider hands back the
 * same instance it was given.
 */
class ResourceLimiter {
public:
    ResourceLimiter(ResourceList min_limits, ResourceList max_limits);

    /// Limiter built from the [limits] section; memory is stored in bytes.
    static std::shared_ptr<const ResourceLimiter> from_config(const LimitsConfig& limits);

    /// Lower bound for @p resource, 0 when unset.
    [[nodiscard]] int64_t min(std::string_view resource) const;
    /// Upper bound for @p resource, INT64_MAX when unset.
    [[nodiscard]] int64_t max(std::string_view resource) const;

    [[nodiscard]] bool has_limit(std::string_view resource) const;
    [[nodiscard]] std::vector<std::string> resources() const;
    [[nodiscard]] std::string to_string() const;

private:
    ResourceList min_limits_;
    ResourceList max_limits_;
};

}  // namespace cluster_scaler
