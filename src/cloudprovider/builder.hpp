/**
 * @file builder.hpp
 * @brief Provider selection by name and construction at startup.
 *
 * The provider is picked once from AutoscalingOptions::cloud_provider; the
 * control loop then only ever sees ICloudProvider. Builders never terminate
 * the process: a Construction error is returned and main() decides.
 */

#pragma once

#include "cloudprovider/cloud_provider.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace cluster_scaler {

using ProviderFactory = std::function<Result<std::unique_ptr<ICloudProvider>>(
    const AutoscalingOptions&,
    const NodeGroupDiscoveryOptions&,
    std::shared_ptr<const ResourceLimiter>,
    Logger&)>;

class ProviderRegistry {
public:
    /// Registry holding every provider compiled into this binary.
    static ProviderRegistry with_builtin_providers();

    /// Add or replace the factory for @p name.
    void register_provider(std::string name, ProviderFactory factory);

    [[nodiscard]] bool contains(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> names() const;

    Result<std::unique_ptr<ICloudProvider>> build(const AutoscalingOptions& options,
                                                  const NodeGroupDiscoveryOptions& discovery,
                                                  std::shared_ptr<const ResourceLimiter> resource_limiter,
                                                  Logger& logger) const;

private:
    std::map<std::string, ProviderFactory> factories_;
};

/**
 * @brief Build the provider named by @p options with the builtin registry.
 */
Result<std::unique_ptr<ICloudProvider>> build_cloud_provider(
    const AutoscalingOptions& options,
    const NodeGroupDiscoveryOptions& discovery,
    std::shared_ptr<const ResourceLimiter> resource_limiter,
    Logger& logger);

}  // namespace cluster_scaler
