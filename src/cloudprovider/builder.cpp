/**
 * @file builder.cpp
 * @brief ProviderRegistry and build_cloud_provider.
 */

#include "cloudprovider/builder.hpp"

#include "rancher/rancher_cloud_provider.hpp"

namespace cluster_scaler {

namespace {

constexpr std::string_view kComponent = "builder";

}  // namespace

ProviderRegistry ProviderRegistry::with_builtin_providers() {
    ProviderRegistry registry;
    registry.register_provider(std::string{kRancherProviderName}, &build_rancher);
    return registry;
}

void ProviderRegistry::register_provider(std::string name, ProviderFactory factory) {
    factories_.insert_or_assign(std::move(name), std::move(factory));
}

bool ProviderRegistry::contains(const std::string& name) const {
    return factories_.count(name) > 0;
}

std::vector<std::string> ProviderRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(factories_.size());
    for (const auto& [name, _] : factories_) out.push_back(name);
    return out;
}

Result<std::unique_ptr<ICloudProvider>> ProviderRegistry::build(
    const AutoscalingOptions& options,
    const NodeGroupDiscoveryOptions& discovery,
    std::shared_ptr<const ResourceLimiter> resource_limiter,
    Logger& logger) const {
    auto it = factories_.find(options.cloud_provider);
    if (it == factories_.end()) {
        std::string known;
        for (const auto& name : names()) {
            known += known.empty() ? name : ", " + name;
        }
        return construction_error("unknown cloud provider \"" + options.cloud_provider
                                  + "\" (known: " + known + ")");
    }

    auto provider = it->second(options, discovery, std::move(resource_limiter), logger);
    if (!provider) {
        if (provider.error().is(ErrorKind::Construction)) return provider.error();
        return construction_error(provider.error().message);
    }
    if (!*provider) {
        return construction_error("cloud provider factory for \"" + options.cloud_provider
                                  + "\" returned no provider");
    }

    logger.info(kComponent, "built cloud provider " + std::string{(*provider)->name()});
    return std::move(*provider);
}

Result<std::unique_ptr<ICloudProvider>> build_cloud_provider(
    const AutoscalingOptions& options,
    const NodeGroupDiscoveryOptions& discovery,
    std::shared_ptr<const ResourceLimiter> resource_limiter,
    Logger& logger) {
    static const ProviderRegistry registry = ProviderRegistry::with_builtin_providers();
    return registry.build(options, discovery, std::move(resource_limiter), logger);
}

}  // namespace cluster_scaler
