/**
 * @file node_group_spec.cpp
 * @brief Node group spec parser.
 */

#include "cloudprovider/node_group_spec.hpp"

#include <charconv>
#include <unordered_set>

namespace cluster_scaler {

namespace {

bool parse_int(std::string_view text, int& out) {
    if (text.empty()) return false;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

}  // namespace

Result<NodeGroupSpec> parse_node_group_spec(std::string_view text) {
    auto first = text.find(':');
    auto second = first == std::string_view::npos ? first : text.find(':', first + 1);
    if (second == std::string_view::npos) {
        return invalid_argument("node group spec must be <min>:<max>:<id>, got \""
                                + std::string{text} + "\"");
    }

    NodeGroupSpec spec;
    if (!parse_int(text.substr(0, first), spec.min_size)) {
        return invalid_argument("invalid min size in node group spec \"" + std::string{text} + "\"");
    }
    if (!parse_int(text.substr(first + 1, second - first - 1), spec.max_size)) {
        return invalid_argument("invalid max size in node group spec \"" + std::string{text} + "\"");
    }
    spec.pool_id = std::string{text.substr(second + 1)};

    if (spec.min_size < 0) {
        return invalid_argument("min size must be >= 0 in node group spec \"" + std::string{text} + "\"");
    }
    if (spec.max_size < spec.min_size) {
        return invalid_argument("max size must be >= min size in node group spec \""
                                + std::string{text} + "\"");
    }
    if (spec.max_size == 0) {
        return invalid_argument("max size must be greater than 0 in node group spec \""
                                + std::string{text} + "\"");
    }
    if (spec.pool_id.empty()) {
        return invalid_argument("empty pool id in node group spec \"" + std::string{text} + "\"");
    }
    return spec;
}

Result<std::vector<NodeGroupSpec>> parse_node_group_specs(const std::vector<std::string>& texts) {
    std::vector<NodeGroupSpec> specs;
    std::unordered_set<PoolId> seen;
    specs.reserve(texts.size());

    for (const auto& text : texts) {
        auto spec = parse_node_group_spec(text);
        if (!spec) return spec.error();
        if (!seen.insert(spec->pool_id).second) {
            return invalid_argument("pool " + spec->pool_id + " listed in more than one node group spec");
        }
        specs.push_back(std::move(*spec));
    }
    return specs;
}

}  // namespace cluster_scaler
