/**
 * @file request.cpp
 * @brief Pool parameter validation and per-attempt request construction.
 */
#include "skufall/provision/request.hpp"

namespace skufall::provision {

using namespace skufall::config::constants;

static ConfigurationError missing(const char* field) {
    return ConfigurationError{field, "must not be empty"};
}

std::optional<ConfigurationError> validate(const PoolParameters& p) {
    if (p.resource_group.empty()) return missing("resource-group");
    if (p.cluster_name.empty())   return missing("cluster-name");
    if (p.pool_name.empty())      return missing("pool-name");
    if (p.mode.empty())           return missing("mode");

    // Scaling bounds: min <= count <= max, and the autoscaler needs room for one node.
    if (p.max_count == 0) {
        return ConfigurationError{"max-count", "must be at least 1"};
    }
    if (p.min_count > p.max_count) {
        return ConfigurationError{"min-count", "min-count (" + std::to_string(p.min_count) +
                                  ") exceeds max-count (" + std::to_string(p.max_count) + ")"};
    }
    if (p.node_count < p.min_count || p.node_count > p.max_count) {
        return ConfigurationError{"node-count", "node-count (" + std::to_string(p.node_count) +
                                  ") must lie within [" + std::to_string(p.min_count) + ", " +
                                  std::to_string(p.max_count) + "]"};
    }

    // Passed through verbatim; az decides which image families exist.
    if (p.os_sku.empty()) return missing("os-sku");

    for (const auto& z : p.zones) {
        if (z.empty()) return ConfigurationError{"zones", "zone entries must not be empty"};
    }
    return std::nullopt;
}

skufall_detail::expected<RequestBuilder, ConfigurationError>
RequestBuilder::create(PoolParameters params) {
    if (auto err = validate(params)) {
        return skufall_detail::unexpected<ConfigurationError>{std::move(*err)};
    }
    return RequestBuilder{std::move(params)};
}

ProvisioningRequest RequestBuilder::build(const Candidate& candidate) const {
    return ProvisioningRequest{params_, candidate};
}

} // namespace skufall::provision
