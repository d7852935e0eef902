#pragma once
/**
 * @file request.hpp
 * @brief Fixed pool parameters and the immutable per-attempt ProvisioningRequest.
 * @details All defaults reference named constants in constants.hpp.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "skufall/compat/expected.hpp"
#include "skufall/config/constants.hpp"
#include "skufall/provision/candidate.hpp"
#include "skufall/provision/errors.hpp"

namespace skufall::provision {

/** @struct PoolParameters
 *  @brief Everything an attempt needs except the candidate identifier.
 */
struct PoolParameters {
    std::string resource_group;   ///< Target resource group (required)
    std::string cluster_name;     ///< Target AKS cluster (required)
    std::string location;         ///< Azure region of the cluster (informational)
    std::string pool_name{config::constants::POOL_NAME_DEFAULT};          ///< Node pool name
    std::string mode{config::constants::POOL_MODE_DEFAULT};               ///< --mode
    std::uint32_t node_count{config::constants::NODE_COUNT_DEFAULT};      ///< Initial nodes
    std::uint32_t min_count{config::constants::MIN_COUNT_DEFAULT};        ///< Autoscaler min
    std::uint32_t max_count{config::constants::MAX_COUNT_DEFAULT};        ///< Autoscaler max
    std::vector<std::string> zones;  ///< Availability zones; empty = regional
    std::string labels;              ///< "k=v[,k=v...]", passed through untouched
    std::string taints;              ///< "k=v:effect[,...]", passed through untouched
    bool spot{false};                ///< Request Spot priority
    std::string os_sku{config::constants::OS_SKU_DEFAULT};                ///< Node image family
    std::string kubernetes_version;  ///< Optional version pin
    std::string ssh_key;             ///< Optional public key reference
    std::string managed_identity;    ///< Optional identity resource id

    bool operator==(const PoolParameters&) const = default;
};

/**
 * @brief Validate the fixed parameters.
 * @return std::nullopt when valid, otherwise the first violation found.
 */
std::optional<ConfigurationError> validate(const PoolParameters& p);

/**
 * @class ProvisioningRequest
 * @brief Immutable bundle of pool parameters plus the candidate for one attempt.
 *
 * Only RequestBuilder creates requests, so every request carries validated parameters.
 */
class ProvisioningRequest final {
public:
    const Candidate& candidate() const noexcept { return candidate_; }
    const std::string& sku() const noexcept { return candidate_.id; }
    const PoolParameters& pool() const noexcept { return pool_; }

    bool operator==(const ProvisioningRequest&) const = default;

private:
    friend class RequestBuilder;
    ProvisioningRequest(PoolParameters pool, Candidate candidate)
        : pool_(std::move(pool)), candidate_(std::move(candidate)) {}

    PoolParameters pool_;
    Candidate      candidate_;
};

/**
 * @class RequestBuilder
 * @brief Holds validated fixed parameters and stamps out one request per candidate.
 */
class RequestBuilder final {
public:
    /// Validate @p params and return a builder, or the first ConfigurationError.
    static skufall_detail::expected<RequestBuilder, ConfigurationError>
    create(PoolParameters params);

    /// Merge the fixed parameters with @p candidate.
    ProvisioningRequest build(const Candidate& candidate) const;

    const PoolParameters& parameters() const noexcept { return params_; }

private:
    explicit RequestBuilder(PoolParameters params) noexcept : params_(std::move(params)) {}

    PoolParameters params_;
};

} // namespace skufall::provision
