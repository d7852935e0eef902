#pragma once
/**
 * @file provisioner.hpp
 * @brief Pluggable Provisioning Operation: create the pool with one candidate, synchronously.
 * @details The az CLI backend is the production implementation; tests script outcomes.
 */

#include <string>

#include "skufall/compat/expected.hpp"
#include "skufall/provision/request.hpp"

namespace skufall::provision {

/** @struct ProvisionError
 *  @brief Error return of the Provisioning Operation.
 */
struct ProvisionError {
    std::string diagnostic;  ///< Human-readable text (raw output of the backend)
    int         exit_code{1}; ///< Backend status, when it has one
    bool        timed_out{false}; ///< The invocation was cut off by its timeout
};

/// Success payload is opaque text; the engine never parses it.
using ProvisionResult = skufall_detail::expected<std::string, ProvisionError>;

class Provisioner {
public:
    virtual ~Provisioner() = default;

    /**
     * @brief Create the pool described by @p request. Blocks until the backend finishes.
     * @note Not idempotent; the executor calls it at most once per candidate.
     */
    virtual ProvisionResult provision(const ProvisioningRequest& request) = 0;
};

} // namespace skufall::provision
