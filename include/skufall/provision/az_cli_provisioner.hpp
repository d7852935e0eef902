#pragma once
/**
 * @file az_cli_provisioner.hpp
 * @brief Provisioning Operation backed by `az aks nodepool add` run as a child process.
 */

#include <chrono>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "skufall/config/constants.hpp"
#include "skufall/os/process.hpp"
#include "skufall/provision/provisioner.hpp"

namespace skufall::provision {

/** @struct AzCliOptions
 *  @brief How to invoke the Azure CLI.
 */
struct AzCliOptions {
    std::string binary{config::constants::AZ_BINARY_DEFAULT}; ///< Name on PATH or absolute path
    std::chrono::seconds attempt_timeout{config::constants::ATTEMPT_TIMEOUT_S_DEFAULT}; ///< 0 = none
    std::size_t max_output_bytes{config::constants::OUTPUT_CAPTURE_LIMIT};
};

/**
 * @brief Arguments (after the binary) for one `az aks nodepool add` call.
 *
 * Fixed part: resource group, cluster, pool name, node count, VM size, mode,
 * autoscaler bounds, OS SKU. Zones, labels, taints, spot priority, Kubernetes
 * version, SSH key and managed identity are appended only when set.
 */
std::vector<std::string> nodepool_add_args(const ProvisioningRequest& request);

/// Shell-quoted command line for logs and dry runs.
std::string render_command(const std::string& binary, const std::vector<std::string>& args);

/**
 * @brief Map a finished az child to an attempt result.
 *
 * Not started → exit 127 "could not run". Started but output capture failed →
 * plain failure carrying what was read plus the I/O error. Timed out → failure
 * marked timed_out. Non-zero exit → failure with the raw output. Zero → payload.
 */
ProvisionResult to_provision_result(os::ProcessResult pr, const AzCliOptions& opts);

class AzCliProvisioner final : public Provisioner {
public:
    explicit AzCliProvisioner(AzCliOptions opts) : opts_(std::move(opts)) {}

    /// Exit status 0 → combined output as payload; anything else → ProvisionError with that output.
    ProvisionResult provision(const ProvisioningRequest& request) override;

    const AzCliOptions& options() const noexcept { return opts_; }

private:
    AzCliOptions opts_;
};

/**
 * @class DryRunProvisioner
 * @brief Logs the command each attempt would run and reports success without running it.
 */
class DryRunProvisioner final : public Provisioner {
public:
    explicit DryRunProvisioner(std::string binary = std::string{config::constants::AZ_BINARY_DEFAULT})
        : binary_(std::move(binary)) {}

    ProvisionResult provision(const ProvisioningRequest& request) override;

    /// Command lines rendered so far, in call order.
    const std::vector<std::string>& commands() const noexcept { return commands_; }

private:
    std::string binary_;
    std::vector<std::string> commands_;
};

} // namespace skufall::provision
