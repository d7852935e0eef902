/**
 * @file az_cli_provisioner.cpp
 * @brief az CLI argument construction and child-process invocation.
 */
#include "skufall/provision/az_cli_provisioner.hpp"
#include "skufall/obs/logging.hpp"
#include "skufall/os/process.hpp"

#include <spdlog/spdlog.h>

namespace skufall::provision {

using namespace skufall::config::constants;

std::vector<std::string> nodepool_add_args(const ProvisioningRequest& request) {
    const PoolParameters& p = request.pool();
    std::vector<std::string> args{
        "aks", "nodepool", "add",
        "--resource-group", p.resource_group,
        "--cluster-name", p.cluster_name,
        "--name", p.pool_name,
        "--node-count", std::to_string(p.node_count),
        "--node-vm-size", request.sku(),
        "--mode", p.mode,
        "--min-count", std::to_string(p.min_count),
        "--max-count", std::to_string(p.max_count),
        "--enable-cluster-autoscaler",
        "--os-sku", p.os_sku,
    };

    if (!p.zones.empty()) {
        args.emplace_back("--zones");
        args.insert(args.end(), p.zones.begin(), p.zones.end());
    }
    if (!p.labels.empty()) {
        args.emplace_back("--labels");
        args.push_back(p.labels);
    }
    if (!p.taints.empty()) {
        args.emplace_back("--node-taints");
        args.push_back(p.taints);
    }
    if (p.spot) {
        args.emplace_back("--priority");
        args.emplace_back(SPOT_PRIORITY);
    }
    if (!p.kubernetes_version.empty()) {
        args.emplace_back("--kubernetes-version");
        args.push_back(p.kubernetes_version);
    }
    if (!p.ssh_key.empty()) {
        args.emplace_back("--ssh-key-value");
        args.push_back(p.ssh_key);
    }
    if (!p.managed_identity.empty()) {
        args.emplace_back("--assign-identity");
        args.push_back(p.managed_identity);
    }
    return args;
}

static std::string shell_quote(const std::string& s) {
    if (s.empty()) return "''";
    const bool plain = s.find_first_not_of(
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789_-.,:=/@+%") == std::string::npos;
    if (plain) return s;
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

std::string render_command(const std::string& binary, const std::vector<std::string>& args) {
    std::string out = shell_quote(binary);
    for (const auto& a : args) {
        out.push_back(' ');
        out += shell_quote(a);
    }
    return out;
}

ProvisionResult AzCliProvisioner::provision(const ProvisioningRequest& request) {
    os::ProcessSpec spec;
    spec.command = opts_.binary;
    spec.args = nodepool_add_args(request);
    spec.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(opts_.attempt_timeout);
    spec.max_output_bytes = opts_.max_output_bytes;

    obs::logger()->debug("exec: {}", render_command(spec.command, spec.args));
    return to_provision_result(os::run_process(spec), opts_);
}

ProvisionResult to_provision_result(os::ProcessResult pr, const AzCliOptions& opts) {
    if (!pr.spawned()) {
        return skufall_detail::unexpected<ProvisionError>{
            ProvisionError{"could not run '" + opts.binary + "': " + pr.error_message, EXIT_CODE_MISSING_BINARY, false}};
    }
    if (pr.timed_out) {
        std::string diag = std::move(pr.output);
        if (!diag.empty() && diag.back() != '\n') diag.push_back('\n');
        diag += "timed out after " + std::to_string(opts.attempt_timeout.count()) + "s";
        return skufall_detail::unexpected<ProvisionError>{ProvisionError{std::move(diag), pr.exit_code, true}};
    }
    if (pr.io_failed()) {
        // The child ran and was stopped; whatever it printed is kept.
        std::string diag = std::move(pr.output);
        if (!diag.empty() && diag.back() != '\n') diag.push_back('\n');
        diag += "lost output of '" + opts.binary + "': " + pr.error_message;
        const int code = pr.exit_code > 0 ? pr.exit_code : 1;
        return skufall_detail::unexpected<ProvisionError>{ProvisionError{std::move(diag), code, false}};
    }
    if (pr.exit_code != 0) {
        // Keep the raw text; only synthesize one when az printed nothing.
        std::string diag = pr.output.empty()
            ? "az exited with status " + std::to_string(pr.exit_code)
            : std::move(pr.output);
        return skufall_detail::unexpected<ProvisionError>{ProvisionError{std::move(diag), pr.exit_code, false}};
    }
    return std::move(pr.output);
}

ProvisionResult DryRunProvisioner::provision(const ProvisioningRequest& request) {
    std::string line = render_command(binary_, nodepool_add_args(request));
    obs::logger()->info("[dry-run] {}", line);
    commands_.push_back(line);
    return line;
}

} // namespace skufall::provision
