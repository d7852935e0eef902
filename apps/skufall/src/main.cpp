/**
 * @file main.cpp
 * @brief skufall: add an AKS user node pool, falling back through prioritized VM SKUs.
 *
 * **Flow**
 * - Parse flags (over an optional JSON config), set up logging.
 * - Build the candidate list (primary, secondary, tertiary).
 * - Resolve the az binary (or use the dry-run backend).
 * - Run the fallback executor; print the winning az output on stdout.
 *
 * **Exit status**
 * - 0 provisioned, 1 every SKU failed, 64 usage/configuration, 127 az not found.
 */

#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "skufall/cli/options.hpp"
#include "skufall/config/constants.hpp"
#include "skufall/obs/logging.hpp"
#include "skufall/obs/observability.hpp"
#include "skufall/os/process.hpp"
#include "skufall/provision/az_cli_provisioner.hpp"
#include "skufall/provision/candidate.hpp"
#include "skufall/provision/fallback_executor.hpp"
#include "skufall/report/report.hpp"
#include "skufall/version.hpp"

using namespace skufall;
using namespace skufall::config::constants;

namespace {

void write_report(const std::string& path, const provision::RunResult& result,
                  const provision::PoolParameters& pool) {
    if (path.empty()) return;
    auto written = report::write_json(path, report::to_json(result, pool));
    if (!written) {
        obs::logger()->error("{}", written.error());
        return;
    }
    obs::logger()->debug("wrote report {} ({} bytes)", path, *written);
}

} // namespace

int main(int argc, char** argv) {
    const std::string program = argc > 0 ? argv[0] : "skufall";

    auto parsed = cli::parse_args(argc, argv);
    if (!parsed) {
        obs::logger()->error("{}", parsed.error().message);
        std::cerr << cli::usage(program);
        return EXIT_CODE_USAGE;
    }
    const cli::Options& opts = *parsed;
    if (opts.show_help) {
        std::cout << cli::usage(program);
        return EXIT_CODE_OK;
    }
    if (opts.show_version) {
        std::cout << "skufall " << version_string << "\n";
        return EXIT_CODE_OK;
    }

    const auto level = obs::parse_level(opts.run.logging.level);
    if (!level) {
        obs::logger()->error("logging.level: unknown level '{}'", opts.run.logging.level);
        return EXIT_CODE_USAGE;
    }
    obs::init_logging(*level);
    auto log = obs::logger();

    auto candidates = provision::build_candidates(opts.run.skus);
    if (!candidates) {
        log->error("{}", to_string(candidates.error()));
        std::cerr << cli::usage(program);
        return EXIT_CODE_USAGE;
    }

    std::unique_ptr<provision::Provisioner> backend;
    if (opts.run.executor.dry_run) {
        backend = std::make_unique<provision::DryRunProvisioner>(opts.run.executor.az_binary);
    } else {
        const auto az = os::find_in_path(opts.run.executor.az_binary);
        if (!az) {
            log->error("Required command '{}' not found in PATH", opts.run.executor.az_binary);
            return EXIT_CODE_MISSING_BINARY;
        }
        provision::AzCliOptions az_opts;
        az_opts.binary = *az;
        az_opts.attempt_timeout = std::chrono::seconds(opts.run.executor.attempt_timeout_s);
        backend = std::make_unique<provision::AzCliProvisioner>(std::move(az_opts));
    }

    log->debug("candidates: {}", provision::join_ids(*candidates));
    provision::FallbackExecutor executor(*backend, obs::make_log_observer());
    const provision::RunResult result = executor.run(*candidates, opts.run.pool);
    write_report(opts.report_path, result, opts.run.pool);

    report::log_verdict(*log, result);
    if (result) {
        std::cout << result->output;
        std::cout.flush();
    }
    return report::exit_code_for(result);
}
