#pragma once
/**
 * @file options.hpp
 * @brief Command-line surface of the skufall tool.
 */

#include <string>
#include <string_view>
#include <vector>

#include "skufall/compat/expected.hpp"
#include "skufall/config/config_loader.hpp"

namespace skufall::cli {

/** @struct Options
 *  @brief Parsed command line, layered over an optional --config file.
 */
struct Options {
    config::RunConfig run;    ///< Effective configuration (defaults < file < flags)
    std::string config_path;  ///< --config, empty if not given
    std::string report_path;  ///< --report, empty if not given
    bool show_help{false};
    bool show_version{false};
};

/** @struct UsageError
 *  @brief Bad or missing arguments; the caller prints usage() and exits with EX_USAGE.
 */
struct UsageError {
    std::string message;
};

/**
 * @brief Parse @p args (argv without the program name).
 *
 * `--zones` consumes values up to the next `--` option. When --help or --version
 * is present no other validation happens. Required: --resource-group,
 * --cluster-name, --location, --sku-primary (from flags or the config file).
 */
skufall_detail::expected<Options, UsageError> parse_args(const std::vector<std::string>& args);

/// Convenience wrapper over main()'s arguments.
skufall_detail::expected<Options, UsageError> parse_args(int argc, const char* const* argv);

/// Usage text for @p program.
std::string usage(std::string_view program);

} // namespace skufall::cli
