#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: named defaults, optionally overridden by a JSON document.
 * @details All defaults reference named constants to avoid magic numbers.
 */

#include <cstdint>
#include <string>
#include <string_view>

#include "skufall/compat/expected.hpp"
#include "skufall/config/constants.hpp"
#include "skufall/provision/candidate.hpp"
#include "skufall/provision/errors.hpp"
#include "skufall/provision/request.hpp"

namespace skufall::config {

    /** @struct ExecutorConfig
     *  @brief Provisioning backend settings.
     */
    struct ExecutorConfig {
        std::string   az_binary{constants::AZ_BINARY_DEFAULT};                ///< az on PATH or absolute path
        std::uint32_t attempt_timeout_s{constants::ATTEMPT_TIMEOUT_S_DEFAULT}; ///< Per-attempt cap, 0 = none
        bool          dry_run{false};                                         ///< Log commands instead of running them

        bool operator==(const ExecutorConfig&) const = default;
    };

    /** @struct LoggingConfig
     *  @brief Process logger settings.
     */
    struct LoggingConfig {
        std::string level{constants::LOG_LEVEL_DEFAULT}; ///< trace|debug|info|warn|error|critical|off

        bool operator==(const LoggingConfig&) const = default;
    };

    /** @struct RunConfig
     *  @brief Aggregate of everything one fallback run needs.
     */
    struct RunConfig {
        provision::PoolParameters pool;     ///< Fixed request parameters
        provision::CandidateSpec  skus;     ///< Primary + optional fallbacks
        ExecutorConfig            executor; ///< Backend settings
        LoggingConfig             logging;  ///< Logger settings

        bool operator==(const RunConfig&) const = default;
    };

    /** @class Loader
     *  @brief Source of run configuration (defaults or parsed files).
     *
     *  Document layout (every key optional, unknown keys rejected):
     *  @code{.json}
     *  {
     *    "pool": { "resource_group": "rg", "cluster_name": "aks", "location": "westeurope",
     *              "name": "memnp", "mode": "User", "node_count": 2, "min_count": 1, "max_count": 5,
     *              "zones": ["1", "2"], "labels": "k=v", "taints": "k=v:NoSchedule", "spot": false,
     *              "os_sku": "Ubuntu", "kubernetes_version": "", "ssh_key": "", "managed_identity": "" },
     *    "skus": { "primary": "Standard_E16s_v5", "secondary": "", "tertiary": "" },
     *    "executor": { "az_binary": "az", "attempt_timeout_seconds": 0, "dry_run": false },
     *    "logging": { "level": "info" }
     *  }
     *  @endcode
     */
    class Loader {
    public:
        /// Named defaults only.
        static RunConfig defaults();

        /**
         * @brief Load configuration from a JSON file on top of defaults().
         * @return RunConfig, or ConfigurationError naming the file/key that was rejected.
         */
        static skufall_detail::expected<RunConfig, provision::ConfigurationError>
        load_from_file(const std::string& path);

        /// Same as load_from_file() for an in-memory document.
        static skufall_detail::expected<RunConfig, provision::ConfigurationError>
        load_from_string(std::string_view json_text);
    };

} // namespace skufall::config
