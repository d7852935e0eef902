#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the node pool fallback engine and CLI.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          Config Loader (JSON) or command-line flags.
 */

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace skufall::config::constants {

// =====================
// Node Pool Defaults (mirror `az aks nodepool add` conventions)
// =====================
inline constexpr std::string_view POOL_NAME_DEFAULT  = "memnp";  ///< User pool name
inline constexpr std::string_view POOL_MODE_DEFAULT  = "User";   ///< Pool mode passed as --mode
inline constexpr std::string_view OS_SKU_DEFAULT     = "Ubuntu"; ///< Node image family
inline constexpr std::string_view SPOT_PRIORITY      = "Spot";   ///< Value for --priority when spot is requested

inline constexpr uint32_t NODE_COUNT_DEFAULT = 2; ///< Initial node count
inline constexpr uint32_t MIN_COUNT_DEFAULT  = 1; ///< Autoscaler lower bound
inline constexpr uint32_t MAX_COUNT_DEFAULT  = 5; ///< Autoscaler upper bound

// =====================
// Candidate List
// =====================
inline constexpr std::size_t MAX_FALLBACK_SKUS = 2;  ///< Secondary + tertiary
inline constexpr uint8_t     RANK_PRIMARY      = 1;  ///< Rank of the mandatory candidate

// =====================
// Provisioning Backend (az CLI child process)
// =====================
inline constexpr std::string_view AZ_BINARY_DEFAULT          = "az";
inline constexpr uint32_t         ATTEMPT_TIMEOUT_S_DEFAULT  = 0;           ///< 0 = wait for az to finish
inline constexpr uint32_t         TERMINATE_GRACE_MS         = 2000;        ///< SIGTERM → SIGKILL dwell
inline constexpr std::size_t      OUTPUT_CAPTURE_LIMIT       = 1u << 20;    ///< 1 MiB of combined stdout/stderr

// =====================
// Process Exit Contract (kept compatible with the shell tooling it replaces)
// =====================
inline constexpr int EXIT_CODE_OK             = 0;   ///< Pool provisioned
inline constexpr int EXIT_CODE_EXHAUSTED      = 1;   ///< Every candidate failed
inline constexpr int EXIT_CODE_USAGE          = 64;  ///< EX_USAGE: bad/missing arguments or config
inline constexpr int EXIT_CODE_TIMED_OUT      = 124; ///< Child killed after attempt timeout
inline constexpr int EXIT_CODE_MISSING_BINARY = 127; ///< az not found / exec failed

// =====================
// Logging
// =====================
inline constexpr std::string_view LOGGER_NAME       = "skufall";
inline constexpr std::string_view LOG_LEVEL_DEFAULT = "info";
/// ISO-8601 local timestamp, same shape as the operator scripts' `date '+%Y-%m-%dT%H:%M:%S%z'`.
inline constexpr std::string_view LOG_PATTERN       = "[%Y-%m-%dT%H:%M:%S%z] [%^%l%$] %v";

} // namespace skufall::config::constants
