#pragma once
/**
 * @file report.hpp
 * @brief Operator-facing rendering of a run: JSON document and one-line verdict.
 */

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

#include "skufall/compat/expected.hpp"
#include "skufall/provision/fallback_executor.hpp"

namespace skufall::report {

/**
 * @brief Render the terminal value and every attempt.
 *
 * Keys: status, pool{resource_group, cluster_name, location, name}, selected_sku
 * (null unless provisioned), message, field (configuration errors only),
 * attempts[{rank, sku, outcome, failure_class, output}].
 */
nlohmann::json to_json(const provision::RunResult& result, const provision::PoolParameters& pool);

/// "Node pool provisioning completed using SKU 'B'" / "All SKU attempts failed: A B" / configuration error text.
std::string summary_line(const provision::RunResult& result);

/**
 * @brief Log the verdict: summary at info on success, at error otherwise.
 * @note Per-attempt diagnostics were logged by the observer as they happened;
 *       here they are repeated at debug level only.
 */
void log_verdict(spdlog::logger& log, const provision::RunResult& result);

/// Process exit status: 0 provisioned, 1 exhausted, 64 (EX_USAGE) configuration error.
int exit_code_for(const provision::RunResult& result) noexcept;

/// Write @p doc (pretty printed) to @p path. Returns bytes written or an error message.
skufall_detail::expected<std::size_t, std::string>
write_json(const std::string& path, const nlohmann::json& doc);

} // namespace skufall::report
