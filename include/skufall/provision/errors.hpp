#pragma once
/**
 * @file errors.hpp
 * @brief Error values reported by the candidate builder, request construction and executor.
 * @details Nothing in the engine throws; every fallible call returns skufall_detail::expected.
 */

#include <cstdint>
#include <string>
#include <string_view>

namespace skufall::provision {

/**
 * @enum EngineErrc
 * @brief Errors that propagate out of a fallback run.
 *
 * Individual attempt failures are absorbed into the AttemptLog and never appear here.
 */
enum class EngineErrc : std::uint8_t {
    Configuration, ///< Invalid/missing input, raised before any attempt
    Exhausted      ///< Every candidate was attempted and failed
};

/** @struct ConfigurationError
 *  @brief Invalid or missing input detected before anything is invoked.
 */
struct ConfigurationError {
    std::string field;   ///< Offending parameter, e.g. "sku-primary" or "pool.max_count"
    std::string message; ///< Human readable reason

    bool operator==(const ConfigurationError&) const = default;
};

/// Render as "<field>: <message>" (or just the message when no field is known).
std::string to_string(const ConfigurationError& e);

/// Stable lowercase label ("configuration", "exhausted").
std::string_view to_string(EngineErrc code) noexcept;

} // namespace skufall::provision
