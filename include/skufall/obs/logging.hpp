#pragma once
/**
 * @file logging.hpp
 * @brief Process logger setup (spdlog, stderr, ISO-8601 timestamps).
 */

#include <memory>
#include <optional>
#include <string_view>

#include <spdlog/logger.h>

namespace skufall::obs {

/**
 * @brief Map a config/CLI level name to spdlog's level.
 * @return std::nullopt for names other than trace|debug|info|warn|warning|error|critical|off.
 */
std::optional<spdlog::level::level_enum> parse_level(std::string_view name) noexcept;

/**
 * @brief (Re)create the "skufall" stderr logger at @p level and make it the default logger.
 * @return The configured logger.
 */
std::shared_ptr<spdlog::logger> init_logging(spdlog::level::level_enum level);

/// The "skufall" logger; created at info level on first use if init_logging() was not called.
std::shared_ptr<spdlog::logger> logger();

} // namespace skufall::obs
