/**
 * @file logging.cpp
 * @brief spdlog wiring for the CLI and the log observer.
 */
#include "skufall/obs/logging.hpp"
#include "skufall/config/constants.hpp"

#include <array>
#include <string>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace skufall::obs {

using namespace skufall::config::constants;

std::optional<spdlog::level::level_enum> parse_level(std::string_view name) noexcept {
    using spdlog::level::level_enum;
    static constexpr std::array<std::pair<std::string_view, level_enum>, 8> table{{
        {"trace", level_enum::trace},
        {"debug", level_enum::debug},
        {"info", level_enum::info},
        {"warn", level_enum::warn},
        {"warning", level_enum::warn},
        {"error", level_enum::err},
        {"critical", level_enum::critical},
        {"off", level_enum::off},
    }};
    for (const auto& [label, lvl] : table) {
        if (label == name) return lvl;
    }
    return std::nullopt;
}

std::shared_ptr<spdlog::logger> init_logging(spdlog::level::level_enum level) {
    const std::string name{LOGGER_NAME};
    spdlog::drop(name);
    auto lg = spdlog::stderr_color_mt(name);
    lg->set_pattern(std::string{LOG_PATTERN});
    lg->set_level(level);
    lg->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(lg);
    return lg;
}

std::shared_ptr<spdlog::logger> logger() {
    if (auto lg = spdlog::get(std::string{LOGGER_NAME})) return lg;
    return init_logging(spdlog::level::info);
}

} // namespace skufall::obs
