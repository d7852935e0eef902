/**
 * @file errors.cpp
 * @brief String rendering for engine errors.
 */
#include "skufall/provision/errors.hpp"

namespace skufall::provision {

std::string to_string(const ConfigurationError& e) {
    if (e.field.empty()) return e.message;
    return e.field + ": " + e.message;
}

std::string_view to_string(EngineErrc code) noexcept {
    switch (code) {
        case EngineErrc::Configuration: return "configuration";
        case EngineErrc::Exhausted:     return "exhausted";
    }
    return "unknown";
}

} // namespace skufall::provision
