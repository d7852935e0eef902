/**
 * @file candidate.cpp
 * @brief Candidate list construction and invariant checks.
 */
#include "skufall/provision/candidate.hpp"
#include "skufall/config/constants.hpp"

#include <algorithm>
#include <array>

namespace skufall::provision {

namespace {
bool contains_id(const CandidateList& list, std::string_view id) {
    return std::any_of(list.begin(), list.end(),
                       [&](const Candidate& c) { return c.id == id; });
}
} // namespace

skufall_detail::expected<CandidateList, ConfigurationError>
build_candidates(const CandidateSpec& spec) {
    return build_candidates(spec.primary, spec.secondary, spec.tertiary);
}

skufall_detail::expected<CandidateList, ConfigurationError>
build_candidates(std::string_view primary, std::string_view secondary, std::string_view tertiary) {
    using config::constants::RANK_PRIMARY;

    if (primary.empty()) {
        return skufall_detail::unexpected<ConfigurationError>{
            ConfigurationError{"sku-primary", "primary SKU must not be empty"}};
    }

    CandidateList out;
    out.reserve(1 + config::constants::MAX_FALLBACK_SKUS);
    out.push_back(Candidate{std::string(primary), RANK_PRIMARY});

    // Rank is the slot, not the position: a lone tertiary keeps rank 3.
    const std::array<std::string_view, config::constants::MAX_FALLBACK_SKUS> fallbacks{secondary, tertiary};
    std::uint8_t rank = RANK_PRIMARY;
    for (const auto id : fallbacks) {
        ++rank;
        if (id.empty() || contains_id(out, id)) continue;
        out.push_back(Candidate{std::string(id), rank});
    }
    return out;
}

skufall_detail::expected<std::size_t, ConfigurationError>
check_candidates(const CandidateList& candidates) {
    if (candidates.empty() || candidates.front().id.empty()) {
        return skufall_detail::unexpected<ConfigurationError>{
            ConfigurationError{"sku-primary", "primary SKU must not be empty"}};
    }
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        const auto& c = candidates[i];
        if (c.id.empty()) {
            return skufall_detail::unexpected<ConfigurationError>{
                ConfigurationError{"candidates", "candidate at rank " + std::to_string(c.rank) + " has an empty SKU"}};
        }
        if (i > 0 && c.rank <= candidates[i - 1].rank) {
            return skufall_detail::unexpected<ConfigurationError>{
                ConfigurationError{"candidates", "ranks must strictly increase (got " +
                                   std::to_string(candidates[i - 1].rank) + " then " +
                                   std::to_string(c.rank) + ")"}};
        }
        for (std::size_t j = 0; j < i; ++j) {
            if (candidates[j].id == c.id) {
                return skufall_detail::unexpected<ConfigurationError>{
                    ConfigurationError{"candidates", "SKU '" + c.id + "' is listed more than once"}};
            }
        }
    }
    return candidates.size();
}

std::string join_ids(const CandidateList& candidates) {
    std::string out;
    for (const auto& c : candidates) {
        if (!out.empty()) out.push_back(' ');
        out += c.id;
    }
    return out;
}

} // namespace skufall::provision
