#pragma once
/**
 * @file candidate.hpp
 * @brief Candidate model and the builder of the priority-ordered candidate list.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "skufall/compat/expected.hpp"
#include "skufall/provision/errors.hpp"

namespace skufall::provision {

/**
 * @brief One configuration to try, e.g. a VM size such as "Standard_E16s_v5".
 *
 * The identifier is opaque to the engine. Rank is the fixed priority slot the
 * identifier was supplied in (1 = primary, 2 = secondary, 3 = tertiary).
 */
struct Candidate final {
    std::string  id;     ///< Opaque configuration identifier (SKU)
    std::uint8_t rank{0}; ///< Priority slot, strictly increasing in attempt order

    bool operator==(const Candidate&) const = default;
};

using CandidateList = std::vector<Candidate>;

/** @struct CandidateSpec
 *  @brief Raw identifiers as supplied by the caller. Empty means "not configured".
 */
struct CandidateSpec {
    std::string primary;   ///< Required
    std::string secondary; ///< Optional fallback
    std::string tertiary;  ///< Optional fallback

    bool operator==(const CandidateSpec&) const = default;
};

/**
 * @brief Build the ordered candidate list: primary, then secondary, then tertiary.
 *
 * Empty fallbacks are omitted. A fallback repeating an identifier already in the
 * list is dropped, so an identifier is never attempted twice.
 *
 * @return The list (size 1..3), or ConfigurationError when the primary is empty.
 */
skufall_detail::expected<CandidateList, ConfigurationError>
build_candidates(const CandidateSpec& spec);

/// Convenience overload for call sites holding plain strings.
skufall_detail::expected<CandidateList, ConfigurationError>
build_candidates(std::string_view primary,
                 std::string_view secondary = {},
                 std::string_view tertiary = {});

/**
 * @brief Check the list invariants the executor relies on.
 * @return Number of candidates, or ConfigurationError describing the first violation.
 * @details Non-empty list, non-empty identifiers, strictly increasing ranks, no duplicates.
 */
skufall_detail::expected<std::size_t, ConfigurationError>
check_candidates(const CandidateList& candidates);

/// Space separated identifiers in attempt order ("A B C").
std::string join_ids(const CandidateList& candidates);

} // namespace skufall::provision
