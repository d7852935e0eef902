#pragma once
/**
 * @file fallback_executor.hpp
 * @brief Ordered fallback engine: first success wins, every failure is recorded.
 */

#include "skufall/compat/expected.hpp"
#include "skufall/obs/observability.hpp"
#include "skufall/provision/attempt.hpp"
#include "skufall/provision/candidate.hpp"
#include "skufall/provision/provisioner.hpp"
#include "skufall/provision/request.hpp"

namespace skufall::provision {

/// Provisioned on first success; EngineError (Configuration | Exhausted) otherwise.
using RunResult = skufall_detail::expected<Provisioned, EngineError>;

/**
 * @class FallbackExecutor
 * @brief Walks candidates in priority order, one synchronous attempt each.
 *
 * - Parameters and the candidate list are checked before the first invocation;
 *   a violation returns EngineErrc::Configuration with an empty log.
 * - Any error from the provisioner is a Failure: it is logged and the next
 *   candidate is tried immediately (no retry of the same candidate, no backoff).
 * - The first Success ends the run.
 *
 * Not thread-safe; one run at a time. The provisioner and observer must outlive
 * the executor.
 */
class FallbackExecutor final {
public:
    explicit FallbackExecutor(Provisioner& provisioner, obs::Observer* observer = nullptr) noexcept
        : provisioner_(provisioner), observer_(observer) {}

    /**
     * @brief Run the fallback procedure.
     * @param candidates Ordered list (see build_candidates()).
     * @param params Fixed parameters merged into every request.
     */
    RunResult run(const CandidateList& candidates, const PoolParameters& params);

    /// State of the current (or last) run.
    RunState state() const noexcept { return state_; }

private:
    void emit(const obs::AttemptEvent& e) const;
    void emit(const obs::RunEvent& e) const;

    Provisioner&   provisioner_;
    obs::Observer* observer_{nullptr};
    RunState       state_{RunState::Pending};
};

} // namespace skufall::provision
