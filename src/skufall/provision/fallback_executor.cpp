/**
 * @file fallback_executor.cpp
 * @brief Implementation of the ordered fallback run.
 */
#include "skufall/provision/fallback_executor.hpp"

#include <chrono>

namespace skufall::provision {

void FallbackExecutor::emit(const obs::AttemptEvent& e) const {
    if (observer_) observer_->record(e);
}

void FallbackExecutor::emit(const obs::RunEvent& e) const {
    if (observer_) observer_->record(e);
}

RunResult FallbackExecutor::run(const CandidateList& candidates, const PoolParameters& params) {
    using clock = std::chrono::steady_clock;
    state_ = RunState::Pending;

    // Everything that can be rejected is rejected here, before the first invocation.
    if (auto checked = check_candidates(candidates); !checked) {
        return skufall_detail::unexpected<EngineError>{EngineError::configuration(checked.error())};
    }
    auto builder = RequestBuilder::create(params);
    if (!builder) {
        return skufall_detail::unexpected<EngineError>{EngineError::configuration(builder.error())};
    }

    const std::string run_id = params.cluster_name + "/" + params.pool_name;
    AttemptLog log;
    std::string tried;

    for (std::size_t i = 0; i < candidates.size(); ++i) {
        const Candidate& candidate = candidates[i];
        const ProvisioningRequest request = builder->build(candidate);
        state_ = RunState::Trying;
        if (!tried.empty()) tried.push_back(' ');
        tried += candidate.id;

        emit(obs::AttemptEvent{run_id, params.pool_name, candidate, obs::AttemptPhase::Started,
                               {}, FailureClass::Uniform, std::chrono::milliseconds{0}, false});

        const auto t0 = clock::now();
        ProvisionResult result = provisioner_.provision(request);
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - t0);

        if (result) {
            log.append(candidate, AttemptOutcome::success(*result));
            emit(obs::AttemptEvent{run_id, params.pool_name, candidate, obs::AttemptPhase::Succeeded,
                                   *result, FailureClass::Uniform, elapsed, false});

            state_ = RunState::Provisioned;
            emit(obs::RunEvent{run_id, state_, log.size(), candidate.id, tried});
            return Provisioned{candidate, std::move(*result), std::move(log)};
        }

        // Any error is grounds to fall back; the diagnostic is kept verbatim.
        ProvisionError& err = result.error();
        const FailureClass cls = err.timed_out ? FailureClass::TimedOut : FailureClass::Uniform;
        const bool has_next = i + 1 < candidates.size();
        log.append(candidate, AttemptOutcome::failure(err.diagnostic, cls));
        emit(obs::AttemptEvent{run_id, params.pool_name, candidate, obs::AttemptPhase::Failed,
                               std::move(err.diagnostic), cls, elapsed, has_next});
    }

    state_ = RunState::Exhausted;
    emit(obs::RunEvent{run_id, state_, log.size(), {}, tried});
    return skufall_detail::unexpected<EngineError>{
        EngineError{EngineErrc::Exhausted, {}, "All SKU attempts failed: " + tried, std::move(log)}};
}

} // namespace skufall::provision
