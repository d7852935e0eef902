#pragma once
/**
 * @file observability.hpp
 * @brief Observability facade for fallback runs: attempt/run events + counters.
 * @details The executor only emits events; formatting and output belong to the sink.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "skufall/provision/attempt.hpp"

namespace skufall::obs {

    /** @struct Counters
     *  @brief Process-level counters for provisioning runs.
     */
    struct Counters {
        uint64_t runs{0};        ///< Runs that reached a terminal state
        uint64_t attempts{0};    ///< Invocations started
        uint64_t successes{0};   ///< Invocations that succeeded
        uint64_t failures{0};    ///< Invocations that failed (any cause)
        uint64_t fallbacks{0};   ///< Failures followed by another candidate
        uint64_t exhausted{0};   ///< Runs that ended with every candidate failed

        bool operator==(const Counters&) const = default;
    };

    /** @enum AttemptPhase
     *  @brief Point in an attempt's life an event describes.
     */
    enum class AttemptPhase : uint8_t { Started, Succeeded, Failed };

    /** @struct AttemptEvent
     *  @brief Payload describing one step of a single attempt.
     */
    struct AttemptEvent {
        std::string run_id;       ///< "<cluster>/<pool>"
        std::string pool_name;    ///< Node pool being created
        provision::Candidate candidate; ///< Candidate being attempted
        AttemptPhase phase{AttemptPhase::Started};
        std::string diagnostic;   ///< Raw backend output (Succeeded/Failed only)
        provision::FailureClass failure_class{provision::FailureClass::Uniform}; ///< Failed only
        std::chrono::milliseconds elapsed{0}; ///< Invocation wall time (Succeeded/Failed only)
        bool has_next{false};     ///< Failed only: another candidate will be tried
    };

    /** @struct RunEvent
     *  @brief Terminal transition of a run.
     */
    struct RunEvent {
        std::string run_id;
        provision::RunState state{provision::RunState::Pending}; ///< Provisioned or Exhausted
        std::size_t attempts{0};       ///< Attempts made
        std::string selected;          ///< Winning identifier (Provisioned only)
        std::string tried;             ///< Space separated identifiers attempted
    };

    std::string_view to_string(AttemptPhase p) noexcept;

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single attempt event.
        virtual void record(const AttemptEvent& e) = 0;
        /// Record a run's terminal transition.
        virtual void record(const RunEvent& e) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// Apply @p e to @p c (shared by every sink so counting stays consistent).
    void count(Counters& c, const AttemptEvent& e) noexcept;
    void count(Counters& c, const RunEvent& e) noexcept;

    /// Process-wide sink writing human lines + JSON detail through the skufall spdlog logger.
    Observer* make_log_observer();

} // namespace skufall::obs
