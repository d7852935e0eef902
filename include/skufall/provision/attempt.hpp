#pragma once
/**
 * @file attempt.hpp
 * @brief Attempt outcomes, the append-only attempt log and the terminal run values.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "skufall/provision/candidate.hpp"
#include "skufall/provision/errors.hpp"

namespace skufall::provision {

/**
 * @enum FailureClass
 * @brief Coarse tag attached to a failed attempt.
 *
 * The executor never inspects diagnostics: any error is Uniform. TimedOut is set
 * only when the invocation itself reported that it was cut off.
 */
enum class FailureClass : std::uint8_t { Uniform, TimedOut };

/** @enum RunState
 *  @brief Per-run state machine: Pending → Trying* → Provisioned | Exhausted.
 */
enum class RunState : std::uint8_t { Pending, Trying, Provisioned, Exhausted };

std::string_view to_string(FailureClass c) noexcept;
std::string_view to_string(RunState s) noexcept;

/**
 * @class AttemptOutcome
 * @brief Result of one invocation. Immutable after construction.
 */
class AttemptOutcome final {
public:
    static AttemptOutcome success(std::string output) {
        return AttemptOutcome{true, std::move(output), FailureClass::Uniform};
    }
    static AttemptOutcome failure(std::string output, FailureClass cls = FailureClass::Uniform) {
        return AttemptOutcome{false, std::move(output), cls};
    }

    bool succeeded() const noexcept { return ok_; }
    /// Raw payload on success, raw diagnostic on failure.
    const std::string& output() const noexcept { return output_; }
    /// Meaningful only when !succeeded().
    FailureClass failure_class() const noexcept { return cls_; }

    bool operator==(const AttemptOutcome&) const = default;

private:
    AttemptOutcome(bool ok, std::string output, FailureClass cls)
        : ok_(ok), output_(std::move(output)), cls_(cls) {}

    bool         ok_;
    std::string  output_;
    FailureClass cls_;
};

/** @struct AttemptRecord
 *  @brief One (Candidate, AttemptOutcome) pair.
 */
struct AttemptRecord {
    Candidate      candidate;
    AttemptOutcome outcome;

    bool operator==(const AttemptRecord&) const = default;
};

/**
 * @class AttemptLog
 * @brief Append-only, chronologically ordered record of every attempt in a run.
 */
class AttemptLog final {
public:
    using const_iterator = std::vector<AttemptRecord>::const_iterator;

    void append(Candidate candidate, AttemptOutcome outcome) {
        entries_.push_back(AttemptRecord{std::move(candidate), std::move(outcome)});
    }

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    const AttemptRecord& operator[](std::size_t i) const { return entries_[i]; }
    const AttemptRecord& back() const { return entries_.back(); }
    const_iterator begin() const noexcept { return entries_.begin(); }
    const_iterator end() const noexcept { return entries_.end(); }

    /// Number of recorded failures.
    [[nodiscard]] std::size_t failures() const noexcept;

    bool operator==(const AttemptLog&) const = default;

private:
    std::vector<AttemptRecord> entries_;
};

/** @struct Provisioned
 *  @brief Terminal success: first candidate that provisioned, its raw output, full log.
 */
struct Provisioned {
    Candidate   candidate;
    std::string output;
    AttemptLog  attempts;
};

/** @struct EngineError
 *  @brief Terminal failure of a run (configuration rejected or all candidates exhausted).
 */
struct EngineError {
    EngineErrc  code{EngineErrc::Configuration};
    std::string field;    ///< Offending parameter for Configuration; empty for Exhausted
    std::string message;  ///< Operator-facing summary
    AttemptLog  attempts; ///< Empty for Configuration; every failed attempt for Exhausted

    static EngineError configuration(const ConfigurationError& e) {
        return EngineError{EngineErrc::Configuration, e.field, e.message, {}};
    }
};

} // namespace skufall::provision
