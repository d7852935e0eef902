/**
 * @file attempt.cpp
 * @brief Labels and tallies for attempt outcomes.
 */
#include "skufall/provision/attempt.hpp"

#include <algorithm>

namespace skufall::provision {

std::string_view to_string(FailureClass c) noexcept {
    switch (c) {
        case FailureClass::Uniform:  return "failure";
        case FailureClass::TimedOut: return "timed_out";
    }
    return "failure";
}

std::string_view to_string(RunState s) noexcept {
    switch (s) {
        case RunState::Pending:     return "pending";
        case RunState::Trying:      return "trying";
        case RunState::Provisioned: return "provisioned";
        case RunState::Exhausted:   return "exhausted";
    }
    return "unknown";
}

std::size_t AttemptLog::failures() const noexcept {
    return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(),
        [](const AttemptRecord& r) { return !r.outcome.succeeded(); }));
}

} // namespace skufall::provision
