/**
 * @file observability.cpp
 * @brief spdlog-backed implementation of Observer.
 */
#include "skufall/obs/observability.hpp"
#include "skufall/obs/logging.hpp"

#include <mutex>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace skufall::obs {

    std::string_view to_string(AttemptPhase p) noexcept {
        switch (p) {
            case AttemptPhase::Started:   return "started";
            case AttemptPhase::Succeeded: return "succeeded";
            case AttemptPhase::Failed:    return "failed";
        }
        return "unknown";
    }

    void count(Counters& c, const AttemptEvent& e) noexcept {
        switch (e.phase) {
            case AttemptPhase::Started:   c.attempts++;  break;
            case AttemptPhase::Succeeded: c.successes++; break;
            case AttemptPhase::Failed:
                c.failures++;
                if (e.has_next) c.fallbacks++;
                break;
        }
    }

    void count(Counters& c, const RunEvent& e) noexcept {
        c.runs++;
        if (e.state == provision::RunState::Exhausted) c.exhausted++;
    }

    namespace {

    nlohmann::json to_json(const AttemptEvent& e) {
        nlohmann::json j{
            {"run", e.run_id},
            {"sku", e.candidate.id},
            {"rank", e.candidate.rank},
            {"phase", to_string(e.phase)},
        };
        if (e.phase != AttemptPhase::Started) j["elapsed_ms"] = e.elapsed.count();
        if (e.phase == AttemptPhase::Failed) {
            j["failure_class"] = provision::to_string(e.failure_class);
            j["has_next"] = e.has_next;
        }
        return j;
    }

    nlohmann::json to_json(const RunEvent& e) {
        return nlohmann::json{
            {"run", e.run_id},
            {"state", provision::to_string(e.state)},
            {"attempts", e.attempts},
            {"selected", e.selected},
            {"tried", e.tried},
        };
    }

    class LogObserver : public Observer {
    public:
        void record(const AttemptEvent& e) override {
            std::lock_guard<std::mutex> lk(mu_);
            count(ctr_, e);
            auto lg = logger();
            switch (e.phase) {
                case AttemptPhase::Started:
                    lg->info("Attempting to add node pool '{}' with SKU '{}'", e.pool_name, e.candidate.id);
                    break;
                case AttemptPhase::Succeeded:
                    lg->info("Successfully created node pool '{}' with SKU '{}'", e.pool_name, e.candidate.id);
                    break;
                case AttemptPhase::Failed:
                    lg->error("Failed to create node pool with SKU '{}': {}", e.candidate.id, e.diagnostic);
                    if (e.has_next) lg->info("Retrying with next SKU (if available)");
                    break;
            }
            // Names come from operator input; invalid UTF-8 is replaced rather than thrown on.
            lg->debug("{}", to_json(e).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
        }
        void record(const RunEvent& e) override {
            std::lock_guard<std::mutex> lk(mu_);
            count(ctr_, e);
            logger()->debug("{}", to_json(e).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    private:
        mutable std::mutex mu_;
        Counters ctr_;
    };

    } // namespace

    Observer* make_log_observer() {
        static LogObserver obs; // process-wide singleton
        return &obs;
    }

} // namespace skufall::obs
