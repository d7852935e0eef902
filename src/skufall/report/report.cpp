/**
 * @file report.cpp
 * @brief JSON rendering of a run, verdict line and exit status mapping.
 */
#include "skufall/report/report.hpp"
#include "skufall/config/constants.hpp"

#include <fstream>

namespace skufall::report {

using nlohmann::json;
using provision::AttemptLog;
using provision::EngineErrc;

namespace {

json attempts_to_json(const AttemptLog& log) {
    json out = json::array();
    for (const auto& rec : log) {
        json a{
            {"rank", rec.candidate.rank},
            {"sku", rec.candidate.id},
            {"outcome", rec.outcome.succeeded() ? "success" : "failure"},
            {"output", rec.outcome.output()},
        };
        a["failure_class"] = rec.outcome.succeeded()
            ? json(nullptr)
            : json(provision::to_string(rec.outcome.failure_class()));
        out.push_back(std::move(a));
    }
    return out;
}

} // namespace

json to_json(const provision::RunResult& result, const provision::PoolParameters& pool) {
    json doc{
        {"pool", {
            {"resource_group", pool.resource_group},
            {"cluster_name", pool.cluster_name},
            {"location", pool.location},
            {"name", pool.pool_name},
        }},
        {"message", summary_line(result)},
    };

    if (result) {
        doc["status"] = "provisioned";
        doc["selected_sku"] = result->candidate.id;
        doc["attempts"] = attempts_to_json(result->attempts);
        return doc;
    }

    const auto& err = result.error();
    doc["status"] = std::string(provision::to_string(err.code));
    doc["selected_sku"] = nullptr;
    if (err.code == EngineErrc::Configuration) doc["field"] = err.field;
    doc["attempts"] = attempts_to_json(err.attempts);
    return doc;
}

std::string summary_line(const provision::RunResult& result) {
    if (result) {
        return "Node pool provisioning completed using SKU '" + result->candidate.id + "'";
    }
    const auto& err = result.error();
    if (err.code == EngineErrc::Configuration) {
        return to_string(provision::ConfigurationError{err.field, err.message});
    }
    return err.message;
}

void log_verdict(spdlog::logger& log, const provision::RunResult& result) {
    if (result) {
        log.info("{}", summary_line(result));
        return;
    }
    log.error("{}", summary_line(result));
    for (const auto& rec : result.error().attempts) {
        log.debug("  [{}] {}: {}", rec.candidate.rank, rec.candidate.id, rec.outcome.output());
    }
}

int exit_code_for(const provision::RunResult& result) noexcept {
    using namespace config::constants;
    if (result) return EXIT_CODE_OK;
    return result.error().code == EngineErrc::Configuration ? EXIT_CODE_USAGE : EXIT_CODE_EXHAUSTED;
}

skufall_detail::expected<std::size_t, std::string>
write_json(const std::string& path, const json& doc) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return skufall_detail::unexpected<std::string>{"unable to open report file: " + path};
    }
    const std::string text = doc.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
    out << text;
    out.flush();
    if (!out) {
        return skufall_detail::unexpected<std::string>{"failed writing report file: " + path};
    }
    return text.size();
}

} // namespace skufall::report
