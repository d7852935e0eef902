/**
* @file config_loader.cpp
 * @brief JSON loader (nlohmann::json) layered over named defaults.
 */
#include "skufall/config/config_loader.hpp"

#include <fstream>
#include <initializer_list>
#include <optional>
#include <sstream>

#include <nlohmann/json.hpp>

namespace skufall::config {
    using nlohmann::json;
    using provision::ConfigurationError;

    namespace {

    using Error = std::optional<ConfigurationError>;

    Error type_error(const std::string& key, const char* expected) {
        return ConfigurationError{key, std::string("expected ") + expected};
    }

    Error reject_unknown(const json& obj, const std::string& section,
                         std::initializer_list<const char*> known) {
        for (const auto& item : obj.items()) {
            bool ok = false;
            for (const char* k : known) {
                if (item.key() == k) { ok = true; break; }
            }
            if (!ok) {
                return ConfigurationError{section.empty() ? item.key() : section + "." + item.key(),
                                          "unknown key"};
            }
        }
        return std::nullopt;
    }

    Error read(const json& obj, const std::string& section, const char* key, std::string& out) {
        if (!obj.contains(key)) return std::nullopt;
        const auto& v = obj.at(key);
        if (!v.is_string()) return type_error(section + "." + key, "a string");
        out = v.get<std::string>();
        return std::nullopt;
    }

    Error read(const json& obj, const std::string& section, const char* key, std::uint32_t& out) {
        if (!obj.contains(key)) return std::nullopt;
        const auto& v = obj.at(key);
        // is_number_unsigned() rejects negatives, which get<uint32_t>() would wrap.
        if (!v.is_number_unsigned() || v.get<std::uint64_t>() > UINT32_MAX) {
            return type_error(section + "." + key, "a non-negative integer");
        }
        out = static_cast<std::uint32_t>(v.get<std::uint64_t>());
        return std::nullopt;
    }

    Error read(const json& obj, const std::string& section, const char* key, bool& out) {
        if (!obj.contains(key)) return std::nullopt;
        const auto& v = obj.at(key);
        if (!v.is_boolean()) return type_error(section + "." + key, "a boolean");
        out = v.get<bool>();
        return std::nullopt;
    }

    Error read(const json& obj, const std::string& section, const char* key, std::vector<std::string>& out) {
        if (!obj.contains(key)) return std::nullopt;
        const auto& v = obj.at(key);
        if (!v.is_array()) return type_error(section + "." + key, "an array of strings");
        std::vector<std::string> tmp;
        for (const auto& e : v) {
            if (!e.is_string()) return type_error(section + "." + key, "an array of strings");
            tmp.push_back(e.get<std::string>());
        }
        out = std::move(tmp);
        return std::nullopt;
    }

    // Returns the section object, or nullptr when absent; sets err on a type mismatch.
    const json* section_of(const json& root, const char* name, Error& err) {
        if (!root.contains(name)) return nullptr;
        const auto& s = root.at(name);
        if (!s.is_object()) {
            err = type_error(name, "an object");
            return nullptr;
        }
        return &s;
    }

    Error apply_pool(const json& s, provision::PoolParameters& p) {
        const std::string sec = "pool";
        if (auto e = reject_unknown(s, sec, {"resource_group", "cluster_name", "location", "name", "mode",
                                             "node_count", "min_count", "max_count", "zones", "labels",
                                             "taints", "spot", "os_sku", "kubernetes_version", "ssh_key",
                                             "managed_identity"})) return e;
        if (auto e = read(s, sec, "resource_group", p.resource_group)) return e;
        if (auto e = read(s, sec, "cluster_name", p.cluster_name)) return e;
        if (auto e = read(s, sec, "location", p.location)) return e;
        if (auto e = read(s, sec, "name", p.pool_name)) return e;
        if (auto e = read(s, sec, "mode", p.mode)) return e;
        if (auto e = read(s, sec, "node_count", p.node_count)) return e;
        if (auto e = read(s, sec, "min_count", p.min_count)) return e;
        if (auto e = read(s, sec, "max_count", p.max_count)) return e;
        if (auto e = read(s, sec, "zones", p.zones)) return e;
        if (auto e = read(s, sec, "labels", p.labels)) return e;
        if (auto e = read(s, sec, "taints", p.taints)) return e;
        if (auto e = read(s, sec, "spot", p.spot)) return e;
        if (auto e = read(s, sec, "os_sku", p.os_sku)) return e;
        if (auto e = read(s, sec, "kubernetes_version", p.kubernetes_version)) return e;
        if (auto e = read(s, sec, "ssh_key", p.ssh_key)) return e;
        return read(s, sec, "managed_identity", p.managed_identity);
    }

    Error apply_skus(const json& s, provision::CandidateSpec& c) {
        const std::string sec = "skus";
        if (auto e = reject_unknown(s, sec, {"primary", "secondary", "tertiary"})) return e;
        if (auto e = read(s, sec, "primary", c.primary)) return e;
        if (auto e = read(s, sec, "secondary", c.secondary)) return e;
        return read(s, sec, "tertiary", c.tertiary);
    }

    Error apply_executor(const json& s, ExecutorConfig& x) {
        const std::string sec = "executor";
        if (auto e = reject_unknown(s, sec, {"az_binary", "attempt_timeout_seconds", "dry_run"})) return e;
        if (auto e = read(s, sec, "az_binary", x.az_binary)) return e;
        if (auto e = read(s, sec, "attempt_timeout_seconds", x.attempt_timeout_s)) return e;
        return read(s, sec, "dry_run", x.dry_run);
    }

    Error apply_logging(const json& s, LoggingConfig& l) {
        const std::string sec = "logging";
        if (auto e = reject_unknown(s, sec, {"level"})) return e;
        return read(s, sec, "level", l.level);
    }

    Error apply_document(const json& root, RunConfig& rc) {
        if (!root.is_object()) return type_error("config", "a JSON object");
        if (auto e = reject_unknown(root, "", {"pool", "skus", "executor", "logging"})) return e;
        Error err;
        if (const json* s = section_of(root, "pool", err)) {
            if (auto e = apply_pool(*s, rc.pool)) return e;
        }
        if (err) return err;
        if (const json* s = section_of(root, "skus", err)) {
            if (auto e = apply_skus(*s, rc.skus)) return e;
        }
        if (err) return err;
        if (const json* s = section_of(root, "executor", err)) {
            if (auto e = apply_executor(*s, rc.executor)) return e;
        }
        if (err) return err;
        if (const json* s = section_of(root, "logging", err)) {
            if (auto e = apply_logging(*s, rc.logging)) return e;
        }
        return err;
    }

    } // namespace

    RunConfig Loader::defaults() {
        return RunConfig{}; // every member defaults from constants
    }

    skufall_detail::expected<RunConfig, ConfigurationError>
    Loader::load_from_string(std::string_view json_text) {
        json root;
        try {
            root = json::parse(json_text.begin(), json_text.end());
        } catch (const json::parse_error& e) {
            return skufall_detail::unexpected<ConfigurationError>{ConfigurationError{"config", e.what()}};
        }

        RunConfig rc = defaults();
        if (auto e = apply_document(root, rc)) {
            return skufall_detail::unexpected<ConfigurationError>{std::move(*e)};
        }
        return rc;
    }

    skufall_detail::expected<RunConfig, ConfigurationError>
    Loader::load_from_file(const std::string& path) {
        std::ifstream in(path);
        if (!in.is_open()) {
            return skufall_detail::unexpected<ConfigurationError>{
                ConfigurationError{"config", "unable to open config file: " + path}};
        }
        std::ostringstream buf;
        buf << in.rdbuf();

        auto rc = load_from_string(buf.str());
        if (!rc) {
            ConfigurationError e = rc.error();
            e.message = path + ": " + e.message;
            return skufall_detail::unexpected<ConfigurationError>{std::move(e)};
        }
        return rc;
    }

} // namespace skufall::config
