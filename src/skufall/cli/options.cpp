/**
 * @file options.cpp
 * @brief Hand-rolled long-option parser (flags map 1:1 onto RunConfig fields).
 */
#include "skufall/cli/options.hpp"

#include <charconv>
#include <cstdint>
#include <optional>

namespace skufall::cli {

namespace {

using Unexpected = skufall_detail::unexpected<UsageError>;

bool is_flag(const std::string& s) { return s.rfind("--", 0) == 0 || s == "-h"; }

std::optional<std::uint32_t> to_u32(const std::string& s) {
    std::uint32_t v = 0;
    const auto* first = s.data();
    const auto* last = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(first, last, v);
    if (s.empty() || ec != std::errc{} || ptr != last) return std::nullopt;
    return v;
}

/// Cursor over the argument vector with "flag needs a value" handling.
class ArgCursor {
public:
    explicit ArgCursor(const std::vector<std::string>& args) : args_(args) {}

    bool done() const noexcept { return i_ >= args_.size(); }
    const std::string& next() { return args_[i_++]; }
    bool peek_value() const noexcept { return !done() && !is_flag(args_[i_]); }

    skufall_detail::expected<std::string, UsageError> value_for(const std::string& flag) {
        if (done()) return Unexpected{UsageError{"Missing value for " + flag}};
        return args_[i_++];
    }

private:
    const std::vector<std::string>& args_;
    std::size_t i_{0};
};

} // namespace

skufall_detail::expected<Options, UsageError> parse_args(const std::vector<std::string>& args) {
    Options opts;

    // Pass 1: --help/--version short-circuit, --config provides the base layer.
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "-h" || args[i] == "--help") { opts.show_help = true; return opts; }
        if (args[i] == "--version") { opts.show_version = true; return opts; }
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) return Unexpected{UsageError{"Missing value for --config"}};
            opts.config_path = args[i + 1];
        }
    }
    if (!opts.config_path.empty()) {
        auto loaded = config::Loader::load_from_file(opts.config_path);
        if (!loaded) return Unexpected{UsageError{to_string(loaded.error())}};
        opts.run = std::move(*loaded);
    } else {
        opts.run = config::Loader::defaults();
    }

    auto& pool = opts.run.pool;
    auto& skus = opts.run.skus;
    auto& exec = opts.run.executor;

    // Pass 2: flags override file values.
    ArgCursor cur(args);
    while (!cur.done()) {
        const std::string flag = cur.next();

        // Boolean switches
        if (flag == "--spot")    { pool.spot = true; continue; }
        if (flag == "--dry-run") { exec.dry_run = true; continue; }
        if (flag == "--verbose") { opts.run.logging.level = "debug"; continue; }
        if (flag == "--quiet")   { opts.run.logging.level = "warn"; continue; }

        if (flag == "--zones") {
            std::vector<std::string> zones;
            while (cur.peek_value()) zones.push_back(cur.next());
            if (zones.empty()) return Unexpected{UsageError{"Missing value for --zones"}};
            pool.zones = std::move(zones);
            continue;
        }

        // String-valued options
        std::string* target = nullptr;
        if      (flag == "--resource-group")   target = &pool.resource_group;
        else if (flag == "--cluster-name")     target = &pool.cluster_name;
        else if (flag == "--location")         target = &pool.location;
        else if (flag == "--sku-primary")      target = &skus.primary;
        else if (flag == "--sku-secondary")    target = &skus.secondary;
        else if (flag == "--sku-tertiary")     target = &skus.tertiary;
        else if (flag == "--pool-name")        target = &pool.pool_name;
        else if (flag == "--node-labels")      target = &pool.labels;
        else if (flag == "--node-taints")      target = &pool.taints;
        else if (flag == "--os-sku")           target = &pool.os_sku;
        else if (flag == "--k8s-version")      target = &pool.kubernetes_version;
        else if (flag == "--ssh-key")          target = &pool.ssh_key;
        else if (flag == "--managed-identity") target = &pool.managed_identity;
        else if (flag == "--az-binary")        target = &exec.az_binary;
        else if (flag == "--report")           target = &opts.report_path;
        else if (flag == "--config")           target = &opts.config_path; // already applied in pass 1
        if (target) {
            auto v = cur.value_for(flag);
            if (!v) return Unexpected{v.error()};
            *target = std::move(*v);
            continue;
        }

        // Integer-valued options
        std::uint32_t* number = nullptr;
        if      (flag == "--node-count")      number = &pool.node_count;
        else if (flag == "--min-count")       number = &pool.min_count;
        else if (flag == "--max-count")       number = &pool.max_count;
        else if (flag == "--attempt-timeout") number = &exec.attempt_timeout_s;
        if (number) {
            auto v = cur.value_for(flag);
            if (!v) return Unexpected{v.error()};
            const auto parsed = to_u32(*v);
            if (!parsed) return Unexpected{UsageError{"Invalid value for " + flag + ": '" + *v + "'"}};
            *number = *parsed;
            continue;
        }

        return Unexpected{UsageError{"Unknown argument: " + flag}};
    }

    std::string missing;
    const auto require = [&](const std::string& value, const char* name) {
        if (!value.empty()) return;
        if (!missing.empty()) missing.push_back(' ');
        missing += name;
    };
    require(pool.resource_group, "--resource-group");
    require(pool.cluster_name, "--cluster-name");
    require(pool.location, "--location");
    require(skus.primary, "--sku-primary");
    if (!missing.empty()) return Unexpected{UsageError{"Missing required arguments: " + missing}};

    return opts;
}

skufall_detail::expected<Options, UsageError> parse_args(int argc, const char* const* argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return parse_args(args);
}

std::string usage(std::string_view program) {
    const std::string p{program};
    return "Usage: " + p + " \\\n"
        "  --resource-group <name> \\\n"
        "  --cluster-name <name> \\\n"
        "  --location <azure-region> \\\n"
        "  --sku-primary <vm-size> \\\n"
        "  [--sku-secondary <vm-size>] \\\n"
        "  [--sku-tertiary <vm-size>] \\\n"
        "  [--pool-name <nodepool-name>] \\\n"
        "  [--node-count <count>] \\\n"
        "  [--min-count <count>] \\\n"
        "  [--max-count <count>] \\\n"
        "  [--zones <zone1> <zone2> ...] \\\n"
        "  [--node-labels key=value[,key=value...]] \\\n"
        "  [--node-taints key=value:effect[,key=value:effect...]] \\\n"
        "  [--spot] \\\n"
        "  [--os-sku <os-sku>] \\\n"
        "  [--k8s-version <version>] \\\n"
        "  [--ssh-key <path-to-public-key>] \\\n"
        "  [--managed-identity <resource-id>] \\\n"
        "  [--config <file.json>] [--report <file.json>] \\\n"
        "  [--attempt-timeout <seconds>] [--az-binary <path>] \\\n"
        "  [--dry-run] [--verbose|--quiet] [--version] [-h|--help]\n"
        "\n"
        "Attempts to add an AKS user node pool with a prioritized list of VM SKUs.\n"
        "If the primary SKU cannot be provisioned, the secondary and tertiary SKUs\n"
        "(when provided) are tried in order. The first success wins.\n";
}

} // namespace skufall::cli
