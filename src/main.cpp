#include "catalog/pg_table_registry.hpp"
#include "catalog/table_allowlist.hpp"
#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "executor/bounded_executor.hpp"
#include "executor/connection_pool.hpp"
#include "executor/pg_query_engine.hpp"
#include "security/query_guard.hpp"
#include "security/security_event.hpp"

#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

using namespace querygate;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitRejected = 1;
constexpr int kExitUsage = 2;

struct CliOptions {
    std::string config_file;
    std::string sql;
    Principal principal;
    ExecuteOptions execute;
    bool validate_only = false;
};

void print_usage(std::string_view program) {
    std::cerr << std::format(
        "Usage: {} <config.toml> [--user ID] [--tenant N]... [--super-admin]\n"
        "       [--permission P]... [--limit N] [--timeout-ms N] [--validate-only] <sql>\n",
        program);
}

std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    opts.principal.user_id = "cli";

    std::vector<std::string_view> positional;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        auto next = [&]() -> std::optional<std::string_view> {
            if (i + 1 >= argc) return std::nullopt;
            return std::string_view(argv[++i]);
        };

        if (arg == "--user") {
            const auto v = next();
            if (!v) return std::nullopt;
            opts.principal.user_id = std::string(*v);
        } else if (arg == "--tenant") {
            const auto v = next();
            const auto id = v ? utils::try_parse_int<int64_t>(*v) : std::nullopt;
            if (!id) return std::nullopt;
            opts.principal.tenant_ids.push_back(*id);
        } else if (arg == "--super-admin") {
            opts.principal.is_super_admin = true;
        } else if (arg == "--permission") {
            const auto v = next();
            if (!v) return std::nullopt;
            opts.principal.permissions.emplace(*v);
        } else if (arg == "--limit") {
            const auto v = next();
            opts.execute.row_limit = v ? utils::try_parse_int<int64_t>(*v) : std::nullopt;
            if (!opts.execute.row_limit) return std::nullopt;
        } else if (arg == "--timeout-ms") {
            const auto v = next();
            opts.execute.timeout_ms = v ? utils::try_parse_int<int64_t>(*v) : std::nullopt;
            if (!opts.execute.timeout_ms) return std::nullopt;
        } else if (arg == "--validate-only") {
            opts.validate_only = true;
        } else if (arg.starts_with("--")) {
            return std::nullopt;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) return std::nullopt;
    opts.config_file = std::string(positional[0]);
    opts.sql = std::string(positional[1]);
    return opts;
}

// ============================================================================
// JSON output
// ============================================================================

std::string json_string_array(const std::vector<std::string>& items) {
    std::string out = "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ',';
        out += std::format("\"{}\"", utils::escape_json(items[i]));
    }
    out += ']';
    return out;
}

std::string json_tables(const std::vector<ParsedTableRef>& tables) {
    std::vector<std::string> names;
    names.reserve(tables.size());
    for (const auto& t : tables) names.push_back(t.full_name());
    return json_string_array(names);
}

std::string validation_json(const ValidationResult& v, const std::optional<SecureResult>& secured) {
    std::string out = std::format(
        R"({{"valid":{},"errors":{},"warnings":{},"tables":{},"requiresTenantFilter":{})",
        utils::booltostr(v.is_valid), json_string_array(v.errors), json_string_array(v.warnings),
        json_tables(v.tables), utils::booltostr(v.requires_tenant_filter));
    if (v.error_kind) {
        out += std::format(R"(,"errorKind":"{}")", error_kind_to_string(*v.error_kind));
    }
    if (secured) {
        if (secured->success) {
            out += std::format(R"(,"securedSql":"{}","tenantFilterBypassed":{})",
                               utils::escape_json(secured->sql),
                               utils::booltostr(secured->tenant_filter_bypassed));
        } else {
            out += std::format(R"(,"secureErrors":{})", json_string_array(secured->errors));
        }
    }
    out += '}';
    return out;
}

std::string result_json(const ExecuteResult& result) {
    std::string out = R"({"success":true,"columns":[)";
    for (size_t i = 0; i < result.columns.size(); ++i) {
        if (i > 0) out += ',';
        out += std::format(R"({{"name":"{}","type":"{}"}})",
                           utils::escape_json(result.columns[i].name),
                           utils::escape_json(result.columns[i].type));
    }
    out += R"(],"rows":[)";
    for (size_t r = 0; r < result.rows.size(); ++r) {
        if (r > 0) out += ',';
        out += '[';
        const auto& row = result.rows[r];
        for (size_t c = 0; c < row.size(); ++c) {
            if (c > 0) out += ',';
            out += row[c] ? std::format("\"{}\"", utils::escape_json(*row[c])) : "null";
        }
        out += ']';
    }
    out += std::format(R"(],"rowCount":{},"executionTimeMs":{}}})",
                       result.row_count, result.execution_time_ms);
    return out;
}

std::string error_json(const GatewayError& e) {
    return std::format(R"({{"success":false,"errorKind":"{}","error":"{}","errors":{}}})",
                       error_kind_to_string(e.kind()), utils::escape_json(e.what()),
                       json_string_array(e.errors()));
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    const auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage(argc > 0 ? argv[0] : "querygate");
        return kExitUsage;
    }

    auto config_result = ConfigLoader::load_from_file(opts->config_file);
    if (!config_result.success) {
        std::cerr << config_result.error_message << '\n';
        return kExitUsage;
    }
    const GatewayConfig& cfg = config_result.config;
    utils::log::set_level(cfg.logging.level);

    auto registry = std::make_shared<PgTableRegistry>(PgTableRegistry::Config{
        cfg.database.connection_string, cfg.allow_list.registry_table, cfg.database.connect_timeout});
    auto allow_list = std::make_shared<TableAllowList>(
        registry, std::make_shared<SystemClock>(), TableAllowList::Config{cfg.allow_list.ttl});
    auto guard = std::make_shared<QueryGuard>(
        allow_list, std::make_shared<LogSecurityEventSink>(),
        QueryGuard::Config{cfg.security.bypass_permission, cfg.allow_list.max_tier});

    if (opts->validate_only) {
        const ValidationResult validation = guard->validate(opts->sql);
        std::optional<SecureResult> secured;
        if (validation.is_valid) {
            secured = guard->secure(opts->sql, opts->principal);
        }
        std::cout << validation_json(validation, secured) << '\n';
        const bool ok = validation.is_valid && secured && secured->success;
        return ok ? kExitOk : kExitRejected;
    }

    auto pool = std::make_shared<ConnectionPool>(ConnectionPool::Config{
        .connection_string = cfg.database.connection_string,
        .max_connections = cfg.database.max_connections,
        .connect_timeout = cfg.database.connect_timeout,
        .health_check_query = cfg.database.health_check_query,
    });
    auto engine = std::make_shared<PgQueryEngine>(
        pool, PgQueryEngine::Config{cfg.database.connect_timeout});

    const BoundedExecutor executor(guard, engine, BoundedExecutor::Config{
        cfg.executor.default_timeout_ms, cfg.executor.max_timeout_ms,
        cfg.executor.default_row_limit, cfg.executor.max_row_limit});

    try {
        const ExecuteResult result = executor.execute(opts->sql, opts->principal, opts->execute);
        std::cout << result_json(result) << '\n';
        return kExitOk;
    } catch (const GatewayError& e) {
        std::cout << error_json(e) << '\n';
        return kExitRejected;
    }
}
