#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace querygate {

// ============================================================================
// Environment Expansion
// ============================================================================

std::string ConfigLoader::expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

namespace {

void expand_env_vars_recursive(toml::table& tbl);

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            s = ConfigLoader::expand_env_vars(s.get());
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            s = ConfigLoader::expand_env_vars(s.get());
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

// ============================================================================
// Section Extraction
// ============================================================================

DatabaseConfig extract_database(const toml::table& root) {
    DatabaseConfig cfg;
    const auto* db = root["database"].as_table();
    if (!db) return cfg;
    const auto& d = *db;

    cfg.connection_string = d["connection_string"].value_or(""s);
    cfg.connect_timeout = std::chrono::milliseconds(d["connect_timeout_ms"].value_or(int64_t{5000}));
    cfg.health_check_query = d["health_check_query"].value_or("SELECT 1"s);
    cfg.max_connections = static_cast<size_t>(d["max_connections"].value_or(int64_t{4}));
    return cfg;
}

ExecutorConfig extract_executor(const toml::table& root) {
    ExecutorConfig cfg;
    const auto* exec = root["executor"].as_table();
    if (!exec) return cfg;
    const auto& e = *exec;

    cfg.default_timeout_ms = e["default_timeout_ms"].value_or(cfg.default_timeout_ms);
    cfg.max_timeout_ms     = e["max_timeout_ms"].value_or(cfg.max_timeout_ms);
    cfg.default_row_limit  = e["default_row_limit"].value_or(cfg.default_row_limit);
    cfg.max_row_limit      = e["max_row_limit"].value_or(cfg.max_row_limit);
    return cfg;
}

AllowListConfig extract_allow_list(const toml::table& root) {
    AllowListConfig cfg;
    const auto* al = root["allow_list"].as_table();
    if (!al) return cfg;
    const auto& a = *al;

    cfg.ttl = std::chrono::seconds(a["ttl_seconds"].value_or(int64_t{300}));
    cfg.registry_table = a["registry_table"].value_or(cfg.registry_table);
    if (const auto tier = a["max_tier"].value<int64_t>()) {
        cfg.max_tier = static_cast<int>(*tier);
    }
    return cfg;
}

SecurityConfig extract_security(const toml::table& root) {
    SecurityConfig cfg;
    const auto* sec = root["security"].as_table();
    if (!sec) return cfg;

    cfg.bypass_permission = (*sec)["bypass_permission"].value_or(cfg.bypass_permission);
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

bool is_known_log_level(const std::string& level) {
    const std::string lower = utils::to_lower(level);
    return lower == "info" || lower == "warn" || lower == "error" || lower == "security";
}

} // anonymous namespace

GatewayConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    GatewayConfig config;
    config.database = extract_database(root);
    config.executor = extract_executor(root);
    config.allow_list = extract_allow_list(root);
    config.security = extract_security(root);
    config.logging = extract_logging(root);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(GatewayConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto tbl = toml::parse_file(config_path);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const GatewayConfig& config) {
    std::vector<std::string> errors;

    if (config.database.connection_string.empty()) {
        errors.emplace_back("database.connection_string must not be empty");
    }
    if (config.database.connect_timeout.count() <= 0) {
        errors.push_back(std::format("database.connect_timeout_ms must be > 0, got {}",
                                     config.database.connect_timeout.count()));
    }
    if (config.database.max_connections == 0) {
        errors.emplace_back("database.max_connections must be > 0");
    }

    const auto& exec = config.executor;
    if (exec.default_timeout_ms <= 0) {
        errors.push_back(std::format("executor.default_timeout_ms must be > 0, got {}", exec.default_timeout_ms));
    }
    if (exec.max_timeout_ms <= 0) {
        errors.push_back(std::format("executor.max_timeout_ms must be > 0, got {}", exec.max_timeout_ms));
    }
    if (exec.default_row_limit <= 0) {
        errors.push_back(std::format("executor.default_row_limit must be > 0, got {}", exec.default_row_limit));
    }
    if (exec.max_row_limit <= 0) {
        errors.push_back(std::format("executor.max_row_limit must be > 0, got {}", exec.max_row_limit));
    }
    if (exec.default_timeout_ms > exec.max_timeout_ms) {
        errors.push_back(std::format("executor.default_timeout_ms ({}) > max_timeout_ms ({})",
                                     exec.default_timeout_ms, exec.max_timeout_ms));
    }
    if (exec.default_row_limit > exec.max_row_limit) {
        errors.push_back(std::format("executor.default_row_limit ({}) > max_row_limit ({})",
                                     exec.default_row_limit, exec.max_row_limit));
    }

    if (config.allow_list.ttl.count() <= 0) {
        errors.push_back(std::format("allow_list.ttl_seconds must be > 0, got {}",
                                     config.allow_list.ttl.count()));
    }
    if (config.allow_list.registry_table.empty()) {
        errors.emplace_back("allow_list.registry_table must not be empty");
    }
    if (config.allow_list.max_tier && *config.allow_list.max_tier < 1) {
        errors.push_back(std::format("allow_list.max_tier must be >= 1, got {}", *config.allow_list.max_tier));
    }

    if (config.security.bypass_permission.empty()) {
        errors.emplace_back("security.bypass_permission must not be empty");
    }

    if (!is_known_log_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be one of info, warn, error, security; got '{}'",
                                     config.logging.level));
    }

    return errors;
}

} // namespace querygate
