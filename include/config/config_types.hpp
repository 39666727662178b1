#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace querygate {

// ============================================================================
// Configuration Types (mirror the TOML sections)
// ============================================================================

struct DatabaseConfig {
    std::string connection_string;
    std::chrono::milliseconds connect_timeout{5000};
    std::string health_check_query{"SELECT 1"};
    size_t max_connections = 4;
};

struct ExecutorConfig {
    int64_t default_timeout_ms = 30000;
    int64_t max_timeout_ms = 120000;
    int64_t default_row_limit = 1000;
    int64_t max_row_limit = 10000;
};

struct AllowListConfig {
    std::chrono::seconds ttl{300};
    std::string registry_table{"explorer_table_metadata"};
    std::optional<int> max_tier;
};

struct SecurityConfig {
    std::string bypass_permission{"data-explorer:execute:all"};
};

struct LoggingConfig {
    std::string level{"info"};
};

struct GatewayConfig {
    DatabaseConfig database;
    ExecutorConfig executor;
    AllowListConfig allow_list;
    SecurityConfig security;
    LoggingConfig logging;
};

} // namespace querygate
