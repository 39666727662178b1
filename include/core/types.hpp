#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace querygate {

// ============================================================================
// Table References
// ============================================================================

/**
 * @brief One table reference found anywhere in a query
 *
 * Collected for every RangeVar, including those inside rejected
 * subqueries, so the audit trail names every table the text touched.
 */
struct ParsedTableRef {
    std::optional<std::string> schema;
    std::string table;
    std::optional<std::string> alias;

    ParsedTableRef() = default;
    ParsedTableRef(std::optional<std::string> s, std::string t,
                   std::optional<std::string> a = std::nullopt)
        : schema(std::move(s)), table(std::move(t)), alias(std::move(a)) {}

    // "schema.table" when qualified, otherwise the bare table name
    std::string full_name() const {
        return schema ? (*schema + "." + table) : table;
    }

    bool operator==(const ParsedTableRef&) const = default;
};

// ============================================================================
// Principal
// ============================================================================

/**
 * @brief The caller on whose behalf a query is secured
 *
 * tenant_ids is the ordered tenant scope resolved upstream; it is used
 * verbatim (no de-duplication, no truncation).
 */
struct Principal {
    std::string user_id;
    bool is_super_admin = false;
    std::unordered_set<std::string> permissions;
    std::vector<int64_t> tenant_ids;

    bool has_permission(const std::string& permission) const {
        return permissions.contains(permission);
    }
};

// ============================================================================
// Execution
// ============================================================================

struct ExecuteOptions {
    std::optional<int64_t> row_limit;
    std::optional<int64_t> timeout_ms;
};

struct ColumnInfo {
    std::string name;
    std::string type;

    bool operator==(const ColumnInfo&) const = default;
};

// NULL values are represented as std::nullopt
using Row = std::vector<std::optional<std::string>>;

struct ExecuteResult {
    std::vector<Row> rows;
    size_t row_count = 0;
    int64_t execution_time_ms = 0;
    std::vector<ColumnInfo> columns;
};

/**
 * @brief Raw engine output (before column derivation)
 */
struct EngineResult {
    bool success = false;
    std::string error_message;

    std::vector<std::string> column_names;
    std::vector<std::string> column_types;
    std::vector<Row> rows;
};

} // namespace querygate
