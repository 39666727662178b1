#pragma once

#include "catalog/table_allowlist.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "parser/sql_parser.hpp"
#include "security/security_event.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace querygate {

inline constexpr std::string_view kDefaultBypassPermission = "data-explorer:execute:all";

struct ValidationResult {
    bool is_valid = false;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::vector<ParsedTableRef> tables;
    bool requires_tenant_filter = false;
    std::optional<ErrorKind> error_kind;      // kind of errors.front()
};

/**
 * @brief Outcome of securing one statement for one principal
 *
 * `sql` is only meaningful when `success` is true.
 */
struct SecureResult {
    bool success = false;
    std::string sql;
    std::optional<ErrorKind> error_kind;
    std::vector<std::string> errors;
    std::vector<ParsedTableRef> tables;
    bool tenant_filter_bypassed = false;

    static SecureResult ok(std::string sql, std::vector<ParsedTableRef> tables, bool bypassed) {
        SecureResult r;
        r.success = true;
        r.sql = std::move(sql);
        r.tables = std::move(tables);
        r.tenant_filter_bypassed = bypassed;
        return r;
    }

    static SecureResult rejected(ErrorKind kind, std::vector<std::string> errors,
                                 std::vector<ParsedTableRef> tables = {}) {
        SecureResult r;
        r.error_kind = kind;
        r.errors = std::move(errors);
        r.tables = std::move(tables);
        return r;
    }
};

struct QueryGuardConfig {
    std::string bypass_permission{kDefaultBypassPermission};
    std::optional<int> max_tier;          // narrow the allow-list by trust tier
};

/**
 * @brief Security orchestrator: validate-then-secure pipeline
 *
 * Stage order is fixed:
 *   1. destructive keyword screen
 *   2. structural parse
 *   3. table allow-list
 *   4. bypass decision / tenant scope
 *   5. tenant filter injection
 *
 * secure() stops at the first failing stage. validate() runs stages 1-3
 * and reports every problem it finds.
 *
 * Thread-safety: safe for concurrent use (the allow-list is the only
 * shared state, and it is RCU-protected).
 */
class QueryGuard {
public:
    using Config = QueryGuardConfig;

    QueryGuard(std::shared_ptr<TableAllowList> allow_list,
               std::shared_ptr<ISecurityEventSink> events,
               Config config = {});

    [[nodiscard]] ValidationResult validate(std::string_view sql) const;

    [[nodiscard]] SecureResult secure(std::string_view sql, const Principal& principal) const;

    /// Super-admins and holders of the bypass permission skip tenant filtering
    [[nodiscard]] bool bypasses_tenant_filter(const Principal& principal) const;

private:
    [[nodiscard]] std::unordered_set<std::string> allowed_tables() const;

    void emit(SecurityEventType type, const Principal& principal,
              std::string detail, std::string_view sql) const;

    std::shared_ptr<TableAllowList> allow_list_;
    std::shared_ptr<ISecurityEventSink> events_;
    Config config_;
    SQLParser parser_;
};

} // namespace querygate
