#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace querygate {

/**
 * @brief Error kinds for the gateway
 *
 * Everything up to FILTER_INJECTION_FAILED is a validation-stage kind:
 * collected and returned as data. The last three are execution-stage kinds:
 * thrown as GatewayError. INVALID_SQL covers text that never became a
 * usable tree (syntax error, empty input, unsupported construct, no table).
 */
enum class ErrorKind {
    MULTI_STATEMENT_REJECTED,
    NON_SELECT_STATEMENT_REJECTED,
    DESTRUCTIVE_KEYWORD_DETECTED,
    UNION_REJECTED,
    SUBQUERY_REJECTED,
    TABLE_NOT_ALLOWED,
    INVALID_SQL,
    EMPTY_TENANT_SCOPE,
    FILTER_INJECTION_FAILED,
    ENGINE_UNREACHABLE,
    QUERY_TIMEOUT,
    EXECUTION_FAILED
};

[[nodiscard]] inline constexpr const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MULTI_STATEMENT_REJECTED:      return "MultiStatementRejected";
        case ErrorKind::NON_SELECT_STATEMENT_REJECTED: return "NonSelectStatementRejected";
        case ErrorKind::DESTRUCTIVE_KEYWORD_DETECTED:  return "DestructiveKeywordDetected";
        case ErrorKind::UNION_REJECTED:                return "UnionRejected";
        case ErrorKind::SUBQUERY_REJECTED:             return "SubqueryRejected";
        case ErrorKind::TABLE_NOT_ALLOWED:             return "TableNotAllowed";
        case ErrorKind::INVALID_SQL:                   return "InvalidSql";
        case ErrorKind::EMPTY_TENANT_SCOPE:            return "EmptyTenantScope";
        case ErrorKind::FILTER_INJECTION_FAILED:       return "FilterInjectionFailed";
        case ErrorKind::ENGINE_UNREACHABLE:            return "EngineUnreachable";
        case ErrorKind::QUERY_TIMEOUT:                 return "QueryTimeout";
        case ErrorKind::EXECUTION_FAILED:              return "ExecutionFailed";
    }
    return "Unknown";
}

/**
 * @brief Execution-boundary exception
 *
 * what() is always caller-safe. Raw engine diagnostics are logged, never
 * carried here. When securing failed, errors() holds the full validation
 * list so a caller can present every problem at once.
 */
class GatewayError : public std::runtime_error {
public:
    GatewayError(ErrorKind kind, const std::string& message,
                 std::vector<std::string> errors = {})
        : std::runtime_error(message), kind_(kind), errors_(std::move(errors)) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::vector<std::string>& errors() const noexcept { return errors_; }

private:
    ErrorKind kind_;
    std::vector<std::string> errors_;
};

} // namespace querygate
