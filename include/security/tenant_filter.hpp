#pragma once

#include "parser/ast.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace querygate {

/// Row-level tenant column every allow-listed table carries
inline constexpr std::string_view kTenantColumn = "practice_uid";

/**
 * @brief Outcome of tenant-filter injection
 *
 * `sql` is empty whenever `success` is false; there is no way to obtain
 * text from a failed injection.
 */
struct SecurityFilterResult {
    bool success = false;
    std::string sql;
    std::optional<std::string> error;

    static SecurityFilterResult ok(std::string sql) {
        SecurityFilterResult r;
        r.success = true;
        r.sql = std::move(sql);
        return r;
    }

    static SecurityFilterResult failure(std::string message) {
        SecurityFilterResult r;
        r.error = std::move(message);
        return r;
    }
};

/**
 * @brief Build the tenant predicate: practice_uid = N, or practice_uid IN (...)
 * @throws std::invalid_argument when tenant_ids is empty
 */
[[nodiscard]] ast::ExprPtr build_tenant_predicate(const std::vector<int64_t>& tenant_ids);

/**
 * @brief Graft the tenant predicate onto the WHERE clause and re-serialize
 *
 * An existing WHERE becomes the left operand of AND, the tenant predicate
 * the right. The statement is mutated in place.
 */
[[nodiscard]] SecurityFilterResult inject_tenant_filter(ast::SelectStatement& stmt,
                                                        const std::vector<int64_t>& tenant_ids);

} // namespace querygate
