#include "security/tenant_filter.hpp"
#include "parser/sql_deparser.hpp"

#include <format>
#include <stdexcept>

namespace querygate {

using namespace ast;

ExprPtr build_tenant_predicate(const std::vector<int64_t>& tenant_ids) {
    if (tenant_ids.empty()) {
        throw std::invalid_argument("tenant predicate requires at least one tenant id");
    }

    auto column = make_expr(ColumnRef{{}, std::string(kTenantColumn), false});
    auto literal = [](int64_t id) {
        return make_expr(Literal{Literal::Kind::INTEGER, std::to_string(id)});
    };

    if (tenant_ids.size() == 1) {
        return make_expr(BinaryExpr{"=", std::move(column), literal(tenant_ids.front())});
    }

    ListExpr ids;
    ids.items.reserve(tenant_ids.size());
    for (const int64_t id : tenant_ids) {
        ids.items.push_back(literal(id));
    }
    return make_expr(BinaryExpr{"IN", std::move(column), make_expr(std::move(ids))});
}

SecurityFilterResult inject_tenant_filter(SelectStatement& stmt,
                                          const std::vector<int64_t>& tenant_ids) {
    if (tenant_ids.empty()) {
        return SecurityFilterResult::failure("Cannot build a tenant filter for an empty tenant scope");
    }
    if (stmt.next) {
        return SecurityFilterResult::failure("Cannot inject a tenant filter into a set operation");
    }

    auto predicate = build_tenant_predicate(tenant_ids);
    if (stmt.where) {
        stmt.where = make_expr(BinaryExpr{"AND", std::move(stmt.where), std::move(predicate)});
    } else {
        stmt.where = std::move(predicate);
    }

    try {
        return SecurityFilterResult::ok(SqlDeparser::deparse(stmt));
    } catch (const DeparseError& e) {
        return SecurityFilterResult::failure(
            std::format("Failed to serialize filtered query: {}", e.what()));
    }
}

} // namespace querygate
