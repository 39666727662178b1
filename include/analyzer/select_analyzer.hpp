#pragma once

#include "core/types.hpp"
#include "parser/ast.hpp"

#include <optional>
#include <string>
#include <vector>

namespace querygate {

/**
 * @brief Single-pass walk over a typed SELECT tree
 *
 * Collects every table reference (including those inside rejected
 * subqueries and CTEs, for the audit trail) and records the first
 * nested SELECT it meets, with a message naming the clause it sits in.
 */
class SelectAnalyzer {
public:
    struct Analysis {
        std::vector<ParsedTableRef> tables;
        bool has_subquery = false;
        std::optional<std::string> subquery_error;  // first nested SELECT found
        bool depth_exceeded = false;
        bool has_star = false;                      // SELECT * or t.*
    };

    [[nodiscard]] static Analysis analyze(const ast::SelectStatement& stmt);

private:
    enum class Clause {
        SELECT_LIST, FROM, JOIN_CONDITION, WHERE, IN_LIST,
        GROUP_BY, HAVING, ORDER_BY, LIMIT, DISTINCT_ON, WINDOW
    };

    explicit SelectAnalyzer(Analysis& out) : out_(out) {}

    void walk_select(const ast::SelectStatement& stmt, bool top_level);
    void walk_from(const ast::FromItem& item);
    void walk_expr(const ast::Expr& expr, Clause clause);
    void walk_sort(const std::vector<ast::SortItem>& items, Clause clause);
    void note_subquery(std::string message);

    static const char* clause_name(Clause clause);

    struct ExprVisitor;

    Analysis& out_;
    int depth_ = 0;
};

} // namespace querygate
