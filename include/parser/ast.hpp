#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace querygate::ast {

// ============================================================================
// Typed SELECT AST
//
// Built from libpg_query's JSON parse tree by AstBuilder. Every node kind is
// an alternative of a std::variant, and every consumer (table walker,
// subquery detector, serializer) visits with one overload per alternative:
// a new node kind is a compile error at each consumption site.
// ============================================================================

struct Expr;
struct FromItem;
struct SelectStatement;

using ExprPtr = std::unique_ptr<Expr>;
using FromItemPtr = std::unique_ptr<FromItem>;
using SelectPtr = std::unique_ptr<SelectStatement>;

// ---- Expressions -----------------------------------------------------------

/// a, t.a, s.t.a, t.*, *
struct ColumnRef {
    std::vector<std::string> qualifiers;
    std::string column;   // empty when star
    bool star = false;
};

struct Literal {
    enum class Kind { INTEGER, FLOAT, STRING, BOOLEAN, NULL_VALUE, KEYWORD };

    Kind kind = Kind::NULL_VALUE;
    std::string text;     // digits, float text, unescaped string, "true"/"false", keyword
};

/**
 * Binary operators keep their SQL spelling in `op`: "=", "<>", "+", "AND",
 * "OR", "IN", "NOT IN", "LIKE", "NOT LIKE", "ILIKE", "NOT ILIKE", "BETWEEN",
 * "NOT BETWEEN", "IS DISTINCT FROM", "IS NOT DISTINCT FROM", "= ANY", ...
 * IN and BETWEEN carry a ListExpr on the right.
 */
struct BinaryExpr {
    std::string op;
    ExprPtr left;
    ExprPtr right;
};

/// NOT x, -x (prefix); x IS NULL, x IS NOT NULL (postfix)
struct UnaryExpr {
    std::string op;
    ExprPtr operand;
    bool postfix = false;
};

/// (a, b, c) or ARRAY[a, b, c]
struct ListExpr {
    std::vector<ExprPtr> items;
    bool array_constructor = false;
};

struct SortItem {
    enum class Direction { DEFAULT, ASC, DESC };
    enum class Nulls { DEFAULT, FIRST, LAST };

    ExprPtr expr;
    Direction direction = Direction::DEFAULT;
    Nulls nulls = Nulls::DEFAULT;
};

struct WindowSpec {
    std::vector<ExprPtr> partition_by;
    std::vector<SortItem> order_by;
};

/// f(args), count(*), count(DISTINCT x), string_agg(x, ',' ORDER BY x),
/// sum(x) FILTER (WHERE ...) OVER (...), COALESCE/GREATEST/LEAST/NULLIF
struct FunctionCall {
    std::vector<std::string> name;   // possibly schema-qualified
    std::vector<ExprPtr> args;
    bool star = false;
    bool distinct = false;
    std::vector<SortItem> order_by;
    ExprPtr filter;
    std::optional<WindowSpec> over;
    bool keyword_form = false;      // COALESCE, GREATEST, ... (never quoted)
};

struct CastExpr {
    ExprPtr arg;
    std::vector<std::string> type_name;   // e.g. {"pg_catalog", "int4"}
    std::vector<ExprPtr> type_modifiers;  // numeric(10, 2)
    int array_bounds = 0;                 // number of [] suffixes
};

struct CaseWhen {
    ExprPtr condition;
    ExprPtr result;
};

struct CaseExpr {
    ExprPtr arg;                    // simple CASE operand, may be null
    std::vector<CaseWhen> whens;
    ExprPtr otherwise;              // may be null
};

/// Nested SELECT inside an expression: EXISTS (...), x IN (...), (SELECT ...)
struct SubqueryExpr {
    enum class Kind { EXISTS, ANY, ALL, SCALAR, ARRAY };

    Kind kind = Kind::SCALAR;
    ExprPtr test;                   // left operand of ANY/ALL
    std::string op;                 // operator of ANY/ALL ("=" for IN)
    SelectPtr query;
};

struct Expr {
    using Node = std::variant<ColumnRef, Literal, BinaryExpr, UnaryExpr, ListExpr,
                              FunctionCall, CastExpr, CaseExpr, SubqueryExpr>;
    Node node;

    template <typename T>
        requires (!std::is_same_v<std::remove_cvref_t<T>, Expr>)
    explicit Expr(T&& n) : node(std::forward<T>(n)) {}
};

template <typename T>
[[nodiscard]] inline ExprPtr make_expr(T&& node) {
    return std::make_unique<Expr>(std::forward<T>(node));
}

// ---- FROM items ------------------------------------------------------------

struct TableSource {
    std::optional<std::string> schema;
    std::string table;
    std::optional<std::string> alias;
};

struct JoinSource {
    enum class Type { INNER, LEFT, RIGHT, FULL, CROSS };

    Type type = Type::INNER;
    FromItemPtr left;
    FromItemPtr right;
    ExprPtr on;                          // may be null
    std::vector<std::string> using_columns;
    bool natural = false;
    std::optional<std::string> alias;
};

struct SubquerySource {
    SelectPtr query;
    std::optional<std::string> alias;
    std::vector<std::string> column_aliases;
    bool lateral = false;
};

struct FromItem {
    using Node = std::variant<TableSource, JoinSource, SubquerySource>;
    Node node;

    template <typename T>
        requires (!std::is_same_v<std::remove_cvref_t<T>, FromItem>)
    explicit FromItem(T&& n) : node(std::forward<T>(n)) {}
};

template <typename T>
[[nodiscard]] inline FromItemPtr make_from(T&& node) {
    return std::make_unique<FromItem>(std::forward<T>(node));
}

// ---- Statement -------------------------------------------------------------

struct SelectTarget {
    ExprPtr expr;
    std::optional<std::string> alias;
};

struct CommonTableExpr {
    std::string name;
    SelectPtr query;
};

enum class SetOperation { NONE, UNION, INTERSECT, EXCEPT };

struct SelectStatement {
    bool distinct = false;
    std::vector<ExprPtr> distinct_on;
    std::vector<SelectTarget> targets;
    std::vector<FromItemPtr> from;
    ExprPtr where;
    std::vector<ExprPtr> group_by;
    ExprPtr having;
    std::vector<SortItem> order_by;
    ExprPtr limit;
    ExprPtr offset;
    std::vector<CommonTableExpr> with;

    // Set-operation chain: this statement <set_op> next
    SetOperation set_op = SetOperation::NONE;
    bool set_all = false;
    SelectPtr next;
};

} // namespace querygate::ast
