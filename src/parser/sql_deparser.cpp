#include "parser/sql_deparser.hpp"
#include "core/utils.hpp"

#include <unordered_set>

namespace querygate {

using namespace ast;

namespace {

// Reserved and type_func_name keywords: never valid as bare identifiers
const std::unordered_set<std::string_view> RESERVED_KEYWORDS = {
    "all", "analyse", "analyze", "and", "any", "array", "as", "asc", "asymmetric",
    "authorization", "binary", "both", "case", "cast", "check", "collate", "collation",
    "column", "concurrently", "constraint", "create", "cross", "current_catalog",
    "current_date", "current_role", "current_schema", "current_time", "current_timestamp",
    "current_user", "default", "deferrable", "desc", "distinct", "do", "else", "end",
    "except", "false", "fetch", "for", "foreign", "freeze", "from", "full", "grant",
    "group", "having", "ilike", "in", "initially", "inner", "intersect", "into", "is",
    "isnull", "join", "lateral", "leading", "left", "like", "limit", "localtime",
    "localtimestamp", "natural", "not", "notnull", "null", "offset", "on", "only", "or",
    "order", "outer", "overlaps", "placing", "primary", "references", "returning",
    "right", "select", "session_user", "similar", "some", "symmetric", "system_user",
    "table", "tablesample", "then", "to", "trailing", "true", "union", "unique", "user",
    "using", "variadic", "verbose", "when", "where", "window", "with"
};

// col_name keywords: fine as column names, but special syntax in function and
// type position, so an unqualified function or type name spelled like one is quoted
const std::unordered_set<std::string_view> COL_NAME_KEYWORDS = {
    "between", "bigint", "bit", "boolean", "char", "character", "coalesce", "dec",
    "decimal", "exists", "extract", "float", "greatest", "grouping", "inout", "int",
    "integer", "interval", "json", "json_array", "json_arrayagg", "json_exists",
    "json_object", "json_objectagg", "json_query", "json_scalar", "json_serialize",
    "json_table", "json_value", "least", "merge_action", "national", "nchar", "none",
    "normalize", "nullif", "numeric", "out", "overlay", "position", "precision", "real",
    "row", "setof", "smallint", "substring", "time", "timestamp", "treat", "trim",
    "values", "varchar", "xmlattributes", "xmlconcat", "xmlelement", "xmlexists",
    "xmlforest", "xmlnamespaces", "xmlparse", "xmlpi", "xmlroot", "xmlserialize",
    "xmltable"
};

bool is_simple_identifier(std::string_view ident) {
    if (ident.empty()) return false;
    const char first = ident.front();
    if (!((first >= 'a' && first <= 'z') || first == '_')) return false;
    for (const char c : ident) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '$';
        if (!ok) return false;
    }
    return true;
}

std::string force_quote(std::string_view ident) {
    std::string out = "\"";
    for (const char c : ident) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

// Function and type names: single-part names that collide with special syntax are quoted
std::string qualified_name(const std::vector<std::string>& parts) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += '.';
        if (parts.size() == 1 && COL_NAME_KEYWORDS.contains(parts[i])) {
            out += force_quote(parts[i]);
        } else {
            out += SqlDeparser::quote_identifier(parts[i]);
        }
    }
    return out;
}

std::string render_select(const SelectStatement& stmt);
std::string render_expr(const Expr& expr);

template <typename Range, typename Fn>
std::string join(const Range& items, Fn&& render) {
    std::string out;
    bool first = true;
    for (const auto& item : items) {
        if (!first) out += ", ";
        first = false;
        out += render(item);
    }
    return out;
}

std::string render_expr_list(const std::vector<ExprPtr>& items) {
    return join(items, [](const ExprPtr& e) { return render_expr(*e); });
}

std::string render_sort(const std::vector<SortItem>& items) {
    return join(items, [](const SortItem& item) {
        std::string out = render_expr(*item.expr);
        switch (item.direction) {
            case SortItem::Direction::ASC:  out += " ASC"; break;
            case SortItem::Direction::DESC: out += " DESC"; break;
            case SortItem::Direction::DEFAULT: break;
        }
        switch (item.nulls) {
            case SortItem::Nulls::FIRST: out += " NULLS FIRST"; break;
            case SortItem::Nulls::LAST:  out += " NULLS LAST"; break;
            case SortItem::Nulls::DEFAULT: break;
        }
        return out;
    });
}

// Operator expressions are parenthesised whenever they appear as an operand
bool needs_parens(const Expr& expr) {
    if (std::holds_alternative<BinaryExpr>(expr.node)) return true;
    if (std::holds_alternative<UnaryExpr>(expr.node)) return true;
    if (const auto* sub = std::get_if<SubqueryExpr>(&expr.node)) {
        return sub->kind == SubqueryExpr::Kind::ANY || sub->kind == SubqueryExpr::Kind::ALL;
    }
    return false;
}

std::string operand(const Expr& expr) {
    std::string text = render_expr(expr);
    return needs_parens(expr) ? "(" + text + ")" : text;
}

struct ExprRenderer {
    std::string operator()(const ColumnRef& ref) const {
        std::string out;
        for (const auto& q : ref.qualifiers) {
            out += SqlDeparser::quote_identifier(q);
            out += '.';
        }
        out += ref.star ? "*" : SqlDeparser::quote_identifier(ref.column);
        return out;
    }

    std::string operator()(const Literal& lit) const {
        switch (lit.kind) {
            case Literal::Kind::STRING:     return SqlDeparser::quote_literal(lit.text);
            case Literal::Kind::BOOLEAN:    return lit.text == "true" ? "TRUE" : "FALSE";
            case Literal::Kind::NULL_VALUE: return "NULL";
            case Literal::Kind::INTEGER:
            case Literal::Kind::FLOAT:
            case Literal::Kind::KEYWORD:
                break;
        }
        return lit.text;
    }

    std::string operator()(const BinaryExpr& e) const {
        if (e.op == "AND" || e.op == "OR") {
            return "(" + render_expr(*e.left) + ") " + e.op + " (" + render_expr(*e.right) + ")";
        }
        if (e.op.contains("BETWEEN")) {
            const auto* bounds = std::get_if<ListExpr>(&e.right->node);
            if (!bounds || bounds->items.size() != 2) {
                throw DeparseError("BETWEEN requires exactly two bounds");
            }
            return operand(*e.left) + " " + e.op + " " + operand(*bounds->items[0])
                + " AND " + operand(*bounds->items[1]);
        }
        if (e.op == "IN" || e.op == "NOT IN") {
            return operand(*e.left) + " " + e.op + " " + render_expr(*e.right);
        }
        if (e.op.ends_with(" ANY") || e.op.ends_with(" ALL")) {
            return operand(*e.left) + " " + e.op + " (" + render_expr(*e.right) + ")";
        }
        return operand(*e.left) + " " + e.op + " " + operand(*e.right);
    }

    std::string operator()(const UnaryExpr& e) const {
        if (e.postfix) return operand(*e.operand) + " " + e.op;
        // The space keeps "- -1" from becoming a comment
        return e.op + " " + operand(*e.operand);
    }

    std::string operator()(const ListExpr& e) const {
        const std::string items = render_expr_list(e.items);
        return e.array_constructor ? "ARRAY[" + items + "]" : "(" + items + ")";
    }

    std::string operator()(const FunctionCall& fn) const {
        std::string out = fn.keyword_form ? utils::to_upper(fn.name.front()) : qualified_name(fn.name);
        out += '(';
        if (fn.star) {
            out += '*';
        } else {
            if (fn.distinct) out += "DISTINCT ";
            out += render_expr_list(fn.args);
            if (!fn.order_by.empty()) out += " ORDER BY " + render_sort(fn.order_by);
        }
        out += ')';
        if (fn.filter) out += " FILTER (WHERE " + render_expr(*fn.filter) + ")";
        if (fn.over) {
            std::string window;
            if (!fn.over->partition_by.empty()) {
                window += "PARTITION BY " + render_expr_list(fn.over->partition_by);
            }
            if (!fn.over->order_by.empty()) {
                if (!window.empty()) window += ' ';
                window += "ORDER BY " + render_sort(fn.over->order_by);
            }
            out += " OVER (" + window + ")";
        }
        return out;
    }

    std::string operator()(const CastExpr& c) const {
        std::string type = qualified_name(c.type_name);
        if (!c.type_modifiers.empty()) type += "(" + render_expr_list(c.type_modifiers) + ")";
        for (int i = 0; i < c.array_bounds; ++i) type += "[]";
        return "CAST(" + render_expr(*c.arg) + " AS " + type + ")";
    }

    std::string operator()(const CaseExpr& c) const {
        std::string out = "CASE";
        if (c.arg) out += " " + render_expr(*c.arg);
        for (const auto& w : c.whens) {
            out += " WHEN " + render_expr(*w.condition) + " THEN " + render_expr(*w.result);
        }
        if (c.otherwise) out += " ELSE " + render_expr(*c.otherwise);
        out += " END";
        return out;
    }

    std::string operator()(const SubqueryExpr& s) const {
        const std::string query = render_select(*s.query);
        switch (s.kind) {
            case SubqueryExpr::Kind::EXISTS:
                return "EXISTS (" + query + ")";
            case SubqueryExpr::Kind::ANY:
                if (s.op == "=") return operand(*s.test) + " IN (" + query + ")";
                return operand(*s.test) + " " + s.op + " ANY (" + query + ")";
            case SubqueryExpr::Kind::ALL:
                return operand(*s.test) + " " + s.op + " ALL (" + query + ")";
            case SubqueryExpr::Kind::ARRAY:
                return "ARRAY(" + query + ")";
            case SubqueryExpr::Kind::SCALAR:
                break;
        }
        return "(" + query + ")";
    }
};

std::string render_expr(const Expr& expr) {
    return std::visit(ExprRenderer{}, expr.node);
}

std::string render_alias(const std::optional<std::string>& alias) {
    return alias ? " AS " + SqlDeparser::quote_identifier(*alias) : std::string();
}

std::string render_from(const FromItem& item);

struct FromRenderer {
    std::string operator()(const TableSource& t) const {
        std::string out;
        if (t.schema) out += SqlDeparser::quote_identifier(*t.schema) + ".";
        out += SqlDeparser::quote_identifier(t.table);
        out += render_alias(t.alias);
        return out;
    }

    std::string operator()(const JoinSource& j) const {
        std::string keyword;
        switch (j.type) {
            case JoinSource::Type::INNER: keyword = "INNER JOIN"; break;
            case JoinSource::Type::LEFT:  keyword = "LEFT JOIN"; break;
            case JoinSource::Type::RIGHT: keyword = "RIGHT JOIN"; break;
            case JoinSource::Type::FULL:  keyword = "FULL JOIN"; break;
            case JoinSource::Type::CROSS: keyword = "CROSS JOIN"; break;
        }
        if (j.natural) keyword = "NATURAL " + keyword;

        // Joins nest to the left; a join on the right must be bracketed
        std::string right = render_from(*j.right);
        if (std::holds_alternative<JoinSource>(j.right->node)) right = "(" + right + ")";

        std::string out = render_from(*j.left) + " " + keyword + " " + right;
        if (j.on) {
            out += " ON " + render_expr(*j.on);
        } else if (!j.using_columns.empty()) {
            out += " USING (" + join(j.using_columns, [](const std::string& c) {
                return SqlDeparser::quote_identifier(c);
            }) + ")";
        }
        if (j.alias) out = "(" + out + ")" + render_alias(j.alias);
        return out;
    }

    std::string operator()(const SubquerySource& s) const {
        std::string out = s.lateral ? "LATERAL (" : "(";
        out += render_select(*s.query) + ")";
        out += render_alias(s.alias);
        if (!s.column_aliases.empty()) {
            out += "(" + join(s.column_aliases, [](const std::string& c) {
                return SqlDeparser::quote_identifier(c);
            }) + ")";
        }
        return out;
    }
};

std::string render_from(const FromItem& item) {
    return std::visit(FromRenderer{}, item.node);
}

std::string render_select(const SelectStatement& stmt) {
    if (stmt.next) {
        throw DeparseError("Set operations cannot be serialized");
    }

    std::string out;
    if (!stmt.with.empty()) {
        out += "WITH " + join(stmt.with, [](const CommonTableExpr& cte) {
            return SqlDeparser::quote_identifier(cte.name) + " AS (" + render_select(*cte.query) + ")";
        }) + " ";
    }

    out += "SELECT";
    if (stmt.distinct) {
        out += " DISTINCT";
        if (!stmt.distinct_on.empty()) out += " ON (" + render_expr_list(stmt.distinct_on) + ")";
    }
    if (!stmt.targets.empty()) {
        out += " " + join(stmt.targets, [](const SelectTarget& t) {
            return render_expr(*t.expr) + render_alias(t.alias);
        });
    }
    if (!stmt.from.empty()) {
        out += " FROM " + join(stmt.from, [](const FromItemPtr& f) { return render_from(*f); });
    }
    if (stmt.where) out += " WHERE " + render_expr(*stmt.where);
    if (!stmt.group_by.empty()) out += " GROUP BY " + render_expr_list(stmt.group_by);
    if (stmt.having) out += " HAVING " + render_expr(*stmt.having);
    if (!stmt.order_by.empty()) out += " ORDER BY " + render_sort(stmt.order_by);
    if (stmt.limit) out += " LIMIT " + render_expr(*stmt.limit);
    if (stmt.offset) out += " OFFSET " + render_expr(*stmt.offset);
    return out;
}

} // anonymous namespace

std::string SqlDeparser::deparse(const SelectStatement& stmt) {
    return render_select(stmt);
}

std::string SqlDeparser::deparse_expr(const Expr& expr) {
    return render_expr(expr);
}

std::string SqlDeparser::quote_identifier(std::string_view ident) {
    if (is_simple_identifier(ident) && !RESERVED_KEYWORDS.contains(ident)) {
        return std::string(ident);
    }
    return force_quote(ident);
}

std::string SqlDeparser::quote_literal(std::string_view value) {
    // E'' form when backslashes are present, so the text means the same
    // whatever standard_conforming_strings is set to
    const bool has_backslash = value.find('\\') != std::string_view::npos;
    std::string out = has_backslash ? "E'" : "'";
    for (const char c : value) {
        if (c == '\'') out += '\'';
        if (c == '\\') out += '\\';
        out += c;
    }
    out += '\'';
    return out;
}

} // namespace querygate
