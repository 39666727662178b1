#include "parser/sql_parser.hpp"
#include "analyzer/select_analyzer.hpp"
#include "parser/ast_builder.hpp"
#include "parser/ast_keys.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

// libpg_query C API
extern "C" {
#include "pg_query.h"
}

#include <format>
#include <unordered_map>

namespace querygate {

namespace k = ast::keys;

namespace {

// Parse-tree node name -> statement kind reported back to callers
const std::unordered_map<std::string_view, std::string_view> STATEMENT_KIND_MAP = {
    {"SelectStmt", "select"},
    {"InsertStmt", "insert"},
    {"UpdateStmt", "update"},
    {"DeleteStmt", "delete"},
    {"MergeStmt", "merge"},
    {"CreateStmt", "create"},
    {"CreateTableAsStmt", "create"},
    {"ViewStmt", "create"},
    {"IndexStmt", "create"},
    {"CreateSchemaStmt", "create"},
    {"CreateFunctionStmt", "create"},
    {"AlterTableStmt", "alter"},
    {"DropStmt", "drop"},
    {"TruncateStmt", "truncate"},
    {"GrantStmt", "grant"},
    {"GrantRoleStmt", "grant"},
    {"CopyStmt", "copy"},
    {"ExplainStmt", "explain"},
    {"TransactionStmt", "transaction"},
    {"VariableSetStmt", "set"},
    {"VariableShowStmt", "show"},
    {"DoStmt", "do"},
    {"CallStmt", "call"},
    {"VacuumStmt", "vacuum"},
    {"LockStmt", "lock"},
    {"PrepareStmt", "prepare"},
    {"ExecuteStmt", "execute"},
};

std::string statement_kind(std::string_view node_type, const JsonValue& body) {
    if (node_type == "GrantStmt" && !body.flag("is_grant")) return "revoke";
    const auto it = STATEMENT_KIND_MAP.find(node_type);
    if (it != STATEMENT_KIND_MAP.end()) return std::string(it->second);

    // FooBarStmt -> "foobar"
    std::string_view name = node_type;
    if (name.ends_with("Stmt")) name.remove_suffix(4);
    return utils::to_lower(name);
}

// libpg_query result must be released on every path
class ScopedParseResult {
public:
    explicit ScopedParseResult(const std::string& sql) : result_(pg_query_parse(sql.c_str())) {}
    ~ScopedParseResult() { pg_query_free_parse_result(result_); }
    ScopedParseResult(const ScopedParseResult&) = delete;
    ScopedParseResult& operator=(const ScopedParseResult&) = delete;

    const PgQueryParseResult& get() const { return result_; }

private:
    PgQueryParseResult result_;
};

// Raw JSON nesting per typed AST level is at most a few objects and arrays
constexpr int kMaxJsonDepth = kMaxAstDepth * 4;

/**
 * @brief Recursively walk the JSON tree collecting every RangeVar.
 *
 * Used when the typed AST could not be built, so the audit trail still
 * names every table the text touched. Stops descending at kMaxJsonDepth.
 */
void find_range_vars(const JsonValue& node, std::vector<ParsedTableRef>& tables, int depth = 0) {
    if (depth >= kMaxJsonDepth) return;

    if (node.is_object()) {
        if (node.contains(k::kRangeVar)) {
            const JsonValue range_var = node[k::kRangeVar];
            if (auto relname = range_var.string_at(k::kRelname)) {
                JsonValue alias = range_var[k::kAliasFld];
                if (alias.contains(k::kAlias)) alias = alias[k::kAlias];
                tables.emplace_back(range_var.string_at(k::kSchemaname), std::move(*relname),
                                    alias.string_at(k::kAliasname));
            }
        }
        node.for_each_member([&](std::string_view, const JsonValue& child) {
            find_range_vars(child, tables, depth + 1);
        });
    } else if (node.is_array()) {
        node.for_each_element([&](const JsonValue& child) {
            find_range_vars(child, tables, depth + 1);
        });
    }
}

bool contains_nested_select(const JsonValue& node, int depth = 0) {
    if (depth >= kMaxJsonDepth) return false;

    bool found = false;
    if (node.is_object()) {
        if (node.contains(k::kSubLink) || node.contains(k::kRangeSubselect)
            || node.contains(k::kCommonTableExpr)) {
            return true;
        }
        node.for_each_member([&](std::string_view, const JsonValue& child) {
            found = found || contains_nested_select(child, depth + 1);
        });
    } else if (node.is_array()) {
        node.for_each_element([&](const JsonValue& child) {
            found = found || contains_nested_select(child, depth + 1);
        });
    }
    return found;
}

const char* set_operation_error(ast::SetOperation op) {
    switch (op) {
        case ast::SetOperation::INTERSECT:
            return "INTERSECT queries are not allowed for security reasons";
        case ast::SetOperation::EXCEPT:
            return "EXCEPT queries are not allowed for security reasons";
        case ast::SetOperation::UNION:
        case ast::SetOperation::NONE:
            break;
    }
    return "UNION queries are not allowed for security reasons";
}

} // anonymous namespace

ParseResult SQLParser::parse(std::string_view sql) const {
    ParseResult result;

    const std::string trimmed = utils::trim(sql);
    if (trimmed.empty()) {
        result.add_error(ErrorKind::INVALID_SQL, "Empty SQL query");
        return result;
    }

    const ScopedParseResult raw(trimmed);

    // Early return: syntax error
    if (raw.get().error) {
        const char* message = raw.get().error->message;
        result.add_error(ErrorKind::INVALID_SQL, std::format("SQL parse error: {}",
            message ? std::string_view(message) : k::kUnknownParseError));
        return result;
    }

    JsonValue tree;
    try {
        tree = JsonValue::parse(raw.get().parse_tree ? raw.get().parse_tree : "");
    } catch (const JsonValue::parse_error& e) {
        utils::log::error(std::format("libpg_query produced an unreadable parse tree: {}", e.what()));
        result.add_error(ErrorKind::INVALID_SQL, "SQL parse error: malformed parse tree");
        return result;
    }

    const JsonValue stmts = tree[k::kStmts];

    // Comment-only or ";"-only text parses to zero statements
    if (stmts.empty()) {
        result.add_error(ErrorKind::INVALID_SQL, "Empty SQL query");
        return result;
    }
    if (stmts.size() > 1) {
        result.add_error(ErrorKind::MULTI_STATEMENT_REJECTED, "Multiple SQL statements not allowed");
        find_range_vars(stmts, result.tables);
        return result;
    }

    // {"stmt": {"SelectStmt": {...}}}
    const JsonValue stmt = stmts[size_t{0}][k::kStmt];
    std::string_view node_type;
    JsonValue body;
    stmt.for_each_member([&](std::string_view key, const JsonValue& val) {
        node_type = key;
        body = val;
    });

    result.statement_kind = statement_kind(node_type, body);
    if (node_type != k::kSelectStmt) {
        result.add_error(ErrorKind::NON_SELECT_STATEMENT_REJECTED,
            std::format("Only SELECT statements are allowed, got: {}", *result.statement_kind));
        find_range_vars(stmt, result.tables);
        return result;
    }

    try {
        result.ast = AstBuilder::build(body);
    } catch (const AstBuildError& e) {
        result.add_error(ErrorKind::INVALID_SQL, e.what());
        find_range_vars(stmt, result.tables);
        result.has_subquery = contains_nested_select(stmt);
        return result;
    }

    if (result.ast->next) {
        result.has_union = true;
        result.add_error(ErrorKind::UNION_REJECTED, set_operation_error(result.ast->set_op));
    }

    auto analysis = SelectAnalyzer::analyze(*result.ast);
    result.tables = std::move(analysis.tables);
    result.has_subquery = analysis.has_subquery;
    result.has_star = analysis.has_star;

    if (analysis.depth_exceeded) {
        result.add_error(ErrorKind::INVALID_SQL,
            std::format("Query nesting exceeds maximum depth of {}", kMaxAstDepth));
    }
    if (analysis.subquery_error) {
        result.add_error(ErrorKind::SUBQUERY_REJECTED, std::move(*analysis.subquery_error));
    }

    result.is_valid = result.errors.empty();
    return result;
}

} // namespace querygate
