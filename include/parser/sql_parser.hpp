#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "parser/ast.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace querygate {

/**
 * @brief Result of parsing one SQL text
 *
 * `ast` is present whenever the text parsed as a single SELECT the typed
 * model can represent, even when the statement is later rejected (union,
 * subquery), so callers can still inspect it. When the builder rejects a
 * construct (unsupported node, ONLY, nesting past kMaxAstDepth) the text
 * did parse but `ast` stays empty; `tables` is still filled from the raw
 * tree. It is exclusively owned here and moved out for rewriting.
 */
struct ParseResult {
    bool is_valid = false;
    std::vector<std::string> errors;
    std::optional<ErrorKind> error_kind;        // kind of errors.front()
    std::unique_ptr<ast::SelectStatement> ast;
    std::vector<ParsedTableRef> tables;         // every reference, not de-duplicated
    bool has_union = false;
    bool has_subquery = false;
    bool has_star = false;                      // SELECT * / t.* in the outer list
    std::optional<std::string> statement_kind;  // "select", "insert", "drop", ...

    void add_error(ErrorKind kind, std::string message) {
        if (!error_kind) error_kind = kind;
        errors.push_back(std::move(message));
    }
};

/**
 * @brief SQL Parser - wraps libpg_query (PostgreSQL's parser)
 *
 * Uses PostgreSQL's actual grammar, so anything the engine accepts is seen
 * exactly as the engine sees it. The JSON parse tree is converted into the
 * typed SELECT AST and scanned for tables, set operations and nested SELECTs.
 *
 * Never throws: every failure lands in ParseResult::errors.
 *
 * Thread-safety: stateless, safe for concurrent use.
 */
class SQLParser {
public:
    [[nodiscard]] ParseResult parse(std::string_view sql) const;
};

} // namespace querygate
