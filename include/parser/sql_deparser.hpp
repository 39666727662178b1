#pragma once

#include "parser/ast.hpp"

#include <stdexcept>
#include <string>
#include <string_view>

namespace querygate {

class DeparseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Renders the typed SELECT AST back into PostgreSQL text
 *
 * Output is canonical rather than faithful to the input spelling:
 * - identifiers are double-quoted unless simple lowercase and unreserved
 * - string literals use standard quoting with doubled single quotes
 * - both operands of AND / OR are always parenthesised
 * - nested operator expressions are parenthesised as operands
 *
 * Re-parsing the output yields a tree with the same meaning.
 * Set-operation chains are refused with DeparseError.
 */
class SqlDeparser {
public:
    [[nodiscard]] static std::string deparse(const ast::SelectStatement& stmt);
    [[nodiscard]] static std::string deparse_expr(const ast::Expr& expr);

    [[nodiscard]] static std::string quote_identifier(std::string_view ident);
    [[nodiscard]] static std::string quote_literal(std::string_view value);
};

} // namespace querygate
