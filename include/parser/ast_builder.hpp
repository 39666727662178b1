#pragma once

#include "core/json.hpp"
#include "parser/ast.hpp"

#include <stdexcept>
#include <string>
#include <string_view>

namespace querygate {

/// Nesting cap shared by the builder and every recursive AST walk
inline constexpr int kMaxAstDepth = 128;

/**
 * @brief Thrown when the parse tree contains something the typed AST
 * cannot represent, or nests deeper than kMaxAstDepth
 */
class AstBuildError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Converts libpg_query's JSON parse tree into the typed SELECT AST
 *
 * Accepts both wrapped ({"Alias": {...}}) and unwrapped forms of typed
 * pointer fields, and both the PG15+ and PG13 A_Const layouts.
 *
 * Anything outside the supported subset (row locking, SELECT INTO,
 * VALUES lists, parameter placeholders, named windows, frame clauses,
 * data-modifying CTEs, ...) raises AstBuildError naming the construct.
 */
class AstBuilder {
public:
    /// @param select_body the object inside {"SelectStmt": {...}}
    [[nodiscard]] static ast::SelectPtr build(const JsonValue& select_body);

private:
    AstBuilder() = default;

    ast::SelectPtr build_select(const JsonValue& body);
    ast::ExprPtr build_expr(const JsonValue& node);
    ast::FromItemPtr build_from(const JsonValue& node);
    ast::SortItem build_sort(const JsonValue& node);
    ast::ExprPtr build_a_const(const JsonValue& body);
    ast::ExprPtr build_a_expr(const JsonValue& body);
    ast::ExprPtr build_bool_expr(const JsonValue& body);
    ast::ExprPtr build_func_call(const JsonValue& body);
    ast::ExprPtr build_sublink(const JsonValue& body);

    std::vector<ast::ExprPtr> build_expr_list(const JsonValue& list);

    // RAII depth counter; throws once kMaxAstDepth is exceeded
    class DepthGuard {
    public:
        explicit DepthGuard(int& depth);
        ~DepthGuard() { --depth_; }
        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;
    private:
        int& depth_;
    };

    int depth_ = 0;
};

[[noreturn]] void throw_unsupported(std::string_view construct);

} // namespace querygate
