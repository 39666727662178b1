#include "analyzer/select_analyzer.hpp"
#include "parser/ast_builder.hpp"

#include <format>

namespace querygate {

using namespace ast;

namespace {

// Depth bookkeeping for the recursive walk; reports false once the cap is hit
class DepthScope {
public:
    DepthScope(int& depth, bool& exceeded) : depth_(depth) {
        ok_ = ++depth_ <= kMaxAstDepth;
        if (!ok_) exceeded = true;
    }
    ~DepthScope() { --depth_; }
    DepthScope(const DepthScope&) = delete;
    DepthScope& operator=(const DepthScope&) = delete;

    [[nodiscard]] bool ok() const { return ok_; }

private:
    int& depth_;
    bool ok_ = true;
};

} // anonymous namespace

// One overload per node kind; no generic fallback
struct SelectAnalyzer::ExprVisitor {
    SelectAnalyzer& self;
    Clause clause;

    void operator()(const ColumnRef&) const {}
    void operator()(const Literal&) const {}

    void operator()(const BinaryExpr& e) const {
        self.walk_expr(*e.left, clause);
        const bool in_list = (e.op == "IN" || e.op == "NOT IN")
            && std::holds_alternative<ListExpr>(e.right->node);
        self.walk_expr(*e.right, in_list ? Clause::IN_LIST : clause);
    }

    void operator()(const UnaryExpr& e) const {
        self.walk_expr(*e.operand, clause);
    }

    void operator()(const ListExpr& e) const {
        for (const auto& item : e.items) self.walk_expr(*item, clause);
    }

    void operator()(const FunctionCall& e) const {
        for (const auto& arg : e.args) self.walk_expr(*arg, clause);
        self.walk_sort(e.order_by, clause);
        if (e.filter) self.walk_expr(*e.filter, clause);
        if (e.over) {
            for (const auto& p : e.over->partition_by) self.walk_expr(*p, Clause::WINDOW);
            self.walk_sort(e.over->order_by, Clause::WINDOW);
        }
    }

    void operator()(const CastExpr& e) const {
        self.walk_expr(*e.arg, clause);
        for (const auto& m : e.type_modifiers) self.walk_expr(*m, clause);
    }

    void operator()(const CaseExpr& e) const {
        if (e.arg) self.walk_expr(*e.arg, clause);
        for (const auto& w : e.whens) {
            self.walk_expr(*w.condition, clause);
            self.walk_expr(*w.result, clause);
        }
        if (e.otherwise) self.walk_expr(*e.otherwise, clause);
    }

    void operator()(const SubqueryExpr& e) const {
        // x IN (SELECT ...) is reported against the IN clause
        const bool in_form = e.kind == SubqueryExpr::Kind::ANY && e.op == "=";
        self.note_subquery(std::format("Subqueries in {} are not allowed for security reasons",
                                       clause_name(in_form ? Clause::IN_LIST : clause)));
        if (e.test) self.walk_expr(*e.test, clause);
        self.walk_select(*e.query, false);
    }
};

SelectAnalyzer::Analysis SelectAnalyzer::analyze(const SelectStatement& stmt) {
    Analysis out;
    SelectAnalyzer analyzer(out);
    analyzer.walk_select(stmt, true);
    return out;
}

void SelectAnalyzer::walk_select(const SelectStatement& stmt, bool top_level) {
    DepthScope scope(depth_, out_.depth_exceeded);
    if (!scope.ok()) return;

    for (const auto& cte : stmt.with) {
        note_subquery("Common table expressions are not allowed for security reasons");
        walk_select(*cte.query, false);
    }

    // FROM and WHERE first so their messages win when several clauses nest SELECTs
    for (const auto& item : stmt.from) walk_from(*item);
    if (stmt.where) walk_expr(*stmt.where, Clause::WHERE);

    for (const auto& target : stmt.targets) {
        if (top_level) {
            const auto* ref = std::get_if<ColumnRef>(&target.expr->node);
            if (ref && ref->star) out_.has_star = true;
        }
        walk_expr(*target.expr, Clause::SELECT_LIST);
    }
    for (const auto& e : stmt.distinct_on) walk_expr(*e, Clause::DISTINCT_ON);
    for (const auto& e : stmt.group_by) walk_expr(*e, Clause::GROUP_BY);
    if (stmt.having) walk_expr(*stmt.having, Clause::HAVING);
    walk_sort(stmt.order_by, Clause::ORDER_BY);
    if (stmt.limit) walk_expr(*stmt.limit, Clause::LIMIT);
    if (stmt.offset) walk_expr(*stmt.offset, Clause::LIMIT);

    if (stmt.next) walk_select(*stmt.next, top_level);
}

void SelectAnalyzer::walk_from(const FromItem& item) {
    DepthScope scope(depth_, out_.depth_exceeded);
    if (!scope.ok()) return;

    std::visit([this](const auto& node) {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, TableSource>) {
            out_.tables.emplace_back(node.schema, node.table, node.alias);
        } else if constexpr (std::is_same_v<T, JoinSource>) {
            walk_from(*node.left);
            walk_from(*node.right);
            if (node.on) walk_expr(*node.on, Clause::JOIN_CONDITION);
        } else {
            static_assert(std::is_same_v<T, SubquerySource>);
            note_subquery(std::format("Subqueries in {} are not allowed for security reasons",
                                      clause_name(Clause::FROM)));
            walk_select(*node.query, false);
        }
    }, item.node);
}

void SelectAnalyzer::walk_expr(const Expr& expr, Clause clause) {
    DepthScope scope(depth_, out_.depth_exceeded);
    if (!scope.ok()) return;
    std::visit(ExprVisitor{*this, clause}, expr.node);
}

void SelectAnalyzer::walk_sort(const std::vector<SortItem>& items, Clause clause) {
    for (const auto& item : items) walk_expr(*item.expr, clause);
}

void SelectAnalyzer::note_subquery(std::string message) {
    out_.has_subquery = true;
    if (!out_.subquery_error) out_.subquery_error = std::move(message);
}

const char* SelectAnalyzer::clause_name(Clause clause) {
    switch (clause) {
        case Clause::SELECT_LIST:    return "SELECT list";
        case Clause::FROM:           return "FROM clause";
        case Clause::JOIN_CONDITION: return "JOIN condition";
        case Clause::WHERE:          return "WHERE clause";
        case Clause::IN_LIST:        return "IN clause";
        case Clause::GROUP_BY:       return "GROUP BY clause";
        case Clause::HAVING:         return "HAVING clause";
        case Clause::ORDER_BY:       return "ORDER BY clause";
        case Clause::LIMIT:          return "LIMIT clause";
        case Clause::DISTINCT_ON:    return "DISTINCT ON clause";
        case Clause::WINDOW:         return "window definition";
    }
    return "query";
}

} // namespace querygate
