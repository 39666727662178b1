#include "parser/ast_builder.hpp"
#include "parser/ast_keys.hpp"
#include "core/utils.hpp"

#include <format>

namespace querygate {

namespace k = ast::keys;
using namespace ast;

[[noreturn]] void throw_unsupported(std::string_view construct) {
    throw AstBuildError(std::format("Unsupported SQL construct: {}", construct));
}

namespace {

// libpg_query wraps every Node* as {"TypeName": {...fields}}
struct Wrapped {
    std::string_view type;
    JsonValue body;
};

Wrapped unwrap(const JsonValue& node) {
    Wrapped w;
    if (!node.is_object() || node.size() != 1) return w;
    node.for_each_member([&](std::string_view key, const JsonValue& val) {
        w.type = key;
        w.body = val;
    });
    return w;
}

// Typed pointer fields (Alias*, TypeName*, SelectStmt*, ...) are written
// unwrapped by current libpg_query; older releases wrapped them.
JsonValue typed(const JsonValue& field, std::string_view type) {
    if (field.is_object() && field.size() == 1 && field.contains(type)) {
        return field[type];
    }
    return field;
}

// Lists appear as bare arrays, or as {"List": {"items": [...]}} inside Node* fields
JsonValue list_items(const JsonValue& field) {
    if (field.is_array()) return field;
    if (field.is_object() && field.contains(k::kList)) {
        return field[k::kList][k::kItems];
    }
    return {};
}

std::string string_value(const JsonValue& node) {
    const auto w = unwrap(node);
    if (w.type != k::kString) {
        throw_unsupported(w.type.empty() ? std::string_view("malformed name") : w.type);
    }
    // PG15+ uses "sval", PG13 used "str"
    if (auto s = w.body.string_at(k::kSval)) return *s;
    return w.body.string_at(k::kStr).value_or("");
}

std::vector<std::string> string_list(const JsonValue& field) {
    std::vector<std::string> out;
    list_items(field).for_each_element([&](const JsonValue& e) {
        out.push_back(string_value(e));
    });
    return out;
}

std::optional<std::string> alias_name(const JsonValue& field) {
    return typed(field, k::kAlias).string_at(k::kAliasname);
}

int64_t int_field(const JsonValue& obj, std::string_view key) {
    const JsonValue v = obj[key];
    return v.is_number() ? v.get<int64_t>() : 0;
}

std::string enum_field(const JsonValue& obj, std::string_view key, std::string_view fallback) {
    return obj.string_at(key).value_or(std::string(fallback));
}

SetOperation set_operation(std::string_view op) {
    if (op == "SETOP_UNION")     return SetOperation::UNION;
    if (op == "SETOP_INTERSECT") return SetOperation::INTERSECT;
    if (op == "SETOP_EXCEPT")    return SetOperation::EXCEPT;
    throw_unsupported(op);
}

// Balanced fold keeps long AND/OR chains shallow: depth grows with log2(n)
ExprPtr fold_boolean(std::vector<ExprPtr>& args, size_t lo, size_t hi, const std::string& op) {
    if (hi - lo == 1) return std::move(args[lo]);
    const size_t mid = lo + (hi - lo + 1) / 2;
    auto left = fold_boolean(args, lo, mid, op);
    auto right = fold_boolean(args, mid, hi, op);
    return make_expr(BinaryExpr{op, std::move(left), std::move(right)});
}

std::string underscores_to_spaces(std::string_view s) {
    std::string out(s);
    for (char& c : out) {
        if (c == '_') c = ' ';
    }
    return out;
}

} // anonymous namespace

AstBuilder::DepthGuard::DepthGuard(int& depth) : depth_(depth) {
    if (++depth_ > kMaxAstDepth) {
        throw AstBuildError(std::format(
            "Query nesting exceeds maximum depth of {}", kMaxAstDepth));
    }
}

SelectPtr AstBuilder::build(const JsonValue& select_body) {
    AstBuilder builder;
    return builder.build_select(select_body);
}

// ============================================================================
// SELECT
// ============================================================================

SelectPtr AstBuilder::build_select(const JsonValue& body) {
    DepthGuard guard(depth_);

    if (!body.is_object()) throw_unsupported("malformed SELECT");
    if (body.contains(k::kIntoClause)) throw_unsupported("SELECT INTO");
    if (!body[k::kLockingClause].empty()) throw_unsupported("row locking clause");
    if (!body[k::kValuesLists].empty()) throw_unsupported("VALUES list");
    if (!body[k::kWindowClause].empty()) throw_unsupported("WINDOW clause");
    if (enum_field(body, k::kLimitOption, "") == "LIMIT_OPTION_WITH_TIES") {
        throw_unsupported("FETCH FIRST ... WITH TIES");
    }

    SelectPtr stmt;
    const std::string op = enum_field(body, k::kOp, "SETOP_NONE");

    if (op != "SETOP_NONE") {
        // Flatten "a UNION b UNION c" into the chain a -> b -> c
        stmt = build_select(typed(body[k::kLarg], k::kSelectStmt));
        SelectStatement* tail = stmt.get();
        while (tail->next) tail = tail->next.get();
        tail->set_op = set_operation(op);
        tail->set_all = body.flag(k::kAll);
        tail->next = build_select(typed(body[k::kRarg], k::kSelectStmt));
    } else {
        stmt = std::make_unique<SelectStatement>();

        const JsonValue distinct = body[k::kDistinctClause];
        if (distinct.is_array() && !distinct.empty()) {
            // Plain DISTINCT is a one-element list holding an empty node
            stmt->distinct = true;
            distinct.for_each_element([&](const JsonValue& e) {
                if (e.is_object() && !e.empty()) {
                    stmt->distinct_on.push_back(build_expr(e));
                }
            });
        }

        body[k::kTargetList].for_each_element([&](const JsonValue& e) {
            const auto w = unwrap(e);
            if (w.type != k::kResTarget) throw_unsupported("malformed select target");
            SelectTarget target;
            target.expr = build_expr(w.body[k::kVal]);
            target.alias = w.body.string_at(k::kName);
            stmt->targets.push_back(std::move(target));
        });

        body[k::kFromClause].for_each_element([&](const JsonValue& e) {
            stmt->from.push_back(build_from(e));
        });

        if (body.contains(k::kWhereClause)) {
            stmt->where = build_expr(body[k::kWhereClause]);
        }
        stmt->group_by = build_expr_list(body[k::kGroupClause]);
        if (body.contains(k::kHavingClause)) {
            stmt->having = build_expr(body[k::kHavingClause]);
        }
    }

    // Clauses that may sit on either a plain SELECT or a whole set operation.
    // For a set operation they land on the chain head.
    if (!body[k::kSortClause].empty()) {
        if (!stmt->order_by.empty()) throw_unsupported("nested ORDER BY in set operation");
        body[k::kSortClause].for_each_element([&](const JsonValue& e) {
            stmt->order_by.push_back(build_sort(e));
        });
    }
    if (body.contains(k::kLimitCount)) {
        if (stmt->limit) throw_unsupported("nested LIMIT in set operation");
        stmt->limit = build_expr(body[k::kLimitCount]);
    }
    if (body.contains(k::kLimitOffset)) {
        if (stmt->offset) throw_unsupported("nested OFFSET in set operation");
        stmt->offset = build_expr(body[k::kLimitOffset]);
    }

    const JsonValue with = typed(body[k::kWithClause], k::kWithClauseType);
    if (with.is_object()) {
        if (!stmt->with.empty()) throw_unsupported("nested WITH in set operation");
        list_items(with[k::kCtes]).for_each_element([&](const JsonValue& e) {
            const auto cte = unwrap(e);
            if (cte.type != k::kCommonTableExpr) throw_unsupported("malformed WITH clause");
            const auto query = unwrap(cte.body[k::kCtequery]);
            if (query.type != k::kSelectStmt) throw_unsupported("data-modifying CTE");
            CommonTableExpr entry;
            entry.name = cte.body.string_at(k::kCtename).value_or("");
            entry.query = build_select(query.body);
            stmt->with.push_back(std::move(entry));
        });
    }

    return stmt;
}

SortItem AstBuilder::build_sort(const JsonValue& node) {
    const auto w = unwrap(node);
    if (w.type != k::kSortBy) throw_unsupported("malformed ORDER BY item");

    SortItem item;
    item.expr = build_expr(w.body[k::kNode]);

    const std::string dir = enum_field(w.body, k::kSortbyDir, "SORTBY_DEFAULT");
    if (dir == "SORTBY_ASC") {
        item.direction = SortItem::Direction::ASC;
    } else if (dir == "SORTBY_DESC") {
        item.direction = SortItem::Direction::DESC;
    } else if (dir == "SORTBY_USING") {
        throw_unsupported("ORDER BY ... USING");
    }

    const std::string nulls = enum_field(w.body, k::kSortbyNulls, "SORTBY_NULLS_DEFAULT");
    if (nulls == "SORTBY_NULLS_FIRST") {
        item.nulls = SortItem::Nulls::FIRST;
    } else if (nulls == "SORTBY_NULLS_LAST") {
        item.nulls = SortItem::Nulls::LAST;
    }
    return item;
}

// ============================================================================
// FROM
// ============================================================================

FromItemPtr AstBuilder::build_from(const JsonValue& node) {
    DepthGuard guard(depth_);
    const auto [type, body] = unwrap(node);

    if (type == k::kRangeVar) {
        if (body.contains(k::kCatalogname)) throw_unsupported("cross-database table reference");
        if (!body.flag(k::kInh)) throw_unsupported("ONLY table reference");
        TableSource table;
        table.schema = body.string_at(k::kSchemaname);
        table.table = body.string_at(k::kRelname).value_or("");
        table.alias = alias_name(body[k::kAliasFld]);
        return make_from(std::move(table));
    }

    if (type == k::kJoinExpr) {
        if (body.contains("join_using_alias")) throw_unsupported("JOIN USING alias");

        JoinSource join;
        join.left = build_from(body[k::kLarg]);
        join.right = build_from(body[k::kRarg]);
        if (body.contains(k::kQuals)) join.on = build_expr(body[k::kQuals]);
        join.using_columns = string_list(body[k::kUsingClause]);
        join.natural = body.flag(k::kIsNatural);
        join.alias = alias_name(body[k::kAliasFld]);

        const std::string jt = enum_field(body, k::kJointype, "JOIN_INNER");
        if (jt == "JOIN_INNER") {
            const bool qualified = join.on || !join.using_columns.empty() || join.natural;
            join.type = qualified ? JoinSource::Type::INNER : JoinSource::Type::CROSS;
        } else if (jt == "JOIN_LEFT") {
            join.type = JoinSource::Type::LEFT;
        } else if (jt == "JOIN_RIGHT") {
            join.type = JoinSource::Type::RIGHT;
        } else if (jt == "JOIN_FULL") {
            join.type = JoinSource::Type::FULL;
        } else {
            throw_unsupported(jt);
        }
        return make_from(std::move(join));
    }

    if (type == k::kRangeSubselect) {
        const auto sub = unwrap(body[k::kSubquery]);
        if (sub.type != k::kSelectStmt) throw_unsupported("malformed derived table");

        SubquerySource source;
        source.query = build_select(sub.body);
        const JsonValue alias = typed(body[k::kAliasFld], k::kAlias);
        source.alias = alias.string_at(k::kAliasname);
        source.column_aliases = string_list(alias[k::kColnames]);
        source.lateral = body.flag(k::kLateral);
        return make_from(std::move(source));
    }

    if (type == "RangeFunction") throw_unsupported("function call in FROM clause");
    throw_unsupported(type.empty() ? std::string_view("malformed FROM item") : type);
}

// ============================================================================
// Expressions
// ============================================================================

std::vector<ExprPtr> AstBuilder::build_expr_list(const JsonValue& list) {
    std::vector<ExprPtr> out;
    list_items(list).for_each_element([&](const JsonValue& e) {
        out.push_back(build_expr(e));
    });
    return out;
}

ExprPtr AstBuilder::build_expr(const JsonValue& node) {
    DepthGuard guard(depth_);
    const auto [type, body] = unwrap(node);

    if (type == k::kColumnRef) {
        ColumnRef ref;
        std::vector<std::string> parts;
        list_items(body[k::kFields]).for_each_element([&](const JsonValue& f) {
            if (unwrap(f).type == k::kAStar) {
                ref.star = true;
                return;
            }
            parts.push_back(string_value(f));
        });
        if (!ref.star) {
            if (parts.empty()) throw_unsupported("malformed column reference");
            ref.column = std::move(parts.back());
            parts.pop_back();
        }
        ref.qualifiers = std::move(parts);
        return make_expr(std::move(ref));
    }

    if (type == k::kAConst)   return build_a_const(body);
    if (type == k::kAExpr)    return build_a_expr(body);
    if (type == k::kBoolExpr) return build_bool_expr(body);
    if (type == k::kFuncCall) return build_func_call(body);
    if (type == k::kSubLink)  return build_sublink(body);

    if (type == k::kNullTest) {
        const bool negated = enum_field(body, k::kNulltesttype, "IS_NULL") == "IS_NOT_NULL";
        return make_expr(UnaryExpr{negated ? "IS NOT NULL" : "IS NULL",
                                   build_expr(body[k::kArg]), true});
    }

    if (type == k::kBooleanTest) {
        // IS_NOT_TRUE -> "IS NOT TRUE"
        const std::string test = enum_field(body, k::kBooltesttype, "IS_TRUE");
        return make_expr(UnaryExpr{underscores_to_spaces(test), build_expr(body[k::kArg]), true});
    }

    if (type == k::kTypeCast) {
        const JsonValue tn = typed(body[k::kTypeNameFld], k::kTypeName);
        if (tn.flag("setof") || tn.flag("pct_type")) throw_unsupported("special type reference");

        CastExpr cast;
        cast.arg = build_expr(body[k::kArg]);
        cast.type_name = string_list(tn[k::kNames]);
        if (cast.type_name.empty()) throw_unsupported("malformed type name");
        cast.type_modifiers = build_expr_list(tn[k::kTypmods]);
        cast.array_bounds = static_cast<int>(list_items(tn[k::kArrayBounds]).size());
        if (cast.type_name.back() == "interval" && !cast.type_modifiers.empty()) {
            throw_unsupported("interval field qualifier");
        }
        return make_expr(std::move(cast));
    }

    if (type == k::kCaseExpr) {
        CaseExpr c;
        if (body.contains(k::kArg)) c.arg = build_expr(body[k::kArg]);
        list_items(body[k::kArgs]).for_each_element([&](const JsonValue& e) {
            const auto w = unwrap(e);
            if (w.type != k::kCaseWhen) throw_unsupported("malformed CASE");
            CaseWhen when;
            when.condition = build_expr(w.body[k::kExpr]);
            when.result = build_expr(w.body[k::kResult]);
            c.whens.push_back(std::move(when));
        });
        if (body.contains(k::kDefresult)) c.otherwise = build_expr(body[k::kDefresult]);
        return make_expr(std::move(c));
    }

    if (type == k::kCoalesceExpr || type == k::kMinMaxExpr) {
        FunctionCall fn;
        if (type == k::kCoalesceExpr) {
            fn.name = {"coalesce"};
        } else {
            fn.name = {enum_field(body, k::kOp, "IS_GREATEST") == "IS_LEAST" ? "least" : "greatest"};
        }
        fn.keyword_form = true;
        fn.args = build_expr_list(body[k::kArgs]);
        return make_expr(std::move(fn));
    }

    if (type == k::kSQLValueFunction) {
        // SVFOP_CURRENT_TIMESTAMP_N -> CURRENT_TIMESTAMP(<typmod>)
        std::string name = enum_field(body, k::kOp, "");
        if (!name.starts_with("SVFOP_")) throw_unsupported("malformed SQL value function");
        name.erase(0, 6);
        if (name.ends_with("_N")) {
            name.resize(name.size() - 2);
            name += std::format("({})", int_field(body, k::kTypmod));
        }
        return make_expr(Literal{Literal::Kind::KEYWORD, std::move(name)});
    }

    if (type == k::kAArrayExpr) {
        return make_expr(ListExpr{build_expr_list(body[k::kElements]), true});
    }

    if (type == "ParamRef") throw_unsupported("parameter placeholder");
    throw_unsupported(type.empty() ? std::string_view("malformed expression") : type);
}

ExprPtr AstBuilder::build_a_const(const JsonValue& body) {
    using Kind = Literal::Kind;

    if (body.flag(k::kIsnull)) {
        return make_expr(Literal{Kind::NULL_VALUE, "NULL"});
    }

    // PG15+: {"ival": {"ival": 5}}; zero is written as {"ival": {}}
    if (body.contains(k::kIval)) {
        return make_expr(Literal{Kind::INTEGER, std::to_string(int_field(body[k::kIval], k::kIval))});
    }
    if (body.contains(k::kFval)) {
        return make_expr(Literal{Kind::FLOAT, body[k::kFval].string_at(k::kFval).value_or("0")});
    }
    if (body.contains(k::kSval)) {
        return make_expr(Literal{Kind::STRING, body[k::kSval].string_at(k::kSval).value_or("")});
    }
    if (body.contains(k::kBoolval)) {
        return make_expr(Literal{Kind::BOOLEAN, body[k::kBoolval].flag(k::kBoolval) ? "true" : "false"});
    }
    if (body.contains(k::kBsval)) {
        // "b101" / "x1F" -> B'101' / X'1F'
        const std::string bits = body[k::kBsval].string_at(k::kBsval).value_or("");
        if (bits.empty()) throw_unsupported("malformed bit string");
        return make_expr(Literal{Kind::KEYWORD,
            std::format("{}'{}'", utils::to_upper(bits.substr(0, 1)), bits.substr(1))});
    }

    // PG13: {"val": {"Integer": {"ival": 5}}}
    if (body.contains(k::kVal)) {
        const auto w = unwrap(body[k::kVal]);
        if (w.type == k::kInteger) {
            return make_expr(Literal{Kind::INTEGER, std::to_string(int_field(w.body, k::kIval))});
        }
        if (w.type == k::kFloat) {
            return make_expr(Literal{Kind::FLOAT, w.body.string_at(k::kStr).value_or("0")});
        }
        if (w.type == k::kString) {
            return make_expr(Literal{Kind::STRING, w.body.string_at(k::kStr).value_or("")});
        }
        if (w.type == k::kNull) {
            return make_expr(Literal{Kind::NULL_VALUE, "NULL"});
        }
    }

    throw_unsupported("malformed constant");
}

ExprPtr AstBuilder::build_a_expr(const JsonValue& body) {
    const std::string kind = enum_field(body, k::kKind, "AEXPR_OP");
    const auto names = string_list(body[k::kName]);
    if (names.empty()) throw_unsupported("malformed operator");
    if (names.size() > 1) throw_unsupported("OPERATOR() syntax");
    const std::string& op = names.front();

    auto operand = [&](std::string_view key) -> ExprPtr {
        return body.contains(key) ? build_expr(body[key]) : nullptr;
    };
    auto binary = [&](std::string spelled) {
        auto left = operand(k::kLexpr);
        auto right = operand(k::kRexpr);
        if (!left || !right) throw_unsupported("malformed operator expression");
        return make_expr(BinaryExpr{std::move(spelled), std::move(left), std::move(right)});
    };
    auto with_list = [&](std::string spelled) {
        auto left = operand(k::kLexpr);
        if (!left) throw_unsupported("malformed operator expression");
        auto items = make_expr(ListExpr{build_expr_list(body[k::kRexpr]), false});
        return make_expr(BinaryExpr{std::move(spelled), std::move(left), std::move(items)});
    };

    if (kind == "AEXPR_OP") {
        auto left = operand(k::kLexpr);
        auto right = operand(k::kRexpr);
        if (!right) throw_unsupported("postfix operator");
        if (!left) return make_expr(UnaryExpr{op, std::move(right), false});
        return make_expr(BinaryExpr{op, std::move(left), std::move(right)});
    }
    if (kind == "AEXPR_OP_ANY") return binary(op + " ANY");
    if (kind == "AEXPR_OP_ALL") return binary(op + " ALL");
    if (kind == "AEXPR_DISTINCT") return binary("IS DISTINCT FROM");
    if (kind == "AEXPR_NOT_DISTINCT") return binary("IS NOT DISTINCT FROM");
    if (kind == "AEXPR_IN") return with_list(op == "<>" ? "NOT IN" : "IN");
    if (kind == "AEXPR_LIKE") return binary(op == "!~~" ? "NOT LIKE" : "LIKE");
    if (kind == "AEXPR_ILIKE") return binary(op == "!~~*" ? "NOT ILIKE" : "ILIKE");
    // SIMILAR TO arrives already rewritten to "~" over similar_to_escape()
    if (kind == "AEXPR_SIMILAR") return binary(op);
    if (kind == "AEXPR_BETWEEN") return with_list("BETWEEN");
    if (kind == "AEXPR_NOT_BETWEEN") return with_list("NOT BETWEEN");
    if (kind == "AEXPR_BETWEEN_SYM") return with_list("BETWEEN SYMMETRIC");
    if (kind == "AEXPR_NOT_BETWEEN_SYM") return with_list("NOT BETWEEN SYMMETRIC");

    if (kind == "AEXPR_NULLIF") {
        FunctionCall fn;
        fn.name = {"nullif"};
        fn.keyword_form = true;
        auto left = operand(k::kLexpr);
        auto right = operand(k::kRexpr);
        if (!left || !right) throw_unsupported("malformed NULLIF");
        fn.args.push_back(std::move(left));
        fn.args.push_back(std::move(right));
        return make_expr(std::move(fn));
    }

    throw_unsupported(kind);
}

ExprPtr AstBuilder::build_bool_expr(const JsonValue& body) {
    const std::string boolop = enum_field(body, k::kBoolop, "AND_EXPR");
    auto args = build_expr_list(body[k::kArgs]);
    if (args.empty()) throw_unsupported("malformed boolean expression");

    if (boolop == "NOT_EXPR") {
        if (args.size() != 1) throw_unsupported("malformed NOT");
        return make_expr(UnaryExpr{"NOT", std::move(args.front()), false});
    }
    if (boolop == "AND_EXPR") return fold_boolean(args, 0, args.size(), "AND");
    if (boolop == "OR_EXPR") return fold_boolean(args, 0, args.size(), "OR");
    throw_unsupported(boolop);
}

ExprPtr AstBuilder::build_func_call(const JsonValue& body) {
    if (body.flag(k::kAggWithinGroup)) throw_unsupported("WITHIN GROUP");
    if (body.flag(k::kFuncVariadic)) throw_unsupported("VARIADIC argument");

    FunctionCall fn;
    fn.name = string_list(body[k::kFuncname]);
    if (fn.name.empty()) throw_unsupported("malformed function call");
    fn.args = build_expr_list(body[k::kArgs]);
    fn.star = body.flag(k::kAggStar);
    fn.distinct = body.flag(k::kAggDistinct);
    list_items(body[k::kAggOrder]).for_each_element([&](const JsonValue& e) {
        fn.order_by.push_back(build_sort(e));
    });
    if (body.contains(k::kAggFilter)) fn.filter = build_expr(body[k::kAggFilter]);

    if (body.contains(k::kOver)) {
        const JsonValue over = typed(body[k::kOver], k::kWindowDef);
        if (over.string_at(k::kName) || over.string_at(k::kRefname)) {
            throw_unsupported("named window");
        }
        // FRAMEOPTION_NONDEFAULT
        if (int_field(over, k::kFrameOptions) & 0x1) throw_unsupported("window frame clause");

        WindowSpec window;
        window.partition_by = build_expr_list(over[k::kPartitionClause]);
        list_items(over[k::kOrderClause]).for_each_element([&](const JsonValue& e) {
            window.order_by.push_back(build_sort(e));
        });
        fn.over = std::move(window);
    }
    return make_expr(std::move(fn));
}

ExprPtr AstBuilder::build_sublink(const JsonValue& body) {
    const std::string link = enum_field(body, k::kSubLinkType, "EXPR_SUBLINK");
    const auto sub = unwrap(body[k::kSubselect]);
    if (sub.type != k::kSelectStmt) throw_unsupported("malformed subquery");

    SubqueryExpr s;
    if (link == "EXISTS_SUBLINK") {
        s.kind = SubqueryExpr::Kind::EXISTS;
    } else if (link == "ANY_SUBLINK" || link == "ALL_SUBLINK") {
        s.kind = link == "ANY_SUBLINK" ? SubqueryExpr::Kind::ANY : SubqueryExpr::Kind::ALL;
        s.test = build_expr(body[k::kTestexpr]);
        // x IN (SELECT ...) carries no operator name
        const auto names = string_list(body[k::kOperName]);
        s.op = names.empty() ? "=" : names.back();
    } else if (link == "EXPR_SUBLINK") {
        s.kind = SubqueryExpr::Kind::SCALAR;
    } else if (link == "ARRAY_SUBLINK") {
        s.kind = SubqueryExpr::Kind::ARRAY;
    } else {
        throw_unsupported(link);
    }
    s.query = build_select(sub.body);
    return make_expr(std::move(s));
}

} // namespace querygate
