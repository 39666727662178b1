#include <catch2/catch_test_macros.hpp>
#include "analyzer/select_analyzer.hpp"
#include "parser/ast_builder.hpp"
#include "parser/sql_parser.hpp"

using namespace querygate;

namespace {

bool has_table(const ParseResult& r, std::optional<std::string> schema, const std::string& table) {
    for (const auto& t : r.tables) {
        if (t.schema == schema && t.table == table) return true;
    }
    return false;
}

} // anonymous namespace

TEST_CASE("SQLParser accepts a single SELECT", "[parser]") {
    SQLParser parser;

    SECTION("Qualified table with WHERE") {
        auto result = parser.parse("SELECT measure FROM ih.encounters WHERE year = 2024");
        REQUIRE(result.is_valid);
        REQUIRE(result.errors.empty());
        REQUIRE(result.ast);
        CHECK(result.statement_kind == "select");
        REQUIRE(result.tables.size() == 1);
        CHECK(result.tables[0].schema == "ih");
        CHECK(result.tables[0].table == "encounters");
        CHECK(result.tables[0].full_name() == "ih.encounters");
        CHECK_FALSE(result.has_union);
        CHECK_FALSE(result.has_subquery);
    }

    SECTION("Trailing semicolon is still one statement") {
        auto result = parser.parse("SELECT measure FROM ih.encounters;");
        CHECK(result.is_valid);
    }

    SECTION("Join aliases are captured") {
        auto result = parser.parse(
            "SELECT e.measure FROM ih.encounters e "
            "JOIN ih.practices AS p ON e.practice_uid = p.practice_uid");
        REQUIRE(result.is_valid);
        REQUIRE(result.tables.size() == 2);
        CHECK(result.tables[0].alias == "e");
        CHECK(result.tables[1].table == "practices");
        CHECK(result.tables[1].alias == "p");
    }

    SECTION("Star target is flagged") {
        auto result = parser.parse("SELECT * FROM ih.encounters");
        REQUIRE(result.is_valid);
        CHECK(result.has_star);
    }

    SECTION("Aggregates, CASE, casts and window functions") {
        auto result = parser.parse(
            "SELECT provider, count(DISTINCT patient_id) AS patients, "
            "sum(CASE WHEN paid THEN amount ELSE 0 END)::numeric(12, 2), "
            "rank() OVER (PARTITION BY region ORDER BY total DESC) "
            "FROM ih.claims WHERE service_date BETWEEN '2024-01-01' AND '2024-12-31' "
            "GROUP BY provider, region, total HAVING count(*) > 10 "
            "ORDER BY patients DESC NULLS LAST LIMIT 50 OFFSET 10");
        CHECK(result.is_valid);
        CHECK(result.errors.empty());
    }
}

TEST_CASE("SQLParser rejects multiple statements", "[parser]") {
    SQLParser parser;
    auto result = parser.parse("SELECT a FROM t; SELECT b FROM u");

    REQUIRE_FALSE(result.is_valid);
    REQUIRE(result.error_kind == ErrorKind::MULTI_STATEMENT_REJECTED);
    REQUIRE(result.errors.size() == 1);
    CHECK(result.errors[0] == "Multiple SQL statements not allowed");
    CHECK(has_table(result, std::nullopt, "t"));
    CHECK(has_table(result, std::nullopt, "u"));
}

TEST_CASE("SQLParser rejects non-SELECT statements by kind", "[parser]") {
    SQLParser parser;

    SECTION("DELETE") {
        auto result = parser.parse("DELETE FROM ih.encounters WHERE id = 1");
        REQUIRE_FALSE(result.is_valid);
        CHECK(result.error_kind == ErrorKind::NON_SELECT_STATEMENT_REJECTED);
        CHECK(result.statement_kind == "delete");
        CHECK(result.errors[0] == "Only SELECT statements are allowed, got: delete");
        CHECK(has_table(result, "ih", "encounters"));
    }

    SECTION("REVOKE is reported as revoke") {
        auto result = parser.parse("REVOKE SELECT ON ih.encounters FROM analyst");
        REQUIRE_FALSE(result.is_valid);
        CHECK(result.statement_kind == "revoke");
    }

    SECTION("EXPLAIN") {
        auto result = parser.parse("EXPLAIN SELECT a FROM t");
        REQUIRE_FALSE(result.is_valid);
        CHECK(result.errors[0] == "Only SELECT statements are allowed, got: explain");
    }
}

TEST_CASE("SQLParser rejects set operations", "[parser]") {
    SQLParser parser;

    SECTION("UNION keeps the tree and both tables") {
        auto result = parser.parse("SELECT a FROM ih.encounters UNION SELECT b FROM public.users");
        REQUIRE_FALSE(result.is_valid);
        CHECK(result.has_union);
        CHECK(result.error_kind == ErrorKind::UNION_REJECTED);
        CHECK(result.errors[0] == "UNION queries are not allowed for security reasons");
        REQUIRE(result.ast);
        CHECK(has_table(result, "ih", "encounters"));
        CHECK(has_table(result, "public", "users"));
    }

    SECTION("INTERSECT") {
        auto result = parser.parse("SELECT a FROM t INTERSECT SELECT a FROM u");
        REQUIRE_FALSE(result.is_valid);
        CHECK(result.has_union);
        CHECK(result.errors[0] == "INTERSECT queries are not allowed for security reasons");
    }

    SECTION("EXCEPT") {
        auto result = parser.parse("SELECT a FROM t EXCEPT SELECT a FROM u");
        REQUIRE_FALSE(result.is_valid);
        CHECK(result.has_union);
        CHECK(result.errors[0] == "EXCEPT queries are not allowed for security reasons");
    }
}

TEST_CASE("SQLParser rejects subqueries and names the clause", "[parser]") {
    SQLParser parser;

    SECTION("IN subquery still reports every table") {
        auto result = parser.parse(
            "SELECT * FROM ih.patients WHERE id IN (SELECT patient_id FROM ih.claims)");
        REQUIRE_FALSE(result.is_valid);
        CHECK(result.has_subquery);
        CHECK(result.error_kind == ErrorKind::SUBQUERY_REJECTED);
        REQUIRE(result.errors.size() == 1);
        CHECK(result.errors[0] == "Subqueries in IN clause are not allowed for security reasons");
        REQUIRE(result.tables.size() == 2);
        CHECK(result.tables[0].full_name() == "ih.patients");
        CHECK(result.tables[1].full_name() == "ih.claims");
    }

    SECTION("Derived table in FROM") {
        auto result = parser.parse("SELECT x FROM (SELECT x FROM t) s");
        REQUIRE_FALSE(result.is_valid);
        CHECK(result.errors[0] == "Subqueries in FROM clause are not allowed for security reasons");
    }

    SECTION("EXISTS in WHERE") {
        auto result = parser.parse("SELECT a FROM t WHERE EXISTS (SELECT 1 FROM u)");
        REQUIRE_FALSE(result.is_valid);
        CHECK(result.errors[0] == "Subqueries in WHERE clause are not allowed for security reasons");
    }

    SECTION("Scalar subquery in the SELECT list") {
        auto result = parser.parse("SELECT (SELECT max(b) FROM u) FROM t");
        REQUIRE_FALSE(result.is_valid);
        CHECK(result.errors[0] == "Subqueries in SELECT list are not allowed for security reasons");
    }

    SECTION("Subquery in HAVING") {
        auto result = parser.parse(
            "SELECT a, count(*) FROM t GROUP BY a HAVING count(*) > (SELECT 1 FROM u)");
        REQUIRE_FALSE(result.is_valid);
        CHECK(result.errors[0] == "Subqueries in HAVING clause are not allowed for security reasons");
    }

    SECTION("Common table expression") {
        auto result = parser.parse("WITH c AS (SELECT a FROM t) SELECT a FROM c");
        REQUIRE_FALSE(result.is_valid);
        CHECK(result.has_subquery);
        CHECK(result.errors[0] == "Common table expressions are not allowed for security reasons");
        CHECK(has_table(result, std::nullopt, "t"));
    }

    SECTION("Only the first subquery is reported") {
        auto result = parser.parse(
            "SELECT (SELECT 1 FROM u) FROM t WHERE a IN (SELECT b FROM v)");
        REQUIRE(result.errors.size() == 1);
        CHECK(result.errors[0] == "Subqueries in IN clause are not allowed for security reasons");
    }
}

TEST_CASE("SQLParser reports malformed and unsupported SQL", "[parser]") {
    SQLParser parser;

    SECTION("Syntax error wraps the parser diagnostic") {
        auto result = parser.parse("SELEC measure FROM ih.encounters");
        REQUIRE_FALSE(result.is_valid);
        CHECK(result.error_kind == ErrorKind::INVALID_SQL);
        REQUIRE(result.errors.size() == 1);
        CHECK(result.errors[0].starts_with("SQL parse error: "));
        CHECK_FALSE(result.ast);
    }

    SECTION("Blank input") {
        auto result = parser.parse("   \n ");
        REQUIRE_FALSE(result.is_valid);
        CHECK(result.errors[0] == "Empty SQL query");
    }

    SECTION("Comment only") {
        auto result = parser.parse("-- nothing here");
        REQUIRE_FALSE(result.is_valid);
        CHECK(result.errors[0] == "Empty SQL query");
    }

    SECTION("Table function in FROM") {
        auto result = parser.parse("SELECT * FROM generate_series(1, 3)");
        REQUIRE_FALSE(result.is_valid);
        CHECK(result.errors[0] == "Unsupported SQL construct: function call in FROM clause");
    }

    SECTION("Row locking clause") {
        auto result = parser.parse("SELECT a FROM t FOR SHARE");
        REQUIRE_FALSE(result.is_valid);
        CHECK(result.errors[0] == "Unsupported SQL construct: row locking clause");
        CHECK(has_table(result, std::nullopt, "t"));
    }

    SECTION("ONLY table reference") {
        auto result = parser.parse("SELECT measure FROM ONLY ih.encounters");
        REQUIRE_FALSE(result.is_valid);
        CHECK(result.error_kind == ErrorKind::INVALID_SQL);
        CHECK(result.errors[0] == "Unsupported SQL construct: ONLY table reference");
        CHECK_FALSE(result.ast);
        CHECK(has_table(result, "ih", "encounters"));
    }

    SECTION("Parameter placeholder") {
        auto result = parser.parse("SELECT a FROM t WHERE id = $1");
        REQUIRE_FALSE(result.is_valid);
        CHECK(result.errors[0] == "Unsupported SQL construct: parameter placeholder");
    }

    SECTION("Deep nesting fails validation instead of crashing") {
        std::string sql = "SELECT a FROM t WHERE ";
        for (int i = 0; i < kMaxAstDepth + 20; ++i) sql += "NOT ";
        sql += "flag";
        auto result = parser.parse(sql);
        REQUIRE_FALSE(result.is_valid);
        CHECK(result.error_kind == ErrorKind::INVALID_SQL);
        CHECK(has_table(result, std::nullopt, "t"));
        CHECK_FALSE(result.has_subquery);
    }

    SECTION("Deep nesting inside a subquery still names the outer table") {
        std::string sql = "SELECT a FROM t WHERE a IN (SELECT b FROM u WHERE ";
        for (int i = 0; i < kMaxAstDepth + 20; ++i) sql += "NOT ";
        sql += "flag)";
        auto result = parser.parse(sql);
        REQUIRE_FALSE(result.is_valid);
        CHECK(result.error_kind == ErrorKind::INVALID_SQL);
        CHECK(has_table(result, std::nullopt, "t"));
        CHECK(has_table(result, std::nullopt, "u"));
        CHECK(result.has_subquery);
    }
}

TEST_CASE("SelectAnalyzer caps walk depth", "[parser]") {
    using namespace ast;

    ExprPtr expr = make_expr(ColumnRef{{}, "flag", false});
    for (int i = 0; i < kMaxAstDepth + 10; ++i) {
        expr = make_expr(UnaryExpr{"NOT", std::move(expr), false});
    }

    SelectStatement stmt;
    stmt.targets.push_back(SelectTarget{make_expr(ColumnRef{{}, "a", false}), std::nullopt});
    stmt.from.push_back(make_from(TableSource{std::nullopt, "t", std::nullopt}));
    stmt.where = std::move(expr);

    const auto analysis = SelectAnalyzer::analyze(stmt);
    CHECK(analysis.depth_exceeded);
    REQUIRE(analysis.tables.size() == 1);
    CHECK(analysis.tables[0].table == "t");
}
