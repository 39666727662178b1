#include <catch2/catch_test_macros.hpp>
#include "executor/bounded_executor.hpp"
#include "mocks/fake_table_registry.hpp"
#include "mocks/mock_query_engine.hpp"
#include "mocks/recording_event_sink.hpp"

#include <functional>

using namespace querygate;
using namespace querygate::testing;

namespace {

struct ExecutorFixture {
    std::shared_ptr<FakeTableRegistry> registry = std::make_shared<FakeTableRegistry>(
        std::vector<AllowedTable>{{"ih", "encounters", 1, true}});
    std::shared_ptr<RecordingEventSink> events = std::make_shared<RecordingEventSink>();
    std::shared_ptr<QueryGuard> guard = std::make_shared<QueryGuard>(
        std::make_shared<TableAllowList>(registry, std::make_shared<ManualClock>()), events);
    std::shared_ptr<MockQueryEngine> engine = std::make_shared<MockQueryEngine>();

    ExecutorFixture() {
        engine->set_result(MockQueryEngine::rows_result({"measure"}, {"text"}, {}));
    }

    BoundedExecutor executor(BoundedExecutor::Config config = {}) const {
        return BoundedExecutor(guard, engine, config);
    }
};

Principal tenant_user(std::vector<int64_t> tenants = {10, 20}) {
    Principal p;
    p.user_id = "analyst-1";
    p.tenant_ids = std::move(tenants);
    return p;
}

constexpr std::string_view kSql = "SELECT measure FROM ih.encounters WHERE year = 2024";

ErrorKind kind_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const GatewayError& e) {
        return e.kind();
    }
    FAIL("expected GatewayError");
    return ErrorKind::EXECUTION_FAILED;
}

} // anonymous namespace

TEST_CASE("BoundedExecutor runs the secured, row-capped statement", "[executor]") {
    ExecutorFixture f;
    f.engine->set_result(MockQueryEngine::rows_result(
        {"measure"}, {"text"}, {{std::string("bmi")}, {std::nullopt}}));

    auto result = f.executor().execute(kSql, tenant_user());

    auto queries = f.engine->queries();
    REQUIRE(queries.size() == 1);
    CHECK(queries[0] == "SELECT measure FROM ih.encounters "
                        "WHERE (year = 2024) AND (practice_uid IN (10, 20)) LIMIT 1000");
    CHECK(f.engine->timeouts()[0] == std::chrono::milliseconds{30000});

    CHECK(result.row_count == 2);
    REQUIRE(result.rows.size() == 2);
    CHECK(result.rows[0][0] == "bmi");
    CHECK_FALSE(result.rows[1][0].has_value());
    REQUIRE(result.columns.size() == 1);
    CHECK(result.columns[0] == ColumnInfo{"measure", "text"});
    CHECK(result.execution_time_ms >= 0);
}

TEST_CASE("BoundedExecutor row ceiling", "[executor]") {
    ExecutorFixture f;
    auto executor = f.executor(BoundedExecutor::Config{30000, 120000, 100, 500});

    SECTION("Smaller LIMIT is kept as written") {
        CHECK(executor.apply_row_limit("SELECT a FROM t LIMIT 5", 100) == "SELECT a FROM t LIMIT 5");
    }

    SECTION("Larger LIMIT is lowered") {
        CHECK(executor.apply_row_limit("SELECT a FROM t LIMIT 5000 OFFSET 2", 100)
              == "SELECT a FROM t LIMIT 100 OFFSET 2");
    }

    SECTION("LIMIT ALL is replaced") {
        CHECK(executor.apply_row_limit("SELECT a FROM t LIMIT ALL", 100) == "SELECT a FROM t LIMIT 100");
    }

    SECTION("Requested limit is capped at the maximum") {
        CHECK(executor.effective_row_limit(ExecuteOptions{50000, std::nullopt}) == 500);
        CHECK(executor.effective_row_limit(ExecuteOptions{20, std::nullopt}) == 20);
        CHECK(executor.effective_row_limit({}) == 100);
    }

    SECTION("Non-positive limit is refused") {
        CHECK_THROWS_AS(executor.effective_row_limit(ExecuteOptions{0, std::nullopt}), GatewayError);
    }

    SECTION("Caller limit reaches the engine") {
        (void)executor.execute(kSql, tenant_user({10}), ExecuteOptions{7, std::nullopt});
        auto queries = f.engine->queries();
        REQUIRE(queries.size() == 1);
        CHECK(queries[0].ends_with("LIMIT 7"));
    }
}

TEST_CASE("BoundedExecutor timeout handling", "[executor]") {
    ExecutorFixture f;
    auto executor = f.executor(BoundedExecutor::Config{30000, 60000, 1000, 10000});

    SECTION("Timeout is capped at the maximum") {
        CHECK(executor.effective_timeout(ExecuteOptions{std::nullopt, 999999}) == std::chrono::milliseconds{60000});
        CHECK(executor.effective_timeout({}) == std::chrono::milliseconds{30000});
        CHECK_THROWS_AS(executor.effective_timeout(ExecuteOptions{std::nullopt, -1}), GatewayError);
    }

    SECTION("Slow engine surfaces QueryTimeout") {
        f.engine->set_delay(std::chrono::milliseconds{300});
        try {
            (void)executor.execute(kSql, tenant_user(), ExecuteOptions{std::nullopt, 50});
            FAIL("expected timeout");
        } catch (const GatewayError& e) {
            CHECK(e.kind() == ErrorKind::QUERY_TIMEOUT);
            CHECK(std::string(e.what()) == "Query exceeded timeout of 50ms");
        }
    }
}

TEST_CASE("BoundedExecutor never reaches the engine for rejected queries", "[executor]") {
    ExecutorFixture f;
    auto executor = f.executor();

    SECTION("Empty tenant scope") {
        CHECK(kind_of([&] { (void)executor.execute(kSql, tenant_user({})); })
              == ErrorKind::EMPTY_TENANT_SCOPE);
    }

    SECTION("Destructive keyword") {
        CHECK(kind_of([&] { (void)executor.execute("DROP TABLE ih.encounters", tenant_user()); })
              == ErrorKind::DESTRUCTIVE_KEYWORD_DETECTED);
    }

    SECTION("Table outside the allow-list carries the full error list") {
        try {
            (void)executor.execute("SELECT * FROM public.users", tenant_user());
            FAIL("expected rejection");
        } catch (const GatewayError& e) {
            CHECK(e.kind() == ErrorKind::TABLE_NOT_ALLOWED);
            CHECK(std::string(e.what()) == "Tables not in allow-list: public.users");
            REQUIRE(e.errors().size() == 1);
        }
    }

    CHECK(f.engine->queries().empty());
}

TEST_CASE("BoundedExecutor engine failures", "[executor]") {
    ExecutorFixture f;
    auto executor = f.executor();

    SECTION("Unreachable engine is checked before securing") {
        f.engine->set_reachable(false);
        CHECK(kind_of([&] { (void)executor.execute(kSql, tenant_user()); })
              == ErrorKind::ENGINE_UNREACHABLE);
        CHECK(f.events->events().empty());
        CHECK(f.engine->queries().empty());
    }

    SECTION("Engine diagnostics are not passed to the caller") {
        f.engine->set_result(MockQueryEngine::failure(
            "ERROR: permission denied for relation secret_audit_log"));
        try {
            (void)executor.execute(kSql, tenant_user());
            FAIL("expected failure");
        } catch (const GatewayError& e) {
            CHECK(e.kind() == ErrorKind::EXECUTION_FAILED);
            CHECK(std::string(e.what()) == "Query execution failed");
        }
    }

    SECTION("Empty result has no columns") {
        f.engine->set_result(MockQueryEngine::rows_result({"measure"}, {"text"}, {}));
        auto result = executor.execute(kSql, tenant_user());
        CHECK(result.row_count == 0);
        CHECK(result.columns.empty());
    }

    SECTION("Columns come from the first row width") {
        f.engine->set_result(MockQueryEngine::rows_result(
            {"measure"}, {"text"}, {{std::string("a"), std::string("b")}}));
        auto result = executor.execute(kSql, tenant_user());
        REQUIRE(result.columns.size() == 2);
        CHECK(result.columns[0] == ColumnInfo{"measure", "text"});
        CHECK(result.columns[1] == ColumnInfo{"column2", "unknown"});
    }
}
