#include <catch2/catch_test_macros.hpp>
#include "security/query_guard.hpp"
#include "mocks/fake_table_registry.hpp"
#include "mocks/recording_event_sink.hpp"

using namespace querygate;
using namespace querygate::testing;

namespace {

struct GuardFixture {
    std::shared_ptr<FakeTableRegistry> registry = std::make_shared<FakeTableRegistry>(
        std::vector<AllowedTable>{
            {"ih", "encounters", 1, true},
            {"ih", "patients", 2, true},
            {"ih", "claims", 3, true},
        });
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    std::shared_ptr<TableAllowList> allow_list = std::make_shared<TableAllowList>(registry, clock);
    std::shared_ptr<RecordingEventSink> events = std::make_shared<RecordingEventSink>();

    QueryGuard guard(QueryGuard::Config config = {}) const {
        return QueryGuard(allow_list, events, std::move(config));
    }
};

Principal analyst(std::vector<int64_t> tenants) {
    Principal p;
    p.user_id = "analyst-1";
    p.tenant_ids = std::move(tenants);
    return p;
}

constexpr std::string_view kScenarioSql = "SELECT measure FROM ih.encounters WHERE year = 2024";

} // anonymous namespace

TEST_CASE("Scenario A: tenant filter is grafted onto the WHERE clause", "[guard]") {
    GuardFixture f;
    auto result = f.guard().secure(kScenarioSql, analyst({10, 20}));

    REQUIRE(result.success);
    CHECK(result.sql == "SELECT measure FROM ih.encounters "
                        "WHERE (year = 2024) AND (practice_uid IN (10, 20))");
    CHECK_FALSE(result.tenant_filter_bypassed);
    REQUIRE(result.tables.size() == 1);
    CHECK(result.tables[0].full_name() == "ih.encounters");
    CHECK(f.events->events().empty());
}

TEST_CASE("Scenario B: destructive keyword is rejected before parsing", "[guard]") {
    GuardFixture f;
    auto result = f.guard().secure("DROP TABLE x; SELECT 1", analyst({10}));

    REQUIRE_FALSE(result.success);
    CHECK(result.error_kind == ErrorKind::DESTRUCTIVE_KEYWORD_DETECTED);
    REQUIRE(result.errors.size() == 1);
    CHECK(result.errors[0] == "Destructive operations not allowed: DROP");
    CHECK(result.tables.empty());
    CHECK(f.registry->load_count() == 0);

    auto events = f.events->events();
    REQUIRE(events.size() == 1);
    CHECK(events[0].type == SecurityEventType::QUERY_REJECTED);
    CHECK(events[0].user_id == "analyst-1");
    CHECK(events[0].detail == "DestructiveKeywordDetected: Destructive operations not allowed: DROP");
}

TEST_CASE("Scenario C: subquery is rejected and every table is reported", "[guard]") {
    GuardFixture f;
    auto result = f.guard().secure(
        "SELECT * FROM ih.patients WHERE id IN (SELECT patient_id FROM ih.claims)", analyst({10}));

    REQUIRE_FALSE(result.success);
    CHECK(result.error_kind == ErrorKind::SUBQUERY_REJECTED);
    REQUIRE(result.tables.size() == 2);
    CHECK(result.tables[0].full_name() == "ih.patients");
    CHECK(result.tables[1].full_name() == "ih.claims");
    CHECK(f.events->count(SecurityEventType::QUERY_REJECTED) == 1);
}

TEST_CASE("Scenario D: table outside the allow-list is named", "[guard]") {
    GuardFixture f;
    auto result = f.guard().secure(
        "SELECT e.measure, u.email FROM ih.encounters e JOIN public.users u ON e.owner = u.id",
        analyst({10}));

    REQUIRE_FALSE(result.success);
    CHECK(result.error_kind == ErrorKind::TABLE_NOT_ALLOWED);
    REQUIRE(result.errors.size() == 1);
    CHECK(result.errors[0] == "Tables not in allow-list: public.users");
    CHECK(f.events->count(SecurityEventType::QUERY_REJECTED) == 1);
}

TEST_CASE("Scenario E: privileged principal bypasses the tenant filter", "[guard]") {
    GuardFixture f;

    SECTION("Super-admin") {
        Principal admin = analyst({});
        admin.is_super_admin = true;

        auto result = f.guard().secure(kScenarioSql, admin);
        REQUIRE(result.success);
        CHECK(result.sql == kScenarioSql);
        CHECK(result.tenant_filter_bypassed);

        auto events = f.events->events();
        REQUIRE(events.size() == 1);
        CHECK(events[0].type == SecurityEventType::TENANT_FILTER_BYPASS);
        CHECK(events[0].detail == "super-admin");
        CHECK(events[0].sql_preview == kScenarioSql);
    }

    SECTION("Holder of the bypass permission") {
        Principal explorer = analyst({10, 20});
        explorer.permissions.insert(std::string(kDefaultBypassPermission));

        auto result = f.guard().secure(kScenarioSql, explorer);
        REQUIRE(result.success);
        CHECK(result.sql == kScenarioSql);
        CHECK(f.events->count(SecurityEventType::TENANT_FILTER_BYPASS) == 1);
        CHECK(f.events->events()[0].detail == "permission data-explorer:execute:all");
    }

    SECTION("Custom bypass permission") {
        Principal explorer = analyst({10});
        explorer.permissions.insert(std::string(kDefaultBypassPermission));

        auto guard = f.guard(QueryGuard::Config{"reports:all", std::nullopt});
        auto result = guard.secure(kScenarioSql, explorer);
        REQUIRE(result.success);
        CHECK_FALSE(result.tenant_filter_bypassed);
        CHECK(result.sql != kScenarioSql);
    }

    SECTION("Bypass still requires allow-listed tables") {
        Principal admin = analyst({});
        admin.is_super_admin = true;

        auto result = f.guard().secure("SELECT email FROM public.users", admin);
        REQUIRE_FALSE(result.success);
        CHECK(result.error_kind == ErrorKind::TABLE_NOT_ALLOWED);
        CHECK(f.events->count(SecurityEventType::TENANT_FILTER_BYPASS) == 0);
    }
}

TEST_CASE("Scenario F: empty tenant scope is a hard failure", "[guard]") {
    GuardFixture f;
    auto result = f.guard().secure(kScenarioSql, analyst({}));

    REQUIRE_FALSE(result.success);
    CHECK(result.error_kind == ErrorKind::EMPTY_TENANT_SCOPE);
    CHECK(result.sql.empty());
    CHECK(f.events->count(SecurityEventType::TENANT_SCOPE_EMPTY) == 1);
    CHECK(f.events->count(SecurityEventType::QUERY_REJECTED) == 0);
}

TEST_CASE("QueryGuard secure stage outcomes", "[guard]") {
    GuardFixture f;
    auto guard = f.guard();

    SECTION("Non-SELECT that passes the screen") {
        auto result = guard.secure("VACUUM ih.encounters", analyst({10}));
        REQUIRE_FALSE(result.success);
        CHECK(result.error_kind == ErrorKind::NON_SELECT_STATEMENT_REJECTED);
    }

    SECTION("Multiple SELECT statements") {
        auto result = guard.secure("SELECT a FROM ih.encounters; SELECT b FROM ih.claims",
                                   analyst({10}));
        REQUIRE_FALSE(result.success);
        CHECK(result.error_kind == ErrorKind::MULTI_STATEMENT_REJECTED);
    }

    SECTION("SELECT without a table") {
        auto result = guard.secure("SELECT 1", analyst({10}));
        REQUIRE_FALSE(result.success);
        CHECK(result.error_kind == ErrorKind::INVALID_SQL);
        CHECK(result.errors[0] == "Query must reference at least one table");
    }

    SECTION("Bare table name resolves against the bare key") {
        auto result = guard.secure("SELECT measure FROM encounters", analyst({10}));
        REQUIRE(result.success);
        CHECK(result.sql == "SELECT measure FROM encounters WHERE practice_uid = 10");
    }

    SECTION("Tier ceiling narrows the allow-list") {
        auto tiered = f.guard(QueryGuard::Config{std::string(kDefaultBypassPermission), 1});
        CHECK(tiered.secure(kScenarioSql, analyst({10})).success);

        auto result = tiered.secure("SELECT name FROM ih.patients", analyst({10}));
        REQUIRE_FALSE(result.success);
        CHECK(result.error_kind == ErrorKind::TABLE_NOT_ALLOWED);
    }

    SECTION("Registry outage with no snapshot allows nothing") {
        f.registry->set_fail(true);
        auto result = guard.secure(kScenarioSql, analyst({10}));
        REQUIRE_FALSE(result.success);
        CHECK(result.error_kind == ErrorKind::TABLE_NOT_ALLOWED);
    }

    SECTION("Secured text is never the input when a filter applies") {
        auto result = guard.secure("SELECT measure FROM ih.encounters", analyst({3}));
        REQUIRE(result.success);
        CHECK(result.sql.find("practice_uid = 3") != std::string::npos);
    }
}

TEST_CASE("QueryGuard validate collects every problem", "[guard]") {
    GuardFixture f;
    auto guard = f.guard();

    SECTION("Clean query carries warnings only") {
        auto result = guard.validate("SELECT * FROM ih.encounters");
        CHECK(result.is_valid);
        CHECK(result.requires_tenant_filter);
        CHECK(result.errors.empty());
        CHECK_FALSE(result.error_kind);
        REQUIRE(result.warnings.size() == 2);
        CHECK(result.warnings[0] == "Query has no LIMIT clause; a row ceiling will be applied");
        CHECK(result.warnings[1] == "SELECT * returns every column of the referenced tables");
    }

    SECTION("LIMIT silences the ceiling warning") {
        auto result = guard.validate("SELECT measure FROM ih.encounters LIMIT 10");
        CHECK(result.is_valid);
        CHECK(result.warnings.empty());
    }

    SECTION("Screen, parse and allow-list errors in stage order") {
        auto result = guard.validate(
            "DELETE FROM public.users WHERE id IN (SELECT id FROM ih.claims)");
        REQUIRE_FALSE(result.is_valid);
        CHECK_FALSE(result.requires_tenant_filter);
        REQUIRE(result.errors.size() == 3);
        CHECK(result.errors[0] == "Destructive operations not allowed: DELETE");
        CHECK(result.errors[1] == "Only SELECT statements are allowed, got: delete");
        CHECK(result.errors[2] == "Tables not in allow-list: public.users");
        CHECK(result.error_kind == ErrorKind::DESTRUCTIVE_KEYWORD_DETECTED);
    }

    SECTION("Subquery and allow-list errors together") {
        auto result = guard.validate(
            "SELECT * FROM ih.patients WHERE id IN (SELECT uid FROM public.users)");
        REQUIRE_FALSE(result.is_valid);
        REQUIRE(result.errors.size() == 2);
        CHECK(result.error_kind == ErrorKind::SUBQUERY_REJECTED);
        CHECK(result.errors[1] == "Tables not in allow-list: public.users");
        CHECK(result.tables.size() == 2);
    }

    SECTION("Syntax error") {
        auto result = guard.validate("SELEC measure FROM");
        REQUIRE_FALSE(result.is_valid);
        CHECK(result.error_kind == ErrorKind::INVALID_SQL);
        CHECK(result.warnings.empty());
    }

    SECTION("Validation emits no events") {
        (void)guard.validate("DROP TABLE x");
        CHECK(f.events->events().empty());
    }
}

TEST_CASE("Security events serialize to one JSON line", "[guard]") {
    SecurityEvent event;
    event.type = SecurityEventType::TENANT_FILTER_BYPASS;
    event.user_id = "admin";
    event.detail = "super-admin";
    event.sql_preview = "SELECT \"a\" FROM t";
    event.timestamp = std::chrono::system_clock::time_point{std::chrono::seconds{1'700'000'000}};

    const std::string json = event.to_json();
    CHECK(json.starts_with(R"({"type":"tenant_filter_bypass","user_id":"admin")"));
    CHECK(json.find(R"("sql_preview":"SELECT \"a\" FROM t")") != std::string::npos);
    CHECK(json.find('\n') == std::string::npos);
}
