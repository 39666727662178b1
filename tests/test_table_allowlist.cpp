#include <catch2/catch_test_macros.hpp>
#include "catalog/table_allowlist.hpp"
#include "mocks/fake_table_registry.hpp"

#include <thread>

using namespace querygate;
using namespace querygate::testing;

namespace {

std::vector<AllowedTable> default_rows() {
    return {
        {"ih", "encounters", 1, true},
        {"ih", "claims", 2, true},
        {"ih", "patients", 3, true},
    };
}

struct AllowListFixture {
    std::shared_ptr<FakeTableRegistry> registry = std::make_shared<FakeTableRegistry>(default_rows());
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    TableAllowList allow_list{registry, clock, TableAllowList::Config{std::chrono::seconds{300}}};
};

} // anonymous namespace

TEST_CASE("Allow-list keys", "[allowlist]") {
    SECTION("Four keys per qualified row") {
        auto keys = TableAllowList::keys_for("ih", "encounters");
        REQUIRE(keys.size() == 4);
        CHECK(keys[0] == "ih.encounters");
        CHECK(keys[1] == "\"ih\".\"encounters\"");
        CHECK(keys[2] == "encounters");
        CHECK(keys[3] == "\"encounters\"");
    }

    SECTION("Empty schema yields bare keys only") {
        auto keys = TableAllowList::keys_for("", "lookup");
        REQUIRE(keys.size() == 2);
        CHECK(keys[0] == "lookup");
    }
}

TEST_CASE("Allow-list snapshot caching", "[allowlist]") {
    AllowListFixture f;

    SECTION("First read loads, later reads within TTL are cached") {
        auto tables = f.allow_list.get_allowed_tables();
        CHECK(tables.contains("ih.encounters"));
        CHECK(tables.contains("claims"));
        CHECK(tables.size() == 12);
        CHECK(f.registry->load_count() == 1);

        f.clock->advance(std::chrono::seconds{299});
        (void)f.allow_list.get_allowed_tables();
        CHECK(f.registry->load_count() == 1);
        CHECK(f.allow_list.version() == 1);
    }

    SECTION("Expired TTL reloads") {
        (void)f.allow_list.get_allowed_tables();
        f.registry->set_rows({{"ih", "encounters", 1, true}});
        f.clock->advance(std::chrono::seconds{300});

        auto tables = f.allow_list.get_allowed_tables();
        CHECK(f.registry->load_count() == 2);
        CHECK_FALSE(tables.contains("ih.claims"));
        CHECK(f.allow_list.version() == 2);
    }

    SECTION("Force refresh ignores the TTL") {
        (void)f.allow_list.get_allowed_tables();
        (void)f.allow_list.get_allowed_tables(true);
        CHECK(f.registry->load_count() == 2);
    }

    SECTION("Invalidate drops the snapshot") {
        (void)f.allow_list.get_allowed_tables();
        f.allow_list.invalidate();
        CHECK(f.allow_list.snapshot() == nullptr);

        (void)f.allow_list.get_allowed_tables();
        CHECK(f.registry->load_count() == 2);
    }

    SECTION("Inactive and nameless rows are skipped") {
        f.registry->set_rows({
            {"ih", "encounters", 1, true},
            {"ih", "retired", 1, false},
            {"ih", "", 1, true},
        });
        auto tables = f.allow_list.get_allowed_tables(true);
        CHECK(tables.contains("ih.encounters"));
        CHECK_FALSE(tables.contains("ih.retired"));
        REQUIRE(f.allow_list.snapshot());
        CHECK(f.allow_list.snapshot()->entries.size() == 1);
    }
}

TEST_CASE("Allow-list reload failures", "[allowlist]") {
    AllowListFixture f;

    SECTION("Stale snapshot is served and the reload is retried") {
        (void)f.allow_list.get_allowed_tables();
        f.registry->set_fail(true);
        f.clock->advance(std::chrono::seconds{301});

        auto tables = f.allow_list.get_allowed_tables();
        CHECK(tables.contains("ih.encounters"));
        CHECK(f.registry->load_count() == 2);

        (void)f.allow_list.get_allowed_tables();
        CHECK(f.registry->load_count() == 3);

        f.registry->set_fail(false);
        (void)f.allow_list.get_allowed_tables();
        CHECK(f.registry->load_count() == 4);
        CHECK(f.allow_list.version() == 2);
    }

    SECTION("No snapshot means an empty, uncached set") {
        f.registry->set_fail(true);
        CHECK(f.allow_list.get_allowed_tables().empty());
        CHECK(f.allow_list.snapshot() == nullptr);

        f.registry->set_fail(false);
        CHECK_FALSE(f.allow_list.get_allowed_tables().empty());
        CHECK(f.registry->load_count() == 2);
    }
}

TEST_CASE("Allow-list tier filter", "[allowlist]") {
    AllowListFixture f;

    auto tier_two = f.allow_list.get_allowed_tables_up_to_tier(2);
    CHECK(tier_two.contains("ih.encounters"));
    CHECK(tier_two.contains("ih.claims"));
    CHECK_FALSE(tier_two.contains("ih.patients"));

    auto tier_one = f.allow_list.get_allowed_tables_up_to_tier(1);
    CHECK(tier_one.size() == 4);
    CHECK(f.registry->load_count() == 1);
}

TEST_CASE("Allow-list reference matching", "[allowlist]") {
    const std::unordered_set<std::string> allowed = {
        "ih.encounters", "\"ih\".\"encounters\"", "encounters", "\"encounters\""
    };

    SECTION("Qualified and bare references resolve") {
        std::vector<ParsedTableRef> refs = {{"ih", "encounters"}, {std::nullopt, "encounters"}};
        CHECK(TableAllowList::find_disallowed(refs, allowed).empty());
    }

    SECTION("Wrong schema does not fall back to the bare name") {
        std::vector<ParsedTableRef> refs = {{"public", "encounters"}};
        auto disallowed = TableAllowList::find_disallowed(refs, allowed);
        REQUIRE(disallowed.size() == 1);
        CHECK(disallowed[0] == "public.encounters");
    }

    SECTION("Each name reported once, in first-seen order") {
        std::vector<ParsedTableRef> refs = {
            {"public", "users"}, {"ih", "encounters"}, {std::nullopt, "secrets"}, {"public", "users"}
        };
        auto disallowed = TableAllowList::find_disallowed(refs, allowed);
        REQUIRE(disallowed.size() == 2);
        CHECK(disallowed[0] == "public.users");
        CHECK(disallowed[1] == "secrets");
    }
}

TEST_CASE("Allow-list concurrent readers see a whole snapshot", "[allowlist]") {
    auto registry = std::make_shared<FakeTableRegistry>(default_rows());
    TableAllowList allow_list(registry);

    std::atomic<bool> torn{false};
    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&allow_list, &torn] {
            for (int j = 0; j < 200; ++j) {
                auto tables = allow_list.get_allowed_tables(j % 10 == 0);
                if (tables.size() != 12) torn.store(true);
            }
        });
    }
    for (auto& t : readers) t.join();
    CHECK_FALSE(torn.load());
}
