// Catch2 tests for the search engines (reference and accelerated share one contract)

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <schemadex/catalog/mock_catalog.h>
#include <schemadex/search/accelerated_search_engine.h>
#include <schemadex/search/search_engine_registry.h>
#include <schemadex/search/search_index.h>

#include <memory>
#include <string>
#include <vector>

using namespace schemadex;
using namespace schemadex::search;
using Catch::Approx;

namespace {

std::vector<catalog::TableDescriptor> sampleTables() {
    return {
        {"S", "USER_ACCOUNTS_ARCHIVE", "Old accounts"},
        {"S", "USER_ACCOUNTS", "Main user account table"},
        {"S", "USERS", "User information"},
        {"S", "ORDERS", "Customer orders"},
        {"T", "USERS", "Duplicate users table"},
        {"S", "HELLO_WORLD", ""},
        {"S", "\xC3\x9C" "BER_DATEN", "Unicode name"},
    };
}

std::vector<catalog::ColumnDescriptor> sampleColumns() {
    using catalog::Nullable;
    return {
        {"S", "USERS", "ID", "INTEGER", 10, 0, Nullable::No, "User identifier"},
        {"S", "USERS", "EMAIL", "VARCHAR", 255, 0, Nullable::Yes, "Email address"},
        {"S", "ORDERS", "ID", "INTEGER", 10, 0, Nullable::No, "Order identifier"},
        {"S", "ORDERS", "TOTAL_PRICE", "DECIMAL", 12, 2, Nullable::No, "Order total"},
    };
}

std::unique_ptr<ISearchEngine> makeEngine(const std::string& name) {
    auto registry = SearchEngineRegistry::withBuiltins();
    return registry.create(name, std::make_shared<StringInterner>());
}

std::vector<std::string> names(const std::vector<TableHit>& hits) {
    std::vector<std::string> out;
    for (const auto& h : hits)
        out.push_back(h.item.qualifiedName());
    return out;
}

} // namespace

TEST_CASE("Search engine table scoring", "[search][index][catch2]") {
    const auto engineName = GENERATE(as<std::string>{}, "reference", "accelerated");
    CAPTURE(engineName);

    auto engine = makeEngine(engineName);
    REQUIRE(engine);
    CHECK(engine->name() == engineName);
    engine->buildIndex(sampleTables(), sampleColumns());

    SECTION("Exact name ranks above substring hits") {
        auto hits = engine->searchTablesScored("USER_ACCOUNTS");
        REQUIRE(hits.size() == 2);
        CHECK(hits[0].item.name == "USER_ACCOUNTS");
        CHECK(hits[0].score == Approx(2.0));
        CHECK(hits[1].item.name == "USER_ACCOUNTS_ARCHIVE");
        CHECK(hits[1].score == Approx(1.0));
    }

    SECTION("Substring hits keep insertion order") {
        auto hits = engine->searchTablesScored("user");
        CHECK(names(hits) ==
              std::vector<std::string>{"S.USER_ACCOUNTS_ARCHIVE", "S.USER_ACCOUNTS", "S.USERS",
                                       "T.USERS"});
        for (const auto& h : hits) {
            CHECK(h.score >= 1.0);
        }
    }

    SECTION("Substring in the middle of a name") {
        auto tables = engine->searchTablesScored("ccount");
        REQUIRE(tables.size() == 2);
        CHECK(tables[0].item.name == "USER_ACCOUNTS_ARCHIVE");
        CHECK(tables[1].item.name == "USER_ACCOUNTS");
        CHECK(tables[0].score == Approx(1.0));

        auto columns = engine->searchColumnsScored("tal_pr");
        REQUIRE(columns.size() == 1);
        CHECK(columns[0].item.name == "TOTAL_PRICE");
        CHECK(columns[0].score == Approx(1.0));
    }

    SECTION("Remarks tier") {
        auto hits = engine->searchTablesScored("account table");
        REQUIRE(hits.size() == 1);
        CHECK(hits[0].item.name == "USER_ACCOUNTS");
        CHECK(hits[0].score == Approx(0.8));
    }

    SECTION("Case-insensitive query") {
        CHECK(names(engine->searchTablesScored("OrDeRs")) == std::vector<std::string>{"S.ORDERS"});
    }

    SECTION("Multi-word query matches underscore names") {
        auto hits = engine->searchTablesScored("hello world");
        REQUIRE(hits.size() == 1);
        CHECK(hits[0].item.name == "HELLO_WORLD");
        CHECK(hits[0].score == Approx(1.0));
    }

    SECTION("Duplicate names across schemas") {
        auto hits = engine->searchTablesScored("users");
        REQUIRE(hits.size() == 2);
        CHECK(hits[0].item.qualifiedName() == "S.USERS");
        CHECK(hits[1].item.qualifiedName() == "T.USERS");
        CHECK(hits[0].score == Approx(2.0));
        CHECK(hits[1].score == Approx(2.0));
    }

    SECTION("Non-ASCII names pass through") {
        auto hits = engine->searchTablesScored("\xC3\x9C" "BER");
        REQUIRE(hits.size() == 1);
        CHECK(hits[0].item.name == "\xC3\x9C" "BER_DATEN");
        CHECK(engine->searchTables("daten").size() == 1);
    }

    SECTION("Empty query returns everything in insertion order") {
        auto hits = engine->searchTablesScored("");
        CHECK(hits.size() == sampleTables().size());
        CHECK(hits.front().item.name == "USER_ACCOUNTS_ARCHIVE");
        CHECK(hits.back().item.remarks == "Unicode name");
    }

    SECTION("No match") {
        CHECK(engine->searchTables("zzz").empty());
    }

    SECTION("Descriptors come back intact") {
        auto tables = engine->searchTables("ORDERS");
        REQUIRE(tables.size() == 1);
        CHECK(tables[0] == catalog::TableDescriptor{"S", "ORDERS", "Customer orders"});
    }
}

TEST_CASE("Search engine column scoring", "[search][index][catch2]") {
    const auto engineName = GENERATE(as<std::string>{}, "reference", "accelerated");
    CAPTURE(engineName);

    auto engine = makeEngine(engineName);
    engine->buildIndex(sampleTables(), sampleColumns());

    SECTION("Exact name across tables") {
        auto hits = engine->searchColumnsScored("id");
        REQUIRE(hits.size() == 2);
        CHECK(hits[0].item.qualifiedName() == "S.USERS.ID");
        CHECK(hits[1].item.qualifiedName() == "S.ORDERS.ID");
        CHECK(hits[0].score == Approx(2.0));
    }

    SECTION("Name substring") {
        auto hits = engine->searchColumnsScored("price");
        REQUIRE(hits.size() == 1);
        CHECK(hits[0].score == Approx(1.0));
    }

    SECTION("Type tier") {
        auto hits = engine->searchColumnsScored("decimal");
        REQUIRE(hits.size() == 1);
        CHECK(hits[0].item.name == "TOTAL_PRICE");
        CHECK(hits[0].score == Approx(0.7));
    }

    SECTION("Remarks tier") {
        auto hits = engine->searchColumnsScored("address");
        REQUIRE(hits.size() == 1);
        CHECK(hits[0].item.name == "EMAIL");
        CHECK(hits[0].score == Approx(0.5));
    }

    SECTION("Optional fields survive") {
        auto cols = engine->searchColumns("TOTAL_PRICE");
        REQUIRE(cols.size() == 1);
        CHECK(cols[0] == sampleColumns()[3]);
    }

    SECTION("Grouped by owning table") {
        auto groups = engine->tablesWithMatchingColumns("order");
        REQUIRE(groups.size() == 1);
        CHECK(groups[0].table == "ORDERS");
        CHECK(groups[0].matchCount == 2);
        CHECK(groups[0].bestScore == Approx(0.5));

        auto byId = engine->tablesWithMatchingColumns("id");
        REQUIRE(byId.size() == 2);
        CHECK(byId[0].table == "USERS");
        CHECK(byId[1].table == "ORDERS");
    }
}

TEST_CASE("Search engine lifecycle", "[search][index][catch2]") {
    const auto engineName = GENERATE(as<std::string>{}, "reference", "accelerated");
    CAPTURE(engineName);

    auto engine = makeEngine(engineName);

    SECTION("Searching before any build") {
        CHECK(engine->searchTables("user").empty());
        CHECK(engine->searchColumns("").empty());
        CHECK(engine->stats().tableCount == 0);
    }

    SECTION("Empty lists") {
        engine->buildIndex({}, {});
        CHECK(engine->searchTables("").empty());
        CHECK(engine->searchColumns("id").empty());
    }

    SECTION("Tables without columns") {
        engine->buildIndex(sampleTables(), {});
        CHECK(engine->searchColumns("id").empty());
        CHECK_FALSE(engine->searchTables("orders").empty());
    }

    SECTION("Rebuild is idempotent") {
        engine->buildIndex(sampleTables(), sampleColumns());
        auto first = names(engine->searchTablesScored("user"));
        auto firstStats = engine->stats();

        engine->buildIndex(sampleTables(), sampleColumns());
        CHECK(names(engine->searchTablesScored("user")) == first);
        CHECK(engine->stats().tableCount == firstStats.tableCount);
        CHECK(engine->stats().columnCount == firstStats.columnCount);
        CHECK(engine->stats().indexNodes == firstStats.indexNodes);
    }

    SECTION("Rebuild replaces content") {
        engine->buildIndex(sampleTables(), sampleColumns());
        engine->buildIndex({{"X", "LEDGER", ""}}, {});
        CHECK(engine->searchTables("user").empty());
        CHECK(engine->searchTables("ledger").size() == 1);
        CHECK(engine->stats().tableCount == 1);
    }

    SECTION("Shared interner") {
        auto interner = std::make_shared<StringInterner>();
        ReferenceSearchEngine a(interner);
        AcceleratedSearchEngine b(interner);
        a.buildIndex(sampleTables(), sampleColumns());
        const auto before = interner->size();
        b.buildIndex(sampleTables(), sampleColumns());
        CHECK(interner->size() == before);
        CHECK(a.intern("S").data() == b.intern("S").data());
    }

    SECTION("Accelerated engine owns its descriptors") {
        auto interner = std::make_shared<StringInterner>();
        AcceleratedSearchEngine accelerated(interner);
        accelerated.buildIndex(sampleTables(), sampleColumns());
        CHECK(interner->size() == 0);

        auto hits = accelerated.searchTablesScored("users");
        REQUIRE(hits.size() == 2);
        CHECK(hits[1].item.schema == "T");
    }
}

TEST_CASE("Search engine helpers", "[search][index][catch2]") {
    ReferenceSearchEngine reference;
    AcceleratedSearchEngine accelerated;

    CHECK(reference.normalize("CUSTOMER_ORDER") == "customer order");
    CHECK(accelerated.normalize("CUSTOMER_ORDER") == "customer order");
    CHECK(reference.normalize("") == "");
    CHECK(reference.splitWords("  hello   world ") == std::vector<std::string>{"hello", "world"});
    CHECK(reference.splitWords("").empty());
}

TEST_CASE("Reference and accelerated engines agree", "[search][index][parity][catch2]") {
    catalog::MockCatalogGenerator heavy(catalog::MockCatalogGenerator::DataSet::Heavy);
    const auto& data = heavy.all();

    ReferenceSearchEngine reference;
    AcceleratedSearchEngine accelerated;
    reference.buildIndex(data.tables, data.columns);
    accelerated.buildIndex(data.tables, data.columns);

    const std::vector<std::string> queries = {"",       "cust",     "ORDER_0", "ledger",
                                              "table 3", "id",       "decimal", "amount_02",
                                              "column 1", "sales",   "zzz",     "_"};

    for (const auto& q : queries) {
        CAPTURE(q);

        auto refTables = reference.searchTablesScored(q);
        auto accTables = accelerated.searchTablesScored(q);
        REQUIRE(refTables.size() == accTables.size());
        for (size_t i = 0; i < refTables.size(); ++i) {
            CHECK(refTables[i].item == accTables[i].item);
            CHECK(refTables[i].score == Approx(accTables[i].score));
        }

        auto refColumns = reference.searchColumnsScored(q);
        auto accColumns = accelerated.searchColumnsScored(q);
        REQUIRE(refColumns.size() == accColumns.size());
        for (size_t i = 0; i < refColumns.size(); ++i) {
            CHECK(refColumns[i].item == accColumns[i].item);
            CHECK(refColumns[i].score == Approx(accColumns[i].score));
        }
    }
}

TEST_CASE("SearchEngineHandle snapshots", "[search][index][catch2]") {
    SearchEngineHandle handle;
    CHECK(handle.snapshot() == nullptr);

    auto first = std::make_shared<ReferenceSearchEngine>();
    first->buildIndex({{"S", "FIRST", ""}}, {});
    handle.publish(first);

    auto reader = handle.snapshot();

    auto second = std::make_shared<ReferenceSearchEngine>();
    second->buildIndex({{"S", "SECOND", ""}}, {});
    handle.publish(second);

    CHECK(reader->searchTables("first").size() == 1);
    CHECK(handle.snapshot()->searchTables("first").empty());
    CHECK(handle.snapshot()->searchTables("second").size() == 1);
}
