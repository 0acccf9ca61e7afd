// Catch2 tests for Levenshtein distance and the bounded variant

#include <catch2/catch_test_macros.hpp>

#include <schemadex/search/edit_distance.h>

#include <string>
#include <vector>

using namespace schemadex::search;

TEST_CASE("editDistance basics", "[search][levenshtein][catch2]") {
    SECTION("Identity") {
        CHECK(editDistance("customer", "customer") == 0);
        CHECK(editDistance("", "") == 0);
    }

    SECTION("Single character operations") {
        CHECK(editDistance("order", "ordar") == 1);  // substitution
        CHECK(editDistance("orders", "order") == 1); // deletion
        CHECK(editDistance("order", "orderx") == 1); // insertion
    }

    SECTION("Multiple operations") {
        CHECK(editDistance("kitten", "sitting") == 3);
        CHECK(editDistance("saturday", "sunday") == 3);
    }

    SECTION("Against the empty string") {
        CHECK(editDistance("invoice", "") == 7);
        CHECK(editDistance("", "ledger") == 6);
    }

    SECTION("Symmetric") {
        const std::vector<std::pair<std::string, std::string>> pairs = {
            {"CUST_ID", "CUSTID"}, {"abc", "xyzabc"}, {"table", "tab"}, {"", "q"}};
        for (const auto& [a, b] : pairs) {
            CHECK(editDistance(a, b) == editDistance(b, a));
        }
    }

    SECTION("Case sensitive") {
        CHECK(editDistance("ABC", "abc") == 3);
    }
}

TEST_CASE("editDistanceBounded agrees within the bound", "[search][levenshtein][catch2]") {
    const std::vector<std::pair<std::string, std::string>> pairs = {
        {"kitten", "sitting"}, {"order", "orders"}, {"cust", "cutt"},
        {"hello", "hello"},    {"abc", "abd"},      {"invoice", "invoices"}};

    for (const auto& [a, b] : pairs) {
        const size_t exact = editDistance(a, b);
        for (size_t bound = exact; bound < exact + 3; ++bound) {
            CHECK(editDistanceBounded(a, b, bound) == exact);
        }
    }
}

TEST_CASE("editDistanceBounded exceeds the bound when the distance does",
          "[search][levenshtein][catch2]") {
    SECTION("Early exit") {
        CHECK(editDistanceBounded("kitten", "sitting", 1) > 1);
        CHECK(editDistanceBounded("customer", "supplier", 2) > 2);
    }

    SECTION("Length gap short-circuit") {
        CHECK(editDistanceBounded("a", "abcdef", 2) == 3);
        CHECK(editDistanceBounded("abcdef", "", 1) == 2);
    }

    SECTION("Zero bound") {
        CHECK(editDistanceBounded("same", "same", 0) == 0);
        CHECK(editDistanceBounded("same", "sane", 0) == 1);
    }
}

TEST_CASE("Distance metric interface", "[search][levenshtein][catch2]") {
    LevenshteinDistance plain;
    BoundedLevenshteinDistance bounded(1);

    const IDistanceMetric& a = plain;
    const IDistanceMetric& b = bounded;

    CHECK(a.distance("kitten", "sitting") == 3);
    CHECK(b.distance("kitten", "sitting") == 2);
    CHECK(b.distance("ledger", "ledgers") == 1);
    CHECK(bounded.maxDistance() == 1);
}
