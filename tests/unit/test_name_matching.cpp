#include <catch2/catch_test_macros.hpp>
#include "io/name_matching.hpp"

using namespace listall;

TEST_CASE("Name matching ignores case and surrounding whitespace", "[names]") {
    SECTION("ASCII") {
        REQUIRE(names_match("  Groceries\t", "groceries"));
        REQUIRE(names_match("Ostokset", "OSTOKSET"));
        REQUIRE_FALSE(names_match("Groceries", "Grocery"));
    }

    SECTION("other scripts") {
        REQUIRE(names_match("ÄITI", "äiti"));
        REQUIRE(names_match("ΣΠΙΤΙ", "σπιτι"));
        REQUIRE(names_match("ПОКУПКИ", "покупки"));
        REQUIRE(names_match("ԱՐԵՎ", "արեվ"));
        REQUIRE(names_match("ǄEM", "ǆem"));
        REQUIRE(names_match("ＳＨＯＰ", "ｓｈｏｐ"));
        REQUIRE(names_match("ƁOOK", "ɓook"));
    }

    SECTION("text without case is compared as is") {
        REQUIRE(names_match("日本 🛒", "日本 🛒"));
        REQUIRE_FALSE(names_match("日本", "中国"));
    }

    SECTION("blank names match each other only") {
        REQUIRE(names_match("", "  "));
        REQUIRE_FALSE(names_match("", "a"));
    }
}
