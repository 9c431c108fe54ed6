#include <catch2/catch_test_macros.hpp>
#include "io/plain_text_writer.hpp"
#include "io/text_parser.hpp"
#include "support/fixtures.hpp"

using namespace listall;

namespace {

List groceries() {
    auto list = test::make_list("Groceries", {"Bread", "Milk", "Eggs"});
    list.items[0].order_number = 1;
    list.items[0].is_crossed_out = true;
    list.items[0].description = "whole grain";
    list.items[1].order_number = 0;
    list.items[1].quantity = 2;
    list.items[2].order_number = 2;
    return list;
}

} // namespace

TEST_CASE("Plain text layout", "[share]") {
    const auto text = write_plain_text(groceries());
    REQUIRE(text == QString::fromUtf8("Groceries\n"
                                      "=========\n"
                                      "\n"
                                      "[ ] Milk (×2)\n"
                                      "[✓] Bread\n"
                                      "   whole grain\n"
                                      "[ ] Eggs\n"));
}

TEST_CASE("Plain text options", "[share]") {
    SECTION("crossed-out items can be left out") {
        const auto text = write_plain_text(groceries(), {.include_crossed_out = false});
        REQUIRE_FALSE(text.contains(QStringLiteral("Bread")));
        REQUIRE_FALSE(text.contains(QStringLiteral("whole grain")));
    }

    SECTION("quantities and descriptions can be left out") {
        const auto text = write_plain_text(groceries(),
                                           {.include_quantities = false, .include_descriptions = false});
        REQUIRE(text.contains(QStringLiteral("[ ] Milk\n")));
        REQUIRE_FALSE(text.contains(QStringLiteral("whole grain")));
    }

    SECTION("an empty list says so") {
        REQUIRE(write_plain_text(test::make_list("Empty")) == QStringLiteral("Empty\n=====\n\n(No items)\n"));
    }
}

TEST_CASE("Underline follows code points", "[share]") {
    const auto text = write_plain_text(test::make_list("Öl 🍺"));
    REQUIRE(text.split(QLatin1Char('\n'))[1] == QStringLiteral("===="));
}

TEST_CASE("Item lines read back as the same candidates", "[share]") {
    const auto lines = write_plain_text(groceries(), {.include_descriptions = false})
                           .split(QLatin1Char('\n'), Qt::SkipEmptyParts)
                           .mid(2);

    std::vector<TextCandidate> parsed;
    for (const auto& line : lines) {
        auto candidate = parse_text_line(line);
        REQUIRE(candidate.has_value());
        parsed.push_back(*candidate);
    }
    REQUIRE(parsed == std::vector<TextCandidate>{{"Milk", false, 2}, {"Bread", true, 1}, {"Eggs", false, 1}});
}

TEST_CASE("Several lists are separated by a blank line", "[share]") {
    const std::vector<List> lists{test::make_list("A", {"x"}), test::make_list("B", {}, 1)};
    REQUIRE(write_plain_text(lists) == QStringLiteral("A\n=\n\n[ ] x\n\nB\n=\n\n(No items)\n"));
    REQUIRE(write_plain_text(std::vector<List>{}).isEmpty());
}
