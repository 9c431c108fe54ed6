#include <catch2/catch_test_macros.hpp>
#include "io/format_detector.hpp"
#include "io/text_parser.hpp"

using namespace listall;

namespace {

TextCandidate line(const char* text) {
    auto parsed = parse_text_line(QString::fromUtf8(text));
    REQUIRE(parsed.has_value());
    return *parsed;
}

} // namespace

TEST_CASE("Text parser reads bullets, checkboxes and numbers", "[text]") {
    const auto parsed = parse_text(QString::fromUtf8("• Milk\n[x] Bread (×2)\n1. Eggs"));

    REQUIRE(parsed == std::vector<TextCandidate>{
        {"Milk", false, 1},
        {"Bread", true, 2},
        {"Eggs", false, 1}
    });
}

TEST_CASE("Text parser skips blank lines and keeps order", "[text]") {
    const auto parsed = parse_text(QString::fromUtf8("\n  \nApples\r\n\t\r\n  Pears  \n"));
    REQUIRE(parsed.size() == 2);
    REQUIRE(parsed[0].title == "Apples");
    REQUIRE(parsed[1].title == "Pears");

    REQUIRE_FALSE(parse_text_line(QStringLiteral(" \t ")).has_value());
    REQUIRE(parse_text(QString{}).empty());
}

TEST_CASE("Text parser bullet markers", "[text]") {
    for (const char* marker : {"•", "-", "*", "✓", "✔", "☐", "☑", "▪", "▸", "→"}) {
        auto text = std::string(marker) + " Coffee";
        CAPTURE(text);
        auto c = line(text.c_str());
        REQUIRE(c.title == "Coffee");
        REQUIRE_FALSE(c.is_crossed_out);
    }

    SECTION("only one marker is removed") {
        REQUIRE(line("- - Nested").title == "- Nested");
    }

    SECTION("a marker excludes a following checkbox") {
        auto c = line("• [x] Tea");
        REQUIRE(c.title == "[x] Tea");
        REQUIRE_FALSE(c.is_crossed_out);
    }
}

TEST_CASE("Text parser numbered prefixes", "[text]") {
    REQUIRE(line("1. Eggs").title == "Eggs");
    REQUIRE(line("12) Butter").title == "Butter");
    REQUIRE(line("3:Cheese").title == "Cheese");
    REQUIRE(line("2024 vintage").title == "2024 vintage");

    SECTION("a number excludes a following checkbox") {
        auto c = line("1. [✓] Flour");
        REQUIRE(c.title == "[✓] Flour");
        REQUIRE_FALSE(c.is_crossed_out);
    }
}

TEST_CASE("Text parser checkboxes", "[text]") {
    REQUIRE(line("[x] Done").is_crossed_out);
    REQUIRE(line("[X] Done").is_crossed_out);
    REQUIRE(line("[✓] Done").is_crossed_out);
    REQUIRE_FALSE(line("[ ] Todo").is_crossed_out);
    REQUIRE_FALSE(line("[] Todo").is_crossed_out);
    REQUIRE(line("[ ] Todo").title == "Todo");
    REQUIRE(line("[y] Maybe").title == "[y] Maybe");
}

TEST_CASE("Text parser quantity suffix", "[text]") {
    SECTION("suffix sets quantity") {
        auto c = line("Oranges (×12)");
        REQUIRE(c.title == "Oranges");
        REQUIRE(c.quantity == 12);
    }

    SECTION("suffix combines with a checkbox and a number") {
        auto checked = line("[x] Bread (×2)");
        REQUIRE(checked.is_crossed_out);
        REQUIRE(checked.quantity == 2);

        auto numbered = line("4. Rolls (×6)  ");
        REQUIRE(numbered.title == "Rolls");
        REQUIRE(numbered.quantity == 6);
    }

    SECTION("unusable quantities fall back to one") {
        REQUIRE(line("Water (×0)").quantity == 1);
        REQUIRE(line("Water (×99999999999)").quantity == 1);
        REQUIRE(line("Water (×0)").title == "Water");
    }

    SECTION("other parentheses stay in the title") {
        auto c = line("Pasta (x2)");
        REQUIRE(c.title == "Pasta (x2)");
        REQUIRE(c.quantity == 1);
        REQUIRE(line("Soup (×2) today").title == "Soup (×2) today");
    }
}

TEST_CASE("Text parser preserves Unicode titles", "[text]") {
    REQUIRE(line("• Leipä 🍞").title == "Leipä 🍞");
    REQUIRE(line("- חלב").title == "חלב");
    REQUIRE(line("[x] 牛乳 (×3)").title == "牛乳");
}

TEST_CASE("Text candidates are wrapped into one list", "[text]") {
    const auto data = wrap_candidates({{"Milk", false, 1}, {"Bread", true, 2}}, "Imported Items");

    REQUIRE(data.version == "1.0");
    REQUIRE(data.export_date.has_value());
    REQUIRE(data.lists.size() == 1);

    const auto& list = data.lists[0];
    REQUIRE(list.name == "Imported Items");
    REQUIRE(list.items.size() == 2);
    REQUIRE(list.items[0].title == "Milk");
    REQUIRE(list.items[0].order_number == 0);
    REQUIRE(list.items[1].order_number == 1);
    REQUIRE(list.items[1].is_crossed_out);
    REQUIRE(list.items[1].quantity == 2);
    REQUIRE(list.items[1].list_id == list.id);
    REQUIRE(list.items[0].id != list.items[1].id);
}

TEST_CASE("Format detection", "[text]") {
    REQUIRE(detect_format(R"({"version":"1.0","exportDate":"2024-01-01T00:00:00Z","lists":[]})") ==
            InputFormat::Structured);

    SECTION("brace-led input goes to the codec even when broken") {
        REQUIRE(detect_format("{\"lists\": []}") == InputFormat::Structured);
        REQUIRE(detect_format("  \n{ not json") == InputFormat::Structured);
    }

    SECTION("everything else is text") {
        REQUIRE(detect_format("Milk\nBread") == InputFormat::FreeText);
        REQUIRE(detect_format("[x] Bread") == InputFormat::FreeText);
        REQUIRE(detect_format("[1, 2]") == InputFormat::FreeText);
        REQUIRE(detect_format("") == InputFormat::FreeText);
    }
}
