#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "generators.hpp"
#include "io/plain_text_writer.hpp"
#include "io/schema_codec.hpp"
#include "io/text_parser.hpp"

using namespace listall;

TEST_CASE("Property: decoding an encoded graph gives it back", "[property][codec]") {
    rc::check("decode(encode(data)) == data",
        [](const ExportData& data) {
            const bool indented = *rc::gen::arbitrary<bool>();
            auto decoded = decode_export(encode_export(data, indented));
            RC_ASSERT(decoded.is_ok());
            RC_ASSERT(decoded.unwrap() == data);
        }
    );
}

TEST_CASE("Property: decorated lines keep title, mark and quantity", "[property][text]") {
    rc::check("checkbox and quantity decorations are stripped exactly",
        [] {
            const auto title = *test::gen_name();
            const bool crossed = *rc::gen::arbitrary<bool>();
            const int quantity = *rc::gen::inRange(1, 1000);

            std::string line = *rc::gen::elementOf(std::vector<std::string>{"", "  ", "\t"});
            line += crossed ? *rc::gen::elementOf(std::vector<std::string>{"[x] ", "[X] ", "[✓] "}) : "[ ] ";
            line += title;
            if (quantity > 1) line += " (×" + std::to_string(quantity) + ")";

            auto parsed = parse_text_line(QString::fromStdString(line));
            RC_ASSERT(parsed.has_value());
            RC_ASSERT(*parsed == (TextCandidate{title, crossed, quantity}));
        }
    );
}

TEST_CASE("Property: shared text reads back item by item", "[property][text]") {
    rc::check("every item line of write_plain_text parses to its item",
        [](const List& list) {
            const auto text = write_plain_text(list, {.include_descriptions = false});
            auto lines = text.split(QLatin1Char('\n'), Qt::SkipEmptyParts).mid(2);
            const auto items = sorted_items(list);

            if (items.empty()) {
                RC_ASSERT(lines == QStringList{QStringLiteral("(No items)")});
                return;
            }
            RC_ASSERT(static_cast<size_t>(lines.size()) == items.size());
            for (size_t i = 0; i < items.size(); ++i) {
                auto parsed = parse_text_line(lines[static_cast<qsizetype>(i)]);
                RC_ASSERT(parsed.has_value());
                RC_ASSERT(parsed->title == items[i].title);
                RC_ASSERT(parsed->is_crossed_out == items[i].is_crossed_out);
                RC_ASSERT(parsed->quantity == items[i].quantity);
            }
        }
    );
}
