#include <catch2/catch_test_macros.hpp>
#include "core/validator.hpp"
#include "support/fixtures.hpp"

using namespace listall;

namespace {

bool has_path(const std::vector<ValidationError>& errors, const std::string& path) {
    for (const auto& e : errors) {
        if (e.path == path) return true;
    }
    return false;
}

} // namespace

TEST_CASE("A well-formed graph has no findings", "[validator]") {
    auto data = test::make_export({test::make_list("Groceries", {"Milk", "Bread"}),
                                   test::make_list("Hardware", {"Nails"}, 1)});
    REQUIRE(validate(data).empty());
    REQUIRE(validate(test::make_export({})).empty());
}

TEST_CASE("Validator checks the envelope", "[validator]") {
    auto data = test::make_export({});

    SECTION("missing export date") {
        data.export_date.reset();
        auto errors = validate(data);
        REQUIRE(errors.size() == 1);
        REQUIRE(errors[0].path == "exportDate");
    }

    SECTION("unsupported version") {
        data.version = "2.0";
        auto errors = validate(data);
        REQUIRE(errors.size() == 1);
        REQUIRE(errors[0].message == "Unsupported version: 2.0");
    }

    SECTION("blank version") {
        data.version = "  ";
        REQUIRE(validate(data)[0].message == "Version is missing");
    }
}

TEST_CASE("Validator collects every finding", "[validator]") {
    auto list = test::make_list("  ", {"", "Milk"});
    list.items[1].quantity = 0;
    auto other = test::make_list("Other", {"Bread"}, 1);
    other.items[0].list_id = Uuid::generate();

    auto errors = validate(test::make_export({list, other}));

    REQUIRE(errors.size() == 4);
    REQUIRE(has_path(errors, "lists[0].name"));
    REQUIRE(has_path(errors, "lists[0].items[0].title"));
    REQUIRE(has_path(errors, "lists[0].items[1].quantity"));
    REQUIRE(has_path(errors, "lists[1].items[0].listId"));
}

TEST_CASE("Validator rejects duplicate ids", "[validator]") {
    auto first = test::make_list("A", {"x"});
    auto second = test::make_list("B", {"y"}, 1);

    SECTION("list ids") {
        second.id = first.id;
        second.items[0].list_id = second.id;
        REQUIRE(has_path(validate(test::make_export({first, second})), "lists[1].id"));
    }

    SECTION("item ids across lists") {
        second.items[0].id = first.items[0].id;
        REQUIRE(has_path(validate(test::make_export({first, second})), "lists[1].items[0].id"));
    }

    SECTION("image ids across items") {
        auto image = test::make_image({1});
        first.items[0].images.push_back(image);
        second.items[0].images.push_back(image);
        REQUIRE(has_path(validate(test::make_export({first, second})), "lists[1].items[0].images[0].id"));
    }
}

TEST_CASE("Entity defects name the reason", "[validator]") {
    auto list = test::make_list("\t");
    REQUIRE(list_defect(list) == std::optional<std::string>("List name cannot be empty"));
    list.name = "Ok";
    REQUIRE_FALSE(list_defect(list).has_value());

    auto item = test::make_item(list.id, "Eggs");
    REQUIRE_FALSE(item_defect(item).has_value());
    item.quantity = -2;
    REQUIRE(item_defect(item) == std::optional<std::string>("Item quantity must be at least 1 (got -2)"));
}

TEST_CASE("Summaries join messages with their paths", "[validator]") {
    std::vector<ValidationError> errors{{"version", "Version is missing"},
                                        {"lists[0].name", "List name cannot be empty"}};
    REQUIRE(summarize(errors) == "Version is missing (version); List name cannot be empty (lists[0].name)");
    REQUIRE(summarize({}).empty());
}
