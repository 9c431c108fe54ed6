#include <catch2/catch_test_macros.hpp>
#include "import/export_service.hpp"
#include "import/import_service.hpp"
#include "io/schema_codec.hpp"
#include "storage/database.hpp"
#include "storage/migrations.hpp"
#include "storage/sqlite_entity_store.hpp"
#include "support/fixtures.hpp"

#include <QTemporaryDir>

using namespace listall;
using namespace listall::storage;

namespace {

// Groceries (2 items, one with two images) and an archived Hardware list.
std::vector<List> sample_lists() {
    auto groceries = test::make_list("Groceries", {"Milk", "Bread"});
    groceries.items[0].description = "oat";
    groceries.items[0].quantity = 2;
    groceries.items[1].is_crossed_out = true;
    groceries.items[1].images = {test::make_image({1, 2, 3}), test::make_image({4}, 1)};

    auto hardware = test::make_list("Hardware", {"Nails"}, 1);
    hardware.is_archived = true;
    return {groceries, hardware};
}

} // namespace

TEST_CASE("SQLite store round-trip: full graph", "[integration][storage]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());
    SqliteEntityStore store(db);

    const auto lists = sample_lists();
    for (const auto& list : lists) {
        REQUIRE(store.create_list(list).is_ok());
        for (const auto& item : list.items) {
            REQUIRE(store.create_item(item).is_ok());
        }
    }

    SECTION("Every list comes back nested") {
        REQUIRE(store.find_all_lists().unwrap() == lists);
    }

    SECTION("Single lookups") {
        REQUIRE(store.find_list(lists[0].id).unwrap() == std::optional<List>(lists[0]));
        REQUIRE(store.find_item(lists[0].items[1].id).unwrap() == std::optional<Item>(lists[0].items[1]));
        REQUIRE_FALSE(store.find_list(Uuid::generate()).unwrap().has_value());
        REQUIRE_FALSE(store.find_item(Uuid::generate()).unwrap().has_value());
    }

    SECTION("Updating an item replaces its images") {
        auto item = lists[0].items[1];
        item.images = {test::make_image({9, 9})};
        item.title = "Rye bread";
        REQUIRE(store.update_item(item).is_ok());
        REQUIRE(*store.find_item(item.id).unwrap() == item);
    }

    SECTION("Removing a list removes its items") {
        REQUIRE(store.remove_list(lists[0].id).is_ok());
        REQUIRE_FALSE(store.find_item(lists[0].items[0].id).unwrap().has_value());
        REQUIRE(store.find_all_lists().unwrap().size() == 1);
    }

    SECTION("Failed block rolls back") {
        auto result = store.atomically([&]() -> Result<void, Error> {
            auto removed = store.remove_list(lists[0].id);
            if (removed.is_err()) return removed;
            return store.create_item(test::make_item(Uuid::generate(), "orphan"));
        });
        REQUIRE(result.is_err());
        REQUIRE(store.find_all_lists().unwrap() == lists);
    }
}

TEST_CASE("Import and export through a database file", "[integration][storage]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("listall.db")).toStdString();
    const auto lists = sample_lists();
    const auto payload = encode_export(test::make_export(lists));

    {
        auto db = Database::open(path).unwrap();
        REQUIRE(initialize_database(db).is_ok());
        SqliteEntityStore store(db);
        auto result = ImportService(store).commit(payload, ImportOptions::replacing());
        REQUIRE(result.is_ok());
        REQUIRE(result.unwrap().items_to_create == 3);
    }

    auto db = Database::open(path).unwrap();
    REQUIRE(initialize_database(db).is_ok());
    SqliteEntityStore store(db);
    ExportService exporter(store);

    SECTION("JSON export decodes to the imported graph") {
        auto decoded = decode_export(exporter.export_json().unwrap());
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.unwrap().lists == lists);
    }

    SECTION("Archived lists can be left out") {
        auto data = exporter.snapshot({.include_archived = false}).unwrap();
        REQUIRE(data.lists.size() == 1);
        REQUIRE(data.lists[0].name == "Groceries");
    }

    SECTION("Text export lists every item") {
        const auto text = exporter.export_plain_text().unwrap();
        REQUIRE(text.contains(QStringLiteral("[ ] Milk (×2)")));
        REQUIRE(text.contains(QString::fromUtf8("[✓] Bread")));
        REQUIRE(text.contains(QStringLiteral("Hardware\n========")));
    }

    SECTION("Merging the export back changes nothing but reports updates") {
        auto preview = ImportService(store).preview(exporter.export_json().unwrap());
        REQUIRE(preview.is_ok());
        REQUIRE(preview.unwrap().lists_to_create == 0);
        REQUIRE(preview.unwrap().lists_to_update == 2);
        REQUIRE(preview.unwrap().items_to_update == 3);
        REQUIRE(preview.unwrap().conflicts.empty());
    }
}

TEST_CASE("Replace on SQLite is all or nothing", "[integration][storage]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());
    SqliteEntityStore store(db);
    ImportService service(store);

    REQUIRE(service.commit(encode_export(test::make_export(sample_lists())), ImportOptions::replacing()).is_ok());
    const auto before = store.find_all_lists().unwrap();

    REQUIRE(db.execute(R"SQL(
        CREATE TRIGGER reject_boom BEFORE INSERT ON items WHEN NEW.title = 'boom'
        BEGIN SELECT RAISE(ABORT, 'boom rejected'); END;
    )SQL").is_ok());

    auto result = service.commit(
        encode_export(test::make_export({test::make_list("Fresh", {"a", "boom", "c"})})),
        ImportOptions::replacing());

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().kind == ImportError::Kind::RepositoryError);
    REQUIRE(result.unwrap_err().reason == "boom rejected");
    REQUIRE(store.find_all_lists().unwrap() == before);
}

TEST_CASE("Merge moving an image to a new item commits on SQLite", "[integration][storage]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());
    SqliteEntityStore store(db);
    ImportService service(store);

    auto groceries = test::make_list("Groceries", {"Milk"});
    const auto photo = test::make_image({1, 2, 3});
    groceries.items[0].images.push_back(photo);
    REQUIRE(service.commit(encode_export(test::make_export({groceries})), ImportOptions::replacing()).is_ok());

    auto incoming = groceries;
    incoming.items[0].images = {test::make_image({4})};
    auto bread = test::make_item(groceries.id, "Bread", 1);
    bread.images.push_back(photo);
    incoming.items.push_back(bread);
    const auto payload = encode_export(test::make_export({incoming}));

    auto preview = service.preview(payload);
    REQUIRE(preview.is_ok());
    REQUIRE(preview.unwrap().items_to_create == 1);
    REQUIRE(preview.unwrap().items_to_update == 1);

    auto result = service.commit(payload);
    REQUIRE(result.is_ok());
    REQUIRE(result.unwrap().items_to_create == 1);

    auto stored = store.find_item(bread.id).unwrap();
    REQUIRE(stored.has_value());
    REQUIRE(stored->images.size() == 1);
    REQUIRE(stored->images[0].image_data == photo.image_data);
    REQUIRE(store.find_item(groceries.items[0].id).unwrap()->images.at(0).image_data ==
            std::vector<uint8_t>{4});
}
