#include <catch2/catch_test_macros.hpp>
#include "import/commit_coordinator.hpp"
#include "storage/memory_entity_store.hpp"
#include "support/fixtures.hpp"

using namespace listall;
using namespace listall::storage;

TEST_CASE("Commit applies every planned write", "[commit]") {
    auto old = test::make_list("Old", {"gone"});
    auto kept = test::make_list("Kept", {"milk"}, 1);
    MemoryEntityStore store({old, kept});

    ChangeSet changes;
    changes.strategy = MergeStrategy::Replace;
    changes.items_to_delete = {old.items[0].id};
    changes.lists_to_delete = {old.id};

    auto created = test::make_list("New");
    changes.lists_to_create = {created};
    auto renamed = kept;
    renamed.name = "Kept (renamed)";
    renamed.items.clear();
    changes.lists_to_update = {renamed};
    changes.items_to_create = {test::make_item(created.id, "fresh")};
    auto edited = kept.items[0];
    edited.quantity = 6;
    changes.items_to_update = {edited};

    auto result = CommitCoordinator(store).commit(changes);
    REQUIRE(result.is_ok());
    REQUIRE(result.unwrap().strategy == MergeStrategy::Replace);
    REQUIRE(result.unwrap().lists_deleted == 1);
    REQUIRE(result.unwrap().items_deleted == 1);
    REQUIRE(result.unwrap().total_changes() == 4);

    REQUIRE(store.lists().size() == 2);
    REQUIRE(store.lists()[0].name == "Kept (renamed)");
    REQUIRE(store.lists()[0].items.at(0).quantity == 6);
    REQUIRE(store.lists()[1].items.at(0).title == "fresh");
}

TEST_CASE("Commit rolls back on the first failing write", "[commit]") {
    auto existing = test::make_list("Groceries", {"Milk"});
    MemoryEntityStore store({existing});

    ChangeSet changes;
    changes.lists_to_create = {test::make_list("A"), existing};

    auto result = CommitCoordinator(store).commit(changes);
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err() == ImportError::repository_error("UNIQUE constraint failed: lists.id"));
    REQUIRE(store.lists() == std::vector<List>{existing});
}

TEST_CASE("An empty change set writes nothing", "[commit]") {
    MemoryEntityStore store;
    auto result = CommitCoordinator(store).commit(ChangeSet{});
    REQUIRE(result.is_ok());
    REQUIRE(result.unwrap().total_changes() == 0);
    REQUIRE(store.write_count() == 0);
}
