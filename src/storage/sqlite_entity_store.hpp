#pragma once

#include "storage/database.hpp"
#include "storage/entity_store.hpp"
#include "storage/image_repository.hpp"
#include "storage/item_repository.hpp"
#include "storage/list_repository.hpp"

namespace listall::storage {

/**
 * SqliteEntityStore - EntityStore over a migrated SQLite database.
 *
 * atomically() is one SQLite transaction; the database must not already be
 * inside one.
 */
class SqliteEntityStore final : public EntityStore {
public:
    explicit SqliteEntityStore(Database& db)
        : db_(db), lists_(db), items_(db), images_(db) {}

    [[nodiscard]] Result<std::vector<List>, Error> find_all_lists() override;
    [[nodiscard]] Result<std::optional<List>, Error> find_list(const Uuid& id) override;
    [[nodiscard]] Result<std::optional<Item>, Error> find_item(const Uuid& id) override;

    [[nodiscard]] Result<void, Error> create_list(const List& list) override;
    [[nodiscard]] Result<void, Error> update_list(const List& list) override;
    [[nodiscard]] Result<void, Error> remove_list(const Uuid& id) override;

    [[nodiscard]] Result<void, Error> create_item(const Item& item) override;
    [[nodiscard]] Result<void, Error> update_item(const Item& item) override;
    [[nodiscard]] Result<void, Error> remove_item(const Uuid& id) override;

    [[nodiscard]] Result<void, Error> atomically(const WriteBlock& body) override;

private:
    [[nodiscard]] Result<void, Error> insert_images(const Item& item);
    [[nodiscard]] Result<std::vector<Item>, Error> items_with_images(std::vector<Item> items);

    Database& db_;
    ListRepository lists_;
    ItemRepository items_;
    ImageRepository images_;
};

} // namespace listall::storage
