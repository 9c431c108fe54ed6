#pragma once

#include "core/model.hpp"
#include "core/result.hpp"
#include "storage/database.hpp"

#include <optional>
#include <vector>

namespace listall::storage {

/**
 * ItemRepository - rows of the `items` table. Items come back without images.
 */
class ItemRepository {
public:
    explicit ItemRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<std::optional<Item>, Error> get(const Uuid& id);

    [[nodiscard]] Result<std::vector<Item>, Error> get_by_list(const Uuid& list_id);

    /**
     * Every item of every list, by list then order number.
     */
    [[nodiscard]] Result<std::vector<Item>, Error> get_all();

    /**
     * Insert an item. `list_id` must name an existing list.
     */
    [[nodiscard]] Result<void, Error> insert(const Item& item);

    /**
     * Overwrite every column of an existing item, including its list.
     * Fails when no row has the item's id.
     */
    [[nodiscard]] Result<void, Error> update(const Item& item);

    [[nodiscard]] Result<void, Error> remove(const Uuid& id);

    [[nodiscard]] Result<int, Error> count();

private:
    Database& db_;

    [[nodiscard]] static Item row_to_item(Statement& stmt);
};

} // namespace listall::storage
