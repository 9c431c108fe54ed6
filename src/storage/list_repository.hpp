#pragma once

#include "core/model.hpp"
#include "core/result.hpp"
#include "storage/database.hpp"

#include <optional>
#include <vector>

namespace listall::storage {

/**
 * ListRepository - rows of the `lists` table. Lists come back without items.
 */
class ListRepository {
public:
    explicit ListRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<std::optional<List>, Error> get(const Uuid& id);

    /**
     * Every list, by order number then insertion order.
     */
    [[nodiscard]] Result<std::vector<List>, Error> get_all();

    [[nodiscard]] Result<void, Error> insert(const List& list);

    /**
     * Overwrite name, order, archive flag and timestamps of an existing row.
     * Fails when no row has the list's id.
     */
    [[nodiscard]] Result<void, Error> update(const List& list);

    /**
     * Delete a list; its items and their images go with it.
     */
    [[nodiscard]] Result<void, Error> remove(const Uuid& id);

    [[nodiscard]] Result<int, Error> count();

private:
    Database& db_;

    [[nodiscard]] static List row_to_list(Statement& stmt);
};

} // namespace listall::storage
