#pragma once

#include "core/model.hpp"
#include "core/result.hpp"

#include <functional>
#include <optional>
#include <vector>

namespace listall::storage {

using WriteBlock = std::function<Result<void, Error>()>;

/**
 * EntityStore - authoritative home of lists, items and images.
 *
 * Reads return fully nested graphs (lists with items, items with images).
 * Writes take one entity at a time: create_list / update_list ignore
 * `List::items`, while create_item / update_item carry the item's images and
 * need `Item::list_id` to name an existing list.
 */
class EntityStore {
public:
    virtual ~EntityStore() = default;

    /**
     * Every list in store order, with items and images.
     */
    [[nodiscard]] virtual Result<std::vector<List>, Error> find_all_lists() = 0;

    [[nodiscard]] virtual Result<std::optional<List>, Error> find_list(const Uuid& id) = 0;

    [[nodiscard]] virtual Result<std::optional<Item>, Error> find_item(const Uuid& id) = 0;

    [[nodiscard]] virtual Result<void, Error> create_list(const List& list) = 0;

    [[nodiscard]] virtual Result<void, Error> update_list(const List& list) = 0;

    /**
     * Remove a list together with its items and their images.
     */
    [[nodiscard]] virtual Result<void, Error> remove_list(const Uuid& id) = 0;

    [[nodiscard]] virtual Result<void, Error> create_item(const Item& item) = 0;

    /**
     * Overwrite an item. Its stored images are replaced by `item.images`.
     */
    [[nodiscard]] virtual Result<void, Error> update_item(const Item& item) = 0;

    [[nodiscard]] virtual Result<void, Error> remove_item(const Uuid& id) = 0;

    /**
     * Run `body` so that either all of its writes land or none do. The first
     * error from `body` is returned after the store has been put back.
     */
    [[nodiscard]] virtual Result<void, Error> atomically(const WriteBlock& body) = 0;
};

} // namespace listall::storage
