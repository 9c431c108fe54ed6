#pragma once

#include "core/model.hpp"
#include "core/result.hpp"
#include "storage/database.hpp"

#include <utility>
#include <vector>

namespace listall::storage {

/**
 * ImageRepository - rows of the `item_images` table. The payload is stored
 * as an opaque blob.
 */
class ImageRepository {
public:
    explicit ImageRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<std::vector<ItemImage>, Error> get_by_item(const Uuid& item_id);

    /**
     * Every image paired with the id of the item that owns it.
     */
    [[nodiscard]] Result<std::vector<std::pair<Uuid, ItemImage>>, Error> get_all();

    [[nodiscard]] Result<void, Error> insert(const Uuid& item_id, const ItemImage& image);

    [[nodiscard]] Result<void, Error> remove_by_item(const Uuid& item_id);

    [[nodiscard]] Result<int, Error> count();

private:
    Database& db_;

    [[nodiscard]] static ItemImage row_to_image(Statement& stmt);
};

} // namespace listall::storage
