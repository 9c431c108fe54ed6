#include "storage/image_repository.hpp"

namespace listall::storage {

ItemImage ImageRepository::row_to_image(Statement& stmt) {
    return ItemImage{
        .id = stmt.column_uuid(0),
        .image_data = stmt.column_blob(1),
        .order_number = stmt.column_int(2),
        .created_at = stmt.column_timestamp(3)
    };
}

Result<std::vector<ItemImage>, Error> ImageRepository::get_by_item(const Uuid& item_id) {
    auto stmt_result = db_.prepare(R"SQL(
        SELECT id, image_data, order_number, created_at
        FROM item_images WHERE item_id = ? ORDER BY order_number, rowid;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<std::vector<ItemImage>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_uuid(1, item_id);
    if (bound.is_err()) {
        return Result<std::vector<ItemImage>, Error>::err(bound.unwrap_err());
    }
    return collect_rows<ItemImage>(stmt, row_to_image);
}

Result<std::vector<std::pair<Uuid, ItemImage>>, Error> ImageRepository::get_all() {
    using Row = std::pair<Uuid, ItemImage>;

    auto stmt_result = db_.prepare(R"SQL(
        SELECT id, image_data, order_number, created_at, item_id
        FROM item_images ORDER BY item_id, order_number, rowid;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<std::vector<Row>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    return collect_rows<Row>(stmt, [](Statement& row) {
        return Row{row.column_uuid(4), row_to_image(row)};
    });
}

Result<void, Error> ImageRepository::insert(const Uuid& item_id, const ItemImage& image) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO item_images (id, item_id, image_data, order_number, created_at)
        VALUES (?, ?, ?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = all_ok({
        stmt.bind_uuid(1, image.id),
        stmt.bind_uuid(2, item_id),
        stmt.bind_blob(3, image.image_data),
        stmt.bind_int(4, image.order_number),
        stmt.bind_timestamp(5, image.created_at)
    });
    if (bound.is_err()) {
        return bound;
    }
    return run_to_completion(stmt);
}

Result<void, Error> ImageRepository::remove_by_item(const Uuid& item_id) {
    auto stmt_result = db_.prepare("DELETE FROM item_images WHERE item_id = ?;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_uuid(1, item_id);
    if (bound.is_err()) {
        return bound;
    }
    return run_to_completion(stmt);
}

Result<int, Error> ImageRepository::count() {
    auto stmt_result = db_.prepare("SELECT COUNT(*) FROM item_images;");
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int, Error>::err(step_result.unwrap_err());
    }
    return Result<int, Error>::ok(stmt.column_int(0));
}

} // namespace listall::storage
