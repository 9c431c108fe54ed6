#include "storage/item_repository.hpp"

namespace listall::storage {

namespace {

constexpr const char* kSelectItem = R"SQL(
    SELECT id, list_id, title, description, quantity, order_number,
           is_crossed_out, created_at, modified_at
    FROM items
)SQL";

Result<void, Error> missing_list(const Item& item) {
    return Result<void, Error>::err(
        Error{"Item " + item.id.to_string() + " has no list", SQLITE_CONSTRAINT});
}

} // namespace

Item ItemRepository::row_to_item(Statement& stmt) {
    return Item{
        .id = stmt.column_uuid(0),
        .list_id = stmt.column_uuid(1),
        .title = stmt.column_text(2),
        .description = stmt.column_optional_text(3),
        .quantity = stmt.column_int(4),
        .order_number = stmt.column_int(5),
        .is_crossed_out = stmt.column_int(6) != 0,
        .created_at = stmt.column_timestamp(7),
        .modified_at = stmt.column_timestamp(8),
        .images = {}
    };
}

Result<std::optional<Item>, Error> ItemRepository::get(const Uuid& id) {
    auto stmt_result = db_.prepare(std::string(kSelectItem) + " WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<std::optional<Item>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_uuid(1, id);
    if (bound.is_err()) {
        return Result<std::optional<Item>, Error>::err(bound.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<std::optional<Item>, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<std::optional<Item>, Error>::ok(std::nullopt);
    }
    return Result<std::optional<Item>, Error>::ok(row_to_item(stmt));
}

Result<std::vector<Item>, Error> ItemRepository::get_by_list(const Uuid& list_id) {
    auto stmt_result = db_.prepare(std::string(kSelectItem) +
                                   " WHERE list_id = ? ORDER BY order_number, rowid;");
    if (stmt_result.is_err()) {
        return Result<std::vector<Item>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_uuid(1, list_id);
    if (bound.is_err()) {
        return Result<std::vector<Item>, Error>::err(bound.unwrap_err());
    }
    return collect_rows<Item>(stmt, row_to_item);
}

Result<std::vector<Item>, Error> ItemRepository::get_all() {
    auto stmt_result = db_.prepare(std::string(kSelectItem) + " ORDER BY list_id, order_number, rowid;");
    if (stmt_result.is_err()) {
        return Result<std::vector<Item>, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    return collect_rows<Item>(stmt, row_to_item);
}

Result<void, Error> ItemRepository::insert(const Item& item) {
    if (!item.list_id) {
        return missing_list(item);
    }

    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO items (id, list_id, title, description, quantity, order_number,
                           is_crossed_out, created_at, modified_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = all_ok({
        stmt.bind_uuid(1, item.id),
        stmt.bind_uuid(2, *item.list_id),
        stmt.bind_text(3, item.title),
        stmt.bind_optional_text(4, item.description),
        stmt.bind_int(5, item.quantity),
        stmt.bind_int(6, item.order_number),
        stmt.bind_int(7, item.is_crossed_out ? 1 : 0),
        stmt.bind_timestamp(8, item.created_at),
        stmt.bind_timestamp(9, item.modified_at)
    });
    if (bound.is_err()) {
        return bound;
    }
    return run_to_completion(stmt);
}

Result<void, Error> ItemRepository::update(const Item& item) {
    if (!item.list_id) {
        return missing_list(item);
    }

    auto stmt_result = db_.prepare(R"SQL(
        UPDATE items
        SET list_id = ?, title = ?, description = ?, quantity = ?, order_number = ?,
            is_crossed_out = ?, created_at = ?, modified_at = ?
        WHERE id = ?;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = all_ok({
        stmt.bind_uuid(1, *item.list_id),
        stmt.bind_text(2, item.title),
        stmt.bind_optional_text(3, item.description),
        stmt.bind_int(4, item.quantity),
        stmt.bind_int(5, item.order_number),
        stmt.bind_int(6, item.is_crossed_out ? 1 : 0),
        stmt.bind_timestamp(7, item.created_at),
        stmt.bind_timestamp(8, item.modified_at),
        stmt.bind_uuid(9, item.id)
    });
    if (bound.is_err()) {
        return bound;
    }

    auto done = run_to_completion(stmt);
    if (done.is_err()) {
        return done;
    }
    if (db_.changes() == 0) {
        return Result<void, Error>::err(Error{"Item not found: " + item.id.to_string(), SQLITE_NOTFOUND});
    }
    return Result<void, Error>::ok();
}

Result<void, Error> ItemRepository::remove(const Uuid& id) {
    auto stmt_result = db_.prepare("DELETE FROM items WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_uuid(1, id);
    if (bound.is_err()) {
        return bound;
    }
    return run_to_completion(stmt);
}

Result<int, Error> ItemRepository::count() {
    auto stmt_result = db_.prepare("SELECT COUNT(*) FROM items;");
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
