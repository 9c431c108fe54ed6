#include "storage/list_repository.hpp"

namespace listall::storage {

namespace {

constexpr const char* kSelectList = R"SQL(
    SELECT id, name, order_number, is_archived, created_at, modified_at
    FROM lists
)SQL";

} // namespace

List ListRepository::row_to_list(Statement& stmt) {
    return List{
        .id = stmt.column_uuid(0),
        .name = stmt.column_text(1),
        .order_number = stmt.column_int(2),
        .is_archived = stmt.column_int(3) != 0,
        .created_at = stmt.column_timestamp(4),
        .modified_at = stmt.column_timestamp(5),
        .items = {}
    };
}

Result<std::optional<List>, Error> ListRepository::get(const Uuid& id) {
    auto stmt_result = db_.prepare(std::string(kSelectList) + " WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<std::optional<List>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_uuid(1, id);
    if (bound.is_err()) {
        return Result<std::optional<List>, Error>::err(bound.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<std::optional<List>, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<std::optional<List>, Error>::ok(std::nullopt);
    }
    return Result<std::optional<List>, Error>::ok(row_to_list(stmt));
}

Result<std::vector<List>, Error> ListRepository::get_all() {
    auto stmt_result = db_.prepare(std::string(kSelectList) + " ORDER BY order_number, rowid;");
    if (stmt_result.is_err()) {
        return Result<std::vector<List>, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    return collect_rows<List>(stmt, row_to_list);
}

Result<void, Error> ListRepository::insert(const List& list) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO lists (id, name, order_number, is_archived, created_at, modified_at)
        VALUES (?, ?, ?, ?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = all_ok({
        stmt.bind_uuid(1, list.id),
        stmt.bind_text(2, list.name),
        stmt.bind_int(3, list.order_number),
        stmt.bind_int(4, list.is_archived ? 1 : 0),
        stmt.bind_timestamp(5, list.created_at),
        stmt.bind_timestamp(6, list.modified_at)
    });
    if (bound.is_err()) {
        return bound;
    }
    return run_to_completion(stmt);
}

Result<void, Error> ListRepository::update(const List& list) {
    auto stmt_result = db_.prepare(R"SQL(
        UPDATE lists
        SET name = ?, order_number = ?, is_archived = ?, created_at = ?, modified_at = ?
        WHERE id = ?;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = all_ok({
        stmt.bind_text(1, list.name),
        stmt.bind_int(2, list.order_number),
        stmt.bind_int(3, list.is_archived ? 1 : 0),
        stmt.bind_timestamp(4, list.created_at),
        stmt.bind_timestamp(5, list.modified_at),
        stmt.bind_uuid(6, list.id)
    });
    if (bound.is_err()) {
        return bound;
    }

    auto done = run_to_completion(stmt);
    if (done.is_err()) {
        return done;
    }
    if (db_.changes() == 0) {
        return Result<void, Error>::err(Error{"List not found: " + list.id.to_string(), SQLITE_NOTFOUND});
    }
    return Result<void, Error>::ok();
}

Result<void, Error> ListRepository::remove(const Uuid& id) {
    auto stmt_result = db_.prepare("DELETE FROM lists WHERE id = ?;");
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

Result<int, Error> ListRepository::count() {
    auto stmt_result = db_.prepare("SELECT COUNT(*) FROM lists;");
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
