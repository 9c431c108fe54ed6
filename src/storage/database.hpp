#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace listall::storage {

/**
 * Prepared statement, finalized when the last copy goes away.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }
    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    Result<void, Error> bind_text(int index, std::string_view text);
    Result<void, Error> bind_optional_text(int index, const std::optional<std::string>& text);
    Result<void, Error> bind_int(int index, int value);
    Result<void, Error> bind_int64(int index, int64_t value);
    Result<void, Error> bind_blob(int index, const std::vector<uint8_t>& bytes);
    Result<void, Error> bind_null(int index);

    // Ids are stored as their text form, timestamps as epoch millis.
    Result<void, Error> bind_uuid(int index, const Uuid& id);
    Result<void, Error> bind_timestamp(int index, Timestamp t);

    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] std::optional<std::string> column_optional_text(int index) const;
    [[nodiscard]] int column_int(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] std::vector<uint8_t> column_blob(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;
    [[nodiscard]] Uuid column_uuid(int index) const;
    [[nodiscard]] Timestamp column_timestamp(int index) const;

    Result<bool, Error> step();  // true while there is a row
    Result<void, Error> reset();

private:
    std::shared_ptr<sqlite3_stmt> stmt_;
};

/**
 * Database - owning handle to one SQLite connection.
 *
 * Every connection runs with foreign keys enforced, so deleting a list
 * cascades to its items and their images.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    [[nodiscard]] static Result<Database, Error> open(const std::string& path);

    /**
     * Open a private in-memory database (tests).
     */
    [[nodiscard]] static Result<Database, Error> open_memory();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }

    void close();

    [[nodiscard]] sqlite3* handle() const { return db_; }

    [[nodiscard]] Result<Statement, Error> prepare(const std::string& sql);

    [[nodiscard]] Result<void, Error> execute(const std::string& sql);

    [[nodiscard]] Result<void, Error> begin_transaction();
    [[nodiscard]] Result<void, Error> commit();
    [[nodiscard]] Result<void, Error> rollback();

    /**
     * Run `f` inside BEGIN/COMMIT. An error from `f` (or from COMMIT) rolls
     * the whole transaction back and is returned unchanged.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f) -> decltype(f()) {
        using ResultType = decltype(f());

        auto begin_result = begin_transaction();
        if (begin_result.is_err()) {
            return ResultType::err(begin_result.unwrap_err());
        }

        auto result = f();
        if (result.is_err()) {
            (void)rollback();
            return result;
        }

        auto commit_result = commit();
        if (commit_result.is_err()) {
            (void)rollback();
            return ResultType::err(commit_result.unwrap_err());
        }
        return result;
    }

    /**
     * Rows touched by the last INSERT/UPDATE/DELETE.
     */
    [[nodiscard]] int changes() const;

    [[nodiscard]] std::string last_error() const;

private:
    explicit Database(sqlite3* db) : db_(db) {}

    sqlite3* db_ = nullptr;
};

/**
 * First error among a batch of bind results, or ok.
 *
 *   auto bound = all_ok({stmt.bind_uuid(1, id), stmt.bind_text(2, name)});
 */
[[nodiscard]] inline Result<void, Error> all_ok(std::initializer_list<Result<void, Error>> results) {
    for (const auto& r : results) {
        if (r.is_err()) return r;
    }
    return Result<void, Error>::ok();
}

/**
 * Step a write statement to completion.
 */
[[nodiscard]] inline Result<void, Error> run_to_completion(Statement& stmt) {
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

/**
 * Step a query to the end, converting every row with `row_fn`.
 */
template<typename T, typename RowFn>
[[nodiscard]] Result<std::vector<T>, Error> collect_rows(Statement& stmt, RowFn&& row_fn) {
    std::vector<T> rows;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<std::vector<T>, Error>::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;
        rows.push_back(row_fn(stmt));
    }
    return Result<std::vector<T>, Error>::ok(std::move(rows));
}

} // namespace listall::storage
