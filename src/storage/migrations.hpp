#pragma once

#include "core/result.hpp"
#include "storage/database.hpp"

#include <string>
#include <vector>

namespace listall::storage {

struct Migration {
    int version;
    std::string name;
    std::string up_sql;
    std::string down_sql;
};

/**
 * Schema history, oldest first. Never edit an entry that has shipped; append
 * a new one instead.
 */
inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "lists_items_images",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS lists (
                id TEXT PRIMARY KEY,
                name TEXT NOT NULL,
                order_number INTEGER NOT NULL DEFAULT 0,
                is_archived INTEGER NOT NULL DEFAULT 0,
                created_at INTEGER NOT NULL,
                modified_at INTEGER NOT NULL
            );

            CREATE TABLE IF NOT EXISTS items (
                id TEXT PRIMARY KEY,
                list_id TEXT NOT NULL REFERENCES lists(id) ON DELETE CASCADE,
                title TEXT NOT NULL,
                description TEXT,
                quantity INTEGER NOT NULL DEFAULT 1 CHECK (quantity >= 1),
                order_number INTEGER NOT NULL DEFAULT 0,
                is_crossed_out INTEGER NOT NULL DEFAULT 0,
                created_at INTEGER NOT NULL,
                modified_at INTEGER NOT NULL
            );
            CREATE INDEX IF NOT EXISTS idx_items_list ON items(list_id);

            CREATE TABLE IF NOT EXISTS item_images (
                id TEXT PRIMARY KEY,
                item_id TEXT NOT NULL REFERENCES items(id) ON DELETE CASCADE,
                image_data BLOB NOT NULL,
                order_number INTEGER NOT NULL DEFAULT 0,
                created_at INTEGER NOT NULL
            );
            CREATE INDEX IF NOT EXISTS idx_item_images_item ON item_images(item_id);
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS item_images;
            DROP TABLE IF EXISTS items;
            DROP TABLE IF EXISTS lists;
        )SQL"
    },
    {
        .version = 2,
        .name = "display_order_indexes",
        .up_sql = R"SQL(
            CREATE INDEX IF NOT EXISTS idx_lists_order ON lists(order_number);
            CREATE INDEX IF NOT EXISTS idx_items_list_order ON items(list_id, order_number);
        )SQL",
        .down_sql = R"SQL(
            DROP INDEX IF EXISTS idx_items_list_order;
            DROP INDEX IF EXISTS idx_lists_order;
        )SQL"
    }
};

/**
 * MigrationRunner - brings a database to a schema version, one transaction
 * per run.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}

    [[nodiscard]] Result<void, Error> migrate();

    [[nodiscard]] Result<void, Error> migrate_to(int target_version);

    /**
     * Undo migrations newer than `target_version`, newest first.
     */
    [[nodiscard]] Result<void, Error> rollback_to(int target_version);

    [[nodiscard]] Result<int, Error> current_version();

    [[nodiscard]] static int latest_version() {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

private:
    [[nodiscard]] Result<void, Error> ensure_migrations_table();
    [[nodiscard]] Result<void, Error> apply(const Migration& m);
    [[nodiscard]] Result<void, Error> revert(const Migration& m);

    Database& db_;
};

[[nodiscard]] inline Result<void, Error> initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace listall::storage
