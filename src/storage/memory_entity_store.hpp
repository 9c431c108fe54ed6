#pragma once

#include "storage/entity_store.hpp"

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace listall::storage {

/**
 * MemoryEntityStore - EntityStore held in a vector, for tests and dry tools.
 *
 * Enforces the same constraints as the SQLite schema: unique ids, items only
 * inside existing lists. atomically() snapshots the whole state and restores
 * it when the block fails.
 */
class MemoryEntityStore final : public EntityStore {
public:
    MemoryEntityStore() = default;
    explicit MemoryEntityStore(std::vector<List> lists) : lists_(std::move(lists)) {}

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

    /**
     * Let the next `writes` writes succeed and fail every one after that.
     */
    void fail_after(int writes) { writes_until_failure_ = writes; }

    void clear_failure() { writes_until_failure_.reset(); }

    [[nodiscard]] const std::vector<List>& lists() const { return lists_; }
    [[nodiscard]] int write_count() const { return write_count_; }

private:
    [[nodiscard]] Result<void, Error> begin_write(const char* what);

    List* list_ptr(const Uuid& id);
    std::pair<List*, size_t> locate_item(const Uuid& id);
    [[nodiscard]] bool image_id_taken(const Uuid& id, const Uuid& ignore_item) const;

    std::vector<List> lists_;
    std::optional<int> writes_until_failure_;
    int write_count_ = 0;
};

} // namespace listall::storage
