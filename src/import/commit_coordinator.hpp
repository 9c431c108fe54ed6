#pragma once

#include "core/import_types.hpp"
#include "core/reconciliation.hpp"
#include "core/result.hpp"
#include "storage/entity_store.hpp"

namespace listall {

/**
 * CommitCoordinator - writes a ChangeSet to the EntityStore as one unit.
 *
 * Replace removes everything listed for deletion before creating anything.
 * Merge and append write lists before items, since items refer to them.
 * All writes run inside EntityStore::atomically, so a failing write leaves
 * the store as it was and the call fails with RepositoryError.
 */
class CommitCoordinator {
public:
    explicit CommitCoordinator(storage::EntityStore& store) : store_(store) {}

    [[nodiscard]] Result<ImportResult, ImportError> commit(const ChangeSet& changes);

private:
    [[nodiscard]] Result<void, Error> apply(const ChangeSet& changes);

    storage::EntityStore& store_;
};

} // namespace listall
