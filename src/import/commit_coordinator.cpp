#include "import/commit_coordinator.hpp"
#include "io/logging_categories.hpp"

#include <QString>

namespace listall {

Result<void, Error> CommitCoordinator::apply(const ChangeSet& changes) {
    // Items first so nothing depends on the cascade.
    for (const auto& id : changes.items_to_delete) {
        if (auto r = store_.remove_item(id); r.is_err()) return r;
    }
    for (const auto& id : changes.lists_to_delete) {
        if (auto r = store_.remove_list(id); r.is_err()) return r;
    }

    for (const auto& list : changes.lists_to_create) {
        if (auto r = store_.create_list(list); r.is_err()) return r;
    }
    for (const auto& list : changes.lists_to_update) {
        if (auto r = store_.update_list(list); r.is_err()) return r;
    }
    for (const auto& item : changes.items_to_create) {
        if (auto r = store_.create_item(item); r.is_err()) return r;
    }
    for (const auto& item : changes.items_to_update) {
        if (auto r = store_.update_item(item); r.is_err()) return r;
    }
    return Result<void, Error>::ok();
}

Result<ImportResult, ImportError> CommitCoordinator::commit(const ChangeSet& changes) {
    auto written = store_.atomically([&] { return apply(changes); });
    if (written.is_err()) {
        const auto& error = written.unwrap_err();
        qCWarning(lcStorage) << "Commit rolled back:" << QString::fromStdString(error.message)
                             << "code" << error.code;
        return Result<ImportResult, ImportError>::err(ImportError::repository_error(error.message));
    }

    ImportResult result;
    static_cast<ImportSummary&>(result) = changes.summary();
    result.strategy = changes.strategy;
    result.lists_deleted = static_cast<int>(changes.lists_to_delete.size());
    result.items_deleted = static_cast<int>(changes.items_to_delete.size());

    qCDebug(lcStorage) << "Committed" << result.total_changes() << "changes,"
                       << result.lists_deleted << "lists and" << result.items_deleted << "items deleted";
    return Result<ImportResult, ImportError>::ok(std::move(result));
}

} // namespace listall
