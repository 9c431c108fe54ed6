#pragma once

#include "core/import_types.hpp"
#include "core/progress.hpp"
#include "core/reconciliation.hpp"
#include "core/result.hpp"
#include "storage/entity_store.hpp"

#include <QByteArray>

namespace listall {

/**
 * Hooks a caller can attach to one preview or commit call.
 */
struct ImportObserver {
    ProgressCallback on_progress;  // synchronous, in production order
    CancelCheck is_cancelled;      // polled before each top-level list
};

/**
 * ImportService - entry point of the import pipeline.
 *
 *   raw bytes -> detect_format -> text parser | schema codec
 *             -> Reconciler (validation, change-set) -> CommitCoordinator
 *
 * preview() and commit() share everything up to the change-set, so their
 * counters and conflicts always agree; only commit() writes.
 *
 * One call at a time per store: each call diffs against its own snapshot, so
 * overlapping calls would not see each other's writes.
 */
class ImportService {
public:
    explicit ImportService(storage::EntityStore& store) : store_(store) {}

    [[nodiscard]] Result<ImportPreview, ImportError> preview(const QByteArray& raw,
                                                             const ImportOptions& options = ImportOptions::defaults(),
                                                             const ImportObserver& observer = {});

    [[nodiscard]] Result<ImportResult, ImportError> commit(const QByteArray& raw,
                                                           const ImportOptions& options = ImportOptions::defaults(),
                                                           const ImportObserver& observer = {});

    /**
     * Turn raw input into a transport graph without touching the store.
     */
    [[nodiscard]] static Result<ExportData, ImportError> parse(const QByteArray& raw,
                                                               const ImportOptions& options);

private:
    [[nodiscard]] Result<ChangeSet, ImportError> plan(const QByteArray& raw,
                                                      const ImportOptions& options,
                                                      const ImportObserver& observer);

    storage::EntityStore& store_;
};

} // namespace listall
