#pragma once

#include "core/import_types.hpp"
#include "core/result.hpp"
#include "storage/entity_store.hpp"

#include <QByteArray>
#include <QString>

namespace listall::app {

enum class ExportFormat {
    Json,
    Text
};

struct CommandOptions {
    ImportOptions import = ImportOptions::defaults();
    bool json = false;  // machine-readable report
};

// Each command returns the text to print on success.

[[nodiscard]] Result<QString, ImportError> run_preview(storage::EntityStore& store,
                                                       const QByteArray& raw,
                                                       const CommandOptions& options);

[[nodiscard]] Result<QString, ImportError> run_import(storage::EntityStore& store,
                                                      const QByteArray& raw,
                                                      const CommandOptions& options);

[[nodiscard]] Result<QString, Error> run_export(storage::EntityStore& store, ExportFormat format);

} // namespace listall::app
