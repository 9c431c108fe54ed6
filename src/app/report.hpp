#pragma once

#include "core/import_types.hpp"

#include <QJsonObject>
#include <QString>

namespace listall::app {

// Human-readable summaries printed by the command line front-end.
[[nodiscard]] QString format_preview(const ImportPreview& preview);
[[nodiscard]] QString format_result(const ImportResult& result);
[[nodiscard]] QString format_error(const ImportError& error);

// JSON forms, keyed the same way as the transport format (camelCase):
// { "strategy", "listsToCreate", "listsToUpdate", "itemsToCreate",
//   "itemsToUpdate", "totalChanges", "conflicts": [...], "errors": [...],
//   "isValid" | "wasSuccessful", "listsDeleted"?, "itemsDeleted"? }
[[nodiscard]] QJsonObject preview_to_json(const ImportPreview& preview);
[[nodiscard]] QJsonObject result_to_json(const ImportResult& result);
[[nodiscard]] QJsonObject error_to_json(const ImportError& error);

} // namespace listall::app
