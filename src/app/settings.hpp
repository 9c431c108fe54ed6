#pragma once

#include "core/import_types.hpp"

#include <QSettings>
#include <QString>

namespace listall::app {

inline constexpr const char* kSettingsDefaultStrategy = "import/default_strategy";
inline constexpr const char* kSettingsValidateData = "import/validate_data";

/**
 * Import defaults stored in QSettings. A missing or unknown strategy reads as
 * merge; a missing validate flag reads as true.
 */
[[nodiscard]] ImportOptions load_import_defaults(QSettings& settings);

void save_import_defaults(QSettings& settings, const ImportOptions& options);

/**
 * Database file to open: LISTALL_DB_PATH when set, else
 * <AppDataLocation>/listall.db. The parent directory is created if missing.
 */
[[nodiscard]] QString resolve_database_path();

} // namespace listall::app
