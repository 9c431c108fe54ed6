#include "app/settings.hpp"

#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>

namespace listall::app {

ImportOptions load_import_defaults(QSettings& settings) {
    auto options = ImportOptions::defaults();

    const auto stored = settings.value(QString::fromLatin1(kSettingsDefaultStrategy)).toString();
    if (auto strategy = parse_strategy(stored.trimmed().toLower().toStdString())) {
        options.merge_strategy = *strategy;
    }
    options.validate_data = settings.value(QString::fromLatin1(kSettingsValidateData), true).toBool();
    return options;
}

void save_import_defaults(QSettings& settings, const ImportOptions& options) {
    const auto name = strategy_name(options.merge_strategy);
    settings.setValue(QString::fromLatin1(kSettingsDefaultStrategy),
                      QString::fromLatin1(name.data(), static_cast<qsizetype>(name.size())));
    settings.setValue(QString::fromLatin1(kSettingsValidateData), options.validate_data);
}

QString resolve_database_path() {
    const auto override_path = qEnvironmentVariable("LISTALL_DB_PATH");
    if (!override_path.isEmpty()) {
        QFileInfo info(override_path);
        QDir dir(info.absolutePath());
        if (!dir.exists()) {
            dir.mkpath(QStringLiteral("."));
        }
        return info.absoluteFilePath();
    }

    QDir dir(QStandardPaths::writableLocation(QStandardPaths::AppDataLocation));
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }
    return dir.filePath(QStringLiteral("listall.db"));
}

} // namespace listall::app
