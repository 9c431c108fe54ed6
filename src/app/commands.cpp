#include "app/commands.hpp"
#include "app/report.hpp"
#include "import/export_service.hpp"
#include "import/import_service.hpp"
#include "io/logging_categories.hpp"

#include <QJsonDocument>

namespace listall::app {

namespace {

ImportObserver progress_logger() {
    return ImportObserver{
        .on_progress = [](const ImportProgress& p) {
            qCDebug(lcImport) << p.progress_percentage() << "%"
                              << QString::fromStdString(p.current_operation);
        },
        .is_cancelled = {}
    };
}

QString to_text(const QJsonObject& obj) {
    return QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Indented));
}

} // namespace

Result<QString, ImportError> run_preview(storage::EntityStore& store,
                                         const QByteArray& raw,
                                         const CommandOptions& options) {
    ImportService service(store);
    return service.preview(raw, options.import, progress_logger())
        .map([&options](const ImportPreview& preview) {
            return options.json ? to_text(preview_to_json(preview)) : format_preview(preview);
        });
}

Result<QString, ImportError> run_import(storage::EntityStore& store,
                                        const QByteArray& raw,
                                        const CommandOptions& options) {
    ImportService service(store);
    return service.commit(raw, options.import, progress_logger())
        .map([&options](const ImportResult& result) {
            return options.json ? to_text(result_to_json(result)) : format_result(result);
        });
}

Result<QString, Error> run_export(storage::EntityStore& store, ExportFormat format) {
    ExportService service(store);
    if (format == ExportFormat::Text) {
        return service.export_plain_text();
    }
    return service.export_json().map([](const QByteArray& json) { return QString::fromUtf8(json); });
}

} // namespace listall::app
