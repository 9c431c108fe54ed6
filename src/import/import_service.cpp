#include "import/import_service.hpp"
#include "import/commit_coordinator.hpp"
#include "io/format_detector.hpp"
#include "io/logging_categories.hpp"
#include "io/name_matching.hpp"
#include "io/schema_codec.hpp"
#include "io/text_parser.hpp"

#include <QString>

namespace listall {

namespace {

QString to_qstring(std::string_view s) {
    return QString::fromUtf8(s.data(), static_cast<qsizetype>(s.size()));
}

void log_failure(const char* stage, const ImportError& error) {
    qCWarning(lcImport) << stage << "failed:" << to_qstring(error_kind_name(error.kind))
                        << QString::fromStdString(error.describe());
}

} // namespace

Result<ExportData, ImportError> ImportService::parse(const QByteArray& raw, const ImportOptions& options) {
    if (raw.trimmed().isEmpty()) {
        return Result<ExportData, ImportError>::err(ImportError::invalid_data());
    }

    const auto format = detect_format(raw);
    qCDebug(lcImport) << "Input classified as" << to_qstring(format_name(format)) << raw.size() << "bytes";

    if (format == InputFormat::Structured) {
        return decode_export(raw);
    }

    auto candidates = parse_text(QString::fromUtf8(raw));
    if (candidates.empty()) {
        return Result<ExportData, ImportError>::err(ImportError::invalid_data());
    }
    qCDebug(lcImport) << "Recovered" << candidates.size() << "items from text";
    return Result<ExportData, ImportError>::ok(wrap_candidates(candidates, options.text_list_name));
}

Result<ChangeSet, ImportError> ImportService::plan(const QByteArray& raw,
                                                  const ImportOptions& options,
                                                  const ImportObserver& observer) {
    auto parsed = parse(raw, options);
    if (parsed.is_err()) {
        return Result<ChangeSet, ImportError>::err(parsed.unwrap_err());
    }
    const auto incoming = std::move(parsed).unwrap();

    auto snapshot = store_.find_all_lists();
    if (snapshot.is_err()) {
        qCWarning(lcStorage) << "Snapshot failed:" << QString::fromStdString(snapshot.unwrap_err().message);
        return Result<ChangeSet, ImportError>::err(
            ImportError::repository_error(snapshot.unwrap_err().message));
    }
    const auto existing = std::move(snapshot).unwrap();

    ProgressReporter progress(observer.on_progress);
    Reconciler reconciler(existing, incoming, Reconciler::Options{
        .strategy = options.merge_strategy,
        .validate_data = options.validate_data
    }, names_match);

    auto changes = reconciler.run(progress, observer.is_cancelled);
    if (changes.is_ok()) {
        for (const auto& error : changes.unwrap().errors) {
            qCWarning(lcImport) << "Skipped:" << QString::fromStdString(error);
        }
    }
    return changes;
}

Result<ImportPreview, ImportError> ImportService::preview(const QByteArray& raw,
                                                          const ImportOptions& options,
                                                          const ImportObserver& observer) {
    qCInfo(lcImport) << "Preview started, strategy" << to_qstring(strategy_name(options.merge_strategy))
                     << "validate" << options.validate_data;

    auto changes = plan(raw, options, observer);
    if (changes.is_err()) {
        log_failure("Preview", changes.unwrap_err());
        return Result<ImportPreview, ImportError>::err(changes.unwrap_err());
    }

    ImportPreview preview;
    static_cast<ImportSummary&>(preview) = changes.unwrap().summary();
    preview.strategy = options.merge_strategy;

    qCInfo(lcImport) << "Preview finished:" << preview.lists_to_create << "lists to create,"
                     << preview.lists_to_update << "to update," << preview.items_to_create
                     << "items to create," << preview.items_to_update << "to update,"
                     << preview.conflicts.size() << "conflicts";
    return Result<ImportPreview, ImportError>::ok(std::move(preview));
}

Result<ImportResult, ImportError> ImportService::commit(const QByteArray& raw,
                                                        const ImportOptions& options,
                                                        const ImportObserver& observer) {
    qCInfo(lcImport) << "Import started, strategy" << to_qstring(strategy_name(options.merge_strategy))
                     << "validate" << options.validate_data;

    auto changes = plan(raw, options, observer);
    if (changes.is_err()) {
        log_failure("Import", changes.unwrap_err());
        return Result<ImportResult, ImportError>::err(changes.unwrap_err());
    }

    CommitCoordinator coordinator(store_);
    auto result = coordinator.commit(changes.unwrap());
    if (result.is_err()) {
        log_failure("Import", result.unwrap_err());
        return result;
    }

    const auto& summary = result.unwrap();
    qCInfo(lcImport) << "Import finished:" << summary.lists_to_create << "lists created,"
                     << summary.lists_to_update << "updated," << summary.items_to_create
                     << "items created," << summary.items_to_update << "updated,"
                     << summary.errors.size() << "skipped";
    return result;
}

} // namespace listall
