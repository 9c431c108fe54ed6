#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFile>
#include <QJsonDocument>
#include <QSettings>
#include <QTextStream>

#include "app/commands.hpp"
#include "app/logging.hpp"
#include "app/report.hpp"
#include "app/settings.hpp"
#include "io/logging_categories.hpp"
#include "storage/database.hpp"
#include "storage/migrations.hpp"
#include "storage/sqlite_entity_store.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitImportError = 1;
constexpr int kExitUsage = 2;

int usage_error(const QString& message) {
    QTextStream(stderr) << "listall: " << message << '\n'
                        << "Try 'listall --help'.\n";
    return kExitUsage;
}

bool read_input(const QString& path, QByteArray& out, QString& error) {
    QFile file;
    bool opened = false;
    if (path == QStringLiteral("-")) {
        opened = file.open(stdin, QIODevice::ReadOnly);
    } else {
        file.setFileName(path);
        opened = file.open(QIODevice::ReadOnly);
    }
    if (!opened) {
        error = QStringLiteral("cannot read %1: %2").arg(path, file.errorString());
        return false;
    }
    out = file.readAll();
    return true;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("ListAll");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("ListAll");
    app.setOrganizationDomain("listall.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Import, preview and export lists.\n\n"
        "Commands:\n"
        "  preview <file>   Show what importing <file> would change ('-' reads stdin).\n"
        "  import <file>    Import <file> into the database.\n"
        "  export           Write every list to stdout."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption strategyOption(
        QStringList{QStringLiteral("s"), QStringLiteral("strategy")},
        QStringLiteral("Merge strategy: replace, merge or append (default from settings, else merge)."),
        QStringLiteral("strategy"));
    parser.addOption(strategyOption);

    const QCommandLineOption noValidateOption(
        QStringList{QStringLiteral("no-validate")},
        QStringLiteral("Skip up-front validation; unusable lists and items are skipped instead."));
    parser.addOption(noValidateOption);

    const QCommandLineOption listNameOption(
        QStringList{QStringLiteral("list-name")},
        QStringLiteral("Name of the list that receives plain-text items."),
        QStringLiteral("name"));
    parser.addOption(listNameOption);

    const QCommandLineOption dbPathOption(
        QStringList{QStringLiteral("db")},
        QStringLiteral("Override database path (sets LISTALL_DB_PATH for this run)."),
        QStringLiteral("path"));
    parser.addOption(dbPathOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Print preview/import reports as JSON."));
    parser.addOption(jsonOption);

    const QCommandLineOption formatOption(
        QStringList{QStringLiteral("format")},
        QStringLiteral("Export format: json or text (default json)."),
        QStringLiteral("format"),
        QStringLiteral("json"));
    parser.addOption(formatOption);

    const QCommandLineOption debugOption(
        QStringList{QStringLiteral("debug")},
        QStringLiteral("Enable import debug logging (also sets LISTALL_DEBUG_IMPORT=1)."));
    parser.addOption(debugOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("preview, import or export."));
    parser.addPositionalArgument(QStringLiteral("file"),
                                 QStringLiteral("Input file for preview/import."),
                                 QStringLiteral("[file]"));
    parser.process(app);

    if (parser.isSet(dbPathOption)) {
        qputenv("LISTALL_DB_PATH", parser.value(dbPathOption).toUtf8());
    }
    if (parser.isSet(debugOption)) {
        qputenv("LISTALL_DEBUG_IMPORT", "1");
    }
    if (!qEnvironmentVariableIsEmpty("LISTALL_DEBUG_IMPORT")) {
        listall::enable_debug_logging();
    }

    if (listall::app::install_file_logging()) {
        qCDebug(listall::lcImport) << "Logging to" << listall::app::default_log_file_path();
    }

    const auto positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        return usage_error(QStringLiteral("missing command"));
    }
    const auto command = positional.first();
    const bool needs_input = command == QStringLiteral("preview") || command == QStringLiteral("import");
    if (!needs_input && command != QStringLiteral("export")) {
        return usage_error(QStringLiteral("unknown command '%1'").arg(command));
    }
    if (needs_input && positional.size() != 2) {
        return usage_error(QStringLiteral("'%1' takes exactly one file").arg(command));
    }

    QSettings settings;
    listall::app::CommandOptions options;
    options.import = listall::app::load_import_defaults(settings);
    options.json = parser.isSet(jsonOption);
    if (parser.isSet(strategyOption)) {
        auto strategy = listall::parse_strategy(parser.value(strategyOption).toLower().toStdString());
        if (!strategy) {
            return usage_error(QStringLiteral("unknown strategy '%1'").arg(parser.value(strategyOption)));
        }
        options.import.merge_strategy = *strategy;
    }
    if (parser.isSet(noValidateOption)) {
        options.import.validate_data = false;
    }
    if (parser.isSet(listNameOption)) {
        options.import.text_list_name = parser.value(listNameOption).toStdString();
    }

    auto export_format = listall::app::ExportFormat::Json;
    const auto format_name = parser.value(formatOption).toLower();
    if (format_name == QStringLiteral("text")) {
        export_format = listall::app::ExportFormat::Text;
    } else if (format_name != QStringLiteral("json")) {
        return usage_error(QStringLiteral("unknown format '%1'").arg(parser.value(formatOption)));
    }

    QByteArray input;
    if (needs_input) {
        QString read_error;
        if (!read_input(positional.at(1), input, read_error)) {
            return usage_error(read_error);
        }
    }

    const auto db_path = listall::app::resolve_database_path();
    auto db_result = listall::storage::Database::open(db_path.toStdString());
    if (db_result.is_err()) {
        qCCritical(listall::lcStorage) << "Cannot open" << db_path << ":"
                                       << QString::fromStdString(db_result.unwrap_err().message);
        return kExitImportError;
    }
    auto db = std::move(db_result).unwrap();
    auto migrated = listall::storage::initialize_database(db);
    if (migrated.is_err()) {
        qCCritical(listall::lcStorage) << "Migration failed:"
                                       << QString::fromStdString(migrated.unwrap_err().message);
        return kExitImportError;
    }
    listall::storage::SqliteEntityStore store(db);

    QTextStream out(stdout);
    if (command == QStringLiteral("export")) {
        auto exported = listall::app::run_export(store, export_format);
        if (exported.is_err()) {
            QTextStream(stderr) << "error: " << QString::fromStdString(exported.unwrap_err().message) << '\n';
            return kExitImportError;
        }
        out << exported.unwrap();
        return kExitOk;
    }

    auto report = command == QStringLiteral("preview")
        ? listall::app::run_preview(store, input, options)
        : listall::app::run_import(store, input, options);
    if (report.is_err()) {
        const auto& error = report.unwrap_err();
        if (options.json) {
            out << QJsonDocument(listall::app::error_to_json(error)).toJson(QJsonDocument::Indented);
        } else {
            QTextStream(stderr) << listall::app::format_error(error);
        }
        return kExitImportError;
    }

    out << report.unwrap();
    return kExitOk;
}
