#include <catch2/catch_test_macros.hpp>
#include "app/logging.hpp"
#include "io/logging_categories.hpp"

#include <QFile>
#include <QTemporaryDir>
#include <QTimeZone>

using namespace listall;
using namespace listall::app;

namespace {

QString read_all(const QString& path) {
    QFile file(path);
    REQUIRE(file.open(QIODevice::ReadOnly | QIODevice::Text));
    return QString::fromUtf8(file.readAll());
}

} // namespace

TEST_CASE("Log records have one header line", "[logging]") {
    const QDateTime when(QDate(2024, 3, 1), QTime(12, 0, 0, 5), QTimeZone(QTimeZone::UTC));

    SECTION("single line") {
        REQUIRE(format_log_record(when, QtWarningMsg, QStringLiteral("listall.import"),
                                  QStringLiteral("Skipped: item #2"))
                == QStringLiteral("2024-03-01T12:00:00.005Z WARN listall.import Skipped: item #2\n"));
    }

    SECTION("continuation lines are indented") {
        REQUIRE(format_log_record(when, QtInfoMsg, QString{},
                                  QStringLiteral("2 findings\nlists[0].name: blank\n"))
                == QStringLiteral("2024-03-01T12:00:00.005Z INFO - 2 findings\n  lists[0].name: blank\n"));
    }
}

TEST_CASE("File logging writes listall categories to the log file", "[logging]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("logs/listall.log"));

    REQUIRE(install_file_logging(LogConfig{.file_path = path, .mirror_to_stderr = false}));
    qCInfo(lcImport) << "Import finished";
    qDebug() << "chatter from elsewhere";
    qWarning() << "warning from elsewhere";
    uninstall_file_logging();

    const auto text = read_all(path);
    REQUIRE(text.contains(QStringLiteral(" INFO listall.import Import finished\n")));
    REQUIRE(text.contains(QStringLiteral(" WARN default warning from elsewhere\n")));
    REQUIRE_FALSE(text.contains(QStringLiteral("chatter")));
}

TEST_CASE("LISTALL_LOG_PATH overrides the log location", "[logging]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("custom.log"));

    qputenv("LISTALL_LOG_PATH", path.toUtf8());
    REQUIRE(default_log_file_path() == path);
    qunsetenv("LISTALL_LOG_PATH");
    REQUIRE(default_log_file_path().endsWith(QStringLiteral("logs/listall.log")));
}
