#include "app/report.hpp"

#include <QJsonArray>
#include <QStringList>

namespace listall::app {

namespace {

QString str(std::string_view s) {
    return QString::fromUtf8(s.data(), static_cast<qsizetype>(s.size()));
}

QJsonObject conflict_to_json(const ConflictDetail& c) {
    QJsonObject obj;
    obj["type"] = str(conflict_type_name(c.type));
    obj["entityName"] = str(c.entity_name);
    obj["entityId"] = str(c.entity_id.to_string());
    obj["currentValue"] = str(c.current_value);
    if (c.incoming_value) {
        obj["incomingValue"] = str(*c.incoming_value);
    }
    obj["message"] = str(c.message);
    return obj;
}

QJsonObject summary_to_json(const ImportSummary& s, MergeStrategy strategy) {
    QJsonObject obj;
    obj["strategy"] = str(strategy_name(strategy));
    obj["listsToCreate"] = s.lists_to_create;
    obj["listsToUpdate"] = s.lists_to_update;
    obj["itemsToCreate"] = s.items_to_create;
    obj["itemsToUpdate"] = s.items_to_update;
    obj["totalChanges"] = s.total_changes();

    QJsonArray conflicts;
    for (const auto& c : s.conflicts) {
        conflicts.append(conflict_to_json(c));
    }
    obj["conflicts"] = conflicts;

    QJsonArray errors;
    for (const auto& e : s.errors) {
        errors.append(str(e));
    }
    obj["errors"] = errors;
    return obj;
}

void append_summary(QStringList& lines, const ImportSummary& s, const QString& create, const QString& update) {
    lines << QStringLiteral("Lists: %1 %2, %3 %4").arg(s.lists_to_create).arg(create)
                                                  .arg(s.lists_to_update).arg(update);
    lines << QStringLiteral("Items: %1 %2, %3 %4").arg(s.items_to_create).arg(create)
                                                  .arg(s.items_to_update).arg(update);
    lines << QStringLiteral("Total changes: %1").arg(s.total_changes());

    if (s.has_conflicts()) {
        lines << QStringLiteral("Conflicts (%1):").arg(s.conflicts.size());
        for (const auto& c : s.conflicts) {
            lines << QStringLiteral("  - ") + str(c.message);
        }
    }
    if (!s.errors.empty()) {
        lines << QStringLiteral("Errors (%1):").arg(s.errors.size());
        for (const auto& e : s.errors) {
            lines << QStringLiteral("  - ") + str(e);
        }
    }
}

} // namespace

QString format_preview(const ImportPreview& preview) {
    QStringList lines;
    lines << QStringLiteral("Preview (%1)").arg(str(strategy_name(preview.strategy)));
    append_summary(lines, preview, QStringLiteral("to create"), QStringLiteral("to update"));
    return lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString format_result(const ImportResult& result) {
    QStringList lines;
    lines << QStringLiteral("Imported (%1)").arg(str(strategy_name(result.strategy)));
    append_summary(lines, result, QStringLiteral("created"), QStringLiteral("updated"));
    if (result.lists_deleted > 0 || result.items_deleted > 0) {
        lines << QStringLiteral("Deleted: %1 lists, %2 items").arg(result.lists_deleted).arg(result.items_deleted);
    }
    return lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString format_error(const ImportError& error) {
    return QStringLiteral("error: ") + str(error.describe()) + QLatin1Char('\n');
}

QJsonObject preview_to_json(const ImportPreview& preview) {
    auto obj = summary_to_json(preview, preview.strategy);
    obj["isValid"] = preview.is_valid();
    return obj;
}

QJsonObject result_to_json(const ImportResult& result) {
    auto obj = summary_to_json(result, result.strategy);
    obj["wasSuccessful"] = result.was_successful();
    obj["listsDeleted"] = result.lists_deleted;
    obj["itemsDeleted"] = result.items_deleted;
    return obj;
}

QJsonObject error_to_json(const ImportError& error) {
    QJsonObject obj;
    obj["error"] = str(error_kind_name(error.kind));
    obj["message"] = str(error.describe());
    return obj;
}

} // namespace listall::app
