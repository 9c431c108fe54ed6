#include "io/format_detector.hpp"

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

namespace listall {
namespace {

constexpr char kUtf8Bom[] = "\xEF\xBB\xBF";

char first_significant_char(const QByteArray& raw) {
    qsizetype pos = raw.startsWith(kUtf8Bom) ? 3 : 0;
    while (pos < raw.size()) {
        const char c = raw.at(pos);
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
            return c;
        }
        ++pos;
    }
    return '\0';
}

} // namespace

InputFormat detect_format(const QByteArray& raw) {
    QJsonParseError error{};
    const auto doc = QJsonDocument::fromJson(raw, &error);
    if (error.error == QJsonParseError::NoError && doc.isObject() &&
        doc.object().contains(QStringLiteral("version"))) {
        return InputFormat::Structured;
    }
    return first_significant_char(raw) == '{' ? InputFormat::Structured : InputFormat::FreeText;
}

} // namespace listall
