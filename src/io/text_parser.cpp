#include "io/text_parser.hpp"

#include <QRegularExpression>
#include <QStringList>

#include <array>

namespace listall {
namespace {

constexpr std::array<char16_t, 10> kBulletMarkers = {
    u'•',
    u'-',
    u'*',
    u'✓',
    u'✔',
    u'☐',
    u'☑',
    u'▪',
    u'▸',
    u'→'
};

const QRegularExpression& number_prefix() {
    static const QRegularExpression re(QStringLiteral("^[0-9]+[.):]\\s*"));
    return re;
}

const QRegularExpression& checkbox_prefix() {
    static const QRegularExpression re(QStringLiteral("^\\[([ xX✓]?)\\]\\s*"));
    return re;
}

const QRegularExpression& quantity_suffix() {
    static const QRegularExpression re(QStringLiteral("\\s*\\(×([0-9]+)\\)\\s*$"));
    return re;
}

bool strip_bullet(QString& line) {
    if (line.isEmpty()) return false;
    const char16_t first = line.front().unicode();
    for (auto marker : kBulletMarkers) {
        if (first == marker) {
            line.remove(0, 1);
            return true;
        }
    }
    return false;
}

bool strip_prefix(QString& line, const QRegularExpression& re, QRegularExpressionMatch* out = nullptr) {
    auto match = re.match(line);
    if (!match.hasMatch()) return false;
    line.remove(0, match.capturedLength(0));
    if (out) *out = match;
    return true;
}

} // namespace

std::optional<TextCandidate> parse_text_line(const QString& raw) {
    QString line = raw.trimmed();
    if (line.isEmpty()) {
        return std::nullopt;
    }

    TextCandidate candidate;

    QRegularExpressionMatch checkbox;
    if (!strip_bullet(line) && !strip_prefix(line, number_prefix()) &&
        strip_prefix(line, checkbox_prefix(), &checkbox)) {
        const auto mark = checkbox.captured(1);
        candidate.is_crossed_out = mark == QStringLiteral("x") || mark == QStringLiteral("X") ||
                                   mark == QStringLiteral("✓");
    }

    auto quantity = quantity_suffix().match(line);
    if (quantity.hasMatch()) {
        bool ok = false;
        const int value = quantity.captured(1).toInt(&ok);
        candidate.quantity = ok && value >= 1 ? value : 1;
        line.truncate(quantity.capturedStart(0));
    }

    candidate.title = line.trimmed().toStdString();
    return candidate;
}

std::vector<TextCandidate> parse_text(const QString& text) {
    std::vector<TextCandidate> out;
    static const QRegularExpression line_break(QStringLiteral("\r\n|\r|\n"));
    for (const auto& line : text.split(line_break)) {
        if (auto candidate = parse_text_line(line)) {
            out.push_back(std::move(*candidate));
        }
    }
    return out;
}

ExportData wrap_candidates(const std::vector<TextCandidate>& candidates, const std::string& list_name) {
    auto list = create_list(Uuid::generate(), list_name);

    int order = 0;
    for (const auto& candidate : candidates) {
        auto item = create_item(Uuid::generate(), list.id, candidate.title, order++);
        item.quantity = candidate.quantity;
        item.is_crossed_out = candidate.is_crossed_out;
        item.created_at = list.created_at;
        item.modified_at = list.modified_at;
        list.items.push_back(std::move(item));
    }

    ExportData data;
    data.export_date = list.created_at;
    data.lists.push_back(std::move(list));
    return data;
}

} // namespace listall
