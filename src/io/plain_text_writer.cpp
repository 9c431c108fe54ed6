#include "io/plain_text_writer.hpp"

namespace listall {

QString write_plain_text(const List& list, const ShareOptions& options) {
    const auto name = QString::fromStdString(list.name);

    QString out;
    out += name + QLatin1Char('\n');
    out += QString(name.toUcs4().size(), QLatin1Char('=')) + QLatin1Char('\n');
    out += QLatin1Char('\n');

    bool any = false;
    for (const auto& item : sorted_items(list)) {
        if (item.is_crossed_out && !options.include_crossed_out) {
            continue;
        }
        any = true;

        out += item.is_crossed_out ? QStringLiteral("[✓] ") : QStringLiteral("[ ] ");
        out += QString::fromStdString(item.title);
        if (options.include_quantities && item.quantity > 1) {
            out += QStringLiteral(" (×%1)").arg(item.quantity);
        }
        out += QLatin1Char('\n');

        if (options.include_descriptions && item.description && !item.description->empty()) {
            out += QStringLiteral("   ") + QString::fromStdString(*item.description) + QLatin1Char('\n');
        }
    }

    if (!any) {
        out += QStringLiteral("(No items)\n");
    }
    return out;
}

QString write_plain_text(const std::vector<List>& lists, const ShareOptions& options) {
    QString out;
    for (const auto& list : lists) {
        if (!out.isEmpty()) out += QLatin1Char('\n');
        out += write_plain_text(list, options);
    }
    return out;
}

} // namespace listall
