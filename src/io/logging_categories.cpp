#include "io/logging_categories.hpp"

namespace listall {

Q_LOGGING_CATEGORY(lcCodec, "listall.codec", QtInfoMsg)
Q_LOGGING_CATEGORY(lcImport, "listall.import", QtInfoMsg)
Q_LOGGING_CATEGORY(lcStorage, "listall.storage", QtInfoMsg)

void enable_debug_logging() {
    QLoggingCategory::setFilterRules(QStringLiteral("listall.*.debug=true"));
}

} // namespace listall
