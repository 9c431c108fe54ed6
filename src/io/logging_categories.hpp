#pragma once

#include <QLoggingCategory>

namespace listall {

Q_DECLARE_LOGGING_CATEGORY(lcCodec)
Q_DECLARE_LOGGING_CATEGORY(lcImport)
Q_DECLARE_LOGGING_CATEGORY(lcStorage)

/**
 * Turn on debug output for every listall.* category.
 * Called for --debug and when LISTALL_DEBUG_IMPORT is set.
 */
void enable_debug_logging();

} // namespace listall
