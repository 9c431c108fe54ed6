#pragma once

#include "core/import_types.hpp"
#include "core/model.hpp"
#include "core/result.hpp"

#include <QByteArray>
#include <QString>

#include <optional>

namespace listall {

/**
 * Decode a JSON transport document.
 *
 * Fails with InvalidFormat when the bytes are not well-formed JSON and with
 * DecodingFailed (naming the offending field path) when a required field is
 * missing or holds the wrong type. `description`, `items` and `images` are
 * optional. Every decoded item gets `list_id` set to its containing list.
 */
[[nodiscard]] Result<ExportData, ImportError> decode_export(const QByteArray& bytes);

/**
 * Encode to the JSON transport document. Image bytes are written as base64,
 * dates as ISO-8601 UTC. An unset export date is written as the current time.
 */
[[nodiscard]] QByteArray encode_export(const ExportData& data, bool indented = true);

/**
 * Read an ISO-8601 date-time. A value without a zone designator is UTC.
 */
[[nodiscard]] std::optional<Timestamp> parse_iso_date(const QString& text);

/**
 * Write `t` as ISO-8601 UTC with a `Z` suffix. Milliseconds appear only when
 * `t` is not a whole second.
 */
[[nodiscard]] QString iso_date(Timestamp t);

} // namespace listall
