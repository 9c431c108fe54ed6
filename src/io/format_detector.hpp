#pragma once

#include <QByteArray>

#include <string_view>

namespace listall {

enum class InputFormat {
    Structured,  // JSON transport document, handed to the schema codec
    FreeText     // anything else, handed to the text parser
};

[[nodiscard]] constexpr std::string_view format_name(InputFormat format) {
    return format == InputFormat::Structured ? "structured" : "text";
}

/**
 * Classify raw input. Never fails.
 *
 * A JSON object with a "version" key is structured. So is anything whose first
 * non-whitespace character is '{', even if it is malformed or lacks "version":
 * the codec then reports exactly what is wrong with it instead of the payload
 * being read as a single line of text.
 */
[[nodiscard]] InputFormat detect_format(const QByteArray& raw);

} // namespace listall
