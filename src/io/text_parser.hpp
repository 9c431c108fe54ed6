#pragma once

#include "core/model.hpp"

#include <QString>

#include <optional>
#include <string>
#include <vector>

namespace listall {

/**
 * TextCandidate - one item recovered from a line of free text.
 */
struct TextCandidate {
    std::string title;
    bool is_crossed_out = false;
    int quantity = 1;

    bool operator==(const TextCandidate&) const = default;
};

/**
 * Parse one line. Returns nullopt for a blank line.
 *
 * After trimming, at most one leading decoration is removed: a bullet
 * (• - * ✓ ✔ ☐ ☑ ▪ ▸ →), else a number prefix ("1." "2)" "3:"), else a
 * checkbox ("[ ]" "[x]" "[X]" "[✓]" "[]"). A checked box marks the item
 * crossed out. A trailing "(×N)" sets the quantity.
 */
[[nodiscard]] std::optional<TextCandidate> parse_text_line(const QString& line);

/**
 * Parse every line of `text` in order, skipping blank lines.
 */
[[nodiscard]] std::vector<TextCandidate> parse_text(const QString& text);

/**
 * Wrap candidates into a transport graph: one list named `list_name` holding
 * one item per candidate, all with fresh ids, ordered by line.
 */
[[nodiscard]] ExportData wrap_candidates(const std::vector<TextCandidate>& candidates,
                                         const std::string& list_name);

} // namespace listall
