#pragma once

#include "core/model.hpp"

#include <QString>

#include <vector>

namespace listall {

struct ShareOptions {
    bool include_crossed_out = true;
    bool include_quantities = true;
    bool include_descriptions = true;
};

/**
 * Render a list for sharing as plain text:
 *
 *   Groceries
 *   =========
 *
 *   [ ] Milk (×2)
 *   [✓] Bread
 *      whole grain
 *
 * Items are written in order-number order. Every item line is read back by
 * parse_text_line as the same title, crossed-out flag and quantity.
 */
[[nodiscard]] QString write_plain_text(const List& list, const ShareOptions& options = {});

/**
 * Render several lists, separated by a blank line.
 */
[[nodiscard]] QString write_plain_text(const std::vector<List>& lists, const ShareOptions& options = {});

} // namespace listall
