#pragma once

#include <string_view>

namespace listall {

/**
 * Whether two UTF-8 names are the same after trimming whitespace, ignoring
 * case (Unicode simple case folding).
 */
[[nodiscard]] bool names_match(std::string_view a, std::string_view b);

} // namespace listall
