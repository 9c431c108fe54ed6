#pragma once

#include "core/model.hpp"

#include <optional>
#include <string>
#include <vector>

namespace listall {

/**
 * ValidationError - one structural problem found in a candidate graph.
 *
 * `path` locates the offending value, e.g. `lists[1].items[0].title`.
 */
struct ValidationError {
    std::string path;
    std::string message;

    bool operator==(const ValidationError&) const = default;
};

/**
 * Check the invariants of a decoded graph before reconciliation.
 *
 * Every check runs and every failure is collected:
 * - version is present and supported, exportDate is present
 * - list names and item titles are non-empty after trimming
 * - item quantities are at least 1
 * - an item's list_id, when set, names its containing list
 * - list, item and image ids are unique within the graph
 */
[[nodiscard]] std::vector<ValidationError> validate(const ExportData& data);

/**
 * Per-entity checks used when up-front validation is disabled; they return
 * the reason an entity has to be skipped, or nothing when it is usable.
 */
[[nodiscard]] std::optional<std::string> list_defect(const List& list);
[[nodiscard]] std::optional<std::string> item_defect(const Item& item);

/**
 * Join messages into the single reason carried by validationFailed.
 */
[[nodiscard]] std::string summarize(const std::vector<ValidationError>& errors);

} // namespace listall
