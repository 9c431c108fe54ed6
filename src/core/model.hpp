#pragma once

#include "core/types.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace listall {

inline constexpr std::string_view kExportSchemaVersion = "1.0";

/**
 * ItemImage - opaque image payload attached to an item.
 *
 * The bytes are never decoded here; the image codec owns their meaning.
 */
struct ItemImage {
    Uuid id;
    std::vector<uint8_t> image_data;
    int order_number = 0;
    Timestamp created_at;

    bool operator==(const ItemImage&) const = default;
};

/**
 * Item - one entry of a list.
 *
 * `list_id` names the owning list; inside a decoded graph it always equals the
 * id of the list that contains the item.
 */
struct Item {
    Uuid id;
    std::optional<Uuid> list_id;
    std::string title;
    std::optional<std::string> description;
    int quantity = 1;
    int order_number = 0;
    bool is_crossed_out = false;
    Timestamp created_at;
    Timestamp modified_at;
    std::vector<ItemImage> images;

    bool operator==(const Item&) const = default;
};

/**
 * List - a named, ordered collection of items.
 */
struct List {
    Uuid id;
    std::string name;
    int order_number = 0;
    bool is_archived = false;
    Timestamp created_at;
    Timestamp modified_at;
    std::vector<Item> items;

    bool operator==(const List&) const = default;
};

/**
 * ExportData - root of the structured transport format.
 *
 * `export_date` is optional in memory so that a graph built by hand can be
 * checked by the validator; the codec always requires it on the wire.
 */
struct ExportData {
    std::string version{kExportSchemaVersion};
    std::optional<Timestamp> export_date;
    std::vector<List> lists;

    bool operator==(const ExportData&) const = default;
};

// ============================================================================
// Pure helpers
// ============================================================================

[[nodiscard]] inline List create_list(Uuid id, std::string name, int order_number = 0) {
    auto now = Timestamp::now();
    return List{
        .id = id,
        .name = std::move(name),
        .order_number = order_number,
        .is_archived = false,
        .created_at = now,
        .modified_at = now,
        .items = {}
    };
}

[[nodiscard]] inline Item create_item(Uuid id, Uuid list_id, std::string title, int order_number = 0) {
    auto now = Timestamp::now();
    return Item{
        .id = id,
        .list_id = list_id,
        .title = std::move(title),
        .description = std::nullopt,
        .quantity = 1,
        .order_number = order_number,
        .is_crossed_out = false,
        .created_at = now,
        .modified_at = now,
        .images = {}
    };
}

/**
 * Strip leading and trailing ASCII whitespace (space, tab, CR, LF, VT, FF).
 */
[[nodiscard]] inline std::string_view trim_view(std::string_view s) {
    constexpr std::string_view ws = " \t\r\n\v\f";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

[[nodiscard]] inline bool is_blank(std::string_view s) {
    return trim_view(s).empty();
}

[[nodiscard]] inline size_t count_items(const std::vector<List>& lists) {
    size_t total = 0;
    for (const auto& list : lists) total += list.items.size();
    return total;
}

/**
 * Items of a list sorted by order number (stable for equal numbers).
 */
[[nodiscard]] inline std::vector<Item> sorted_items(const List& list) {
    auto items = list.items;
    std::stable_sort(items.begin(), items.end(),
        [](const Item& a, const Item& b) { return a.order_number < b.order_number; });
    return items;
}

} // namespace listall
