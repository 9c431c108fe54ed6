#pragma once

#include "core/types.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace listall {

/**
 * MergeStrategy - how incoming data is reconciled with the existing store.
 * Fixed for the whole of one import call.
 */
enum class MergeStrategy {
    Replace,  // delete everything, then create incoming with incoming ids
    Merge,    // match by id / name, update matches, create the rest
    Append    // create everything with fresh ids
};

[[nodiscard]] constexpr std::string_view strategy_name(MergeStrategy strategy) {
    switch (strategy) {
        case MergeStrategy::Replace: return "replace";
        case MergeStrategy::Merge: return "merge";
        case MergeStrategy::Append: return "append";
    }
    return "merge";
}

[[nodiscard]] inline std::optional<MergeStrategy> parse_strategy(std::string_view name) {
    if (name == "replace") return MergeStrategy::Replace;
    if (name == "merge") return MergeStrategy::Merge;
    if (name == "append") return MergeStrategy::Append;
    return std::nullopt;
}

inline constexpr std::string_view kDefaultTextListName = "Imported Items";

struct ImportOptions {
    MergeStrategy merge_strategy = MergeStrategy::Merge;
    bool validate_data = true;
    // Name of the list that wraps free-text candidates.
    std::string text_list_name{kDefaultTextListName};

    [[nodiscard]] static ImportOptions defaults() { return ImportOptions{}; }

    [[nodiscard]] static ImportOptions replacing() {
        return ImportOptions{.merge_strategy = MergeStrategy::Replace};
    }

    [[nodiscard]] static ImportOptions appending() {
        return ImportOptions{.merge_strategy = MergeStrategy::Append};
    }
};

/**
 * ImportError - terminal failure of a preview or commit call.
 */
struct ImportError {
    enum class Kind {
        InvalidData,       // empty or unusable raw input
        InvalidFormat,     // not well-formed JSON
        DecodingFailed,    // well-formed JSON that does not fit the schema
        ValidationFailed,  // pre-flight invariant violation
        RepositoryError,   // entity store write failed during commit
        Cancelled          // caller cancelled the traversal
    };

    Kind kind = Kind::InvalidData;
    std::string reason;

    [[nodiscard]] static ImportError invalid_data() { return {Kind::InvalidData, {}}; }
    [[nodiscard]] static ImportError invalid_format(std::string why = {}) {
        return {Kind::InvalidFormat, std::move(why)};
    }
    [[nodiscard]] static ImportError decoding_failed(std::string why) {
        return {Kind::DecodingFailed, std::move(why)};
    }
    [[nodiscard]] static ImportError validation_failed(std::string why) {
        return {Kind::ValidationFailed, std::move(why)};
    }
    [[nodiscard]] static ImportError repository_error(std::string why) {
        return {Kind::RepositoryError, std::move(why)};
    }
    [[nodiscard]] static ImportError cancelled() { return {Kind::Cancelled, {}}; }

    /**
     * User-facing description.
     */
    [[nodiscard]] std::string describe() const {
        switch (kind) {
            case Kind::InvalidData: return "The provided data is invalid or corrupted";
            case Kind::InvalidFormat: return "The file format is not supported";
            case Kind::DecodingFailed: return "Failed to decode data: " + reason;
            case Kind::ValidationFailed: return "Data validation failed: " + reason;
            case Kind::RepositoryError: return "Failed to save data: " + reason;
            case Kind::Cancelled: return "Import was cancelled";
        }
        return reason;
    }

    bool operator==(const ImportError&) const = default;
};

[[nodiscard]] constexpr std::string_view error_kind_name(ImportError::Kind kind) {
    switch (kind) {
        case ImportError::Kind::InvalidData: return "invalidData";
        case ImportError::Kind::InvalidFormat: return "invalidFormat";
        case ImportError::Kind::DecodingFailed: return "decodingFailed";
        case ImportError::Kind::ValidationFailed: return "validationFailed";
        case ImportError::Kind::RepositoryError: return "repositoryError";
        case ImportError::Kind::Cancelled: return "cancelled";
    }
    return "unknown";
}

/**
 * ConflictDetail - informational record that an update would overwrite a value.
 */
struct ConflictDetail {
    enum class Type {
        ListModified,
        ItemModified,
        ListDeleted,
        ItemDeleted
    };

    Type type = Type::ListModified;
    std::string entity_name;
    Uuid entity_id;
    std::string current_value;
    std::optional<std::string> incoming_value;  // absent for deletions
    std::string message;

    bool operator==(const ConflictDetail&) const = default;
};

[[nodiscard]] constexpr std::string_view conflict_type_name(ConflictDetail::Type type) {
    switch (type) {
        case ConflictDetail::Type::ListModified: return "listModified";
        case ConflictDetail::Type::ItemModified: return "itemModified";
        case ConflictDetail::Type::ListDeleted: return "listDeleted";
        case ConflictDetail::Type::ItemDeleted: return "itemDeleted";
    }
    return "unknown";
}

/**
 * Counters and findings shared by ImportPreview and ImportResult.
 */
struct ImportSummary {
    int lists_to_create = 0;
    int lists_to_update = 0;
    int items_to_create = 0;
    int items_to_update = 0;
    std::vector<ConflictDetail> conflicts;
    std::vector<std::string> errors;

    [[nodiscard]] int total_changes() const {
        return lists_to_create + lists_to_update + items_to_create + items_to_update;
    }

    [[nodiscard]] bool has_conflicts() const { return !conflicts.empty(); }

    bool operator==(const ImportSummary&) const = default;
};

/**
 * ImportPreview - dry-run outcome; nothing has been written.
 */
struct ImportPreview : ImportSummary {
    MergeStrategy strategy = MergeStrategy::Merge;

    [[nodiscard]] bool is_valid() const { return errors.empty(); }
};

/**
 * ImportResult - outcome of a committed import.
 */
struct ImportResult : ImportSummary {
    MergeStrategy strategy = MergeStrategy::Merge;
    // Existing lists and items removed by a replace.
    int lists_deleted = 0;
    int items_deleted = 0;

    [[nodiscard]] bool was_successful() const { return errors.empty(); }
};

/**
 * ImportProgress - snapshot of traversal progress.
 */
struct ImportProgress {
    int total_lists = 0;
    int processed_lists = 0;
    int total_items = 0;
    int processed_items = 0;
    std::string current_operation;

    [[nodiscard]] double overall_progress() const {
        const int total = total_lists + total_items;
        if (total <= 0) return 0.0;
        const double ratio = static_cast<double>(processed_lists + processed_items) / total;
        return std::clamp(ratio, 0.0, 1.0);
    }

    [[nodiscard]] int progress_percentage() const {
        return static_cast<int>(overall_progress() * 100.0);
    }

    bool operator==(const ImportProgress&) const = default;
};

} // namespace listall
