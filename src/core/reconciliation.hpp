#pragma once

#include "core/import_types.hpp"
#include "core/model.hpp"
#include "core/progress.hpp"
#include "core/result.hpp"

#include <functional>
#include <string_view>
#include <utility>
#include <vector>

namespace listall {

/**
 * ChangeSet - the complete write plan of one import, built before any store
 * mutation.
 *
 * Lists in lists_to_create / lists_to_update carry no items; every item write
 * is its own entry whose list_id names the target list. Item entries carry
 * their images.
 */
struct ChangeSet {
    MergeStrategy strategy = MergeStrategy::Merge;

    // Replace only: everything that exists before the import.
    std::vector<Uuid> lists_to_delete;
    std::vector<Uuid> items_to_delete;

    std::vector<List> lists_to_create;
    std::vector<List> lists_to_update;
    std::vector<Item> items_to_create;
    std::vector<Item> items_to_update;

    std::vector<ConflictDetail> conflicts;
    std::vector<std::string> errors;

    [[nodiscard]] ImportSummary summary() const;
    [[nodiscard]] bool empty() const;
};

using CancelCheck = std::function<bool()>;

// Decides whether an incoming list name matches a stored one.
using NameMatcher = std::function<bool(std::string_view, std::string_view)>;

/**
 * Reconciler - diffs an incoming graph against a snapshot of the store.
 *
 * One instance per call. run() walks the incoming lists in order and produces
 * the same ChangeSet whether the caller previews it or commits it; it never
 * touches the store.
 *
 *   NotStarted -> Traversing -> Completed
 *                            -> Aborted   (validation failure or cancellation)
 *
 * With validate_data set, the whole graph is validated first and any finding
 * aborts the run. Without it, unusable lists and items are skipped one by one
 * and reported in ChangeSet::errors.
 *
 * Merge falls back to `same_name` for lists without an id match.
 */
class Reconciler {
public:
    enum class State {
        NotStarted,
        Traversing,
        Completed,
        Aborted
    };

    struct Options {
        MergeStrategy strategy = MergeStrategy::Merge;
        bool validate_data = true;
    };

    Reconciler(const std::vector<List>& existing, const ExportData& incoming, Options options,
               NameMatcher same_name)
        : existing_(existing), incoming_(incoming), options_(options), same_name_(std::move(same_name)) {}

    Reconciler(const Reconciler&) = delete;
    Reconciler& operator=(const Reconciler&) = delete;

    /**
     * Run the traversal. May be called once; a second call fails with
     * validationFailed.
     *
     * `is_cancelled` is polled before each top-level list.
     */
    [[nodiscard]] Result<ChangeSet, ImportError> run(ProgressReporter& progress,
                                                     const CancelCheck& is_cancelled = {});

    [[nodiscard]] State state() const noexcept { return state_; }

private:
    const std::vector<List>& existing_;
    const ExportData& incoming_;
    Options options_;
    NameMatcher same_name_;
    State state_ = State::NotStarted;
};

[[nodiscard]] constexpr std::string_view state_name(Reconciler::State state) {
    switch (state) {
        case Reconciler::State::NotStarted: return "not-started";
        case Reconciler::State::Traversing: return "traversing";
        case Reconciler::State::Completed: return "completed";
        case Reconciler::State::Aborted: return "aborted";
    }
    return "unknown";
}

} // namespace listall
