#include "core/reconciliation.hpp"
#include "core/validator.hpp"

#include <unordered_map>
#include <unordered_set>

namespace listall {
namespace {

std::string quoted(std::string_view s) {
    return "'" + std::string(s) + "'";
}

std::string list_label(const List& list, size_t index) {
    if (is_blank(list.name)) return "#" + std::to_string(index + 1);
    return quoted(list.name);
}

std::string item_label(const Item& item, size_t index) {
    if (is_blank(item.title)) return "#" + std::to_string(index + 1);
    return quoted(item.title);
}

std::string describe_changes(const std::vector<std::string>& changes) {
    std::string out;
    for (const auto& c : changes) {
        if (!out.empty()) out += ", ";
        out += c;
    }
    return out;
}

std::string optional_text(const std::optional<std::string>& s) {
    return s ? quoted(*s) : std::string("none");
}

std::vector<std::string> list_field_changes(const List& current, const List& incoming) {
    std::vector<std::string> changes;
    if (current.name != incoming.name) {
        changes.push_back("name changed from " + quoted(current.name) + " to " + quoted(incoming.name));
    }
    if (current.order_number != incoming.order_number) {
        changes.push_back("orderNumber changed from " + std::to_string(current.order_number) +
                          " to " + std::to_string(incoming.order_number));
    }
    if (current.is_archived != incoming.is_archived) {
        changes.push_back(incoming.is_archived ? "list will be archived" : "list will be unarchived");
    }
    return changes;
}

std::vector<std::string> item_field_changes(const Item& current, const Item& incoming) {
    std::vector<std::string> changes;
    if (current.title != incoming.title) {
        changes.push_back("title changed from " + quoted(current.title) + " to " + quoted(incoming.title));
    }
    if (current.description != incoming.description) {
        changes.push_back("description changed from " + optional_text(current.description) +
                          " to " + optional_text(incoming.description));
    }
    if (current.quantity != incoming.quantity) {
        changes.push_back("quantity changed from " + std::to_string(current.quantity) +
                          " to " + std::to_string(incoming.quantity));
    }
    if (current.order_number != incoming.order_number) {
        changes.push_back("orderNumber changed from " + std::to_string(current.order_number) +
                          " to " + std::to_string(incoming.order_number));
    }
    if (current.is_crossed_out != incoming.is_crossed_out) {
        changes.push_back(incoming.is_crossed_out ? "item will be crossed out" : "item will be restored");
    }
    if (!incoming.images.empty() && current.images != incoming.images) {
        changes.push_back("images replaced (" + std::to_string(current.images.size()) + " -> " +
                          std::to_string(incoming.images.size()) + ")");
    }
    return changes;
}

/**
 * Lookup tables over the existing snapshot.
 */
struct ExistingIndex {
    const std::vector<List>& lists;
    const NameMatcher& same_name;
    std::unordered_map<Uuid, const List*> lists_by_id;
    std::unordered_set<Uuid> item_ids;
    std::unordered_set<Uuid> image_ids;

    ExistingIndex(const std::vector<List>& existing, const NameMatcher& matcher)
        : lists(existing), same_name(matcher) {
        for (const auto& list : existing) {
            lists_by_id.emplace(list.id, &list);
            for (const auto& item : list.items) {
                item_ids.insert(item.id);
                for (const auto& image : item.images) {
                    image_ids.insert(image.id);
                }
            }
        }
    }

    // First exact id match, else first trimmed case-insensitive name match
    // in snapshot order.
    [[nodiscard]] const List* match_list(const List& incoming) const {
        if (auto it = lists_by_id.find(incoming.id); it != lists_by_id.end()) {
            return it->second;
        }
        for (const auto& list : lists) {
            if (same_name(list.name, incoming.name)) {
                return &list;
            }
        }
        return nullptr;
    }
};

class Traversal {
public:
    Traversal(const std::vector<List>& existing,
              const ExportData& incoming,
              MergeStrategy strategy,
              const NameMatcher& same_name,
              ProgressReporter& progress)
        : index_(existing, same_name)
        , incoming_(incoming)
        , progress_(progress)
        , total_lists_(static_cast<int>(incoming.lists.size()))
        , total_items_(static_cast<int>(count_items(incoming.lists)))
    {
        changes_.strategy = strategy;
        reserved_items_ = index_.item_ids;
        reserved_images_ = index_.image_ids;

        if (strategy == MergeStrategy::Replace) {
            // The store is emptied first, so incoming ids cannot collide with it.
            for (const auto& list : existing) {
                changes_.lists_to_delete.push_back(list.id);
                for (const auto& item : list.items) {
                    changes_.items_to_delete.push_back(item.id);
                }
            }
            reserved_items_.clear();
            reserved_images_.clear();
        }
    }

    void visit_list(size_t li) {
        const auto& list = incoming_.lists[li];

        if (auto defect = list_defect(list)) {
            skip_list(list, li, *defect);
            return;
        }
        if (!seen_lists_.insert(list.id).second) {
            skip_list(list, li, "duplicate list id " + list.id.to_string());
            return;
        }

        switch (changes_.strategy) {
            case MergeStrategy::Replace:
                create_list_with_items(list, li, list.id, IdPolicy::KeepIncoming);
                break;
            case MergeStrategy::Append:
                create_list_with_items(list, li, Uuid::generate(), IdPolicy::Fresh);
                break;
            case MergeStrategy::Merge:
                merge_list(list, li);
                break;
        }

        list_done();
    }

    [[nodiscard]] ChangeSet take() { return std::move(changes_); }

private:
    enum class IdPolicy {
        KeepIncoming,  // keep incoming ids unless they are already taken
        Fresh          // always generate
    };

    void skip_list(const List& list, size_t li, const std::string& why) {
        changes_.errors.push_back("Skipped list " + list_label(list, li) + ": " + why);
        processed_items_ += static_cast<int>(list.items.size());
        list_done();
    }

    void list_done() {
        ++processed_lists_;
        progress_.report(processed_lists_, processed_items_,
                         ProgressReporter::list_operation(processed_lists_, total_lists_));
    }

    void item_done() {
        ++processed_items_;
        progress_.report(processed_lists_, processed_items_,
                         ProgressReporter::item_operation(processed_items_, total_items_));
    }

    // Returns false (and records why) when the item has to be skipped.
    bool accept_item(const Item& item, size_t ii, const List& parent, size_t li) {
        auto defect = item_defect(item);
        if (!defect && !seen_items_.insert(item.id).second) {
            defect = "duplicate item id " + item.id.to_string();
        }
        if (defect) {
            changes_.errors.push_back("Skipped item " + item_label(item, ii) + " in list " +
                                      list_label(parent, li) + ": " + *defect);
            return false;
        }
        return true;
    }

    Uuid claim_item_id(const Uuid& wanted, IdPolicy policy) {
        Uuid id = wanted;
        if (policy == IdPolicy::Fresh || reserved_items_.contains(id)) {
            id = Uuid::generate();
        }
        reserved_items_.insert(id);
        return id;
    }

    // `owned` are ids the item already holds in the store; it may keep them.
    std::vector<ItemImage> claim_images(const std::vector<ItemImage>& images, IdPolicy policy,
                                        std::unordered_set<Uuid> owned = {}) {
        std::vector<ItemImage> out;
        out.reserve(images.size());
        for (const auto& image : images) {
            auto copy = image;
            if (policy == IdPolicy::Fresh) {
                copy.id = Uuid::generate();
            } else if (owned.erase(copy.id) == 0 && reserved_images_.contains(copy.id)) {
                copy.id = Uuid::generate();
            }
            reserved_images_.insert(copy.id);
            out.push_back(std::move(copy));
        }
        return out;
    }

    Item planned_item(const Item& incoming, const Uuid& list_id, IdPolicy policy) {
        auto item = incoming;
        item.id = claim_item_id(incoming.id, policy);
        item.list_id = list_id;
        item.images = claim_images(incoming.images, policy);
        return item;
    }

    void create_list_with_items(const List& incoming, size_t li, const Uuid& list_id, IdPolicy policy) {
        auto list = incoming;
        list.id = list_id;
        list.items.clear();
        changes_.lists_to_create.push_back(std::move(list));

        for (size_t ii = 0; ii < incoming.items.size(); ++ii) {
            const auto& item = incoming.items[ii];
            if (accept_item(item, ii, incoming, li)) {
                changes_.items_to_create.push_back(planned_item(item, list_id, policy));
            }
            item_done();
        }
    }

    void merge_list(const List& incoming, size_t li) {
        const List* current = index_.match_list(incoming);
        if (!current) {
            create_list_with_items(incoming, li, incoming.id, IdPolicy::KeepIncoming);
            return;
        }

        auto target = *current;
        target.name = incoming.name;
        target.order_number = incoming.order_number;
        target.is_archived = incoming.is_archived;
        target.modified_at = incoming.modified_at;
        target.items.clear();

        if (auto changes = list_field_changes(*current, incoming); !changes.empty()) {
            changes_.conflicts.push_back(ConflictDetail{
                .type = ConflictDetail::Type::ListModified,
                .entity_name = current->name,
                .entity_id = current->id,
                .current_value = current->name,
                .incoming_value = incoming.name,
                .message = "List " + quoted(current->name) + " will be updated: " + describe_changes(changes)
            });
        }
        changes_.lists_to_update.push_back(std::move(target));

        std::unordered_map<Uuid, const Item*> current_items;
        for (const auto& item : current->items) {
            current_items.emplace(item.id, &item);
        }

        for (size_t ii = 0; ii < incoming.items.size(); ++ii) {
            const auto& item = incoming.items[ii];
            if (accept_item(item, ii, incoming, li)) {
                if (auto it = current_items.find(item.id); it != current_items.end()) {
                    update_item(*it->second, item, *current);
                } else {
                    changes_.items_to_create.push_back(
                        planned_item(item, current->id, IdPolicy::KeepIncoming));
                }
            }
            item_done();
        }
    }

    void update_item(const Item& current, const Item& incoming, const List& owner) {
        auto target = current;
        target.title = incoming.title;
        target.description = incoming.description;
        target.quantity = incoming.quantity;
        target.order_number = incoming.order_number;
        target.is_crossed_out = incoming.is_crossed_out;
        target.modified_at = incoming.modified_at;

        if (!incoming.images.empty()) {
            // Replaced images stay reserved: the commit creates new items
            // before it updates this one, so their rows still exist then.
            std::unordered_set<Uuid> owned;
            for (const auto& image : current.images) {
                owned.insert(image.id);
            }
            target.images = claim_images(incoming.images, IdPolicy::KeepIncoming, std::move(owned));
        }

        if (auto changes = item_field_changes(current, incoming); !changes.empty()) {
            changes_.conflicts.push_back(ConflictDetail{
                .type = ConflictDetail::Type::ItemModified,
                .entity_name = current.title,
                .entity_id = current.id,
                .current_value = current.title,
                .incoming_value = incoming.title,
                .message = "Item " + quoted(current.title) + " in list " + quoted(owner.name) +
                           " will be updated: " + describe_changes(changes)
            });
        }
        changes_.items_to_update.push_back(std::move(target));
    }

    ExistingIndex index_;
    const ExportData& incoming_;
    ProgressReporter& progress_;
    ChangeSet changes_;

    int total_lists_;
    int total_items_;
    int processed_lists_ = 0;
    int processed_items_ = 0;

    std::unordered_set<Uuid> seen_lists_;
    std::unordered_set<Uuid> seen_items_;
    std::unordered_set<Uuid> reserved_items_;
    std::unordered_set<Uuid> reserved_images_;
};

} // namespace

ImportSummary ChangeSet::summary() const {
    ImportSummary s;
    s.lists_to_create = static_cast<int>(lists_to_create.size());
    s.lists_to_update = static_cast<int>(lists_to_update.size());
    s.items_to_create = static_cast<int>(items_to_create.size());
    s.items_to_update = static_cast<int>(items_to_update.size());
    s.conflicts = conflicts;
    s.errors = errors;
    return s;
}

bool ChangeSet::empty() const {
    return lists_to_delete.empty() && items_to_delete.empty() &&
           lists_to_create.empty() && lists_to_update.empty() &&
           items_to_create.empty() && items_to_update.empty();
}

Result<ChangeSet, ImportError> Reconciler::run(ProgressReporter& progress, const CancelCheck& is_cancelled) {
    if (state_ != State::NotStarted) {
        return Result<ChangeSet, ImportError>::err(
            ImportError::validation_failed("reconciliation already ran"));
    }

    if (options_.validate_data) {
        auto findings = validate(incoming_);
        if (!findings.empty()) {
            state_ = State::Aborted;
            return Result<ChangeSet, ImportError>::err(ImportError::validation_failed(summarize(findings)));
        }
    }

    state_ = State::Traversing;
    progress.begin(static_cast<int>(incoming_.lists.size()),
                   static_cast<int>(count_items(incoming_.lists)));

    Traversal traversal(existing_, incoming_, options_.strategy, same_name_, progress);
    for (size_t li = 0; li < incoming_.lists.size(); ++li) {
        if (is_cancelled && is_cancelled()) {
            state_ = State::Aborted;
            return Result<ChangeSet, ImportError>::err(ImportError::cancelled());
        }
        traversal.visit_list(li);
    }

    progress.finish();
    state_ = State::Completed;
    return Result<ChangeSet, ImportError>::ok(traversal.take());
}

} // namespace listall
