#include "core/progress.hpp"

#include <algorithm>

namespace listall {

void ProgressReporter::begin(int total_lists, int total_items) {
    progress_ = ImportProgress{
        .total_lists = std::max(total_lists, 0),
        .processed_lists = 0,
        .total_items = std::max(total_items, 0),
        .processed_items = 0,
        .current_operation = "Preparing import"
    };
    publish();
}

void ProgressReporter::report(int processed_lists, int processed_items, std::string operation) {
    progress_.processed_lists = std::clamp(std::max(processed_lists, progress_.processed_lists),
                                           0, progress_.total_lists);
    progress_.processed_items = std::clamp(std::max(processed_items, progress_.processed_items),
                                           0, progress_.total_items);
    progress_.current_operation = std::move(operation);
    publish();
}

void ProgressReporter::finish(std::string operation) {
    progress_.processed_lists = progress_.total_lists;
    progress_.processed_items = progress_.total_items;
    progress_.current_operation = std::move(operation);
    publish();
}

std::string ProgressReporter::list_operation(int index, int total) {
    return "Processing list " + std::to_string(index) + " of " + std::to_string(total);
}

std::string ProgressReporter::item_operation(int index, int total) {
    return "Processing item " + std::to_string(index) + " of " + std::to_string(total);
}

void ProgressReporter::publish() {
    ++updates_;
    if (callback_) {
        callback_(progress_);
    }
}

} // namespace listall
