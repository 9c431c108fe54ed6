#pragma once

#include "core/import_types.hpp"

#include <functional>
#include <string>
#include <utility>

namespace listall {

using ProgressCallback = std::function<void(const ImportProgress&)>;

/**
 * ProgressReporter - turns traversal steps into ImportProgress updates.
 *
 * Counters handed to report() never move backwards: a smaller value than the
 * one already published is held at the published value. Delivery is
 * synchronous, on the calling thread, in production order.
 */
class ProgressReporter {
public:
    explicit ProgressReporter(ProgressCallback callback = {})
        : callback_(std::move(callback)) {}

    /**
     * Reset the counters for a new traversal and publish the zero state.
     */
    void begin(int total_lists, int total_items);

    void report(int processed_lists, int processed_items, std::string operation);

    /**
     * Publish the terminal state: every counter at its total.
     */
    void finish(std::string operation = "Import complete");

    [[nodiscard]] const ImportProgress& current() const { return progress_; }
    [[nodiscard]] int updates() const { return updates_; }

    [[nodiscard]] static std::string list_operation(int index, int total);
    [[nodiscard]] static std::string item_operation(int index, int total);

private:
    void publish();

    ProgressCallback callback_;
    ImportProgress progress_;
    int updates_ = 0;
};

} // namespace listall
