#include "storage/memory_entity_store.hpp"

#include <algorithm>

namespace listall::storage {

namespace {

// Same codes SQLite reports for the equivalent failures.
constexpr int kConstraint = 19;
constexpr int kNotFound = 12;
constexpr int kIoError = 10;

Result<void, Error> failure(std::string message, int code) {
    return Result<void, Error>::err(Error{std::move(message), code});
}

} // namespace

Result<void, Error> MemoryEntityStore::begin_write(const char* what) {
    if (writes_until_failure_) {
        if (*writes_until_failure_ <= 0) {
            return failure(std::string("injected write failure during ") + what, kIoError);
        }
        --*writes_until_failure_;
    }
    ++write_count_;
    return Result<void, Error>::ok();
}

List* MemoryEntityStore::list_ptr(const Uuid& id) {
    auto it = std::find_if(lists_.begin(), lists_.end(), [&](const List& l) { return l.id == id; });
    return it == lists_.end() ? nullptr : &*it;
}

std::pair<List*, size_t> MemoryEntityStore::locate_item(const Uuid& id) {
    for (auto& list : lists_) {
        for (size_t i = 0; i < list.items.size(); ++i) {
            if (list.items[i].id == id) return {&list, i};
        }
    }
    return {nullptr, 0};
}

bool MemoryEntityStore::image_id_taken(const Uuid& id, const Uuid& ignore_item) const {
    for (const auto& list : lists_) {
        for (const auto& item : list.items) {
            if (item.id == ignore_item) continue;
            for (const auto& image : item.images) {
                if (image.id == id) return true;
            }
        }
    }
    return false;
}

Result<std::vector<List>, Error> MemoryEntityStore::find_all_lists() {
    return Result<std::vector<List>, Error>::ok(lists_);
}

Result<std::optional<List>, Error> MemoryEntityStore::find_list(const Uuid& id) {
    const List* list = list_ptr(id);
    return Result<std::optional<List>, Error>::ok(list ? std::optional<List>(*list) : std::nullopt);
}

Result<std::optional<Item>, Error> MemoryEntityStore::find_item(const Uuid& id) {
    auto [list, index] = locate_item(id);
    return Result<std::optional<Item>, Error>::ok(
        list ? std::optional<Item>(list->items[index]) : std::nullopt);
}

Result<void, Error> MemoryEntityStore::create_list(const List& list) {
    if (auto w = begin_write("create_list"); w.is_err()) return w;
    if (list_ptr(list.id)) {
        return failure("UNIQUE constraint failed: lists.id", kConstraint);
    }
    auto stored = list;
    stored.items.clear();
    lists_.push_back(std::move(stored));
    return Result<void, Error>::ok();
}

Result<void, Error> MemoryEntityStore::update_list(const List& list) {
    if (auto w = begin_write("update_list"); w.is_err()) return w;
    List* current = list_ptr(list.id);
    if (!current) {
        return failure("List not found: " + list.id.to_string(), kNotFound);
    }
    current->name = list.name;
    current->order_number = list.order_number;
    current->is_archived = list.is_archived;
    current->created_at = list.created_at;
    current->modified_at = list.modified_at;
    return Result<void, Error>::ok();
}

Result<void, Error> MemoryEntityStore::remove_list(const Uuid& id) {
    if (auto w = begin_write("remove_list"); w.is_err()) return w;
    std::erase_if(lists_, [&](const List& l) { return l.id == id; });
    return Result<void, Error>::ok();
}

Result<void, Error> MemoryEntityStore::create_item(const Item& item) {
    if (auto w = begin_write("create_item"); w.is_err()) return w;
    if (!item.list_id) {
        return failure("Item " + item.id.to_string() + " has no list", kConstraint);
    }
    List* owner = list_ptr(*item.list_id);
    if (!owner) {
        return failure("FOREIGN KEY constraint failed: items.list_id", kConstraint);
    }
    if (locate_item(item.id).first) {
        return failure("UNIQUE constraint failed: items.id", kConstraint);
    }
    for (const auto& image : item.images) {
        if (image_id_taken(image.id, item.id)) {
            return failure("UNIQUE constraint failed: item_images.id", kConstraint);
        }
    }
    owner->items.push_back(item);
    return Result<void, Error>::ok();
}

Result<void, Error> MemoryEntityStore::update_item(const Item& item) {
    if (auto w = begin_write("update_item"); w.is_err()) return w;
    if (!item.list_id) {
        return failure("Item " + item.id.to_string() + " has no list", kConstraint);
    }
    auto [owner, index] = locate_item(item.id);
    if (!owner) {
        return failure("Item not found: " + item.id.to_string(), kNotFound);
    }
    for (const auto& image : item.images) {
        if (image_id_taken(image.id, item.id)) {
            return failure("UNIQUE constraint failed: item_images.id", kConstraint);
        }
    }

    if (owner->id == *item.list_id) {
        owner->items[index] = item;
        return Result<void, Error>::ok();
    }

    List* target = list_ptr(*item.list_id);
    if (!target) {
        return failure("FOREIGN KEY constraint failed: items.list_id", kConstraint);
    }
    owner->items.erase(owner->items.begin() + static_cast<std::ptrdiff_t>(index));
    target->items.push_back(item);
    return Result<void, Error>::ok();
}

Result<void, Error> MemoryEntityStore::remove_item(const Uuid& id) {
    if (auto w = begin_write("remove_item"); w.is_err()) return w;
    auto [owner, index] = locate_item(id);
    if (owner) {
        owner->items.erase(owner->items.begin() + static_cast<std::ptrdiff_t>(index));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> MemoryEntityStore::atomically(const WriteBlock& body) {
    auto snapshot = lists_;
    auto result = body();
    if (result.is_err()) {
        lists_ = std::move(snapshot);
    }
    return result;
}

} // namespace listall::storage
