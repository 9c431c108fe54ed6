#include "storage/sqlite_entity_store.hpp"

#include <unordered_map>

namespace listall::storage {

Result<std::vector<List>, Error> SqliteEntityStore::find_all_lists() {
    auto lists_result = lists_.get_all();
    if (lists_result.is_err()) {
        return lists_result;
    }
    auto items_result = items_.get_all();
    if (items_result.is_err()) {
        return Result<std::vector<List>, Error>::err(items_result.unwrap_err());
    }
    auto images_result = images_.get_all();
    if (images_result.is_err()) {
        return Result<std::vector<List>, Error>::err(images_result.unwrap_err());
    }

    std::unordered_map<Uuid, std::vector<ItemImage>> images_by_item;
    for (auto& [item_id, image] : images_result.unwrap()) {
        images_by_item[item_id].push_back(std::move(image));
    }

    std::unordered_map<Uuid, std::vector<Item>> items_by_list;
    for (auto& item : items_result.unwrap()) {
        if (auto it = images_by_item.find(item.id); it != images_by_item.end()) {
            item.images = std::move(it->second);
        }
        items_by_list[*item.list_id].push_back(std::move(item));
    }

    auto lists = std::move(lists_result).unwrap();
    for (auto& list : lists) {
        if (auto it = items_by_list.find(list.id); it != items_by_list.end()) {
            list.items = std::move(it->second);
        }
    }
    return Result<std::vector<List>, Error>::ok(std::move(lists));
}

Result<std::vector<Item>, Error> SqliteEntityStore::items_with_images(std::vector<Item> items) {
    for (auto& item : items) {
        auto images = images_.get_by_item(item.id);
        if (images.is_err()) {
            return Result<std::vector<Item>, Error>::err(images.unwrap_err());
        }
        item.images = std::move(images).unwrap();
    }
    return Result<std::vector<Item>, Error>::ok(std::move(items));
}

Result<std::optional<List>, Error> SqliteEntityStore::find_list(const Uuid& id) {
    auto list_result = lists_.get(id);
    if (list_result.is_err() || !list_result.unwrap()) {
        return list_result;
    }

    auto list = *std::move(list_result).unwrap();
    auto items = items_.get_by_list(id).and_then([this](std::vector<Item> found) {
        return items_with_images(std::move(found));
    });
    if (items.is_err()) {
        return Result<std::optional<List>, Error>::err(items.unwrap_err());
    }
    list.items = std::move(items).unwrap();
    return Result<std::optional<List>, Error>::ok(std::move(list));
}

Result<std::optional<Item>, Error> SqliteEntityStore::find_item(const Uuid& id) {
    auto item_result = items_.get(id);
    if (item_result.is_err() || !item_result.unwrap()) {
        return item_result;
    }

    auto item = *std::move(item_result).unwrap();
    auto images = images_.get_by_item(id);
    if (images.is_err()) {
        return Result<std::optional<Item>, Error>::err(images.unwrap_err());
    }
    item.images = std::move(images).unwrap();
    return Result<std::optional<Item>, Error>::ok(std::move(item));
}

Result<void, Error> SqliteEntityStore::create_list(const List& list) {
    return lists_.insert(list);
}

Result<void, Error> SqliteEntityStore::update_list(const List& list) {
    return lists_.update(list);
}

Result<void, Error> SqliteEntityStore::remove_list(const Uuid& id) {
    return lists_.remove(id);
}

Result<void, Error> SqliteEntityStore::insert_images(const Item& item) {
    for (const auto& image : item.images) {
        auto inserted = images_.insert(item.id, image);
        if (inserted.is_err()) {
            return inserted;
        }
    }
    return Result<void, Error>::ok();
}

Result<void, Error> SqliteEntityStore::create_item(const Item& item) {
    return items_.insert(item).and_then([&] { return insert_images(item); });
}

Result<void, Error> SqliteEntityStore::update_item(const Item& item) {
    return items_.update(item)
        .and_then([&] { return images_.remove_by_item(item.id); })
        .and_then([&] { return insert_images(item); });
}

Result<void, Error> SqliteEntityStore::remove_item(const Uuid& id) {
    return items_.remove(id);
}

Result<void, Error> SqliteEntityStore::atomically(const WriteBlock& body) {
    return db_.transaction(body);
}

} // namespace listall::storage
