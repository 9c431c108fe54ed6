#pragma once

#include "core/model.hpp"

#include <string>
#include <vector>

namespace listall::test {

inline Timestamp at(int64_t seconds) {
    return Timestamp(1700000000000 + seconds * 1000);
}

inline Item make_item(const Uuid& list_id, std::string title, int order = 0, int quantity = 1) {
    return Item{
        .id = Uuid::generate(),
        .list_id = list_id,
        .title = std::move(title),
        .description = std::nullopt,
        .quantity = quantity,
        .order_number = order,
        .is_crossed_out = false,
        .created_at = at(0),
        .modified_at = at(0),
        .images = {}
    };
}

inline List make_list(std::string name, std::vector<std::string> titles = {}, int order = 0) {
    List list{
        .id = Uuid::generate(),
        .name = std::move(name),
        .order_number = order,
        .is_archived = false,
        .created_at = at(0),
        .modified_at = at(0),
        .items = {}
    };
    int item_order = 0;
    for (auto& title : titles) {
        list.items.push_back(make_item(list.id, std::move(title), item_order++));
    }
    return list;
}

inline ItemImage make_image(std::vector<uint8_t> bytes, int order = 0) {
    return ItemImage{
        .id = Uuid::generate(),
        .image_data = std::move(bytes),
        .order_number = order,
        .created_at = at(0)
    };
}

inline ExportData make_export(std::vector<List> lists) {
    ExportData data;
    data.export_date = at(3600);
    data.lists = std::move(lists);
    return data;
}

} // namespace listall::test
