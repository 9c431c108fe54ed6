#include "core/validator.hpp"

#include <unordered_set>

namespace listall {
namespace {

std::string list_path(size_t li) {
    return "lists[" + std::to_string(li) + "]";
}

std::string item_path(size_t li, size_t ii) {
    return list_path(li) + ".items[" + std::to_string(ii) + "]";
}

} // namespace

std::optional<std::string> list_defect(const List& list) {
    if (is_blank(list.name)) {
        return std::string("List name cannot be empty");
    }
    return std::nullopt;
}

std::optional<std::string> item_defect(const Item& item) {
    if (is_blank(item.title)) {
        return std::string("Item title cannot be empty");
    }
    if (item.quantity < 1) {
        return "Item quantity must be at least 1 (got " + std::to_string(item.quantity) + ")";
    }
    return std::nullopt;
}

std::vector<ValidationError> validate(const ExportData& data) {
    std::vector<ValidationError> errors;

    if (is_blank(data.version)) {
        errors.push_back({"version", "Version is missing"});
    } else if (data.version != kExportSchemaVersion) {
        errors.push_back({"version", "Unsupported version: " + data.version});
    }
    if (!data.export_date) {
        errors.push_back({"exportDate", "Export date is missing"});
    }

    std::unordered_set<Uuid> list_ids;
    std::unordered_set<Uuid> item_ids;
    std::unordered_set<Uuid> image_ids;

    for (size_t li = 0; li < data.lists.size(); ++li) {
        const auto& list = data.lists[li];

        if (auto defect = list_defect(list)) {
            errors.push_back({list_path(li) + ".name", *defect});
        }
        if (!list_ids.insert(list.id).second) {
            errors.push_back({list_path(li) + ".id", "Duplicate list id " + list.id.to_string()});
        }

        for (size_t ii = 0; ii < list.items.size(); ++ii) {
            const auto& item = list.items[ii];
            const auto path = item_path(li, ii);

            if (is_blank(item.title)) {
                errors.push_back({path + ".title",
                                  "Item title cannot be empty in list '" + list.name + "'"});
            }
            if (item.quantity < 1) {
                errors.push_back({path + ".quantity",
                                  "Item quantity must be at least 1 in list '" + list.name + "'"});
            }
            if (item.list_id && *item.list_id != list.id) {
                errors.push_back({path + ".listId",
                                  "Item '" + item.title + "' does not belong to list '" + list.name + "'"});
            }
            if (!item_ids.insert(item.id).second) {
                errors.push_back({path + ".id", "Duplicate item id " + item.id.to_string()});
            }
            for (size_t gi = 0; gi < item.images.size(); ++gi) {
                const auto& image = item.images[gi];
                if (!image_ids.insert(image.id).second) {
                    errors.push_back({path + ".images[" + std::to_string(gi) + "].id",
                                      "Duplicate image id " + image.id.to_string()});
                }
            }
        }
    }

    return errors;
}

std::string summarize(const std::vector<ValidationError>& errors) {
    std::string out;
    for (const auto& e : errors) {
        if (!out.empty()) out += "; ";
        out += e.message;
        out += " (";
        out += e.path;
        out += ")";
    }
    return out;
}

} // namespace listall
