#include "import/export_service.hpp"
#include "io/logging_categories.hpp"
#include "io/schema_codec.hpp"

#include <algorithm>

namespace listall {

Result<ExportData, Error> ExportService::snapshot(const ExportOptions& options) {
    auto lists = store_.find_all_lists();
    if (lists.is_err()) {
        qCWarning(lcStorage) << "Export snapshot failed:" << QString::fromStdString(lists.unwrap_err().message);
        return Result<ExportData, Error>::err(lists.unwrap_err());
    }

    ExportData data;
    data.export_date = Timestamp::now();
    data.lists = std::move(lists).unwrap();
    if (!options.include_archived) {
        std::erase_if(data.lists, [](const List& l) { return l.is_archived; });
    }
    for (auto& list : data.lists) {
        list.items = sorted_items(list);
    }
    return Result<ExportData, Error>::ok(std::move(data));
}

Result<QByteArray, Error> ExportService::export_json(const ExportOptions& options) {
    return snapshot(options).map([](const ExportData& data) {
        qCInfo(lcImport) << "Exporting" << data.lists.size() << "lists as JSON";
        return encode_export(data);
    });
}

Result<QString, Error> ExportService::export_plain_text(const ExportOptions& options,
                                                        const ShareOptions& share) {
    return snapshot(options).map([&share](const ExportData& data) {
        qCInfo(lcImport) << "Exporting" << data.lists.size() << "lists as text";
        return write_plain_text(data.lists, share);
    });
}

} // namespace listall
