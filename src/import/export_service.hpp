#pragma once

#include "core/model.hpp"
#include "core/result.hpp"
#include "io/plain_text_writer.hpp"
#include "storage/entity_store.hpp"

#include <QByteArray>
#include <QString>

namespace listall {

struct ExportOptions {
    bool include_archived = true;
};

/**
 * ExportService - renders the store in the formats ImportService reads back.
 */
class ExportService {
public:
    explicit ExportService(storage::EntityStore& store) : store_(store) {}

    /**
     * Transport graph of the whole store, stamped with the current time.
     */
    [[nodiscard]] Result<ExportData, Error> snapshot(const ExportOptions& options = {});

    [[nodiscard]] Result<QByteArray, Error> export_json(const ExportOptions& options = {});

    [[nodiscard]] Result<QString, Error> export_plain_text(const ExportOptions& options = {},
                                                           const ShareOptions& share = {});

private:
    storage::EntityStore& store_;
};

} // namespace listall
