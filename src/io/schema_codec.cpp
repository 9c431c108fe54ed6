#include "io/schema_codec.hpp"
#include "io/logging_categories.hpp"

#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QTimeZone>

#include <cmath>
#include <limits>

namespace listall {
namespace {

QString qstr(const std::string& s) {
    return QString::fromStdString(s);
}

// ============================================================================
// Encoding
// ============================================================================

QJsonObject to_json(const ItemImage& image) {
    QJsonObject obj;
    obj["id"] = qstr(image.id.to_string());
    const QByteArray raw(reinterpret_cast<const char*>(image.image_data.data()),
                         static_cast<qsizetype>(image.image_data.size()));
    obj["imageData"] = QString::fromLatin1(raw.toBase64());
    obj["orderNumber"] = image.order_number;
    obj["createdAt"] = iso_date(image.created_at);
    return obj;
}

QJsonObject to_json(const Item& item) {
    QJsonObject obj;
    obj["id"] = qstr(item.id.to_string());
    obj["title"] = qstr(item.title);
    obj["description"] = item.description ? QJsonValue(qstr(*item.description)) : QJsonValue(QJsonValue::Null);
    obj["quantity"] = item.quantity;
    obj["orderNumber"] = item.order_number;
    obj["isCrossedOut"] = item.is_crossed_out;
    obj["createdAt"] = iso_date(item.created_at);
    obj["modifiedAt"] = iso_date(item.modified_at);

    QJsonArray images;
    for (const auto& image : item.images) {
        images.append(to_json(image));
    }
    obj["images"] = images;
    return obj;
}

QJsonObject to_json(const List& list) {
    QJsonObject obj;
    obj["id"] = qstr(list.id.to_string());
    obj["name"] = qstr(list.name);
    obj["orderNumber"] = list.order_number;
    obj["isArchived"] = list.is_archived;
    obj["createdAt"] = iso_date(list.created_at);
    obj["modifiedAt"] = iso_date(list.modified_at);

    QJsonArray items;
    for (const auto& item : list.items) {
        items.append(to_json(item));
    }
    obj["items"] = items;
    return obj;
}

// ============================================================================
// Decoding
// ============================================================================

/**
 * Reads typed fields out of one JSON object. The first failure is kept in
 * `error` with the full field path; later reads on a failed reader are no-ops.
 */
class FieldReader {
public:
    FieldReader(QJsonObject obj, std::string path, std::string& error)
        : obj_(std::move(obj)), path_(std::move(path)), error_(error) {}

    bool text(const char* key, std::string& out) {
        const auto v = required(key);
        if (!v) return false;
        if (!v->isString()) return fail(key, "expected a string");
        out = v->toString().toStdString();
        return true;
    }

    bool optional_text(const char* key, std::optional<std::string>& out) {
        if (!ok()) return false;
        const auto v = obj_.value(QLatin1String(key));
        if (v.isUndefined() || v.isNull()) {
            out.reset();
            return true;
        }
        if (!v.isString()) return fail(key, "expected a string or null");
        out = v.toString().toStdString();
        return true;
    }

    bool integer(const char* key, int& out) {
        const auto v = required(key);
        if (!v) return false;
        if (!v->isDouble()) return fail(key, "expected an integer");
        const double d = v->toDouble();
        if (std::floor(d) != d || d < std::numeric_limits<int>::min() || d > std::numeric_limits<int>::max()) {
            return fail(key, "expected an integer");
        }
        out = static_cast<int>(d);
        return true;
    }

    bool boolean(const char* key, bool& out) {
        const auto v = required(key);
        if (!v) return false;
        if (!v->isBool()) return fail(key, "expected a boolean");
        out = v->toBool();
        return true;
    }

    bool uuid(const char* key, Uuid& out) {
        const auto v = required(key);
        if (!v) return false;
        if (!v->isString()) return fail(key, "expected a UUID string");
        auto parsed = Uuid::parse(v->toString().toStdString());
        if (!parsed) return fail(key, "invalid UUID '" + v->toString().toStdString() + "'");
        out = *parsed;
        return true;
    }

    bool timestamp(const char* key, Timestamp& out) {
        const auto v = required(key);
        if (!v) return false;
        if (!v->isString()) return fail(key, "expected an ISO-8601 date string");
        auto parsed = parse_iso_date(v->toString());
        if (!parsed) return fail(key, "invalid date '" + v->toString().toStdString() + "'");
        out = *parsed;
        return true;
    }

    bool base64(const char* key, std::vector<uint8_t>& out) {
        const auto v = required(key);
        if (!v) return false;
        if (!v->isString()) return fail(key, "expected a base64 string");
        auto decoded = QByteArray::fromBase64Encoding(v->toString().toLatin1(),
                                                      QByteArray::AbortOnBase64DecodingErrors);
        if (decoded.decodingStatus != QByteArray::Base64DecodingStatus::Ok) {
            return fail(key, "invalid base64 data");
        }
        out.assign(decoded.decoded.begin(), decoded.decoded.end());
        return true;
    }

    // Absent means empty; present must be an array.
    bool array(const char* key, QJsonArray& out, bool is_required = false) {
        if (!ok()) return false;
        const auto v = obj_.value(QLatin1String(key));
        if (v.isUndefined()) {
            if (is_required) return fail(key, "missing required field");
            out = {};
            return true;
        }
        if (!v.isArray()) return fail(key, "expected an array");
        out = v.toArray();
        return true;
    }

    [[nodiscard]] std::string path(const char* key) const {
        return path_.empty() ? std::string(key) : path_ + "." + key;
    }

    [[nodiscard]] bool ok() const { return error_.empty(); }

private:
    std::optional<QJsonValue> required(const char* key) {
        if (!ok()) return std::nullopt;
        const auto v = obj_.value(QLatin1String(key));
        if (v.isUndefined()) {
            fail(key, "missing required field");
            return std::nullopt;
        }
        return v;
    }

    bool fail(const char* key, const std::string& what) {
        error_ = path(key) + ": " + what;
        return false;
    }

    QJsonObject obj_;
    std::string path_;
    std::string& error_;
};

bool element_object(const QJsonArray& array, qsizetype index, const std::string& path,
                    QJsonObject& out, std::string& error) {
    const auto v = array.at(index);
    if (!v.isObject()) {
        error = path + ": expected an object";
        return false;
    }
    out = v.toObject();
    return true;
}

std::string indexed(const std::string& path, qsizetype index) {
    return path + "[" + std::to_string(index) + "]";
}

bool read_image(const QJsonObject& obj, const std::string& path, ItemImage& image, std::string& error) {
    FieldReader r(obj, path, error);
    return r.uuid("id", image.id) &&
           r.base64("imageData", image.image_data) &&
           r.integer("orderNumber", image.order_number) &&
           r.timestamp("createdAt", image.created_at);
}

bool read_item(const QJsonObject& obj, const std::string& path, Item& item, std::string& error) {
    FieldReader r(obj, path, error);
    QJsonArray images;
    if (!(r.uuid("id", item.id) &&
          r.text("title", item.title) &&
          r.optional_text("description", item.description) &&
          r.integer("quantity", item.quantity) &&
          r.integer("orderNumber", item.order_number) &&
          r.boolean("isCrossedOut", item.is_crossed_out) &&
          r.timestamp("createdAt", item.created_at) &&
          r.timestamp("modifiedAt", item.modified_at) &&
          r.array("images", images))) {
        return false;
    }

    const auto images_path = r.path("images");
    for (qsizetype i = 0; i < images.size(); ++i) {
        QJsonObject element;
        ItemImage image;
        const auto element_path = indexed(images_path, i);
        if (!element_object(images, i, element_path, element, error) ||
            !read_image(element, element_path, image, error)) {
            return false;
        }
        item.images.push_back(std::move(image));
    }
    return true;
}

bool read_list(const QJsonObject& obj, const std::string& path, List& list, std::string& error) {
    FieldReader r(obj, path, error);
    QJsonArray items;
    if (!(r.uuid("id", list.id) &&
          r.text("name", list.name) &&
          r.integer("orderNumber", list.order_number) &&
          r.boolean("isArchived", list.is_archived) &&
          r.timestamp("createdAt", list.created_at) &&
          r.timestamp("modifiedAt", list.modified_at) &&
          r.array("items", items))) {
        return false;
    }

    const auto items_path = r.path("items");
    for (qsizetype i = 0; i < items.size(); ++i) {
        QJsonObject element;
        Item item;
        const auto element_path = indexed(items_path, i);
        if (!element_object(items, i, element_path, element, error) ||
            !read_item(element, element_path, item, error)) {
            return false;
        }
        item.list_id = list.id;
        list.items.push_back(std::move(item));
    }
    return true;
}

} // namespace

std::optional<Timestamp> parse_iso_date(const QString& text) {
    auto dt = QDateTime::fromString(text, Qt::ISODateWithMs);
    if (!dt.isValid()) return std::nullopt;
    if (dt.timeSpec() == Qt::LocalTime) {
        dt.setTimeZone(QTimeZone(QTimeZone::UTC));
    }
    return Timestamp(dt.toMSecsSinceEpoch());
}

QString iso_date(Timestamp t) {
    const auto dt = QDateTime::fromMSecsSinceEpoch(t.millis(), QTimeZone(QTimeZone::UTC));
    return dt.toString(t.millis() % 1000 == 0 ? Qt::ISODate : Qt::ISODateWithMs);
}

Result<ExportData, ImportError> decode_export(const QByteArray& bytes) {
    QJsonParseError parse_error{};
    const auto doc = QJsonDocument::fromJson(bytes, &parse_error);
    if (parse_error.error != QJsonParseError::NoError) {
        qCDebug(lcCodec) << "Malformed JSON at offset" << parse_error.offset << parse_error.errorString();
        return Result<ExportData, ImportError>::err(
            ImportError::invalid_format(parse_error.errorString().toStdString()));
    }
    if (!doc.isObject()) {
        return Result<ExportData, ImportError>::err(
            ImportError::decoding_failed("expected a JSON object at the top level"));
    }

    std::string error;
    ExportData data;
    Timestamp export_date;
    QJsonArray lists;

    FieldReader root(doc.object(), {}, error);
    if (root.text("version", data.version) &&
        root.timestamp("exportDate", export_date) &&
        root.array("lists", lists, true)) {
        data.export_date = export_date;
        for (qsizetype i = 0; i < lists.size(); ++i) {
            QJsonObject element;
            List list;
            const auto element_path = indexed("lists", i);
            if (!element_object(lists, i, element_path, element, error) ||
                !read_list(element, element_path, list, error)) {
                break;
            }
            data.lists.push_back(std::move(list));
        }
    }

    if (!error.empty()) {
        qCDebug(lcCodec) << "Decoding failed:" << QString::fromStdString(error);
        return Result<ExportData, ImportError>::err(ImportError::decoding_failed(error));
    }

    qCDebug(lcCodec) << "Decoded" << data.lists.size() << "lists," << count_items(data.lists) << "items";
    return Result<ExportData, ImportError>::ok(std::move(data));
}

QByteArray encode_export(const ExportData& data, bool indented) {
    QJsonObject root;
    root["version"] = qstr(data.version);
    root["exportDate"] = iso_date(data.export_date.value_or(Timestamp::now()));

    QJsonArray lists;
    for (const auto& list : data.lists) {
        lists.append(to_json(list));
    }
    root["lists"] = lists;

    return QJsonDocument(root).toJson(indented ? QJsonDocument::Indented : QJsonDocument::Compact);
}

} // namespace listall
