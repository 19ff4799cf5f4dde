#include "storage/annotation_json.hpp"

#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <QSet>
#include <QString>
#include <QTimeZone>

namespace marginalia::storage {
namespace {

Error invalid_json(const QString& message) {
    return Error::validation("invalid_json", message.toStdString());
}

std::optional<std::string> optional_string(const QJsonObject& obj, const QString& key) {
    const auto value = obj.value(key);
    if (!value.isString()) return std::nullopt;
    return value.toString().toStdString();
}

Result<Timestamp> read_timestamp(const QJsonObject& obj, const QString& key) {
    const auto value = obj.value(key);
    if (value.isUndefined() || value.isNull()) {
        return Result<Timestamp>::ok(Timestamp{});
    }
    if (!value.isString()) {
        return Result<Timestamp>::err(invalid_json(key + QStringLiteral(" must be an ISO 8601 string")));
    }
    auto parsed = QDateTime::fromString(value.toString(), Qt::ISODateWithMs);
    if (!parsed.isValid()) {
        return Result<Timestamp>::err(invalid_json(QStringLiteral("Invalid timestamp in ") + key));
    }
    // No zone designator means UTC, not local time.
    if (parsed.timeSpec() == Qt::LocalTime) {
        parsed.setTimeZone(QTimeZone::utc());
    }
    return Result<Timestamp>::ok(Timestamp(parsed.toMSecsSinceEpoch()));
}

Result<int64_t> read_offset(const QJsonObject& obj, const QString& key) {
    const auto value = obj.value(key);
    if (!value.isDouble()) {
        return Result<int64_t>::err(invalid_json(key + QStringLiteral(" must be a number")));
    }
    return Result<int64_t>::ok(value.toInteger());
}

} // namespace

Result<Annotation> annotation_from_json(const QJsonObject& obj) {
    const auto type = parse_type(obj.value(QStringLiteral("type")).toString().toStdString());
    if (!type) {
        return Result<Annotation>::err(invalid_json(
            QStringLiteral("Unknown annotation type: ") + obj.value(QStringLiteral("type")).toString()));
    }

    AnnotationFields fields;
    fields.id = obj.value(QStringLiteral("id")).toString().toStdString();
    fields.book_id = obj.value(QStringLiteral("bookId")).toString().toStdString();
    fields.note = optional_string(obj, QStringLiteral("note"));
    fields.is_public = obj.value(QStringLiteral("isPublic")).toBool(false);
    fields.like_count = obj.value(QStringLiteral("likeCount")).toInt(0);
    fields.is_liked_by_current_user = obj.value(QStringLiteral("isLikedByCurrentUser")).toBool(false);

    auto start = read_offset(obj, QStringLiteral("startOffset"));
    if (start.is_err()) return Result<Annotation>::err(start.unwrap_err());
    auto end = read_offset(obj, QStringLiteral("endOffset"));
    if (end.is_err()) return Result<Annotation>::err(end.unwrap_err());
    fields.start_offset = start.unwrap();
    fields.end_offset = end.unwrap();

    auto created = read_timestamp(obj, QStringLiteral("createdAt"));
    if (created.is_err()) return Result<Annotation>::err(created.unwrap_err());
    auto updated = read_timestamp(obj, QStringLiteral("updatedAt"));
    if (updated.is_err()) return Result<Annotation>::err(updated.unwrap_err());
    fields.created_at = created.unwrap();
    fields.updated_at = obj.contains(QStringLiteral("updatedAt")) ? updated.unwrap() : fields.created_at;

    switch (*type) {
        case AnnotationType::Highlight: {
            const auto color = obj.value(QStringLiteral("color")).toString(QStringLiteral("yellow"));
            return make_highlight(std::move(fields),
                                  obj.value(QStringLiteral("selectedText")).toString().toStdString(),
                                  color.toStdString());
        }
        case AnnotationType::Note:
            return make_note(std::move(fields), optional_string(obj, QStringLiteral("selectedText")));
        case AnnotationType::Bookmark:
            return make_bookmark(std::move(fields));
    }
    return Result<Annotation>::err(invalid_json(QStringLiteral("Unknown annotation type")));
}

QJsonObject annotation_to_json(const Annotation& a) {
    QJsonObject obj;
    obj.insert(QStringLiteral("id"), QString::fromStdString(a.id));
    obj.insert(QStringLiteral("bookId"), QString::fromStdString(a.book_id));
    const auto type = type_token(get_type(a));
    obj.insert(QStringLiteral("type"), QString::fromUtf8(type.data(), static_cast<qsizetype>(type.size())));
    obj.insert(QStringLiteral("startOffset"), static_cast<qint64>(a.start_offset));
    obj.insert(QStringLiteral("endOffset"), static_cast<qint64>(a.end_offset));
    if (a.note) {
        obj.insert(QStringLiteral("note"), QString::fromStdString(*a.note));
    }
    obj.insert(QStringLiteral("isPublic"), a.is_public);
    obj.insert(QStringLiteral("likeCount"), a.like_count);
    obj.insert(QStringLiteral("isLikedByCurrentUser"), a.is_liked_by_current_user);
    obj.insert(QStringLiteral("createdAt"), QString::fromStdString(a.created_at.to_iso_string()));
    obj.insert(QStringLiteral("updatedAt"), QString::fromStdString(a.updated_at.to_iso_string()));

    std::visit(Overloaded{
        [&obj](const HighlightBody& h) {
            obj.insert(QStringLiteral("selectedText"), QString::fromStdString(h.selected_text));
            const auto color = color_token(h.color);
            obj.insert(QStringLiteral("color"),
                       QString::fromUtf8(color.data(), static_cast<qsizetype>(color.size())));
        },
        [&obj](const NoteBody& n) {
            if (n.selected_text) {
                obj.insert(QStringLiteral("selectedText"), QString::fromStdString(*n.selected_text));
            }
        },
        [](const BookmarkBody&) {},
    }, a.body);
    return obj;
}

Result<std::vector<Annotation>> parse_annotations(const QByteArray& json) {
    using R = Result<std::vector<Annotation>>;

    QJsonParseError parse_error{};
    const auto doc = QJsonDocument::fromJson(json, &parse_error);
    if (parse_error.error != QJsonParseError::NoError) {
        return R::err(invalid_json(QStringLiteral("Malformed JSON: ") + parse_error.errorString()));
    }

    QJsonArray items;
    if (doc.isArray()) {
        items = doc.array();
    } else if (doc.isObject() && doc.object().value(QStringLiteral("annotations")).isArray()) {
        items = doc.object().value(QStringLiteral("annotations")).toArray();
    } else {
        return R::err(invalid_json(QStringLiteral("Expected an array of annotations")));
    }

    std::vector<Annotation> out;
    out.reserve(static_cast<size_t>(items.size()));
    QSet<QString> seen;
    for (qsizetype i = 0; i < items.size(); ++i) {
        if (!items.at(i).isObject()) {
            return R::err(invalid_json(QStringLiteral("Entry %1 is not an object").arg(i)));
        }
        auto parsed = annotation_from_json(items.at(i).toObject());
        if (parsed.is_err()) {
            auto error = parsed.unwrap_err();
            error.message = "Entry " + std::to_string(i) + ": " + error.message;
            return R::err(std::move(error));
        }
        const auto id = QString::fromStdString(parsed.unwrap().id);
        if (seen.contains(id)) {
            return R::err(Error::validation("duplicate_id", "Duplicate annotation id: " + id.toStdString()));
        }
        seen.insert(id);
        out.push_back(std::move(parsed).unwrap());
    }
    return R::ok(std::move(out));
}

QByteArray serialize_annotations(const std::vector<Annotation>& annotations) {
    QJsonArray items;
    for (const auto& a : annotations) {
        items.append(annotation_to_json(a));
    }
    return QJsonDocument(items).toJson(QJsonDocument::Indented);
}

} // namespace marginalia::storage
