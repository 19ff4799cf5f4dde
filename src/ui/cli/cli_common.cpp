#include "ui/cli/cli_common.hpp"

#include "core/annotation_store.hpp"
#include "storage/annotation_json.hpp"

#include <QFile>

Q_LOGGING_CATEGORY(marginaliaCliLog, "marginalia.cli")

namespace marginalia::ui {

Result<std::vector<Annotation>> load_annotation_file(const QString& path) {
    using R = Result<std::vector<Annotation>>;

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return R::err(Error::io("read_failed",
                                ("Cannot read " + path + ": " + file.errorString()).toStdString()));
    }

    auto parsed = storage::parse_annotations(file.readAll());
    if (parsed.is_err()) {
        return R::err(parsed.unwrap_err());
    }

    auto annotations = std::move(parsed).unwrap();
    if (annotations.empty()) {
        return R::ok({});
    }

    AnnotationStore store(annotations.front().book_id);
    for (auto& a : annotations) {
        auto added = store.add(std::move(a));
        if (added.is_err()) {
            return R::err(added.unwrap_err());
        }
    }
    qCDebug(marginaliaCliLog) << "loaded" << store.size() << "annotations for book"
                              << QString::fromStdString(store.book_id());
    return R::ok(store.snapshot());
}

QStringList split_list(const QString& value) {
    QStringList out;
    for (const auto& part : value.split(QLatin1Char(','), Qt::SkipEmptyParts)) {
        const auto trimmed = part.trimmed();
        if (!trimmed.isEmpty()) {
            out.append(trimmed);
        }
    }
    return out;
}

} // namespace marginalia::ui
