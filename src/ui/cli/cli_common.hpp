#pragma once

#include "core/annotation.hpp"
#include "core/result.hpp"

#include <QLoggingCategory>
#include <QString>
#include <QStringList>

#include <vector>

Q_DECLARE_LOGGING_CATEGORY(marginaliaCliLog)

namespace marginalia::ui {

/**
 * Read a JSON annotation file into an AnnotationStore and return its
 * snapshot. All entries must belong to the same book.
 */
[[nodiscard]] Result<std::vector<Annotation>> load_annotation_file(const QString& path);

// "a, b,,c" -> {"a", "b", "c"}
[[nodiscard]] QStringList split_list(const QString& value);

[[nodiscard]] inline QString to_qstring(std::string_view s) {
    return QString::fromUtf8(s.data(), static_cast<qsizetype>(s.size()));
}

} // namespace marginalia::ui
