#pragma once

#include "core/annotation.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "export/export_options.hpp"

#include <QByteArray>
#include <QString>

#include <vector>

namespace marginalia::exporting {

struct ExportResult {
    QString filename;
    QString mime_type;
    QByteArray data;
    int page_count{0};  // pdf only
};

[[nodiscard]] QString mime_type(ExportFormat format);

/**
 * Exporter - Format dispatch for one export call.
 *
 * Options are validated before any rendering starts; an invalid title or
 * format yields an ExportOptions error and no bytes.
 */
class Exporter {
public:
    [[nodiscard]] static Result<ExportResult> run(const std::vector<Annotation>& annotations,
                                                  const ExportOptions& options,
                                                  Timestamp now);
};

} // namespace marginalia::exporting
