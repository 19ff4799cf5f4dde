#include "export/exporter.hpp"

#include "export/export_common.hpp"
#include "export/markdown_export.hpp"
#include "export/page_layout.hpp"
#include "export/pdf_canvas.hpp"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(marginaliaExportLog, "marginalia.export")

namespace marginalia::exporting {
namespace {

Result<ExportResult> export_pdf(const PreparedExport& prepared, const ExportOptions& options, Timestamp now) {
    PdfCanvas canvas(QString::fromStdString(options.book_title));
    if (!canvas.is_active()) {
        return Result<ExportResult>::err(Error::io("pdf_writer", "Could not start PDF document"));
    }

    const auto layout = render_page_layout(prepared, options, canvas, now);

    ExportResult out;
    out.data = canvas.finish();
    out.page_count = layout.page_count;
    qCDebug(marginaliaExportLog) << "pdf pages=" << layout.page_count << "bytes=" << out.data.size();
    return Result<ExportResult>::ok(std::move(out));
}

} // namespace

QString mime_type(ExportFormat format) {
    switch (format) {
        case ExportFormat::Markdown: return QStringLiteral("text/markdown");
        case ExportFormat::Pdf: return QStringLiteral("application/pdf");
    }
    return QStringLiteral("application/octet-stream");
}

Result<ExportResult> Exporter::run(const std::vector<Annotation>& annotations,
                                   const ExportOptions& options,
                                   Timestamp now) {
    auto prepared = prepare_export(annotations, options, now);
    if (prepared.is_err()) {
        qCWarning(marginaliaExportLog) << "export rejected:"
                                       << QString::fromStdString(prepared.unwrap_err().describe());
        return Result<ExportResult>::err(prepared.unwrap_err());
    }

    const auto& ready = prepared.unwrap();
    const auto format = format_token(options.format);
    qCDebug(marginaliaExportLog) << "exporting" << QString::fromUtf8(format.data(), static_cast<qsizetype>(format.size()))
                                 << "total=" << ready.stats.total_annotations
                                 << "highlights=" << ready.stats.highlights
                                 << "notes=" << ready.stats.notes
                                 << "bookmarks=" << ready.stats.bookmarks;

    Result<ExportResult> rendered = [&]() {
        if (options.format == ExportFormat::Pdf) {
            return export_pdf(ready, options, now);
        }
        ExportResult out;
        out.data = QByteArray::fromStdString(render_markdown(ready, options, now));
        return Result<ExportResult>::ok(std::move(out));
    }();

    return std::move(rendered).map([&](ExportResult out) {
        out.filename = QString::fromStdString(generate_export_filename(options.book_title, options.format, now));
        out.mime_type = mime_type(options.format);
        return out;
    });
}

} // namespace marginalia::exporting
