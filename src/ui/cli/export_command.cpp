#include "ui/cli/export_command.hpp"

#include "export/exporter.hpp"
#include "ui/MarkdownPreview.hpp"
#include "ui/cli/cli_common.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>

namespace marginalia::ui {
namespace {

Result<void> write_file(const QString& path, const QByteArray& data) {
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return Result<void>::err(Error::io("write_failed",
                                           ("Cannot write " + path + ": " + file.errorString()).toStdString()));
    }
    if (file.write(data) != data.size()) {
        return Result<void>::err(Error::io("write_failed",
                                           ("Short write to " + path + ": " + file.errorString()).toStdString()));
    }
    return Result<void>::ok();
}

Result<exporting::ExportFilters> build_filters(const ExportCommandOptions& options) {
    using R = Result<exporting::ExportFilters>;

    exporting::ExportFilters filters;
    filters.public_only = options.public_only;

    for (const auto& token : split_list(options.types)) {
        const auto type = parse_type(token.toUpper().toStdString());
        if (!type) {
            return R::err(Error::export_options("invalid_type", "Unknown annotation type: " + token.toStdString()));
        }
        filters.types.push_back(*type);
    }
    for (const auto& token : split_list(options.colors)) {
        const auto color = parse_color(token.toLower().toStdString());
        if (!color) {
            return R::err(Error::export_options("invalid_color", "Unknown highlight color: " + token.toStdString()));
        }
        filters.colors.push_back(*color);
    }
    return R::ok(std::move(filters));
}

} // namespace

Result<exporting::ExportOptions> build_export_options(const ExportCommandOptions& options) {
    using R = Result<exporting::ExportOptions>;

    auto format = exporting::parse_export_format(options.format.toLower().toStdString());
    if (format.is_err()) return R::err(format.unwrap_err());
    auto date_format = exporting::parse_date_format(options.date_format.toLower().toStdString());
    if (date_format.is_err()) return R::err(date_format.unwrap_err());
    auto filters = build_filters(options);
    if (filters.is_err()) return R::err(filters.unwrap_err());

    exporting::ExportOptions out;
    out.format = format.unwrap();
    out.book_title = options.title.toStdString();
    if (!options.author.trimmed().isEmpty()) {
        out.book_author = options.author.trimmed().toStdString();
    }
    const auto& f = filters.unwrap();
    if (!f.types.empty() || !f.colors.empty() || f.public_only) {
        out.filters = f;
    }
    out.include_toc = !options.no_toc;
    out.include_stats = !options.no_stats;
    out.date_format = date_format.unwrap();
    return R::ok(std::move(out));
}

Result<QString> run_export_command(const ExportCommandOptions& options, Timestamp now) {
    using R = Result<QString>;

    auto export_options = build_export_options(options);
    if (export_options.is_err()) return R::err(export_options.unwrap_err());
    const auto& opts = export_options.unwrap();

    if (options.html && opts.format != exporting::ExportFormat::Markdown) {
        return R::err(Error::export_options("invalid_format", "--html requires --format markdown"));
    }

    auto annotations = load_annotation_file(options.input_path);
    if (annotations.is_err()) return R::err(annotations.unwrap_err());

    auto exported = exporting::Exporter::run(annotations.unwrap(), opts, now);
    if (exported.is_err()) return R::err(exported.unwrap_err());
    const auto& result = exported.unwrap();

    const QDir dir(options.out_dir);
    if (!dir.exists() && !QDir().mkpath(dir.absolutePath())) {
        return R::err(Error::io("write_failed", "Cannot create directory " + options.out_dir.toStdString()));
    }

    QString printed;
    const auto path = dir.filePath(result.filename);
    auto written = write_file(path, result.data);
    if (written.is_err()) return R::err(written.unwrap_err());
    printed += path + QLatin1Char('\n');

    if (options.html) {
        const auto html_path = dir.filePath(QFileInfo(result.filename).completeBaseName() + QStringLiteral(".html"));
        const auto html = MarkdownPreview::to_html_document(options.title, QString::fromUtf8(result.data));
        auto html_written = write_file(html_path, html.toUtf8());
        if (html_written.is_err()) return R::err(html_written.unwrap_err());
        printed += html_path + QLatin1Char('\n');
    }

    qCInfo(marginaliaCliLog) << "exported" << result.mime_type << "to" << path;
    return R::ok(printed);
}

} // namespace marginalia::ui
