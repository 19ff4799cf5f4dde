#include "export/export_options.hpp"

#include "core/text.hpp"

namespace marginalia::exporting {

Result<ExportFormat> parse_export_format(std::string_view token) {
    if (token == "markdown") return Result<ExportFormat>::ok(ExportFormat::Markdown);
    if (token == "pdf") return Result<ExportFormat>::ok(ExportFormat::Pdf);
    return Result<ExportFormat>::err(Error::export_options(
        "invalid_format", "Invalid export format: " + std::string(token)));
}

Result<DateFormat> parse_date_format(std::string_view token) {
    if (token == "short") return Result<DateFormat>::ok(DateFormat::Short);
    if (token == "long") return Result<DateFormat>::ok(DateFormat::Long);
    if (token == "iso") return Result<DateFormat>::ok(DateFormat::Iso);
    return Result<DateFormat>::err(Error::configuration(
        "invalid_date_format", "Unknown date format: " + std::string(token)));
}

Result<void> validate_export_options(const ExportOptions& options) {
    if (text::is_blank(options.book_title)) {
        return Result<void>::err(Error::export_options("invalid_title", "Book title is required"));
    }
    if (options.format != ExportFormat::Markdown && options.format != ExportFormat::Pdf) {
        return Result<void>::err(Error::export_options("invalid_format", "Invalid export format"));
    }
    return Result<void>::ok();
}

} // namespace marginalia::exporting
