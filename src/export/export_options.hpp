#pragma once

#include "core/annotation.hpp"
#include "core/result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace marginalia::exporting {

enum class ExportFormat {
    Markdown,
    Pdf
};

enum class DateFormat {
    Short,  // 01/05/2024
    Long,   // January 5, 2024
    Iso     // 2024-01-05
};

/**
 * ExportFilters - Narrowing applied before export. A color filter keeps
 * only highlights of the listed colors.
 */
struct ExportFilters {
    std::vector<AnnotationType> types;
    bool public_only{false};
    std::vector<HighlightColor> colors;
};

struct ExportOptions {
    ExportFormat format{ExportFormat::Markdown};
    std::string book_title;
    std::optional<std::string> book_author;
    std::optional<ExportFilters> filters;
    bool include_toc{true};
    bool include_stats{true};
    DateFormat date_format{DateFormat::Long};
};

[[nodiscard]] constexpr std::string_view format_token(ExportFormat format) {
    return format == ExportFormat::Markdown ? "markdown" : "pdf";
}

[[nodiscard]] constexpr std::string_view file_extension(ExportFormat format) {
    return format == ExportFormat::Markdown ? "md" : "pdf";
}

/**
 * "markdown" | "pdf"; anything else fails with invalid_format.
 */
[[nodiscard]] Result<ExportFormat> parse_export_format(std::string_view token);

/**
 * "short" | "long" | "iso"; anything else is a Configuration error.
 */
[[nodiscard]] Result<DateFormat> parse_date_format(std::string_view token);

/**
 * Fails with invalid_title when the trimmed title is empty.
 */
[[nodiscard]] Result<void> validate_export_options(const ExportOptions& options);

} // namespace marginalia::exporting
