#pragma once

#include "core/annotation.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "export/export_options.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace marginalia::exporting {

/**
 * ExportStats - Counts over the filtered, sorted export set.
 */
struct ExportStats {
    size_t total_annotations{0};
    size_t highlights{0};
    size_t notes{0};
    size_t bookmarks{0};
    size_t with_notes{0};
    size_t public_annotations{0};
    Timestamp export_date;

    bool operator==(const ExportStats&) const = default;
};

/**
 * ExportItem - An annotation with its 1-based index inside its bucket.
 */
struct ExportItem {
    size_t index{0};
    Annotation annotation;
};

/**
 * ExportGroups - Highlights, Notes and Bookmarks buckets, each in document order.
 */
struct ExportGroups {
    std::vector<ExportItem> highlights;
    std::vector<ExportItem> notes;
    std::vector<ExportItem> bookmarks;
};

/**
 * PreparedExport - Output of the common stage, input of every serializer.
 */
struct PreparedExport {
    std::vector<Annotation> annotations;  // filtered, in document order
    ExportStats stats;
    ExportGroups groups;
};

[[nodiscard]] std::string format_export_date(Timestamp ts, DateFormat format);

/**
 * Lowercase, runs of non [a-z0-9] become "-", leading/trailing "-" trimmed,
 * truncated to 50 characters.
 */
[[nodiscard]] std::string slugify(std::string_view title);

/**
 * "<slug>-annotations-YYYY-MM-DD.<md|pdf>".
 */
[[nodiscard]] std::string generate_export_filename(std::string_view book_title,
                                                   ExportFormat format,
                                                   Timestamp now);

[[nodiscard]] std::string truncate_text(std::string_view text, size_t max_length);

[[nodiscard]] std::vector<Annotation> filter_for_export(
    const std::vector<Annotation>& annotations,
    const std::optional<ExportFilters>& filters
);

/**
 * Document order: start offset ascending, ties keep input order.
 */
[[nodiscard]] std::vector<Annotation> sort_for_export(std::vector<Annotation> annotations);

[[nodiscard]] ExportStats calculate_export_stats(const std::vector<Annotation>& annotations,
                                                 Timestamp now);

[[nodiscard]] ExportGroups group_for_export(const std::vector<Annotation>& annotations);

/**
 * validate -> filter -> sort -> stats -> group. Fails before any work is
 * done when the options are invalid.
 */
[[nodiscard]] Result<PreparedExport> prepare_export(
    const std::vector<Annotation>& annotations,
    const ExportOptions& options,
    Timestamp now
);

} // namespace marginalia::exporting
