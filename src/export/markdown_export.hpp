#pragma once

#include "core/annotation.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "export/export_common.hpp"
#include "export/export_options.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace marginalia::exporting {

/**
 * Backslash-prefix every Markdown metacharacter: \ ` * _ { } [ ] ( ) # + - . !
 *
 * Single pass; escaping already escaped text escapes the backslashes again.
 */
[[nodiscard]] std::string escape_markdown(std::string_view text);

[[nodiscard]] std::string markdown_header(const ExportOptions& options);

[[nodiscard]] std::string markdown_stats(const ExportStats& stats);

/**
 * One "- [Label](#anchor) (count)" line per non-empty bucket.
 */
[[nodiscard]] std::string markdown_toc(const ExportGroups& groups);

[[nodiscard]] std::string markdown_item(const ExportItem& item, DateFormat date_format);

[[nodiscard]] std::string render_markdown(const PreparedExport& prepared,
                                          const ExportOptions& options,
                                          Timestamp now);

/**
 * Full pipeline: validate options, prepare, render.
 */
[[nodiscard]] Result<std::string> generate_markdown_export(
    const std::vector<Annotation>& annotations,
    const ExportOptions& options,
    Timestamp now
);

} // namespace marginalia::exporting
