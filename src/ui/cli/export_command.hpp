#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "export/export_options.hpp"

#include <QString>

namespace marginalia::ui {

struct ExportCommandOptions {
    QString input_path;
    QString format = QStringLiteral("markdown");
    QString title;
    QString author;
    QString types;   // comma separated HIGHLIGHT,NOTE,BOOKMARK
    QString colors;  // comma separated palette tokens
    bool public_only = false;
    bool no_toc = false;
    bool no_stats = false;
    QString date_format = QStringLiteral("long");
    QString out_dir = QStringLiteral(".");
    bool html = false;
};

/**
 * Translate command-line values into ExportOptions. Unknown types, colors,
 * formats or date formats are errors, never silently dropped.
 */
[[nodiscard]] Result<exporting::ExportOptions> build_export_options(const ExportCommandOptions& options);

/**
 * Export the file and write the result into out_dir. Returns the lines to
 * print, one per written file.
 */
[[nodiscard]] Result<QString> run_export_command(const ExportCommandOptions& options, Timestamp now);

} // namespace marginalia::ui
