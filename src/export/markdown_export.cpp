#include "export/markdown_export.hpp"

#include <string_view>

namespace marginalia::exporting {
namespace {

constexpr std::string_view kMarkdownSpecials = "\\`*_{}[]()#+-.!";

constexpr std::string_view kDivider = "---\n\n";

void append_line(std::string& out, std::string_view line = {}) {
    out.append(line);
    out.push_back('\n');
}

bool has_text(const std::optional<std::string>& value) {
    return value && !value->empty();
}

// Prefixes every line so multi-line selections stay inside the quote.
std::string blockquote(std::string_view text) {
    std::string out = "> ";
    for (const char c : text) {
        out.push_back(c);
        if (c == '\n') out += "> ";
    }
    return out;
}

void append_section(std::string& out, std::string_view title,
                    const std::vector<ExportItem>& items, DateFormat date_format,
                    bool trailing_divider) {
    if (items.empty()) return;
    out += "## ";
    out += title;
    out += "\n\n";
    for (const auto& item : items) {
        out += markdown_item(item, date_format);
    }
    if (trailing_divider) {
        out += kDivider;
    }
}

} // namespace

std::string escape_markdown(std::string_view text) {
    std::string out;
    out.reserve(text.size() + text.size() / 8);
    for (const char c : text) {
        if (kMarkdownSpecials.find(c) != std::string_view::npos) {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

std::string markdown_header(const ExportOptions& options) {
    std::string out;
    append_line(out, "# " + options.book_title);
    if (options.book_author && !options.book_author->empty()) {
        append_line(out, "**Author:** " + *options.book_author);
    }
    append_line(out);
    append_line(out, "---");
    append_line(out);
    return out;
}

std::string markdown_stats(const ExportStats& stats) {
    std::string out;
    append_line(out, "## Summary");
    append_line(out);
    append_line(out, "- **Total Annotations:** " + std::to_string(stats.total_annotations));
    append_line(out, "- **Highlights:** " + std::to_string(stats.highlights));
    append_line(out, "- **Notes:** " + std::to_string(stats.notes));
    append_line(out, "- **Bookmarks:** " + std::to_string(stats.bookmarks));
    append_line(out, "- **Exported:** " + format_export_date(stats.export_date, DateFormat::Long));
    append_line(out);
    append_line(out, "---");
    append_line(out);
    return out;
}

std::string markdown_toc(const ExportGroups& groups) {
    std::string out;
    append_line(out, "## Table of Contents");
    append_line(out);
    if (!groups.highlights.empty()) {
        append_line(out, "- [Highlights](#highlights) (" + std::to_string(groups.highlights.size()) + ")");
    }
    if (!groups.notes.empty()) {
        append_line(out, "- [Notes](#notes) (" + std::to_string(groups.notes.size()) + ")");
    }
    if (!groups.bookmarks.empty()) {
        append_line(out, "- [Bookmarks](#bookmarks) (" + std::to_string(groups.bookmarks.size()) + ")");
    }
    append_line(out);
    append_line(out, "---");
    append_line(out);
    return out;
}

std::string markdown_item(const ExportItem& item, DateFormat date_format) {
    const auto& a = item.annotation;
    const auto date = format_export_date(a.created_at, date_format);
    const auto heading = "### " + std::to_string(item.index) + ". " +
                         std::string(annotation_label(get_type(a)));

    std::string out;
    append_line(out, heading);
    append_line(out);

    std::visit(Overloaded{
        [&](const HighlightBody& h) {
            append_line(out, blockquote(escape_markdown(h.selected_text)));
            append_line(out);
            append_line(out, "**Color:** " + color_display_name(h.color) + " | **Date:** " + date);
            if (has_note(a)) {
                append_line(out);
                append_line(out, "**Note:** " + escape_markdown(*a.note));
            }
        },
        [&](const NoteBody& n) {
            append_line(out, escape_markdown(a.note.value_or("")));
            if (has_text(n.selected_text)) {
                append_line(out);
                append_line(out, blockquote("*" + escape_markdown(*n.selected_text) + "*"));
            }
            append_line(out);
            append_line(out, "**Date:** " + date);
        },
        [&](const BookmarkBody&) {
            append_line(out, "**Position:** " + std::to_string(a.start_offset) + " | **Date:** " + date);
            if (has_note(a)) {
                append_line(out);
                append_line(out, "**Note:** " + escape_markdown(*a.note));
            }
        },
    }, a.body);

    append_line(out);
    return out;
}

std::string render_markdown(const PreparedExport& prepared,
                            const ExportOptions& options,
                            Timestamp now) {
    std::string out = markdown_header(options);

    if (options.include_stats) {
        out += markdown_stats(prepared.stats);
    }
    if (options.include_toc) {
        out += markdown_toc(prepared.groups);
    }

    append_section(out, "Highlights", prepared.groups.highlights, options.date_format, true);
    append_section(out, "Notes", prepared.groups.notes, options.date_format, true);
    append_section(out, "Bookmarks", prepared.groups.bookmarks, options.date_format, false);

    out += "\n---\n";
    out += "*Exported from Marginalia on " + format_export_date(now, DateFormat::Long) + "*";
    return out;
}

Result<std::string> generate_markdown_export(const std::vector<Annotation>& annotations,
                                             const ExportOptions& options,
                                             Timestamp now) {
    return prepare_export(annotations, options, now).map([&](const PreparedExport& prepared) {
        return render_markdown(prepared, options, now);
    });
}

} // namespace marginalia::exporting
