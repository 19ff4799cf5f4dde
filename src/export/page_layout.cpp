#include "export/page_layout.hpp"

#include "core/text.hpp"

#include <cmath>

namespace marginalia::exporting {
namespace {

constexpr int kMetaGray = 100;
constexpr int kFooterGray = 128;
constexpr int kNoteIndentChars = 5;

void render_section(LayoutWriter& w, std::string_view title,
                    const std::vector<ExportItem>& items, DateFormat date_format) {
    if (items.empty()) return;

    const auto& page = w.page();
    const double lh = page.line_height;
    const double x = page.margin_left;
    const int body_chars = chars_per_line(page.body_font_size, page);

    w.ensure_space(lh * 3);
    w.text(x, title, TextStyle{FontRole::Heading, FontWeight::Bold});
    w.advance(lh + 2);

    for (const auto& item : items) {
        const auto block = make_pdf_block(item, date_format);

        // Header plus the first lines of the body stay together.
        w.ensure_space(lh * 5);
        w.text(x, std::to_string(block.index) + ". " + block.type_label,
               TextStyle{FontRole::Body, FontWeight::Bold});
        w.advance(lh);

        TextStyle content_style{FontRole::Body, FontWeight::Normal};
        content_style.background = block.color_hex;
        for (const auto& line : wrap_text(block.content, body_chars)) {
            w.text(x + 5, line, content_style);
            w.advance(lh - 1);
        }

        if (block.note && *block.note != block.content) {
            const TextStyle note_style{FontRole::Body, FontWeight::Italic};
            w.text(x + 5, "Note:", note_style);
            w.advance(lh - 1);
            for (const auto& line : wrap_text(*block.note, body_chars - kNoteIndentChars)) {
                w.text(x + 10, line, note_style);
                w.advance(lh - 1);
            }
        }

        std::string meta = "Date: " + block.date;
        if (block.color_name) {
            meta += " | Color: " + *block.color_name;
        }
        w.text(x + 5, meta, TextStyle{FontRole::Small, FontWeight::Normal, kMetaGray});
        w.advance(lh + 3);
    }

    w.divider();
    w.advance(lh);
}

} // namespace

int chars_per_line(double font_size, const PageGeometry& page) {
    return static_cast<int>(std::floor(page.content_width() / (font_size * 0.5)));
}

std::vector<std::string> wrap_text(std::string_view text, int max_chars) {
    std::vector<std::string> lines;
    std::string current;

    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && text::is_space(text[i])) ++i;
        const size_t start = i;
        while (i < text.size() && !text::is_space(text[i])) ++i;
        if (start == i) break;

        const auto word = text.substr(start, i - start);
        if (current.empty()) {
            current.assign(word);
        } else if (static_cast<int>(current.size() + 1 + word.size()) <= max_chars) {
            current.push_back(' ');
            current.append(word);
        } else {
            lines.push_back(std::move(current));
            current.assign(word);
        }
    }
    if (!current.empty()) {
        lines.push_back(std::move(current));
    }
    return lines;
}

double font_size(FontRole role, const PageGeometry& page) {
    switch (role) {
        case FontRole::Title: return page.title_font_size;
        case FontRole::Heading: return page.heading_font_size;
        case FontRole::Body: return page.body_font_size;
        case FontRole::Small: return page.small_font_size;
    }
    return page.body_font_size;
}

// ============================================================================
// LayoutWriter
// ============================================================================

LayoutWriter::LayoutWriter(PageCanvas& canvas, const PageGeometry& page)
    : canvas_(canvas)
    , page_(page)
    , y_(page.margin_top) {}

bool LayoutWriter::ensure_space(double needed_height) {
    if (y_ + needed_height <= page_.bottom_limit()) {
        return false;
    }
    canvas_.new_page();
    ++page_index_;
    y_ = page_.margin_top;
    return true;
}

void LayoutWriter::text(double x, std::string_view text, const TextStyle& style) {
    ensure_space(page_.line_height);
    canvas_.draw_text(x, y_, text, style);
}

void LayoutWriter::divider() {
    ensure_space(0);
    canvas_.draw_line(page_.margin_left, y_, page_.width - page_.margin_right, y_);
}

// ============================================================================
// Blocks and the layout pass
// ============================================================================

PdfBlock make_pdf_block(const ExportItem& item, DateFormat date_format) {
    const auto& a = item.annotation;

    PdfBlock block;
    block.index = item.index;
    block.type = get_type(a);
    block.type_label = std::string(annotation_label(block.type));
    block.date = format_export_date(a.created_at, date_format);

    const bool with_note = has_note(a);
    std::visit(Overloaded{
        [&](const HighlightBody& h) {
            block.content = h.selected_text;
            block.color_name = color_display_name(h.color);
            block.color_hex = std::string(color_to_hex(h.color));
            if (with_note) block.note = a.note;
        },
        [&](const NoteBody&) {
            block.content = a.note.value_or("");
            block.note = a.note;
        },
        [&](const BookmarkBody&) {
            if (with_note) {
                block.content = *a.note;
                block.note = a.note;
            } else {
                block.content = "Position: " + std::to_string(a.start_offset);
            }
        },
    }, a.body);
    return block;
}

LayoutResult render_page_layout(const PreparedExport& prepared,
                                const ExportOptions& options,
                                PageCanvas& canvas,
                                Timestamp now,
                                const PageGeometry& page) {
    LayoutWriter w(canvas, page);
    const double lh = page.line_height;
    const double x = page.margin_left;

    for (const auto& line : wrap_text(options.book_title, chars_per_line(page.title_font_size, page))) {
        w.text(x, line, TextStyle{FontRole::Title, FontWeight::Bold});
        w.advance(lh + 2);
    }

    if (options.book_author && !options.book_author->empty()) {
        w.text(x, "Author: " + *options.book_author, TextStyle{FontRole::Body, FontWeight::Italic});
        w.advance(lh);
    }

    w.advance(3);
    w.divider();
    w.advance(lh);

    if (options.include_stats) {
        const auto& stats = prepared.stats;
        const TextStyle body{FontRole::Body, FontWeight::Normal};

        w.text(x, "Summary", TextStyle{FontRole::Heading, FontWeight::Bold});
        w.advance(lh);
        w.text(x, "Total Annotations: " + std::to_string(stats.total_annotations), body);
        w.advance(lh - 1);
        w.text(x, "Highlights: " + std::to_string(stats.highlights), body);
        w.advance(lh - 1);
        w.text(x, "Notes: " + std::to_string(stats.notes), body);
        w.advance(lh - 1);
        w.text(x, "Bookmarks: " + std::to_string(stats.bookmarks), body);
        w.advance(lh + 3);
        w.divider();
        w.advance(lh);
    }

    render_section(w, "Highlights", prepared.groups.highlights, options.date_format);
    render_section(w, "Notes", prepared.groups.notes, options.date_format);
    render_section(w, "Bookmarks", prepared.groups.bookmarks, options.date_format);

    w.ensure_space(lh * 2);
    w.text(x, "Exported from Marginalia on " + format_export_date(now, DateFormat::Long),
           TextStyle{FontRole::Small, FontWeight::Normal, kFooterGray});

    return LayoutResult{w.page_count(), w.y()};
}

} // namespace marginalia::exporting
