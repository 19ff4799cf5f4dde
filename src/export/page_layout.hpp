#pragma once

#include "core/annotation.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "export/export_common.hpp"
#include "export/export_options.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace marginalia::exporting {

/**
 * PageGeometry - Fixed A4 page in millimetres.
 */
struct PageGeometry {
    double width{210};
    double height{297};
    double margin_top{20};
    double margin_bottom{20};
    double margin_left{20};
    double margin_right{20};
    double line_height{7};
    double title_font_size{18};
    double heading_font_size{14};
    double body_font_size{11};
    double small_font_size{9};

    [[nodiscard]] constexpr double content_width() const {
        return width - margin_left - margin_right;
    }

    [[nodiscard]] constexpr double bottom_limit() const {
        return height - margin_bottom;
    }
};

inline constexpr PageGeometry A4_PAGE{};

/**
 * Fixed-pitch heuristic: floor(content_width / (font_size * 0.5)).
 */
[[nodiscard]] int chars_per_line(double font_size, const PageGeometry& page = A4_PAGE);

/**
 * Greedy word wrap on whitespace.
 *
 * Words are never split; a word longer than max_chars sits alone on its
 * line. Blank input yields no lines.
 */
[[nodiscard]] std::vector<std::string> wrap_text(std::string_view text, int max_chars);

enum class FontRole {
    Title,
    Heading,
    Body,
    Small
};

enum class FontWeight {
    Normal,
    Bold,
    Italic
};

struct TextStyle {
    FontRole role{FontRole::Body};
    FontWeight weight{FontWeight::Normal};
    int gray{0};                            // 0 = black, 255 = white
    std::optional<std::string> background;  // "#rrggbb" highlight fill

    bool operator==(const TextStyle&) const = default;
};

[[nodiscard]] double font_size(FontRole role, const PageGeometry& page = A4_PAGE);

/**
 * PageCanvas - Drawing surface for the layout pass.
 *
 * Coordinates are millimetres from the top-left corner of the current page;
 * text y is the baseline. The first page exists before any call.
 */
class PageCanvas {
public:
    virtual ~PageCanvas() = default;

    virtual void new_page() = 0;
    virtual void draw_text(double x, double y, std::string_view text, const TextStyle& style) = 0;
    virtual void draw_line(double x1, double y1, double x2, double y2) = 0;
};

/**
 * LayoutWriter - The running cursor of one layout pass.
 *
 * Owns only the vertical position and the page index. Every draw goes
 * through ensure_space first, so nothing lands below the bottom margin.
 */
class LayoutWriter {
public:
    LayoutWriter(PageCanvas& canvas, const PageGeometry& page = A4_PAGE);

    /**
     * Start a new page when y + needed_height would pass the bottom margin.
     * Returns true when a page was added.
     */
    bool ensure_space(double needed_height);

    void advance(double dy) { y_ += dy; }

    void text(double x, std::string_view text, const TextStyle& style);
    void divider();

    [[nodiscard]] double y() const { return y_; }
    [[nodiscard]] int page_index() const { return page_index_; }
    [[nodiscard]] int page_count() const { return page_index_ + 1; }
    [[nodiscard]] const PageGeometry& page() const { return page_; }

private:
    PageCanvas& canvas_;
    PageGeometry page_;
    double y_;
    int page_index_{0};
};

/**
 * PdfBlock - One annotation flattened for the page layout.
 */
struct PdfBlock {
    size_t index{0};
    AnnotationType type{AnnotationType::Highlight};
    std::string type_label;
    std::string content;
    std::optional<std::string> note;
    std::optional<std::string> color_name;
    std::optional<std::string> color_hex;
    std::string date;
};

/**
 * Highlight: content is the selected text. Note: content is the note.
 * Bookmark: content is the note, or "Position: N" without one.
 */
[[nodiscard]] PdfBlock make_pdf_block(const ExportItem& item, DateFormat date_format);

struct LayoutResult {
    int page_count{1};
    double final_y{0};
};

/**
 * Lay out a prepared export onto the canvas.
 */
LayoutResult render_page_layout(const PreparedExport& prepared,
                                const ExportOptions& options,
                                PageCanvas& canvas,
                                Timestamp now,
                                const PageGeometry& page = A4_PAGE);

} // namespace marginalia::exporting
