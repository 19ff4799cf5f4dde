#pragma once

#include <QString>

namespace marginalia::ui {

/**
 * MarkdownPreview - Renders an exported Markdown document to HTML with cmark.
 *
 * Raw HTML inside the document is not passed through.
 */
class MarkdownPreview {
public:
    [[nodiscard]] static QString to_html(const QString& markdown);

    // Complete page with <title>, for writing next to an export.
    [[nodiscard]] static QString to_html_document(const QString& title, const QString& markdown);
};

} // namespace marginalia::ui
