#include "ui/MarkdownPreview.hpp"

#include <cmark.h>

#include <cstdlib>

namespace marginalia::ui {

QString MarkdownPreview::to_html(const QString& markdown) {
    if (markdown.isEmpty()) {
        return QString();
    }

    const auto utf8 = markdown.toUtf8();
    char* html = cmark_markdown_to_html(utf8.constData(),
                                        static_cast<size_t>(utf8.size()),
                                        CMARK_OPT_DEFAULT);
    if (!html) {
        return QString();
    }

    QString out = QString::fromUtf8(html);
    std::free(html);
    return out;
}

QString MarkdownPreview::to_html_document(const QString& title, const QString& markdown) {
    return QStringLiteral("<!DOCTYPE html>\n<html lang=\"en\">\n<head>\n<meta charset=\"UTF-8\">\n"
                          "<title>%1</title>\n</head>\n<body>\n%2</body>\n</html>\n")
        .arg(title.toHtmlEscaped(), to_html(markdown));
}

} // namespace marginalia::ui
