#pragma once

#include "export/page_layout.hpp"

#include <QBuffer>
#include <QByteArray>
#include <QPainter>
#include <QPdfWriter>
#include <QString>

#include <memory>

namespace marginalia::exporting {

/**
 * PdfCanvas - PageCanvas backed by QPdfWriter + QPainter.
 *
 * Writes into an in-memory buffer; finish() ends the document and returns
 * its bytes. Millimetre coordinates are mapped to device units at the
 * writer's resolution.
 */
class PdfCanvas final : public PageCanvas {
public:
    explicit PdfCanvas(const QString& title, const PageGeometry& page = A4_PAGE);
    ~PdfCanvas() override;

    PdfCanvas(const PdfCanvas&) = delete;
    PdfCanvas& operator=(const PdfCanvas&) = delete;

    void new_page() override;
    void draw_text(double x, double y, std::string_view text, const TextStyle& style) override;
    void draw_line(double x1, double y1, double x2, double y2) override;

    /**
     * End painting and return the document. Further draws are ignored.
     */
    [[nodiscard]] QByteArray finish();

    [[nodiscard]] bool is_active() const;

private:
    [[nodiscard]] double to_device(double mm) const;

    PageGeometry page_;
    QByteArray bytes_;
    QBuffer buffer_;
    std::unique_ptr<QPdfWriter> writer_;
    QPainter painter_;
    bool finished_{false};
};

} // namespace marginalia::exporting
