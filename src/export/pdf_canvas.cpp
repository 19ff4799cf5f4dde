#include "export/pdf_canvas.hpp"

#include <QColor>
#include <QFont>
#include <QFontMetricsF>
#include <QMarginsF>
#include <QPageLayout>
#include <QPageSize>
#include <QPen>
#include <QRectF>

namespace marginalia::exporting {
namespace {

constexpr int kResolutionDpi = 300;
constexpr double kMillimetresPerInch = 25.4;
constexpr int kDividerGray = 200;

QFont font_for(const TextStyle& style, const PageGeometry& page) {
    QFont font(QStringLiteral("Helvetica"));
    font.setStyleHint(QFont::SansSerif);
    font.setPointSizeF(font_size(style.role, page));
    font.setBold(style.weight == FontWeight::Bold);
    font.setItalic(style.weight == FontWeight::Italic);
    return font;
}

} // namespace

PdfCanvas::PdfCanvas(const QString& title, const PageGeometry& page)
    : page_(page)
    , buffer_(&bytes_) {
    buffer_.open(QIODevice::WriteOnly);

    writer_ = std::make_unique<QPdfWriter>(&buffer_);
    writer_->setTitle(title);
    writer_->setCreator(QStringLiteral("Marginalia"));
    writer_->setResolution(kResolutionDpi);
    writer_->setPageLayout(QPageLayout(
        QPageSize(QSizeF(page_.width, page_.height), QPageSize::Millimeter),
        QPageLayout::Portrait,
        QMarginsF(0, 0, 0, 0),
        QPageLayout::Millimeter));

    painter_.begin(writer_.get());
    painter_.setRenderHint(QPainter::Antialiasing);
}

PdfCanvas::~PdfCanvas() {
    if (painter_.isActive()) {
        painter_.end();
    }
}

bool PdfCanvas::is_active() const {
    return !finished_ && painter_.isActive();
}

double PdfCanvas::to_device(double mm) const {
    return mm * kResolutionDpi / kMillimetresPerInch;
}

void PdfCanvas::new_page() {
    if (!is_active()) return;
    writer_->newPage();
}

void PdfCanvas::draw_text(double x, double y, std::string_view text, const TextStyle& style) {
    if (!is_active()) return;

    const auto qtext = QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()));
    painter_.setFont(font_for(style, page_));
    const QPointF baseline(to_device(x), to_device(y));

    if (style.background) {
        const QFontMetricsF metrics(painter_.font(), painter_.device());
        const QRectF rect(baseline.x(),
                          baseline.y() - metrics.ascent(),
                          metrics.horizontalAdvance(qtext),
                          metrics.height());
        painter_.fillRect(rect, QColor(QString::fromStdString(*style.background)));
    }

    painter_.setPen(QColor(style.gray, style.gray, style.gray));
    painter_.drawText(baseline, qtext);
}

void PdfCanvas::draw_line(double x1, double y1, double x2, double y2) {
    if (!is_active()) return;
    QPen pen(QColor(kDividerGray, kDividerGray, kDividerGray));
    pen.setWidthF(to_device(0.2));
    painter_.setPen(pen);
    painter_.drawLine(QPointF(to_device(x1), to_device(y1)), QPointF(to_device(x2), to_device(y2)));
}

QByteArray PdfCanvas::finish() {
    if (!finished_) {
        finished_ = true;
        if (painter_.isActive()) {
            painter_.end();
        }
        buffer_.close();
    }
    return bytes_;
}

} // namespace marginalia::exporting
