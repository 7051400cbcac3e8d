// ============================================================================
// Rasterizer - Implementation
// ============================================================================

#include "Rasterizer.h"
#include "../pdf/PdfProvider.h"

#include <QDebug>
#include <QObject>
#include <QPainter>

Rasterizer::Rasterizer(int dpi)
    : m_dpi(dpi)
{
}

RasterResult Rasterizer::rasterize(const PdfProvider& provider) const
{
    RasterResult result;

    if (!provider.isValid()) {
        result.errorMessage = QObject::tr("Source document is not readable");
        return result;
    }

    const int total = provider.pageCount();
    result.images.reserve(total);

    for (int i = 0; i < total; ++i) {
        QImage image = rasterizePage(provider, i);
        if (image.isNull()) {
            result.errorMessage = QObject::tr("Failed to render page %1").arg(i + 1);
            result.failedPage = i;
            result.images.clear();
            qWarning() << "[Rasterizer]" << result.errorMessage << "of" << provider.filePath();
            return result;
        }
        result.images.append(image);
    }

#ifdef SLIDEHANDOUT_DEBUG
    if (!result.images.isEmpty()) {
        qDebug() << "[Rasterizer] Rendered" << total << "pages at" << m_dpi << "DPI,"
                 << "first page" << result.images.first().size();
    }
#endif

    result.success = true;
    return result;
}

QImage Rasterizer::rasterizePage(const PdfProvider& provider, int pageIndex) const
{
    const QImage rendered = provider.renderPageToImage(pageIndex, m_dpi);
    if (rendered.isNull() || rendered.width() <= 0 || rendered.height() <= 0) {
        return QImage();
    }
    return toOpaqueRgb(rendered);
}

QImage Rasterizer::toOpaqueRgb(const QImage& image)
{
    if (image.isNull()) {
        return QImage();
    }

    if (image.format() == QImage::Format_RGB888) {
        return image;
    }

    if (image.hasAlphaChannel()) {
        // Composite on white; PDF pages have no transparent background
        QImage rgb(image.size(), QImage::Format_RGB888);
        rgb.fill(Qt::white);
        QPainter painter(&rgb);
        painter.drawImage(0, 0, image);
        painter.end();
        return rgb;
    }

    return image.convertToFormat(QImage::Format_RGB888);
}
