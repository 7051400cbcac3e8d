#pragma once

// ============================================================================
// Rasterizer - Renders every source page to an opaque RGB image
// ============================================================================

#include <QImage>
#include <QString>
#include <QVector>

class PdfProvider;

/**
 * @brief Result of rasterizing a whole document.
 */
struct RasterResult {
    bool success = false;
    QString errorMessage;
    int failedPage = -1;        ///< 0-based page that failed to render, or -1
    QVector<QImage> images;     ///< One Format_RGB888 image per page, in page order
};

/**
 * @brief Renders a PdfProvider page by page at a fixed DPI.
 *
 * The DPI is used as given (zoom = dpi / 72). Clamping to the configured
 * maximum happens before this point.
 */
class Rasterizer {
public:
    explicit Rasterizer(int dpi);

    int dpi() const { return m_dpi; }

    /**
     * @brief Render all pages of the provider.
     * @return Images in page order. Any page that renders to a null image
     *         fails the whole run; a zero-page document gives an empty list.
     */
    RasterResult rasterize(const PdfProvider& provider) const;

    /**
     * @brief Render a single page.
     * @return Opaque RGB888 image, or a null image if the backend failed.
     */
    QImage rasterizePage(const PdfProvider& provider, int pageIndex) const;

    /**
     * @brief Flatten any image onto white and convert it to RGB888.
     */
    static QImage toOpaqueRgb(const QImage& image);

private:
    int m_dpi;
};
