#pragma once

// ============================================================================
// TestDecks - Synthetic slide decks for the built-in tests
// ============================================================================
// Writes plain PDFs with one full-page image per page, using the composer
// itself with a 1x1 grid and no margins. No fixture files are shipped.
// ============================================================================

#include "LayoutPlanner.h"
#include "../pdf/MuPdfComposer.h"

#include <QColor>
#include <QFile>
#include <QImage>
#include <QSizeF>
#include <QString>
#include <QVector>

namespace TestDecks {

/// 4:3 slide, 720x540 pt
inline QSizeF landscapeSlide() { return QSizeF(720.0, 540.0); }

/// Letter portrait page
inline QSizeF portraitSlide() { return QSizeF(612.0, 792.0); }

/**
 * @brief Solid-colour slide image with a darker band across the top.
 */
inline QImage makeSlide(const QColor& color, const QSize& pixelSize = QSize(400, 300))
{
    QImage image(pixelSize, QImage::Format_RGB888);
    image.fill(color);
    const int band = qMax(1, pixelSize.height() / 10);
    for (int y = 0; y < band; ++y) {
        for (int x = 0; x < pixelSize.width(); ++x) {
            image.setPixelColor(x, y, color.darker(200));
        }
    }
    return image;
}

/**
 * @brief Colours cycled through by makeDeck().
 */
inline QColor slideColor(int index)
{
    static const QColor palette[] = {
        QColor(220, 40, 40), QColor(40, 160, 60), QColor(40, 80, 220),
        QColor(230, 190, 30), QColor(150, 60, 180), QColor(30, 180, 190)
    };
    return palette[index % 6];
}

/**
 * @brief Write a PDF whose pages each show one slide image edge to edge.
 * @param path Output file.
 * @param slides Page images, in order (may be empty for a zero-page PDF).
 * @param pageSizePt Size of every page in points.
 * @param title Optional Info/Title.
 * @return true if the file was written.
 */
inline bool writeDeck(const QString& path, const QVector<QImage>& slides,
                      const QSizeF& pageSizePt, const QString& title = QString())
{
    HandoutConfig config;
    config.pageSize = pageSizePt;
    config.margin = 0;
    config.gap = 0;

    const QSize planSize = slides.isEmpty() ? pageSizePt.toSize() : slides.first().size();
    GridSpec grid = LayoutPlanner(config).plan(TilingMode::fixed(1), planSize);

    ComposeOptions options;
    options.title = title;
    options.borderWidth = 0;

    MuPdfComposer composer;
    ComposeResult result = composer.compose(slides, grid, options);
    if (!result.success) {
        return false;
    }

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }
    const bool written = file.write(result.pdfData) == result.pdfData.size();
    file.close();
    return written;
}

/**
 * @brief Write a deck of count solid-colour slides.
 */
inline bool makeDeck(const QString& path, int count,
                     const QSizeF& pageSizePt = landscapeSlide(),
                     const QString& title = QString())
{
    const QSize pixels = QSizeF(pageSizePt.width() / 2, pageSizePt.height() / 2).toSize();
    QVector<QImage> slides;
    for (int i = 0; i < count; ++i) {
        slides.append(makeSlide(slideColor(i), pixels));
    }
    return writeDeck(path, slides, pageSizePt, title);
}

} // namespace TestDecks
