#pragma once

// ============================================================================
// HandoutConfig - Page geometry and output settings for handout builds
// ============================================================================
// A plain value passed explicitly through the pipeline (CLI -> batch ->
// HandoutBuilder -> LayoutPlanner / MuPdfComposer). There is no global
// instance; callers load one with fromSettings() and hand it down.
// ============================================================================

#include "TilingMode.h"

#include <QColor>
#include <QSizeF>
#include <QString>

class QSettings;

/**
 * @brief Layout and encoding settings for one handout build.
 *
 * All lengths are in PDF points (1/72 inch). The output page size is fixed
 * to US Letter and is not read from settings.
 */
struct HandoutConfig {
    QSizeF pageSize = QSizeF(612.0, 792.0);   ///< Output page size (US Letter)
    qreal margin = 36.0;                      ///< Outer page margin
    qreal gap = 12.0;                         ///< Gap between adjacent tiles

    int maxDpi = 300;                         ///< Upper bound applied to requested DPI
    int defaultDpi = 200;                     ///< DPI used when none is requested
    TilingMode defaultTiling = TilingMode::automatic();

    /**
     * @brief Aspect ratio (width / height) above which auto mode treats the
     * first slide as landscape. 1.0 means "wider than tall".
     */
    qreal landscapeThreshold = 1.0;

    QColor borderColor = QColor::fromRgbF(0.8, 0.8, 0.8);  ///< Tile outline colour (light grey)
    qreal borderWidth = 0.5;                                ///< Tile outline width, hairline-thin

    QString imageFormat = QStringLiteral("PNG");  ///< "PNG" (lossless) or "JPEG"
    int jpegQuality = 85;                         ///< Used when imageFormat is JPEG

    int conversionTimeoutSec = 120;               ///< LibreOffice gives up after this long

    /**
     * @brief Built-in defaults (margin 36pt, gap 12pt, DPI cap 300).
     */
    static HandoutConfig defaults();

    /**
     * @brief Load overrides from the "handout/" group of a settings store.
     * @param settings Settings to read (typically QSettings("SlideHandout", "App")).
     * @return Config with valid overrides applied; invalid values keep the default.
     */
    static HandoutConfig fromSettings(QSettings& settings);

    /**
     * @brief Clamp a requested DPI to maxDpi.
     *
     * Only the upper bound is applied here. Non-positive values are
     * rejected by the caller before this point.
     */
    int clampDpi(int dpi) const;

    /**
     * @brief Check that margin and gap leave room for at least a 3x3 grid.
     */
    bool hasUsableGeometry() const;
};
