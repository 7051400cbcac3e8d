#pragma once

// ============================================================================
// LayoutPlanner - Grid shape and tile geometry for handout pages
// ============================================================================
// Given the tiling mode and the first rendered slide, decides how many slides
// share one printed page and where each one is placed. The result (GridSpec)
// is computed once per run and reused for every output page.
//
// Coordinates are PDF points with a bottom-left origin, matching the content
// streams written by MuPdfComposer.
// ============================================================================

#include "HandoutConfig.h"
#include "TilingMode.h"

#include <QRectF>
#include <QSize>
#include <QSizeF>

/**
 * @brief Columns x rows partition of one output page.
 */
struct GridShape {
    int columns = 2;
    int rows = 2;

    int tileCount() const { return columns * rows; }

    bool operator==(const GridShape& other) const
    {
        return columns == other.columns && rows == other.rows;
    }
};

/**
 * @brief Immutable layout shared by every tile of a handout run.
 *
 * The scaled tile size is derived from the first slide only. Later slides
 * with a different aspect ratio are drawn at the same size.
 */
struct GridSpec {
    bool valid = false;

    int tilesPerPage = 0;   ///< Resolved count (after auto and fallback)
    int columns = 0;
    int rows = 0;

    qreal cellWidth = 0;
    qreal cellHeight = 0;
    qreal scaledWidth = 0;
    qreal scaledHeight = 0;

    QSizeF pageSize;
    qreal margin = 0;
    qreal gap = 0;

    bool isValid() const { return valid; }

    /**
     * @brief Placement of the scaled image for one slot of a page.
     * @param slot 0-based index within the page (0 .. tilesPerPage-1).
     * @return Rectangle in points; x/y is the bottom-left corner.
     *
     * Slots fill left to right, then top to bottom. The image is centred
     * inside its cell.
     */
    QRectF tileRect(int slot) const;

    /**
     * @brief Number of output pages for a source of totalPages slides.
     * @return ceil(totalPages / tilesPerPage), 0 for an empty source.
     */
    int outputPageCount(int totalPages) const;
};

/**
 * @brief Computes GridSpec values from a HandoutConfig.
 *
 * Stateless apart from the config it was built with.
 */
class LayoutPlanner {
public:
    explicit LayoutPlanner(const HandoutConfig& config);

    /**
     * @brief Grid shape for an explicit tile count.
     *
     * Supported: 1 (1x1), 2 (1x2), 4 (2x2), 6 (2x3), 9 (3x3).
     * Any other count returns the 2x2 shape.
     */
    static GridShape gridShapeFor(int tilesPerPage);

    /**
     * @brief Check whether a tile count has its own grid shape.
     */
    static bool isSupportedTileCount(int tilesPerPage);

    /**
     * @brief Auto rule: landscape slides get 2 per page, all others 4.
     * @param aspectRatio width / height of the first slide.
     * @param threshold Ratio above which a slide counts as landscape.
     */
    static int chooseTileCount(qreal aspectRatio, qreal threshold);

    /**
     * @brief Resolve a tiling mode to a concrete tile count.
     *
     * Called once per run with the first rendered slide's size.
     */
    int resolveTileCount(const TilingMode& mode, const QSize& firstImageSize) const;

    /**
     * @brief Build the layout for a run.
     * @param mode Requested tiling (auto or explicit count).
     * @param firstImageSize Pixel size of the first rendered slide.
     * @return GridSpec, invalid if the image size is empty.
     */
    GridSpec plan(const TilingMode& mode, const QSize& firstImageSize) const;

    const HandoutConfig& config() const { return m_config; }

private:
    HandoutConfig m_config;
};
