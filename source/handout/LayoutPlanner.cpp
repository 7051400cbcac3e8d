// ============================================================================
// LayoutPlanner - Implementation
// ============================================================================

#include "LayoutPlanner.h"

#include <QDebug>

// ============================================================================
// GridSpec
// ============================================================================

QRectF GridSpec::tileRect(int slot) const
{
    if (!valid || slot < 0 || slot >= tilesPerPage) {
        return QRectF();
    }

    const int col = slot % columns;
    const int row = slot / columns;

    // Rows are counted from the top of the page; PDF y grows upwards.
    const qreal x = margin + col * (cellWidth + gap) + (cellWidth - scaledWidth) / 2.0;
    const qreal y = pageSize.height() - margin - (row + 1) * cellHeight - row * gap
                    + (cellHeight - scaledHeight) / 2.0;

    return QRectF(x, y, scaledWidth, scaledHeight);
}

int GridSpec::outputPageCount(int totalPages) const
{
    if (!valid || totalPages <= 0) {
        return 0;
    }
    return (totalPages + tilesPerPage - 1) / tilesPerPage;
}

// ============================================================================
// LayoutPlanner
// ============================================================================

LayoutPlanner::LayoutPlanner(const HandoutConfig& config)
    : m_config(config)
{
}

GridShape LayoutPlanner::gridShapeFor(int tilesPerPage)
{
    switch (tilesPerPage) {
        case 1: return GridShape{1, 1};
        case 2: return GridShape{1, 2};
        case 4: return GridShape{2, 2};
        case 6: return GridShape{2, 3};
        case 9: return GridShape{3, 3};
        default: return GridShape{2, 2};
    }
}

bool LayoutPlanner::isSupportedTileCount(int tilesPerPage)
{
    return gridShapeFor(tilesPerPage).tileCount() == tilesPerPage;
}

int LayoutPlanner::chooseTileCount(qreal aspectRatio, qreal threshold)
{
    return aspectRatio > threshold ? 2 : 4;
}

int LayoutPlanner::resolveTileCount(const TilingMode& mode, const QSize& firstImageSize) const
{
    if (!mode.isAuto) {
        return mode.tilesPerPage;
    }
    if (firstImageSize.height() <= 0) {
        return 4;
    }
    const qreal ratio = static_cast<qreal>(firstImageSize.width()) / firstImageSize.height();
    return chooseTileCount(ratio, m_config.landscapeThreshold);
}

GridSpec LayoutPlanner::plan(const TilingMode& mode, const QSize& firstImageSize) const
{
    GridSpec spec;
    spec.pageSize = m_config.pageSize;
    spec.margin = m_config.margin;
    spec.gap = m_config.gap;

    if (firstImageSize.width() <= 0 || firstImageSize.height() <= 0) {
        qWarning() << "[LayoutPlanner] Cannot plan from empty image size" << firstImageSize;
        return spec;
    }

    const int requested = resolveTileCount(mode, firstImageSize);
    if (!isSupportedTileCount(requested)) {
        qDebug() << "[LayoutPlanner]" << requested << "tiles per page has no grid, using 2x2";
    }

    const GridShape shape = gridShapeFor(requested);
    spec.columns = shape.columns;
    spec.rows = shape.rows;
    spec.tilesPerPage = shape.tileCount();

    const qreal availableWidth = spec.pageSize.width() - 2 * spec.margin
                                 - (spec.columns - 1) * spec.gap;
    const qreal availableHeight = spec.pageSize.height() - 2 * spec.margin
                                  - (spec.rows - 1) * spec.gap;
    spec.cellWidth = availableWidth / spec.columns;
    spec.cellHeight = availableHeight / spec.rows;

    if (spec.cellWidth <= 0 || spec.cellHeight <= 0) {
        qWarning() << "[LayoutPlanner] Margin/gap leave no room for a"
                   << spec.columns << "x" << spec.rows << "grid";
        return spec;
    }

    const qreal scale = qMin(spec.cellWidth / firstImageSize.width(),
                             spec.cellHeight / firstImageSize.height());
    spec.scaledWidth = firstImageSize.width() * scale;
    spec.scaledHeight = firstImageSize.height() * scale;
    spec.valid = true;

#ifdef SLIDEHANDOUT_DEBUG
    qDebug() << "[LayoutPlanner] Grid" << spec.columns << "x" << spec.rows
             << "cell" << spec.cellWidth << "x" << spec.cellHeight
             << "tile" << spec.scaledWidth << "x" << spec.scaledHeight;
#endif

    return spec;
}
