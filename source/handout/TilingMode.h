#pragma once

// ============================================================================
// TilingMode - How many slides go on one printed page
// ============================================================================

#include <QString>

/**
 * @brief Either an explicit tile count or "auto".
 *
 * Auto is resolved once per run from the first rendered slide (see
 * LayoutPlanner::chooseTileCount). Explicit counts are not validated here:
 * counts without a grid shape fall back to 2x2 in the planner.
 */
struct TilingMode {
    bool isAuto = false;
    int tilesPerPage = 4;   ///< Requested count; meaningless when isAuto

    static TilingMode automatic();
    static TilingMode fixed(int tiles);

    /**
     * @brief Parse "auto" (any case) or a positive integer.
     * @param text User input, e.g. from --tiles.
     * @param out Receives the parsed mode on success; untouched otherwise.
     * @return false for empty, non-numeric, zero or negative input.
     */
    static bool parse(const QString& text, TilingMode& out);

    QString toString() const;

    bool operator==(const TilingMode& other) const
    {
        return isAuto == other.isAuto && (isAuto || tilesPerPage == other.tilesPerPage);
    }
    bool operator!=(const TilingMode& other) const { return !(*this == other); }
};
