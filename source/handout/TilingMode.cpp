#include "TilingMode.h"

TilingMode TilingMode::automatic()
{
    TilingMode mode;
    mode.isAuto = true;
    return mode;
}

TilingMode TilingMode::fixed(int tiles)
{
    TilingMode mode;
    mode.isAuto = false;
    mode.tilesPerPage = tiles;
    return mode;
}

bool TilingMode::parse(const QString& text, TilingMode& out)
{
    const QString value = text.trimmed();
    if (value.isEmpty()) {
        return false;
    }

    if (value.compare(QLatin1String("auto"), Qt::CaseInsensitive) == 0) {
        out = automatic();
        return true;
    }

    bool ok = false;
    const int tiles = value.toInt(&ok);
    if (!ok || tiles <= 0) {
        return false;
    }

    out = fixed(tiles);
    return true;
}

QString TilingMode::toString() const
{
    return isAuto ? QStringLiteral("auto") : QString::number(tilesPerPage);
}
