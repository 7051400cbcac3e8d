// ============================================================================
// HandoutConfig - Implementation
// ============================================================================

#include "HandoutConfig.h"
#include "LayoutPlanner.h"

#include <QDebug>
#include <QSettings>

HandoutConfig HandoutConfig::defaults()
{
    return HandoutConfig();
}

HandoutConfig HandoutConfig::fromSettings(QSettings& settings)
{
    HandoutConfig config;
    const HandoutConfig fallback;

    settings.beginGroup(QStringLiteral("handout"));

    config.margin = settings.value("margin", fallback.margin).toDouble();
    config.gap = settings.value("gap", fallback.gap).toDouble();
    if (config.margin < 0 || config.gap < 0 || !config.hasUsableGeometry()) {
        qWarning() << "[HandoutConfig] Ignoring margin/gap override"
                   << config.margin << config.gap << "(no room left for tiles)";
        config.margin = fallback.margin;
        config.gap = fallback.gap;
    }

    config.maxDpi = settings.value("maxDpi", fallback.maxDpi).toInt();
    if (config.maxDpi <= 0) {
        qWarning() << "[HandoutConfig] Ignoring invalid maxDpi" << config.maxDpi;
        config.maxDpi = fallback.maxDpi;
    }

    config.defaultDpi = settings.value("defaultDpi", fallback.defaultDpi).toInt();
    if (config.defaultDpi <= 0) {
        qWarning() << "[HandoutConfig] Ignoring invalid defaultDpi" << config.defaultDpi;
        config.defaultDpi = fallback.defaultDpi;
    }

    const QString tiling = settings.value("defaultTiling",
                                          fallback.defaultTiling.toString()).toString();
    if (!TilingMode::parse(tiling, config.defaultTiling)) {
        qWarning() << "[HandoutConfig] Ignoring invalid defaultTiling" << tiling;
        config.defaultTiling = fallback.defaultTiling;
    }

    config.landscapeThreshold = settings.value("landscapeThreshold",
                                               fallback.landscapeThreshold).toDouble();
    if (config.landscapeThreshold <= 0) {
        qWarning() << "[HandoutConfig] Ignoring invalid landscapeThreshold"
                   << config.landscapeThreshold;
        config.landscapeThreshold = fallback.landscapeThreshold;
    }

    const QColor border(settings.value("borderColor",
                                       fallback.borderColor.name()).toString());
    config.borderColor = border.isValid() ? border : fallback.borderColor;

    config.borderWidth = settings.value("borderWidth", fallback.borderWidth).toDouble();
    if (config.borderWidth < 0) {
        config.borderWidth = fallback.borderWidth;
    }

    config.imageFormat = settings.value("imageFormat", fallback.imageFormat).toString().toUpper();
    if (config.imageFormat == QLatin1String("JPG")) {
        config.imageFormat = QStringLiteral("JPEG");
    }
    if (config.imageFormat != QLatin1String("PNG") && config.imageFormat != QLatin1String("JPEG")) {
        qWarning() << "[HandoutConfig] Unknown imageFormat" << config.imageFormat << "- using PNG";
        config.imageFormat = fallback.imageFormat;
    }

    config.jpegQuality = qBound(1, settings.value("jpegQuality", fallback.jpegQuality).toInt(), 100);

    config.conversionTimeoutSec = settings.value("conversionTimeoutSec",
                                                 fallback.conversionTimeoutSec).toInt();
    if (config.conversionTimeoutSec <= 0) {
        qWarning() << "[HandoutConfig] Ignoring invalid conversionTimeoutSec"
                   << config.conversionTimeoutSec;
        config.conversionTimeoutSec = fallback.conversionTimeoutSec;
    }

    settings.endGroup();
    return config;
}

int HandoutConfig::clampDpi(int dpi) const
{
    return qMin(dpi, maxDpi);
}

bool HandoutConfig::hasUsableGeometry() const
{
    // The densest supported grid is 3x3; every cell must keep a positive size.
    const GridShape densest = LayoutPlanner::gridShapeFor(9);
    const qreal width = pageSize.width() - 2 * margin - (densest.columns - 1) * gap;
    const qreal height = pageSize.height() - 2 * margin - (densest.rows - 1) * gap;
    return width > 0 && height > 0;
}
