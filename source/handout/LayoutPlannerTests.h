#ifndef LAYOUTPLANNERTESTS_H
#define LAYOUTPLANNERTESTS_H

#include <QObject>
#include <QTest>
#include <QSettings>
#include <QTemporaryDir>

#include "LayoutPlanner.h"
#include "HandoutConfig.h"
#include "TilingMode.h"

/**
 * Unit tests for grid selection and tile geometry.
 * Run with: slidehandout --test-layout
 */
class LayoutPlannerTests : public QObject {
    Q_OBJECT

private slots:
    // Fixed tile count -> grid table
    void testGridShapeTable() {
        QCOMPARE(LayoutPlanner::gridShapeFor(1), (GridShape{1, 1}));
        QCOMPARE(LayoutPlanner::gridShapeFor(2), (GridShape{1, 2}));
        QCOMPARE(LayoutPlanner::gridShapeFor(4), (GridShape{2, 2}));
        QCOMPARE(LayoutPlanner::gridShapeFor(6), (GridShape{2, 3}));
        QCOMPARE(LayoutPlanner::gridShapeFor(9), (GridShape{3, 3}));
    }

    // Counts without their own grid use 2x2
    void testUnsupportedCountsFallBack() {
        for (int tiles : {0, 3, 5, 7, 8, 12, 16, -1}) {
            QCOMPARE(LayoutPlanner::gridShapeFor(tiles), (GridShape{2, 2}));
            QVERIFY(!LayoutPlanner::isSupportedTileCount(tiles));
        }

        LayoutPlanner planner(HandoutConfig::defaults());
        GridSpec spec = planner.plan(TilingMode::fixed(5), QSize(1000, 750));
        QVERIFY(spec.isValid());
        QCOMPARE(spec.columns, 2);
        QCOMPARE(spec.rows, 2);
        QCOMPARE(spec.tilesPerPage, 4);
    }

    void testChooseTileCount() {
        QCOMPARE(LayoutPlanner::chooseTileCount(16.0 / 9.0, 1.0), 2);
        QCOMPARE(LayoutPlanner::chooseTileCount(4.0 / 3.0, 1.0), 2);
        QCOMPARE(LayoutPlanner::chooseTileCount(1.0, 1.0), 4);   // square is not landscape
        QCOMPARE(LayoutPlanner::chooseTileCount(0.75, 1.0), 4);
        QCOMPARE(LayoutPlanner::chooseTileCount(1.1, 1.2), 4);
        QCOMPARE(LayoutPlanner::chooseTileCount(1.3, 1.2), 2);
    }

    // 10 slides, 4 per page -> 3 pages with 264x354 cells
    void testLetterTwoByTwoGeometry() {
        LayoutPlanner planner(HandoutConfig::defaults());
        GridSpec spec = planner.plan(TilingMode::fixed(4), QSize(2000, 1500));

        QVERIFY(spec.isValid());
        QCOMPARE(spec.columns, 2);
        QCOMPARE(spec.rows, 2);
        QCOMPARE(spec.cellWidth, 264.0);
        QCOMPARE(spec.cellHeight, 354.0);
        QCOMPARE(spec.scaledWidth, 264.0);
        QCOMPARE(spec.scaledHeight, 198.0);
        QCOMPARE(spec.outputPageCount(10), 3);

        QCOMPARE(spec.tileRect(0), QRectF(36.0, 480.0, 264.0, 198.0));
        QCOMPARE(spec.tileRect(1), QRectF(312.0, 480.0, 264.0, 198.0));
        QCOMPARE(spec.tileRect(2), QRectF(36.0, 114.0, 264.0, 198.0));
        QCOMPARE(spec.tileRect(3), QRectF(312.0, 114.0, 264.0, 198.0));
        QVERIFY(spec.tileRect(4).isNull());
        QVERIFY(spec.tileRect(-1).isNull());
    }

    // Portrait slides are limited by cell width, landscape by height
    void testTileNeverOverflowsCell() {
        LayoutPlanner planner(HandoutConfig::defaults());
        const QList<QSize> sizes = {QSize(2000, 1125), QSize(1125, 2000), QSize(1, 1),
                                    QSize(5000, 10), QSize(10, 5000), QSize(1700, 2200)};
        for (int tiles : {1, 2, 4, 6, 9}) {
            for (const QSize& size : sizes) {
                GridSpec spec = planner.plan(TilingMode::fixed(tiles), size);
                QVERIFY(spec.isValid());
                QVERIFY(spec.scaledWidth <= spec.cellWidth + 1e-9);
                QVERIFY(spec.scaledHeight <= spec.cellHeight + 1e-9);

                // One of the two dimensions fills the cell
                QVERIFY(qFuzzyCompare(spec.scaledWidth, spec.cellWidth) ||
                        qFuzzyCompare(spec.scaledHeight, spec.cellHeight));

                for (int slot = 0; slot < spec.tilesPerPage; ++slot) {
                    QRectF r = spec.tileRect(slot);
                    QVERIFY(r.left() >= spec.margin - 1e-9);
                    QVERIFY(r.right() <= spec.pageSize.width() - spec.margin + 1e-9);
                    QVERIFY(r.top() >= spec.margin - 1e-9);
                    QVERIFY(r.bottom() <= spec.pageSize.height() - spec.margin + 1e-9);
                }
            }
        }
    }

    void testAutoPicksTwoForLandscape() {
        LayoutPlanner planner(HandoutConfig::defaults());
        GridSpec spec = planner.plan(TilingMode::automatic(), QSize(2000, 1125));

        QVERIFY(spec.isValid());
        QCOMPARE(spec.tilesPerPage, 2);
        QCOMPARE(spec.columns, 1);
        QCOMPARE(spec.rows, 2);
        QCOMPARE(spec.cellWidth, 540.0);
        QCOMPARE(spec.cellHeight, 354.0);
        QCOMPARE(spec.outputPageCount(1), 1);
    }

    void testAutoPicksFourForPortrait() {
        LayoutPlanner planner(HandoutConfig::defaults());
        QCOMPARE(planner.plan(TilingMode::automatic(), QSize(1125, 2000)).tilesPerPage, 4);
        QCOMPARE(planner.plan(TilingMode::automatic(), QSize(1000, 1000)).tilesPerPage, 4);
    }

    void testAutoUsesConfiguredThreshold() {
        HandoutConfig config;
        config.landscapeThreshold = 1.5;
        LayoutPlanner planner(config);
        QCOMPARE(planner.resolveTileCount(TilingMode::automatic(), QSize(1333, 1000)), 4);
        QCOMPARE(planner.resolveTileCount(TilingMode::automatic(), QSize(1778, 1000)), 2);
        QCOMPARE(planner.resolveTileCount(TilingMode::fixed(6), QSize(1778, 1000)), 6);
    }

    void testOutputPageCount() {
        LayoutPlanner planner(HandoutConfig::defaults());
        GridSpec six = planner.plan(TilingMode::fixed(6), QSize(800, 600));
        QCOMPARE(six.outputPageCount(0), 0);
        QCOMPARE(six.outputPageCount(1), 1);
        QCOMPARE(six.outputPageCount(6), 1);
        QCOMPARE(six.outputPageCount(7), 2);
        QCOMPARE(six.outputPageCount(13), 3);
    }

    void testEmptyImageIsInvalid() {
        LayoutPlanner planner(HandoutConfig::defaults());
        QVERIFY(!planner.plan(TilingMode::fixed(4), QSize(0, 100)).isValid());
        QVERIFY(!planner.plan(TilingMode::automatic(), QSize(100, 0)).isValid());
        QVERIFY(!planner.plan(TilingMode::fixed(4), QSize()).isValid());
        QCOMPARE(GridSpec().outputPageCount(5), 0);
    }

    void testTilingModeParse() {
        TilingMode mode;
        QVERIFY(TilingMode::parse("auto", mode));
        QVERIFY(mode.isAuto);
        QVERIFY(TilingMode::parse(" AUTO ", mode));
        QVERIFY(mode.isAuto);

        QVERIFY(TilingMode::parse("6", mode));
        QCOMPARE(mode, TilingMode::fixed(6));

        // Parsed even without a grid shape; the planner falls back later
        QVERIFY(TilingMode::parse("12", mode));
        QCOMPARE(mode.tilesPerPage, 12);

        TilingMode untouched = TilingMode::fixed(2);
        QVERIFY(!TilingMode::parse("", untouched));
        QVERIFY(!TilingMode::parse("0", untouched));
        QVERIFY(!TilingMode::parse("-4", untouched));
        QVERIFY(!TilingMode::parse("four", untouched));
        QVERIFY(!TilingMode::parse("2x2", untouched));
        QCOMPARE(untouched, TilingMode::fixed(2));

        QCOMPARE(TilingMode::automatic().toString(), QString("auto"));
        QCOMPARE(TilingMode::fixed(9).toString(), QString("9"));
    }

    void testConfigDefaults() {
        HandoutConfig config = HandoutConfig::defaults();
        QCOMPARE(config.pageSize, QSizeF(612.0, 792.0));
        QCOMPARE(config.margin, 36.0);
        QCOMPARE(config.gap, 12.0);
        QCOMPARE(config.maxDpi, 300);
        QCOMPARE(config.borderWidth, 0.5);
        QCOMPARE(config.borderColor, QColor::fromRgbF(0.8, 0.8, 0.8));
        QCOMPARE(config.conversionTimeoutSec, 120);
        QVERIFY(config.defaultTiling.isAuto);
        QCOMPARE(config.clampDpi(600), 300);
        QCOMPARE(config.clampDpi(150), 150);
        QVERIFY(config.hasUsableGeometry());
    }

    void testConfigFromSettings() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QSettings settings(dir.filePath("handout.ini"), QSettings::IniFormat);
        settings.setValue("handout/margin", 18.0);
        settings.setValue("handout/gap", 6.0);
        settings.setValue("handout/maxDpi", 150);
        settings.setValue("handout/defaultTiling", "6");
        settings.setValue("handout/imageFormat", "jpg");
        settings.setValue("handout/borderColor", "#ff0000");
        settings.setValue("handout/conversionTimeoutSec", 30);

        HandoutConfig config = HandoutConfig::fromSettings(settings);
        QCOMPARE(config.margin, 18.0);
        QCOMPARE(config.gap, 6.0);
        QCOMPARE(config.maxDpi, 150);
        QCOMPARE(config.defaultTiling, TilingMode::fixed(6));
        QCOMPARE(config.imageFormat, QString("JPEG"));
        QCOMPARE(config.borderColor, QColor(Qt::red));
        QCOMPARE(config.conversionTimeoutSec, 30);
        QCOMPARE(config.pageSize, QSizeF(612.0, 792.0));
    }

    void testConfigRejectsInvalidSettings() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QSettings settings(dir.filePath("handout.ini"), QSettings::IniFormat);
        settings.setValue("handout/margin", 400.0);
        settings.setValue("handout/maxDpi", 0);
        settings.setValue("handout/defaultTiling", "lots");
        settings.setValue("handout/imageFormat", "TIFF");
        settings.setValue("handout/conversionTimeoutSec", -5);

        HandoutConfig config = HandoutConfig::fromSettings(settings);
        const HandoutConfig defaults = HandoutConfig::defaults();
        QCOMPARE(config.margin, defaults.margin);
        QCOMPARE(config.gap, defaults.gap);
        QCOMPARE(config.maxDpi, defaults.maxDpi);
        QVERIFY(config.defaultTiling.isAuto);
        QCOMPARE(config.imageFormat, QString("PNG"));
        QCOMPARE(config.conversionTimeoutSec, defaults.conversionTimeoutSec);
    }
};

#endif // LAYOUTPLANNERTESTS_H
