#pragma once

// ============================================================================
// HandoutBuilderTests - End-to-end tests for the handout pipeline
// ============================================================================
// Source decks are synthesized with TestDecks into a temporary directory.
// Presentation inputs go through a fake converter, and the render-failure
// and empty-deck paths through a fake PdfProvider, so neither LibreOffice
// nor special fixture files are needed.
//
// Run with: slidehandout --test-pipeline
// ============================================================================

#include "HandoutBuilder.h"
#include "TestDecks.h"
#include "../DocumentConverter.h"
#include "../pdf/PdfProvider.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QVector>

namespace HandoutBuilderTests {

/**
 * @brief Converter that writes a synthetic deck instead of running soffice.
 */
class FakeConverter : public DocumentConverter {
public:
    explicit FakeConverter(int slides, bool succeed = true)
        : m_slides(slides), m_succeed(succeed) {}

    QString convertToPdf(const QString& inputPath, const QString& outputDir,
                         ConversionStatus& status) override
    {
        ++calls;
        if (!m_succeed) {
            m_error = QStringLiteral("soffice exited with code 1");
            status = ConversionFailed;
            return QString();
        }
        const QString out = QDir(outputDir).filePath(
            QFileInfo(inputPath).completeBaseName() + QStringLiteral(".pdf"));
        if (!TestDecks::makeDeck(out, m_slides, TestDecks::landscapeSlide(),
                                 QStringLiteral("Converted Deck"))) {
            m_error = QStringLiteral("could not write converted deck");
            status = ConversionFailed;
            return QString();
        }
        status = Success;
        return out;
    }

    QString lastError() const override { return m_error; }

    int calls = 0;

private:
    int m_slides;
    bool m_succeed;
    QString m_error;
};

/**
 * @brief In-memory document: fixed page count, optional failing page.
 *
 * Pages are landscape unless per-page sizes are given.
 */
class FakeProvider : public PdfProvider {
public:
    FakeProvider(int pages, int failingPage = -1)
        : m_pages(pages), m_failingPage(failingPage) {}

    explicit FakeProvider(const QVector<QSizeF>& pageSizes)
        : m_pages(pageSizes.size()), m_failingPage(-1), m_sizes(pageSizes) {}

    bool isValid() const override { return true; }
    bool isLocked() const override { return false; }
    int pageCount() const override { return m_pages; }
    QString title() const override { return QStringLiteral("Fake"); }
    QString filePath() const override { return QStringLiteral("fake.pdf"); }

    QSizeF pageSize(int pageIndex) const override
    {
        if (pageIndex < 0 || pageIndex >= m_pages) {
            return QSizeF();
        }
        return m_sizes.isEmpty() ? TestDecks::landscapeSlide() : m_sizes.at(pageIndex);
    }

    QImage renderPageToImage(int pageIndex, qreal dpi) const override
    {
        if (pageIndex < 0 || pageIndex >= m_pages || pageIndex == m_failingPage) {
            return QImage();
        }
        const QSizeF pt = pageSize(pageIndex);
        const QSize px(qRound(pt.width() * dpi / 72.0), qRound(pt.height() * dpi / 72.0));
        return TestDecks::makeSlide(TestDecks::slideColor(pageIndex), px);
    }

private:
    int m_pages;
    int m_failingPage;
    QVector<QSizeF> m_sizes;
};

inline HandoutRequest requestFor(const QString& input, const QString& output,
                                 const TilingMode& mode, int dpi = 72)
{
    HandoutRequest request;
    request.inputPath = input;
    request.outputPath = output;
    request.tilingMode = mode;
    request.dpi = dpi;
    return request;
}

/**
 * @brief 10 landscape slides, 4 per page -> 3 Letter pages on disk.
 */
inline bool testFixedTiling()
{
    qDebug() << "=== Test: fixed tiling ===";
    bool success = true;

    QTemporaryDir dir;
    const QString input = dir.filePath("deck.pdf");
    const QString output = dir.filePath("handout.pdf");
    if (!TestDecks::makeDeck(input, 10)) {
        qDebug() << "FAIL: could not write source deck";
        return false;
    }

    HandoutBuilder builder(HandoutConfig::defaults());
    HandoutResult result = builder.build(requestFor(input, output, TilingMode::fixed(4)));

    if (!result.success) {
        qDebug() << "FAIL: build failed:" << result.errorMessage;
        return false;
    }
    if (result.sourcePages != 10 || result.outputPages != 3 ||
        result.columns != 2 || result.rows != 2) {
        qDebug() << "FAIL: expected 10 -> 3 pages on 2x2, got" << result.sourcePages
                 << "->" << result.outputPages << "on" << result.columns << "x" << result.rows;
        success = false;
    }

    auto provider = PdfProvider::create(output);
    if (!provider || provider->pageCount() != 3) {
        qDebug() << "FAIL: output does not have 3 pages";
        return false;
    }
    QSizeF size = provider->pageSize(2);
    if (qAbs(size.width() - 612.0) > 0.5 || qAbs(size.height() - 792.0) > 0.5) {
        qDebug() << "FAIL: output page is" << size;
        success = false;
    }
    if (result.fileSizeBytes != QFileInfo(output).size()) {
        qDebug() << "FAIL: reported size" << result.fileSizeBytes
                 << "differs from file size" << QFileInfo(output).size();
        success = false;
    }

    if (success) {
        qDebug() << "  - 10 slides / 4 per page -> 3 pages: OK";
    }
    return success;
}

/**
 * @brief Auto mode: landscape decks get 2 per page, portrait decks 4.
 */
inline bool testAutoTiling()
{
    qDebug() << "=== Test: auto tiling ===";
    bool success = true;

    QTemporaryDir dir;
    const QString landscape = dir.filePath("landscape.pdf");
    const QString portrait = dir.filePath("portrait.pdf");
    if (!TestDecks::makeDeck(landscape, 5, TestDecks::landscapeSlide()) ||
        !TestDecks::makeDeck(portrait, 5, TestDecks::portraitSlide())) {
        qDebug() << "FAIL: could not write source decks";
        return false;
    }

    HandoutBuilder builder(HandoutConfig::defaults());
    QByteArray pdf;

    HandoutResult wide = builder.buildToBuffer(
        requestFor(landscape, QString(), TilingMode::automatic()), &pdf);
    if (!wide.success || wide.tilesPerPage != 2 || wide.outputPages != 3) {
        qDebug() << "FAIL: landscape auto should be 2/page, 3 pages; got"
                 << wide.tilesPerPage << wide.outputPages << wide.errorMessage;
        success = false;
    }

    HandoutResult tall = builder.buildToBuffer(
        requestFor(portrait, QString(), TilingMode::automatic()), &pdf);
    if (!tall.success || tall.tilesPerPage != 4 || tall.outputPages != 2) {
        qDebug() << "FAIL: portrait auto should be 4/page, 2 pages; got"
                 << tall.tilesPerPage << tall.outputPages << tall.errorMessage;
        success = false;
    }

    if (success) {
        qDebug() << "  - Landscape -> 2, portrait -> 4: OK";
    }
    return success;
}

inline bool colorNear(const QColor& a, const QColor& b, int tolerance = 8)
{
    return qAbs(a.red() - b.red()) <= tolerance &&
           qAbs(a.green() - b.green()) <= tolerance &&
           qAbs(a.blue() - b.blue()) <= tolerance;
}

/**
 * @brief A landscape first slide sets the grid; later portrait slides are
 * stretched into the same tile rectangle.
 */
inline bool testMixedAspectDeck()
{
    qDebug() << "=== Test: mixed aspect deck ===";
    bool success = true;

    QVector<QSizeF> sizes{TestDecks::landscapeSlide()};
    for (int i = 0; i < 4; ++i) {
        sizes.append(TestDecks::portraitSlide());
    }
    FakeProvider provider(sizes);

    HandoutBuilder builder(HandoutConfig::defaults());
    QByteArray pdf;
    HandoutResult result = builder.composeFromProvider(
        provider, requestFor(QStringLiteral("fake.pdf"), QString(), TilingMode::automatic()), &pdf);
    if (!result.success || result.tilesPerPage != 2 || result.outputPages != 3) {
        qDebug() << "FAIL: landscape first slide should give 2/page over 3 pages; got"
                 << result.tilesPerPage << result.outputPages << result.errorMessage;
        return false;
    }

    QTemporaryDir dir;
    const QString output = dir.filePath("mixed.pdf");
    QFile file(output);
    if (!file.open(QIODevice::WriteOnly) || file.write(pdf) != pdf.size()) {
        qDebug() << "FAIL: could not write handout";
        return false;
    }
    file.close();

    auto handout = PdfProvider::create(output);
    QImage page = handout ? handout->renderPageToImage(0, 72.0) : QImage();
    if (page.isNull()) {
        qDebug() << "FAIL: could not render handout page";
        return false;
    }

    // Slot 1 of page 0 holds slide 1, the first portrait one
    const GridSpec grid = LayoutPlanner(HandoutConfig::defaults())
                              .plan(TilingMode::automatic(), QSize(720, 540));
    const QRectF r = grid.tileRect(1);
    const qreal pageHeight = grid.pageSize.height();
    const int left = qRound(r.left());
    const int right = qRound(r.right());
    const int top = qRound(pageHeight - r.bottom());
    const int bottom = qRound(pageHeight - r.top());
    const int midX = qRound(r.center().x());
    const int midY = qRound(pageHeight - r.center().y());
    const QColor fill = TestDecks::slideColor(1);
    const QColor band = fill.darker(200);
    const QColor white(Qt::white);

    struct Sample { int x; int y; QColor expected; const char* where; };
    const Sample samples[] = {
        {midX, midY, fill, "centre"},
        {left + 4, bottom - 4, fill, "bottom-left"},
        {right - 4, bottom - 4, fill, "bottom-right"},
        {left + 4, top + 4, band, "top-left"},
        {right - 4, top + 4, band, "top-right"},
        {left - 6, midY, white, "left of tile"},
        {right + 6, midY, white, "right of tile"},
        {midX, top - 6, white, "above tile"},
        {midX, bottom + 6, white, "below tile"},
    };
    for (const Sample& sample : samples) {
        const QColor got = page.pixelColor(sample.x, sample.y);
        if (!colorNear(got, sample.expected)) {
            qDebug() << "FAIL:" << sample.where << "at" << sample.x << sample.y
                     << "expected" << sample.expected.name() << "got" << got.name();
            success = false;
        }
    }

    if (success) {
        qDebug() << "  - Portrait slide fills the landscape tile: OK";
    }
    return success;
}

/**
 * @brief Unsupported explicit counts fall back to 2x2.
 */
inline bool testUnsupportedCountFallsBack()
{
    qDebug() << "=== Test: unsupported tile count ===";

    QTemporaryDir dir;
    const QString input = dir.filePath("deck.pdf");
    if (!TestDecks::makeDeck(input, 3)) {
        qDebug() << "FAIL: could not write source deck";
        return false;
    }

    HandoutBuilder builder(HandoutConfig::defaults());
    QByteArray pdf;
    HandoutResult result = builder.buildToBuffer(
        requestFor(input, QString(), TilingMode::fixed(5)), &pdf);

    if (!result.success || result.tilesPerPage != 4 || result.columns != 2 || result.rows != 2) {
        qDebug() << "FAIL: 5 tiles should fall back to 2x2, got"
                 << result.columns << "x" << result.rows;
        return false;
    }

    qDebug() << "  - 5 tiles -> 2x2: OK";
    return true;
}

/**
 * @brief An empty document gives a valid zero-page handout.
 */
inline bool testEmptyDeck()
{
    qDebug() << "=== Test: empty deck ===";

    FakeProvider provider(0);
    HandoutBuilder builder(HandoutConfig::defaults());
    QByteArray pdf;
    HandoutResult result = builder.composeFromProvider(
        provider, requestFor(QStringLiteral("fake.pdf"), QString(), TilingMode::automatic()), &pdf);

    if (!result.success || result.outputPages != 0 || result.sourcePages != 0 ||
        !pdf.startsWith("%PDF")) {
        qDebug() << "FAIL: empty deck should give an empty PDF:" << result.errorMessage;
        return false;
    }

    qDebug() << "  - Zero pages -> empty PDF: OK";
    return true;
}

/**
 * @brief A page that fails to render aborts the run with its 1-based number.
 */
inline bool testRenderFailure()
{
    qDebug() << "=== Test: render failure ===";

    FakeProvider provider(5, 2);
    HandoutBuilder builder(HandoutConfig::defaults());
    QByteArray pdf;
    HandoutResult result = builder.composeFromProvider(
        provider, requestFor(QStringLiteral("fake.pdf"), QString(), TilingMode::fixed(4)), &pdf);

    if (result.success || result.errorKind != HandoutError::RenderFailed ||
        !result.errorMessage.contains(QStringLiteral("page 3")) || !pdf.isEmpty()) {
        qDebug() << "FAIL: expected RenderFailed on page 3, got"
                 << HandoutBuilder::errorKindName(result.errorKind) << result.errorMessage;
        return false;
    }

    qDebug() << "  - Render failure reported with page number: OK";
    return true;
}

/**
 * @brief Missing or corrupt sources fail and write nothing.
 */
inline bool testUnreadableSource()
{
    qDebug() << "=== Test: unreadable source ===";
    bool success = true;

    QTemporaryDir dir;
    const QString output = dir.filePath("out.pdf");
    HandoutBuilder builder(HandoutConfig::defaults());

    HandoutResult missing = builder.build(
        requestFor(dir.filePath("nope.pdf"), output, TilingMode::automatic()));
    if (missing.success || missing.errorKind != HandoutError::SourceUnreadable) {
        qDebug() << "FAIL: missing input should be SourceUnreadable";
        success = false;
    }

    const QString corrupt = dir.filePath("corrupt.pdf");
    QFile file(corrupt);
    if (file.open(QIODevice::WriteOnly)) {
        file.write("this is not a pdf at all");
        file.close();
    }
    HandoutResult broken = builder.build(requestFor(corrupt, output, TilingMode::automatic()));
    if (broken.success || broken.errorKind != HandoutError::SourceUnreadable) {
        qDebug() << "FAIL: corrupt input should be SourceUnreadable, got"
                 << HandoutBuilder::errorKindName(broken.errorKind);
        success = false;
    }

    if (QFile::exists(output)) {
        qDebug() << "FAIL: output must not be created on failure";
        success = false;
    }

    if (success) {
        qDebug() << "  - Missing/corrupt input rejected, nothing written: OK";
    }
    return success;
}

/**
 * @brief A failed build leaves an existing output file as it was.
 */
inline bool testExistingOutputPreservedOnFailure()
{
    qDebug() << "=== Test: existing output preserved ===";

    QTemporaryDir dir;
    const QString output = dir.filePath("out.pdf");
    QFile file(output);
    if (!file.open(QIODevice::WriteOnly)) {
        qDebug() << "FAIL: could not create placeholder";
        return false;
    }
    file.write("previous");
    file.close();

    HandoutBuilder builder(HandoutConfig::defaults());
    HandoutResult result = builder.build(
        requestFor(dir.filePath("missing.pdf"), output, TilingMode::automatic()));

    QFile check(output);
    if (result.success || !check.open(QIODevice::ReadOnly) || check.readAll() != "previous") {
        qDebug() << "FAIL: existing output was modified by a failed build";
        return false;
    }

    qDebug() << "  - Failed build leaves output untouched: OK";
    return true;
}

/**
 * @brief DPI <= 0 is rejected; DPI above the cap is clamped.
 */
inline bool testDpiHandling()
{
    qDebug() << "=== Test: DPI handling ===";
    bool success = true;

    QTemporaryDir dir;
    const QString input = dir.filePath("deck.pdf");
    if (!TestDecks::makeDeck(input, 1)) {
        qDebug() << "FAIL: could not write source deck";
        return false;
    }

    HandoutConfig config = HandoutConfig::defaults();
    config.maxDpi = 100;
    HandoutBuilder builder(config);
    QByteArray pdf;

    HandoutResult zero = builder.buildToBuffer(
        requestFor(input, QString(), TilingMode::automatic(), 0), &pdf);
    if (zero.success || zero.errorKind != HandoutError::InvalidArguments) {
        qDebug() << "FAIL: DPI 0 should be InvalidArguments";
        success = false;
    }

    HandoutResult high = builder.buildToBuffer(
        requestFor(input, QString(), TilingMode::automatic(), 600), &pdf);
    if (!high.success || high.dpiUsed != 100) {
        qDebug() << "FAIL: DPI 600 should be clamped to 100, got" << high.dpiUsed
                 << high.errorMessage;
        success = false;
    }

    if (success) {
        qDebug() << "  - DPI validated and clamped: OK";
    }
    return success;
}

/**
 * @brief Presentations go through the converter; its failures are reported.
 */
inline bool testPresentationConversion()
{
    qDebug() << "=== Test: presentation conversion ===";
    bool success = true;

    QTemporaryDir dir;
    const QString input = dir.filePath("talk.pptx");
    QFile file(input);
    if (file.open(QIODevice::WriteOnly)) {
        file.write("PK placeholder");
        file.close();
    }

    FakeConverter good(6);
    HandoutBuilder builder(HandoutConfig::defaults(), &good);
    HandoutResult converted = builder.build(
        requestFor(input, dir.filePath("talk-handout.pdf"), TilingMode::fixed(6)));
    if (!converted.success || good.calls != 1 || converted.outputPages != 1 ||
        converted.sourcePages != 6) {
        qDebug() << "FAIL: converted deck should give 1 page of 6:" << converted.errorMessage;
        success = false;
    }

    FakeConverter bad(6, false);
    HandoutBuilder failing(HandoutConfig::defaults(), &bad);
    HandoutResult failed = failing.build(
        requestFor(input, dir.filePath("never.pdf"), TilingMode::automatic()));
    if (failed.success || failed.errorKind != HandoutError::ConversionFailed ||
        !failed.errorMessage.contains(QStringLiteral("code 1"))) {
        qDebug() << "FAIL: converter failure should be ConversionFailed:" << failed.errorMessage;
        success = false;
    }

    HandoutBuilder noConverter(HandoutConfig::defaults());
    HandoutResult none = noConverter.build(
        requestFor(input, dir.filePath("never.pdf"), TilingMode::automatic()));
    if (none.success || none.errorKind != HandoutError::ConversionFailed) {
        qDebug() << "FAIL: presentation without converter should be ConversionFailed";
        success = false;
    }

    if (QFile::exists(dir.filePath("never.pdf"))) {
        qDebug() << "FAIL: failed conversion must not write output";
        success = false;
    }

    if (success) {
        qDebug() << "  - Conversion path and failures: OK";
    }
    return success;
}

/**
 * @brief Source title and producer end up in the handout.
 */
inline bool testTitleCarriedOver()
{
    qDebug() << "=== Test: title carried over ===";

    QTemporaryDir dir;
    const QString input = dir.filePath("deck.pdf");
    const QString output = dir.filePath("handout.pdf");
    if (!TestDecks::makeDeck(input, 2, TestDecks::landscapeSlide(), QStringLiteral("Lecture 4"))) {
        qDebug() << "FAIL: could not write source deck";
        return false;
    }

    HandoutBuilder builder(HandoutConfig::defaults());
    HandoutResult result = builder.build(requestFor(input, output, TilingMode::automatic()));
    auto provider = result.success ? PdfProvider::create(output) : nullptr;

    if (!provider || provider->title() != QStringLiteral("Lecture 4")) {
        qDebug() << "FAIL: title not carried over";
        return false;
    }

    qDebug() << "  - Title carried over: OK";
    return true;
}

/**
 * @brief Run all HandoutBuilder tests.
 * @return True if all tests pass.
 */
inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "HandoutBuilder Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testFixedTiling();
    allPass &= testAutoTiling();
    allPass &= testMixedAspectDeck();
    allPass &= testUnsupportedCountFallsBack();
    allPass &= testEmptyDeck();
    allPass &= testRenderFailure();
    allPass &= testUnreadableSource();
    allPass &= testExistingOutputPreservedOnFailure();
    allPass &= testDpiHandling();
    allPass &= testPresentationConversion();
    allPass &= testTitleCarriedOver();

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "All HandoutBuilder tests PASSED";
    } else {
        qDebug() << "Some HandoutBuilder tests FAILED";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace HandoutBuilderTests
