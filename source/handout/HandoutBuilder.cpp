// ============================================================================
// HandoutBuilder - Implementation
// ============================================================================

#include "HandoutBuilder.h"
#include "Rasterizer.h"
#include "../DocumentConverter.h"
#include "../pdf/MuPdfComposer.h"
#include "../pdf/PdfProvider.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QSaveFile>
#include <QTemporaryDir>

HandoutBuilder::HandoutBuilder(const HandoutConfig& config, DocumentConverter* converter,
                               QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_converter(converter)
{
}

QString HandoutBuilder::errorKindName(HandoutError kind)
{
    switch (kind) {
        case HandoutError::None:             return QStringLiteral("none");
        case HandoutError::InvalidArguments: return QStringLiteral("invalid_arguments");
        case HandoutError::ConversionFailed: return QStringLiteral("conversion_failed");
        case HandoutError::SourceUnreadable: return QStringLiteral("source_unreadable");
        case HandoutError::RenderFailed:     return QStringLiteral("render_failed");
        case HandoutError::ComposeFailed:    return QStringLiteral("compose_failed");
        case HandoutError::WriteFailed:      return QStringLiteral("write_failed");
    }
    return QStringLiteral("unknown");
}

QString HandoutBuilder::resolvedPath(const QString& path)
{
    const QFileInfo info(path);
    QString resolved = info.canonicalFilePath();
    if (resolved.isEmpty()) {
        const QString dir = QFileInfo(info.absolutePath()).canonicalFilePath();
        resolved = dir.isEmpty() ? QDir::cleanPath(info.absoluteFilePath())
                                 : QDir(dir).filePath(info.fileName());
    }
#if defined(Q_OS_WIN) || defined(Q_OS_MACOS)
    // Case-insensitive file systems
    resolved = resolved.toLower();
#endif
    return resolved;
}

HandoutResult HandoutBuilder::failure(HandoutError kind, const QString& message)
{
    HandoutResult result;
    result.errorKind = kind;
    result.errorMessage = message;
    return result;
}

HandoutResult HandoutBuilder::validate(const HandoutRequest& request, bool needsOutput) const
{
    if (request.inputPath.isEmpty()) {
        return failure(HandoutError::InvalidArguments, tr("No input file given"));
    }
    if (needsOutput && request.outputPath.isEmpty()) {
        return failure(HandoutError::InvalidArguments, tr("No output path given"));
    }
    if (request.dpi <= 0) {
        return failure(HandoutError::InvalidArguments,
                       tr("DPI must be a positive number (got %1)").arg(request.dpi));
    }
    if (!request.tilingMode.isAuto && request.tilingMode.tilesPerPage <= 0) {
        return failure(HandoutError::InvalidArguments,
                       tr("Tiles per page must be positive (got %1)")
                           .arg(request.tilingMode.tilesPerPage));
    }

    HandoutResult ok;
    ok.success = true;
    return ok;
}

// ============================================================================
// Pipeline
// ============================================================================

HandoutResult HandoutBuilder::build(const HandoutRequest& request)
{
    HandoutResult check = validate(request, true);
    if (!check.success) {
        return check;
    }
    if (resolvedPath(request.inputPath) == resolvedPath(request.outputPath)) {
        return failure(HandoutError::InvalidArguments,
                       tr("Output would replace the source deck: %1").arg(request.outputPath));
    }

    QByteArray pdfData;
    HandoutResult result = buildToBuffer(request, &pdfData);
    if (!result.success) {
        return result;
    }

    // Nothing reaches outputPath unless commit() succeeds
    QSaveFile file(request.outputPath);
    if (!file.open(QIODevice::WriteOnly)) {
        return failure(HandoutError::WriteFailed,
                       tr("Cannot write output file: %1 (%2)")
                           .arg(request.outputPath, file.errorString()));
    }
    if (file.write(pdfData) != pdfData.size()) {
        const QString reason = file.errorString();
        file.cancelWriting();
        return failure(HandoutError::WriteFailed,
                       tr("Failed to write output file: %1 (%2)").arg(request.outputPath, reason));
    }
    if (!file.commit()) {
        return failure(HandoutError::WriteFailed,
                       tr("Failed to save output file: %1 (%2)")
                           .arg(request.outputPath, file.errorString()));
    }

    result.fileSizeBytes = QFileInfo(request.outputPath).size();
    qDebug() << "[HandoutBuilder] Wrote" << request.outputPath
             << "(" << result.outputPages << "pages," << result.fileSizeBytes << "bytes)";
    return result;
}

HandoutResult HandoutBuilder::buildToBuffer(const HandoutRequest& request, QByteArray* pdfData)
{
    HandoutResult check = validate(request, false);
    if (!check.success) {
        return check;
    }
    if (!pdfData) {
        return failure(HandoutError::InvalidArguments, tr("No output buffer given"));
    }

    if (!QFileInfo::exists(request.inputPath)) {
        return failure(HandoutError::SourceUnreadable,
                       tr("File not found: %1").arg(request.inputPath));
    }

    // Converted PDF lives here until composition is done
    QTemporaryDir conversionDir;
    QString pdfPath = request.inputPath;

    if (DocumentConverter::needsConversion(request.inputPath)) {
        if (!m_converter) {
            return failure(HandoutError::ConversionFailed,
                           tr("No presentation converter available for %1")
                               .arg(request.inputPath));
        }
        if (!conversionDir.isValid()) {
            return failure(HandoutError::ConversionFailed,
                           tr("Failed to create temporary directory for conversion"));
        }

        DocumentConverter::ConversionStatus status = DocumentConverter::ConversionFailed;
        pdfPath = m_converter->convertToPdf(request.inputPath, conversionDir.path(), status);
        if (status != DocumentConverter::Success || pdfPath.isEmpty()) {
            QString reason = m_converter->lastError();
            if (reason.isEmpty()) {
                reason = DocumentConverter::statusName(status);
            }
            return failure(HandoutError::ConversionFailed,
                           tr("Conversion failed for %1: %2").arg(request.inputPath, reason));
        }
#ifdef SLIDEHANDOUT_DEBUG
        qDebug() << "[HandoutBuilder] Converted" << request.inputPath << "->" << pdfPath;
#endif
    }

    QString openError;
    std::unique_ptr<PdfProvider> provider = PdfProvider::create(pdfPath, &openError);
    if (!provider) {
        return failure(HandoutError::SourceUnreadable, openError);
    }

    return composeFromProvider(*provider, request, pdfData);
}

HandoutResult HandoutBuilder::composeFromProvider(const PdfProvider& provider,
                                                  const HandoutRequest& request,
                                                  QByteArray* pdfData)
{
    HandoutResult check = validate(request, false);
    if (!check.success) {
        return check;
    }
    if (!pdfData) {
        return failure(HandoutError::InvalidArguments, tr("No output buffer given"));
    }
    if (!provider.isValid()) {
        return failure(HandoutError::SourceUnreadable,
                       provider.isLocked()
                           ? tr("PDF is password-protected: %1").arg(provider.filePath())
                           : tr("Cannot open PDF (corrupt or unsupported): %1")
                                 .arg(provider.filePath()));
    }

    const int dpi = m_config.clampDpi(request.dpi);
    if (dpi != request.dpi) {
        qDebug() << "[HandoutBuilder] DPI" << request.dpi << "clamped to" << dpi;
    }

    // ===== Rasterize =====
    Rasterizer rasterizer(dpi);
    RasterResult raster = rasterizer.rasterize(provider);
    if (!raster.success) {
        return failure(HandoutError::RenderFailed, raster.errorMessage);
    }

    // ===== Plan =====
    // An empty deck has no first image; plan against a square placeholder so
    // the empty document still gets a valid layout (auto resolves to 4).
    const QSize firstSize = raster.images.isEmpty() ? QSize(1, 1) : raster.images.first().size();
    LayoutPlanner planner(m_config);
    GridSpec grid = planner.plan(request.tilingMode, firstSize);
    if (!grid.isValid()) {
        return failure(HandoutError::ComposeFailed,
                       tr("Cannot lay out %1x%2 slides on the page")
                           .arg(firstSize.width()).arg(firstSize.height()));
    }

    // ===== Compose =====
    ComposeOptions options;
    options.title = provider.title();
    options.producer = QStringLiteral("SlideHandout " SLIDEHANDOUT_VERSION);
    options.borderColor = m_config.borderColor;
    options.borderWidth = m_config.borderWidth;
    options.imageFormat = m_config.imageFormat;
    options.jpegQuality = m_config.jpegQuality;

    MuPdfComposer composer;
    connect(&composer, &MuPdfComposer::progressUpdated,
            this, &HandoutBuilder::progressUpdated);

    ComposeResult composed = composer.compose(raster.images, grid, options);
    if (!composed.success) {
        return failure(HandoutError::ComposeFailed, composed.errorMessage);
    }

    *pdfData = composed.pdfData;

    HandoutResult result;
    result.success = true;
    result.sourcePages = raster.images.size();
    result.outputPages = composed.pagesComposed;
    result.tilesPerPage = grid.tilesPerPage;
    result.columns = grid.columns;
    result.rows = grid.rows;
    result.dpiUsed = dpi;
    result.fileSizeBytes = pdfData->size();
    return result;
}
