#pragma once

// ============================================================================
// MuPdfComposer - Builds the handout PDF with MuPDF
// ============================================================================
// Places rasterized slides onto US Letter pages following a GridSpec:
// - Each slide is embedded once as an image XObject
// - Every tile gets a thin stroked outline
// - A page is sealed as soon as its grid is full or the slides run out
//
// The document is built in memory and only handed out by finalize(), after
// which it is sealed. Nothing is written to disk here; HandoutBuilder owns
// the output file.
// ============================================================================

#include "../handout/LayoutPlanner.h"

#include <QByteArray>
#include <QColor>
#include <QImage>
#include <QObject>
#include <QString>
#include <QVector>

// Forward declarations for MuPDF types (avoid exposing mupdf headers in public API)
struct fz_context;
struct pdf_document;
struct pdf_obj;

/**
 * @brief Appearance and metadata options for a composed handout.
 */
struct ComposeOptions {
    QString title;                          ///< Info/Title (usually the source title)
    QString producer = QStringLiteral("SlideHandout");
    QColor borderColor = QColor::fromRgbF(0.8, 0.8, 0.8);
    qreal borderWidth = 0.5;                ///< 0 disables the outline
    QString imageFormat = QStringLiteral("PNG");  ///< "PNG" or "JPEG"
    int jpegQuality = 85;
};

/**
 * @brief Result of a one-shot compose() call.
 */
struct ComposeResult {
    bool success = false;
    QString errorMessage;
    int pagesComposed = 0;
    int tilesPlaced = 0;
    QByteArray pdfData;     ///< Finished PDF; empty unless success
};

/**
 * @brief Append-only handout document builder.
 *
 * Thread Safety: Not thread-safe. One composer per run.
 *
 * Usage:
 * @code
 * MuPdfComposer composer;
 * composer.begin(grid, options);
 * for (const QImage& slide : slides) {
 *     composer.addTile(slide);
 * }
 * QByteArray pdf;
 * if (!composer.finalize(&pdf)) {
 *     qWarning() << composer.lastError();
 * }
 * @endcode
 */
class MuPdfComposer : public QObject {
    Q_OBJECT

public:
    explicit MuPdfComposer(QObject* parent = nullptr);
    ~MuPdfComposer() override;

    // Disable copy (MuPDF context is not copyable)
    MuPdfComposer(const MuPdfComposer&) = delete;
    MuPdfComposer& operator=(const MuPdfComposer&) = delete;

    /**
     * @brief Start a new empty output document.
     * @param grid Layout shared by every tile (must be valid).
     * @return false if the grid is invalid, a document is already open,
     *         or MuPDF could not be initialized.
     */
    bool begin(const GridSpec& grid, const ComposeOptions& options = {});

    /**
     * @brief Place the next slide in the next free cell.
     *
     * Starts a new page when needed and seals it once its grid is full.
     * The image is drawn at the grid's scaled size whatever its own size.
     *
     * @return false after finalize(), before begin(), or on a MuPDF error.
     */
    bool addTile(const QImage& image);

    /**
     * @brief Seal the document and serialize it.
     * @param pdfData Receives the PDF bytes.
     * @return false if already sealed, never begun, or serialization failed.
     *
     * A document with no tiles is valid and has zero pages.
     */
    bool finalize(QByteArray* pdfData);

    /**
     * @brief Compose all images in one call.
     *
     * Emits progressUpdated() after every placed tile.
     */
    ComposeResult compose(const QVector<QImage>& images, const GridSpec& grid,
                          const ComposeOptions& options = {});

    bool isOpen() const { return m_outputDoc != nullptr && !m_sealed; }
    bool isSealed() const { return m_sealed; }
    int pageCount() const { return m_pagesSealed; }
    int tileCount() const { return m_tilesPlaced; }
    QString lastError() const { return m_lastError; }

    /**
     * @brief Encode an image for embedding.
     * @param image Source image (flattened to RGB before encoding)
     * @param format "PNG" (lossless) or "JPEG"
     * @param jpegQuality 1-100, used for JPEG only
     * @return Encoded bytes, or empty on failure.
     */
    static QByteArray compressImage(const QImage& image, const QString& format, int jpegQuality);

signals:
    /**
     * @brief Emitted by compose() after each tile.
     * @param current Tiles placed so far (1-based)
     * @param total Total tiles to place
     */
    void progressUpdated(int current, int total);

private:
    // ===== Initialization =====
    bool initContext();
    void cleanup();

    // ===== Page Processing =====
    bool beginPage();
    bool sealPage();
    void dropPendingPage();

    // ===== Finalization =====
    bool writeMetadata();
    bool saveToBuffer(QByteArray* pdfData);

    void fail(const QString& message);

private:
    // MuPDF contexts
    fz_context* m_ctx = nullptr;
    pdf_document* m_outputDoc = nullptr;

    // Current (unsealed) page
    pdf_obj* m_pageResources = nullptr;
    pdf_obj* m_pageXObjects = nullptr;
    QByteArray m_pageContent;       ///< Content stream being built
    int m_slotOnPage = 0;           ///< Next free slot on the current page
    bool m_pageOpen = false;

    GridSpec m_grid;
    ComposeOptions m_options;
    int m_pagesSealed = 0;
    int m_tilesPlaced = 0;
    bool m_sealed = false;
    QString m_lastError;
};
