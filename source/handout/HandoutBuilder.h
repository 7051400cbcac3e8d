#pragma once

// ============================================================================
// HandoutBuilder - Turns one slide deck into one handout PDF
// ============================================================================
// Pipeline for a single request:
//   validate -> convert (presentations only) -> open -> rasterize
//            -> plan -> compose -> write
//
// Every run is independent: nothing is cached between requests and the
// output file only appears once the whole document has been composed.
// ============================================================================

#include "HandoutConfig.h"
#include "LayoutPlanner.h"

#include <QByteArray>
#include <QObject>
#include <QString>

class DocumentConverter;
class PdfProvider;

/**
 * @brief What to build.
 */
struct HandoutRequest {
    QString inputPath;      ///< .pdf, or .ppt/.pptx/.odp when a converter is set
    QString outputPath;     ///< Target PDF (ignored by buildToBuffer)
    int dpi = 200;          ///< Must be > 0; values above the cap are clamped
    TilingMode tilingMode = TilingMode::automatic();
};

/**
 * @brief Why a build failed.
 */
enum class HandoutError {
    None,
    InvalidArguments,
    ConversionFailed,
    SourceUnreadable,       ///< Missing, corrupt or password-locked
    RenderFailed,
    ComposeFailed,
    WriteFailed
};

/**
 * @brief Outcome of one build.
 */
struct HandoutResult {
    bool success = false;
    QString errorMessage;
    HandoutError errorKind = HandoutError::None;

    int sourcePages = 0;
    int outputPages = 0;
    int tilesPerPage = 0;
    int columns = 0;
    int rows = 0;
    int dpiUsed = 0;
    qint64 fileSizeBytes = 0;   ///< Size of the written (or buffered) PDF
};

/**
 * @brief Runs the handout pipeline for single requests.
 *
 * The converter is borrowed, not owned, and may be null; presentation
 * inputs then fail with ConversionFailed.
 */
class HandoutBuilder : public QObject {
    Q_OBJECT

public:
    explicit HandoutBuilder(const HandoutConfig& config,
                            DocumentConverter* converter = nullptr,
                            QObject* parent = nullptr);

    /**
     * @brief Build the handout and write it to request.outputPath.
     *
     * The file is written through QSaveFile; on any failure the previous
     * content (or absence) of outputPath is left untouched. An outputPath
     * naming the input deck itself is rejected with InvalidArguments.
     */
    HandoutResult build(const HandoutRequest& request);

    /**
     * @brief Build the handout and return its bytes instead of writing a file.
     * @param pdfData Receives the finished PDF on success.
     */
    HandoutResult buildToBuffer(const HandoutRequest& request, QByteArray* pdfData);

    /**
     * @brief Rasterize, plan and compose from an already opened document.
     *
     * Used by buildToBuffer() once the source is open. Only dpi and
     * tilingMode of the request are read.
     */
    HandoutResult composeFromProvider(const PdfProvider& provider,
                                      const HandoutRequest& request,
                                      QByteArray* pdfData);

    const HandoutConfig& config() const { return m_config; }

    static QString errorKindName(HandoutError kind);

    /**
     * @brief Resolved form of a path, for telling whether two paths name
     * the same file.
     *
     * Symlinks and relative spellings are resolved through the nearest
     * existing directory, so a file that does not exist yet still compares
     * equal to other spellings of its location.
     */
    static QString resolvedPath(const QString& path);

signals:
    /**
     * @brief Emitted while tiles are placed.
     * @param current Tiles placed so far
     * @param total Total tiles (source pages)
     */
    void progressUpdated(int current, int total);

private:
    HandoutResult validate(const HandoutRequest& request, bool needsOutput) const;
    static HandoutResult failure(HandoutError kind, const QString& message);

    HandoutConfig m_config;
    DocumentConverter* m_converter = nullptr;
};
