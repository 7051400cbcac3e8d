#ifndef BATCHOPERATIONS_H
#define BATCHOPERATIONS_H

/**
 * @file BatchOperations.h
 * @brief Batch handout builds for SlideHandout.
 *
 * Runs one independent HandoutBuilder pipeline per input deck and collects
 * per-file results. Used by the command-line interface.
 */

#include "../handout/HandoutConfig.h"

#include <QString>
#include <QStringList>
#include <QList>
#include <functional>
#include <atomic>

class DocumentConverter;

namespace BatchOps {

// =============================================================================
// Result Types
// =============================================================================

/**
 * @brief Status of a single file operation.
 */
enum class FileStatus {
    Success,        ///< Handout written (or would be, in dry-run mode)
    Skipped,        ///< Skipped (output exists, cancelled)
    Error           ///< Build failed
};

/**
 * @brief Result for a single file operation.
 */
struct FileResult {
    QString inputPath;              ///< Path to the source deck
    QString outputPath;             ///< Path to the handout (empty if not determined)
    FileStatus status = FileStatus::Error;
    QString message;                ///< Error message or skip reason
    QString errorKind;              ///< HandoutBuilder::errorKindName() on error
    qint64 outputSize = 0;          ///< Output file size in bytes (0 if not created)
    int sourcePages = 0;            ///< Slides in the source deck
    int pagesProcessed = 0;         ///< Handout pages written
    int tilesPerPage = 0;           ///< Resolved tiles per handout page
};

/**
 * @brief Summary result for a batch operation.
 */
struct BatchResult {
    QList<FileResult> results;      ///< Per-file results
    int successCount = 0;
    int skippedCount = 0;
    int errorCount = 0;
    qint64 totalOutputSize = 0;     ///< Total size of all output files
    qint64 elapsedMs = 0;
    bool cancelled = false;         ///< Stopped early by the cancellation flag
    bool stoppedEarly = false;      ///< Stopped early by the result callback

    bool hasErrors() const { return errorCount > 0; }
    bool allSucceeded() const { return errorCount == 0 && skippedCount == 0; }
    int totalCount() const { return successCount + skippedCount + errorCount; }
};

// =============================================================================
// Callbacks
// =============================================================================

/**
 * @brief Progress callback, called before processing each file.
 *
 * @param current Current file index (1-based)
 * @param total Total number of files to process
 * @param currentFile Path to file being processed
 * @param status Brief status message (e.g., "Building handout...")
 */
using ProgressCallback = std::function<void(int current, int total,
                                            const QString& currentFile,
                                            const QString& status)>;

/**
 * @brief Result callback, called after each file with its result.
 *
 * Enables progressive output. Return false to stop processing the
 * remaining files (fail-fast).
 */
using ResultCallback = std::function<bool(int current, int total,
                                         const FileResult& result)>;

/**
 * @brief Tile progress within the deck being built.
 *
 * @param placed Slides placed on handout pages so far
 * @param total Slides in the deck
 */
using TileProgressCallback = std::function<void(int placed, int total)>;

// =============================================================================
// Options
// =============================================================================

/**
 * @brief Options for a handout batch.
 */
struct HandoutBatchOptions {
    QString outputPath;             ///< Output file (single input) or directory
    int dpi = 200;                  ///< Rasterization DPI (> 0, clamped to the cap)
    TilingMode tilingMode = TilingMode::automatic();
    bool overwrite = false;         ///< Overwrite existing output files
    bool dryRun = false;            ///< Preview only, don't create files
    DocumentConverter* converter = nullptr;  ///< For .ppt/.pptx/.odp inputs (borrowed)
    TileProgressCallback tileProgress;       ///< Optional, called per placed slide
};

// =============================================================================
// Batch Operation Functions
// =============================================================================

/**
 * @brief Build one handout per input deck.
 *
 * Output path handling:
 * - Single input + path ending in .pdf: writes exactly there
 * - Otherwise the output path is a directory and each deck becomes
 *   <basename>.pdf inside it (created if needed)
 *
 * A deck fails with "invalid_arguments" when its handout path names one of
 * the input decks, or a handout already claimed by an earlier deck of the
 * same batch (e.g. talk.pdf and talk.pptx into one directory).
 *
 * Each file runs to completion; cancellation is only checked between files.
 *
 * @param inputPaths Deck paths (see expandInputPaths)
 * @param options Batch options
 * @param config Layout and encoding settings shared by every file
 * @param progress Optional progress callback (called before each file)
 * @param cancelled Optional cancellation flag (checked between files)
 * @param resultCb Optional result callback (called after each file)
 * @return BatchResult with per-file results and summary
 */
BatchResult buildHandoutBatch(const QStringList& inputPaths,
                              const HandoutBatchOptions& options,
                              const HandoutConfig& config,
                              ProgressCallback progress = nullptr,
                              std::atomic<bool>* cancelled = nullptr,
                              ResultCallback resultCb = nullptr);

// =============================================================================
// Utility Functions
// =============================================================================

/**
 * @brief Generate the output file path for a deck in directory mode.
 *
 * Example: "/talks/Week1.pptx" + "/out" -> "/out/Week1.pdf"
 */
QString generateOutputPath(const QString& inputPath, const QString& outputDir);

/**
 * @brief Determine if output path names a single file rather than a directory.
 *
 * - Ends with .pdf: single file
 * - Ends with / or is an existing directory: directory
 * - Otherwise: assumed to be directory
 */
bool isSingleFileOutput(const QString& outputPath);

} // namespace BatchOps

#endif // BATCHOPERATIONS_H
