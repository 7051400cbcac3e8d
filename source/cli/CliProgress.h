#ifndef CLIPROGRESS_H
#define CLIPROGRESS_H

/**
 * @file CliProgress.h
 * @brief Console progress reporter for handout builds.
 *
 * Supports three output modes:
 * - Simple: One line per file (`[1/3] talk.pdf... OK (12 slides → 3 pages)`)
 * - Verbose: Input/output paths, layout and size per file
 * - JSON: One object per line for scripting
 */

#include "CliParser.h"
#include "../batch/BatchOperations.h"

#include <QTextStream>

class QJsonObject;

namespace Cli {

/**
 * @brief Progress reporter for console output.
 *
 * Usage:
 * @code
 *   ConsoleProgress progress(OutputMode::Simple);
 *   auto result = BatchOps::buildHandoutBatch(inputs, options, config,
 *       progress.callback(), nullptr,
 *       [&](int i, int n, const BatchOps::FileResult& fr) {
 *           progress.reportFile(i, n, fr);
 *           return true;
 *       });
 *   progress.reportSummary(result, options.dryRun);
 * @endcode
 */
class ConsoleProgress {
public:
    /**
     * @brief Construct a reporter writing to stdout/stderr.
     */
    explicit ConsoleProgress(OutputMode mode = OutputMode::Simple);

    /**
     * @brief Construct a reporter writing to the given devices.
     * @param out Receives progress, file results and the summary
     * @param err Receives errors and warnings
     */
    ConsoleProgress(OutputMode mode, QIODevice* out, QIODevice* err);

    OutputMode mode() const { return m_mode; }

    /**
     * @brief Progress callback for BatchOps (called before each file).
     */
    BatchOps::ProgressCallback callback();

    /**
     * @brief Per-slide progress for the deck being built (verbose mode only).
     *
     * Rewrites one "Placing slides n/m" line and ends it once the last
     * slide is placed.
     */
    BatchOps::TileProgressCallback tileCallback();

    /**
     * @brief Report one completed file.
     * @param index 1-based position in the batch
     * @param total Number of files in the batch
     * @param result The file result
     */
    void reportFile(int index, int total, const BatchOps::FileResult& result);

    /**
     * @brief Report the final batch summary.
     * @param dryRun Whether this was a dry run (affects messaging)
     */
    void reportSummary(const BatchOps::BatchResult& result, bool dryRun);

    /// Error on stderr (JSON object in JSON mode)
    void reportError(const QString& message);

    /// Warning on stderr (JSON object in JSON mode)
    void reportWarning(const QString& message);

    // Format file size for display (e.g., "1.5 MB")
    static QString formatSize(qint64 bytes);

    // Format duration for display (e.g., "1.5 s" or "125 ms")
    static QString formatDuration(qint64 ms);

private:
    void reportFileSimple(int index, int total, const BatchOps::FileResult& result);
    void reportFileVerbose(const BatchOps::FileResult& result);
    void reportFileJson(int index, int total, const BatchOps::FileResult& result);

    void reportDiagnostic(const QString& type, const QString& prefix, const QString& message);
    static void writeJsonLine(QTextStream& stream, const QJsonObject& object);

    // "12 slides → 3 pages", or "12 slides" when nothing was composed
    static QString pageSummary(const BatchOps::FileResult& result);

private:
    OutputMode m_mode;
    QTextStream m_out;
    QTextStream m_err;
};

} // namespace Cli

#endif // CLIPROGRESS_H
