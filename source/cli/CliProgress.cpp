#include "CliProgress.h"

#include <QCoreApplication>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>

/**
 * @file CliProgress.cpp
 * @brief Console reporting for handout builds.
 *
 * @see CliProgress.h for API documentation
 */

namespace Cli {

namespace {

struct StatusLabels {
    const char* json;       ///< Machine value for the "status" field
    const char* simple;     ///< Simple mode tag
    const char* verbose;    ///< Verbose mode word
};

StatusLabels labelsFor(BatchOps::FileStatus status)
{
    switch (status) {
        case BatchOps::FileStatus::Success: return {"success", "OK", "Built"};
        case BatchOps::FileStatus::Skipped: return {"skipped", "SKIPPED", "Skipped"};
        case BatchOps::FileStatus::Error:   return {"error", "ERROR", "Error"};
    }
    return {"unknown", "?", "Unknown"};
}

QString tr(const char* text)
{
    return QCoreApplication::translate("CLI", text);
}

} // namespace

ConsoleProgress::ConsoleProgress(OutputMode mode)
    : m_mode(mode)
    , m_out(stdout)
    , m_err(stderr)
{
}

ConsoleProgress::ConsoleProgress(OutputMode mode, QIODevice* out, QIODevice* err)
    : m_mode(mode)
    , m_out(out)
    , m_err(err)
{
}

BatchOps::ProgressCallback ConsoleProgress::callback()
{
    return [this](int current, int total, const QString& deck, const QString& status) {
        // Only verbose mode announces a deck before it is built
        if (m_mode != OutputMode::Verbose) {
            return;
        }
        m_out << QStringLiteral("[%1/%2] %3: %4\n")
                 .arg(current).arg(total).arg(QFileInfo(deck).fileName(), status);
        m_out.flush();
    };
}

BatchOps::TileProgressCallback ConsoleProgress::tileCallback()
{
    return [this](int placed, int total) {
        if (m_mode != OutputMode::Verbose) {
            return;
        }
        m_out << "\r" << tr("  Placing slides %1/%2").arg(placed).arg(total);
        if (placed >= total) {
            m_out << "\n";
        }
        m_out.flush();
    };
}

// =============================================================================
// Per-deck lines
// =============================================================================

void ConsoleProgress::reportFile(int index, int total, const BatchOps::FileResult& result)
{
    if (m_mode == OutputMode::Json) {
        reportFileJson(index, total, result);
    } else if (m_mode == OutputMode::Verbose) {
        reportFileVerbose(result);
    } else {
        reportFileSimple(index, total, result);
    }
}

QString ConsoleProgress::pageSummary(const BatchOps::FileResult& result)
{
    if (result.pagesProcessed <= 0 && result.sourcePages > 0) {
        return tr("%1 slides").arg(result.sourcePages);
    }
    return tr("%1 slides → %2 pages").arg(result.sourcePages).arg(result.pagesProcessed);
}

void ConsoleProgress::reportFileSimple(int index, int total, const BatchOps::FileResult& result)
{
    // [1/3] talk.pdf... OK (12 slides → 3 pages)
    // [3/3] broken.pdf... ERROR: Cannot open PDF ...
    QString line = QStringLiteral("[%1/%2] %3... %4")
                       .arg(index).arg(total)
                       .arg(QFileInfo(result.inputPath).fileName(),
                            tr(labelsFor(result.status).simple));

    if (result.status == BatchOps::FileStatus::Success) {
        line += QStringLiteral(" (%1)").arg(pageSummary(result));
    } else if (result.status == BatchOps::FileStatus::Skipped && !result.message.isEmpty()) {
        line += QStringLiteral(" (%1)").arg(result.message);
    } else if (!result.message.isEmpty()) {
        line += QStringLiteral(": %1").arg(result.message);
    }

    m_out << line << "\n";
    m_out.flush();
}

void ConsoleProgress::reportFileVerbose(const BatchOps::FileResult& result)
{
    m_out << tr("  Input:  ") << result.inputPath << "\n";
    if (!result.outputPath.isEmpty()) {
        m_out << tr("  Output: ") << result.outputPath << "\n";
    }
    if (result.sourcePages > 0) {
        m_out << tr("  Slides: ") << pageSummary(result);
        if (result.tilesPerPage > 0) {
            m_out << tr(", %1 per page").arg(result.tilesPerPage);
        }
        m_out << "\n";
    }
    if (result.outputSize > 0) {
        m_out << tr("  Size:   ") << formatSize(result.outputSize) << "\n";
    }

    m_out << tr("  Status: ") << tr(labelsFor(result.status).verbose);
    if (!result.errorKind.isEmpty()) {
        m_out << " [" << result.errorKind << "]";
    }
    if (!result.message.isEmpty()) {
        m_out << " - " << result.message;
    }
    m_out << "\n\n";
    m_out.flush();
}

void ConsoleProgress::reportFileJson(int index, int total, const BatchOps::FileResult& result)
{
    QJsonObject line{
        {QStringLiteral("type"), QStringLiteral("file")},
        {QStringLiteral("index"), index},
        {QStringLiteral("total"), total},
        {QStringLiteral("input"), result.inputPath},
        {QStringLiteral("output"), result.outputPath},
        {QStringLiteral("status"), QString::fromLatin1(labelsFor(result.status).json)},
        {QStringLiteral("slides"), result.sourcePages},
        {QStringLiteral("pages"), result.pagesProcessed},
    };
    if (result.tilesPerPage > 0) {
        line.insert(QStringLiteral("tiles_per_page"), result.tilesPerPage);
    }
    if (result.outputSize > 0) {
        line.insert(QStringLiteral("size"), result.outputSize);
    }
    if (!result.errorKind.isEmpty()) {
        line.insert(QStringLiteral("error_kind"), result.errorKind);
    }
    if (!result.message.isEmpty()) {
        line.insert(QStringLiteral("message"), result.message);
    }

    writeJsonLine(m_out, line);
}

// =============================================================================
// Summary
// =============================================================================

void ConsoleProgress::reportSummary(const BatchOps::BatchResult& result, bool dryRun)
{
    if (m_mode == OutputMode::Json) {
        writeJsonLine(m_out, QJsonObject{
            {QStringLiteral("type"), QStringLiteral("summary")},
            {QStringLiteral("total"), result.totalCount()},
            {QStringLiteral("success"), result.successCount},
            {QStringLiteral("skipped"), result.skippedCount},
            {QStringLiteral("errors"), result.errorCount},
            {QStringLiteral("total_size"), result.totalOutputSize},
            {QStringLiteral("elapsed_ms"), result.elapsedMs},
            {QStringLiteral("dry_run"), dryRun},
            {QStringLiteral("cancelled"), result.cancelled},
        });
        return;
    }

    m_out << "\n" << (dryRun ? tr("=== Dry Run Summary ===\n") : tr("=== Summary ===\n"));
    m_out << tr("Decks:    ") << result.totalCount() << "\n";
    m_out << tr("Built:    ") << result.successCount << "\n";
    if (result.skippedCount > 0) {
        m_out << tr("Skipped:  ") << result.skippedCount << "\n";
    }
    if (result.errorCount > 0) {
        m_out << tr("Errors:   ") << result.errorCount << "\n";
    }
    if (result.cancelled) {
        m_out << tr("Cancelled before all decks were built\n");
    }
    if (!dryRun && result.totalOutputSize > 0) {
        m_out << tr("Size:     ") << formatSize(result.totalOutputSize) << "\n";
    }
    m_out << tr("Time:     ") << formatDuration(result.elapsedMs) << "\n";
    m_out.flush();
}

// =============================================================================
// Errors and warnings
// =============================================================================

void ConsoleProgress::reportError(const QString& message)
{
    reportDiagnostic(QStringLiteral("error"), tr("Error: "), message);
}

void ConsoleProgress::reportWarning(const QString& message)
{
    reportDiagnostic(QStringLiteral("warning"), tr("Warning: "), message);
}

void ConsoleProgress::reportDiagnostic(const QString& type, const QString& prefix,
                                       const QString& message)
{
    if (m_mode == OutputMode::Json) {
        writeJsonLine(m_err, QJsonObject{
            {QStringLiteral("type"), type},
            {QStringLiteral("message"), message},
        });
        return;
    }
    m_err << prefix << message << "\n";
    m_err.flush();
}

void ConsoleProgress::writeJsonLine(QTextStream& stream, const QJsonObject& object)
{
    stream << QString::fromUtf8(QJsonDocument(object).toJson(QJsonDocument::Compact)) << "\n";
    stream.flush();
}

// =============================================================================
// Formatting
// =============================================================================

QString ConsoleProgress::formatSize(qint64 bytes)
{
    if (bytes < 1024) {
        return QStringLiteral("%1 B").arg(bytes);
    }
    if (bytes < 1024 * 1024) {
        return QStringLiteral("%1 KB").arg(bytes / 1024.0, 0, 'f', 1);
    }
    return QStringLiteral("%1 MB").arg(bytes / (1024.0 * 1024.0), 0, 'f', 1);
}

QString ConsoleProgress::formatDuration(qint64 ms)
{
    if (ms < 1000) {
        return QStringLiteral("%1 ms").arg(ms);
    }
    if (ms < 60 * 1000) {
        return QStringLiteral("%1 s").arg(ms / 1000.0, 0, 'f', 1);
    }
    return QStringLiteral("%1m %2s").arg(ms / 60000).arg((ms % 60000) / 1000);
}

} // namespace Cli
