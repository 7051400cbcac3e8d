#include "BatchOperations.h"

#include "../DocumentConverter.h"
#include "../handout/HandoutBuilder.h"
#include "../pdf/PdfProvider.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QElapsedTimer>
#include <QHash>
#include <QSet>
#include <QDebug>

/**
 * @file BatchOperations.cpp
 * @brief Implementation of batch handout builds.
 *
 * @see BatchOperations.h for API documentation
 */

namespace BatchOps {

// =============================================================================
// Utility Functions
// =============================================================================

QString generateOutputPath(const QString& inputPath, const QString& outputDir)
{
    const QString baseName = QFileInfo(inputPath).completeBaseName();
    return QDir(outputDir).filePath(baseName + QStringLiteral(".pdf"));
}

bool isSingleFileOutput(const QString& outputPath)
{
    if (outputPath.isEmpty()) {
        return false;
    }

    if (outputPath.endsWith(QStringLiteral(".pdf"), Qt::CaseInsensitive)) {
        return true;
    }

    // Anything else (trailing separator, existing directory, bare name)
    // is treated as a directory
    return false;
}

static void recordResult(BatchResult& result, const FileResult& fr)
{
    switch (fr.status) {
        case FileStatus::Success:
            result.successCount++;
            result.totalOutputSize += fr.outputSize;
            break;
        case FileStatus::Skipped:
            result.skippedCount++;
            break;
        case FileStatus::Error:
            result.errorCount++;
            break;
    }
    result.results.append(fr);
}

/**
 * @brief Describe what a real run would do, without writing anything.
 */
static FileResult dryRunFile(const QString& inputPath, const QString& outputPath)
{
    FileResult fr;
    fr.inputPath = inputPath;
    fr.outputPath = outputPath;

    if (DocumentConverter::needsConversion(inputPath)) {
        fr.status = FileStatus::Success;
        fr.message = QObject::tr("Would convert and build: %1").arg(outputPath);
        return fr;
    }

    QString error;
    std::unique_ptr<PdfProvider> provider = PdfProvider::create(inputPath, &error);
    if (!provider) {
        fr.status = FileStatus::Error;
        fr.errorKind = HandoutBuilder::errorKindName(HandoutError::SourceUnreadable);
        fr.message = error;
        return fr;
    }

    fr.status = FileStatus::Success;
    fr.sourcePages = provider->pageCount();
    fr.message = QObject::tr("Would build: %1").arg(outputPath);
    return fr;
}

// =============================================================================
// Handout Batch
// =============================================================================

BatchResult buildHandoutBatch(const QStringList& inputPaths,
                              const HandoutBatchOptions& options,
                              const HandoutConfig& config,
                              ProgressCallback progress,
                              std::atomic<bool>* cancelled,
                              ResultCallback resultCb)
{
    BatchResult result;
    QElapsedTimer timer;
    timer.start();

    const int total = inputPaths.size();

    if (inputPaths.isEmpty()) {
        result.elapsedMs = timer.elapsed();
        return result;
    }

    if (options.outputPath.isEmpty()) {
        for (const QString& inputPath : inputPaths) {
            FileResult fr;
            fr.inputPath = inputPath;
            fr.status = FileStatus::Error;
            fr.errorKind = HandoutBuilder::errorKindName(HandoutError::InvalidArguments);
            fr.message = QObject::tr("No output path specified");
            recordResult(result, fr);
        }
        result.elapsedMs = timer.elapsed();
        return result;
    }

    // Determine single-file vs directory mode
    const bool singleFileMode = (inputPaths.size() == 1) && isSingleFileOutput(options.outputPath);

    QString outputDir;
    if (!singleFileMode) {
        outputDir = options.outputPath;
        QDir dir(outputDir);
        if (!dir.exists() && !options.dryRun && !dir.mkpath(QStringLiteral("."))) {
            for (const QString& inputPath : inputPaths) {
                FileResult fr;
                fr.inputPath = inputPath;
                fr.status = FileStatus::Error;
                fr.errorKind = HandoutBuilder::errorKindName(HandoutError::WriteFailed);
                fr.message = QObject::tr("Failed to create output directory: %1").arg(outputDir);
                recordResult(result, fr);
            }
            result.elapsedMs = timer.elapsed();
            return result;
        }
    }

    HandoutBuilder builder(config, options.converter);
    if (options.tileProgress) {
        QObject::connect(&builder, &HandoutBuilder::progressUpdated, options.tileProgress);
    }

    // Handouts must never land on a source deck or on each other
    QSet<QString> inputTargets;
    for (const QString& inputPath : inputPaths) {
        inputTargets.insert(HandoutBuilder::resolvedPath(inputPath));
    }
    QHash<QString, QString> claimedOutputs;     // resolved output -> deck that claimed it

    for (int i = 0; i < total; ++i) {
        const QString& inputPath = inputPaths.at(i);

        // Between files only; a build in progress is never interrupted
        if (cancelled && cancelled->load()) {
            result.cancelled = true;
            break;
        }

        if (progress) {
            progress(i + 1, total, inputPath, QObject::tr("Building handout..."));
        }

        const QString outputPath = singleFileMode
            ? options.outputPath
            : generateOutputPath(inputPath, outputDir);

        FileResult fr;
        fr.inputPath = inputPath;
        fr.outputPath = outputPath;

        const QString target = HandoutBuilder::resolvedPath(outputPath);
        const QString invalidArguments = HandoutBuilder::errorKindName(HandoutError::InvalidArguments);

        if (inputTargets.contains(target)) {
            fr.status = FileStatus::Error;
            fr.errorKind = invalidArguments;
            fr.message = QObject::tr("Output would replace a source deck: %1").arg(outputPath);
        } else if (claimedOutputs.contains(target)) {
            fr.status = FileStatus::Error;
            fr.errorKind = invalidArguments;
            fr.message = QObject::tr("Output %1 is already the handout of %2")
                             .arg(outputPath, QFileInfo(claimedOutputs.value(target)).fileName());
        } else if (QFile::exists(outputPath) && !options.overwrite) {
            fr.status = FileStatus::Skipped;
            fr.message = QObject::tr("Output file already exists");
        } else if (options.dryRun) {
            fr = dryRunFile(inputPath, outputPath);
        } else {
            HandoutRequest request;
            request.inputPath = inputPath;
            request.outputPath = outputPath;
            request.dpi = options.dpi;
            request.tilingMode = options.tilingMode;

            HandoutResult built = builder.build(request);
            fr.sourcePages = built.sourcePages;
            if (built.success) {
                fr.status = FileStatus::Success;
                fr.outputSize = built.fileSizeBytes;
                fr.pagesProcessed = built.outputPages;
                fr.tilesPerPage = built.tilesPerPage;
            } else {
                fr.status = FileStatus::Error;
                fr.errorKind = HandoutBuilder::errorKindName(built.errorKind);
                fr.message = built.errorMessage;
            }
        }

        if (!claimedOutputs.contains(target)) {
            claimedOutputs.insert(target, inputPath);
        }
        recordResult(result, fr);

        if (resultCb && !resultCb(i + 1, total, fr)) {
            result.stoppedEarly = (i + 1 < total);
            break;
        }
    }

    result.elapsedMs = timer.elapsed();

#ifdef SLIDEHANDOUT_DEBUG
    qDebug() << "[BatchOps] buildHandoutBatch complete:"
             << result.successCount << "success,"
             << result.skippedCount << "skipped,"
             << result.errorCount << "errors,"
             << result.elapsedMs << "ms";
#endif

    return result;
}

} // namespace BatchOps
