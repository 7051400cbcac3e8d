#include "CliHandler.h"
#include "CliProgress.h"
#include "CliSignal.h"
#include "../DocumentConverter.h"
#include "../batch/InputDiscovery.h"

#include <QCoreApplication>
#include <QDir>
#include <QSettings>

#include <algorithm>

/**
 * @file CliHandler.cpp
 * @brief Implementation of CLI command handlers.
 *
 * @see CliHandler.h for API documentation
 */

namespace Cli {

// =============================================================================
// Helper Functions
// =============================================================================

OutputMode getOutputMode(const QCommandLineParser& parser)
{
    if (parser.isSet(QStringLiteral("json"))) {
        return OutputMode::Json;
    }
    if (parser.isSet(QStringLiteral("verbose"))) {
        return OutputMode::Verbose;
    }
    return OutputMode::Simple;
}

int exitCodeFromResult(const BatchOps::BatchResult& result)
{
    if (result.totalCount() == 0) {
        return ExitCode::InvalidArgs;
    }
    if (result.errorCount == 0) {
        return ExitCode::Success;
    }
    if (result.successCount == 0 && result.skippedCount == 0) {
        const QString writeFailed = QStringLiteral("write_failed");
        bool allWriteErrors = true;
        for (const BatchOps::FileResult& fr : result.results) {
            if (fr.status == BatchOps::FileStatus::Error && fr.errorKind != writeFailed) {
                allWriteErrors = false;
                break;
            }
        }
        return allWriteErrors ? ExitCode::IoError : ExitCode::TotalFailure;
    }
    return ExitCode::PartialFailure;
}

// =============================================================================
// Build Handler
// =============================================================================

int handleBuild(const QCommandLineParser& parser)
{
    QSettings settings(QStringLiteral("SlideHandout"), QStringLiteral("App"));
    return handleBuild(parser, HandoutConfig::fromSettings(settings));
}

int handleBuild(const QCommandLineParser& parser, const HandoutConfig& config,
                DocumentConverter* converter)
{
    OutputMode outputMode = getOutputMode(parser);
    ConsoleProgress progress(outputMode);

    QStringList inputPaths = parser.positionalArguments();
    if (inputPaths.isEmpty()) {
        progress.reportError(QCoreApplication::translate("CLI",
            "No input files specified. Use 'slidehandout build --help' for usage."));
        return ExitCode::InvalidArgs;
    }

    QString outputPath = parser.value(QStringLiteral("output"));
    if (outputPath.isEmpty()) {
        progress.reportError(QCoreApplication::translate("CLI",
            "Output path required. Use -o or --output to specify destination."));
        return ExitCode::InvalidArgs;
    }
    outputPath = QDir::cleanPath(QDir::current().absoluteFilePath(outputPath));

    // Layout options, checked before any work starts
    TilingMode tiling = config.defaultTiling;
    if (parser.isSet(QStringLiteral("tiles")) &&
        !parseTilesOption(parser.value(QStringLiteral("tiles")), tiling)) {
        progress.reportError(QCoreApplication::translate("CLI",
            "Invalid --tiles value '%1'. Use auto or a positive number (1, 2, 4, 6, 9).")
            .arg(parser.value(QStringLiteral("tiles"))));
        return ExitCode::InvalidArgs;
    }

    int dpi = config.defaultDpi;
    if (parser.isSet(QStringLiteral("dpi")) &&
        !parseDpiOption(parser.value(QStringLiteral("dpi")), dpi)) {
        progress.reportError(QCoreApplication::translate("CLI",
            "Invalid --dpi value '%1'. DPI must be a positive whole number.")
            .arg(parser.value(QStringLiteral("dpi"))));
        return ExitCode::InvalidArgs;
    }
    if (dpi > config.maxDpi) {
        progress.reportWarning(QCoreApplication::translate("CLI",
            "DPI %1 exceeds the maximum; using %2.").arg(dpi).arg(config.maxDpi));
    }

    QStringList inputs = BatchOps::expandInputPaths(
        inputPaths, parser.isSet(QStringLiteral("recursive")));
    if (inputs.isEmpty()) {
        progress.reportError(QCoreApplication::translate("CLI",
            "No slide decks found in the specified paths."));
        return ExitCode::InvalidArgs;
    }

    if (inputs.size() > 1 && BatchOps::isSingleFileOutput(outputPath)) {
        progress.reportError(QCoreApplication::translate("CLI",
            "Cannot build %1 handouts into a single PDF file.\n"
            "Use a directory as output destination, e.g.: -o ~/Handouts/")
            .arg(inputs.size()));
        return ExitCode::InvalidArgs;
    }

    LibreOfficeConverter libreOffice;
    libreOffice.setTimeoutMs(config.conversionTimeoutSec * 1000);
    if (!converter && !LibreOfficeConverter::isLibreOfficeAvailable()) {
        const bool needsLibreOffice = std::any_of(inputs.cbegin(), inputs.cend(),
                                                  &DocumentConverter::needsConversion);
        if (needsLibreOffice) {
            progress.reportWarning(LibreOfficeConverter::getInstallationInstructions());
        }
    }

    BatchOps::HandoutBatchOptions options;
    options.outputPath = outputPath;
    options.dpi = dpi;
    options.tilingMode = tiling;
    options.overwrite = parser.isSet(QStringLiteral("overwrite"));
    options.dryRun = parser.isSet(QStringLiteral("dry-run"));
    options.converter = converter ? converter : &libreOffice;
    options.tileProgress = progress.tileCallback();

    const bool failFast = parser.isSet(QStringLiteral("fail-fast"));

    // Report each file as it completes; stop on the first error with --fail-fast
    auto onResult = [&](int current, int total, const BatchOps::FileResult& fileResult) {
        progress.reportFile(current, total, fileResult);
        noticeCancellation();
        if (failFast && fileResult.status == BatchOps::FileStatus::Error) {
            if (current < total) {
                progress.reportWarning(QCoreApplication::translate("CLI",
                    "Stopping due to --fail-fast flag."));
            }
            return false;
        }
        return true;
    };

    BatchOps::BatchResult result = BatchOps::buildHandoutBatch(
        inputs, options, config, progress.callback(), getCancellationFlag(), onResult);

    progress.reportSummary(result, options.dryRun);

    if (result.cancelled || wasCancelled()) {
        progress.reportWarning(QCoreApplication::translate("CLI",
            "Cancelled; %1 of %2 files processed.").arg(result.totalCount()).arg(inputs.size()));
        return ExitCode::Cancelled;
    }

    return exitCodeFromResult(result);
}

} // namespace Cli
