#ifndef CLIHANDLER_H
#define CLIHANDLER_H

/**
 * @file CliHandler.h
 * @brief Command handlers for the SlideHandout CLI.
 *
 * The build handler parses its options, expands input paths, runs the
 * batch and reports each file as soon as it completes.
 */

#include "CliParser.h"
#include "../batch/BatchOperations.h"

#include <QCommandLineParser>

namespace Cli {

/**
 * @brief Handle the build command with settings loaded from QSettings.
 *
 * @param parser The QCommandLineParser with parsed arguments
 * @return Exit code (see ExitCode namespace)
 */
int handleBuild(const QCommandLineParser& parser);

/**
 * @brief Handle the build command with an explicit configuration.
 *
 * Validates --tiles and --dpi (exit code InvalidArgs on bad values),
 * expands inputs, builds one handout per deck and reports results.
 *
 * @param parser The QCommandLineParser with parsed arguments
 * @param config Layout settings and defaults for --tiles/--dpi
 * @param converter Converter for presentations; nullptr uses LibreOffice
 * @return Exit code (see ExitCode namespace)
 */
int handleBuild(const QCommandLineParser& parser, const HandoutConfig& config,
                DocumentConverter* converter = nullptr);

/**
 * @brief Determine the output mode from parser options.
 *
 * Priority: --json > --verbose > Simple
 */
OutputMode getOutputMode(const QCommandLineParser& parser);

/**
 * @brief Determine exit code from batch result.
 *
 * - Nothing processed -> InvalidArgs (3)
 * - No errors -> Success (0)
 * - Every file failed to write -> IoError (4)
 * - Every file failed -> TotalFailure (2)
 * - Some failed -> PartialFailure (1)
 */
int exitCodeFromResult(const BatchOps::BatchResult& result);

} // namespace Cli

#endif // CLIHANDLER_H
