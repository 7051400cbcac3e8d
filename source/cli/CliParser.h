#ifndef CLIPARSER_H
#define CLIPARSER_H

/**
 * @file CliParser.h
 * @brief Command-line argument parsing for SlideHandout.
 *
 * Supported commands:
 * - build: Turn slide decks (PDF, PPT, PPTX, ODP) into printable handouts
 *
 * plus the global --help and --version flags.
 */

#include "../handout/TilingMode.h"

#include <QString>
#include <QStringList>
#include <QCommandLineParser>

class QCoreApplication;

namespace Cli {

// =============================================================================
// CLI Commands
// =============================================================================

/**
 * @brief Known CLI commands.
 */
enum class Command {
    None,           ///< No or unknown command - show help
    Help,           ///< Show help message
    Version,        ///< Show version information
    Build           ///< Build handouts
};

/**
 * @brief Output mode for CLI progress/results.
 */
enum class OutputMode {
    Simple,         ///< One line per file (default)
    Verbose,        ///< Detailed per-file info
    Json            ///< JSON lines for scripting
};

// =============================================================================
// Exit Codes
// =============================================================================

namespace ExitCode {
    constexpr int Success = 0;        ///< All operations succeeded
    constexpr int PartialFailure = 1; ///< Some files failed/skipped
    constexpr int TotalFailure = 2;   ///< All files failed
    constexpr int InvalidArgs = 3;    ///< Bad command line arguments
    constexpr int IoError = 4;        ///< Can't read/write files
    constexpr int Cancelled = 5;      ///< Operation cancelled (Ctrl+C)
}

// =============================================================================
// Command Detection
// =============================================================================

/**
 * @brief Parse the command keyword from the first argument.
 * @param args Full argument list including the program name
 * @return The detected command, or Command::None
 */
Command parseCommand(const QStringList& args);

/**
 * @brief Get command name as string (e.g., "build").
 */
QString commandName(Command cmd);

// =============================================================================
// Option Values
// =============================================================================

/**
 * @brief Parse a --tiles value ("auto" or a positive integer).
 * @param value Option text
 * @param mode Receives the parsed mode; untouched on failure
 * @return false if the value is not a valid tiling mode
 */
bool parseTilesOption(const QString& value, TilingMode& mode);

/**
 * @brief Parse a --dpi value (positive integer).
 * @param value Option text
 * @param dpi Receives the DPI; untouched on failure
 * @return false if the value is not a positive integer
 */
bool parseDpiOption(const QString& value, int& dpi);

// =============================================================================
// Parser Setup
// =============================================================================

/**
 * @brief Configure QCommandLineParser for a specific command.
 */
void setupParser(QCommandLineParser& parser, Command cmd);

/**
 * @brief Print help for a command (general help for None/Help).
 */
void showHelp(const QCommandLineParser& parser, Command cmd);

/**
 * @brief Print version information.
 */
void showVersion();

/**
 * @brief Version string compiled into the binary.
 */
QString versionString();

// =============================================================================
// Main Entry Point
// =============================================================================

/**
 * @brief Run the CLI on an argument list.
 *
 * Parses arguments, executes the requested command, and returns an exit
 * code. Does not install signal handlers.
 *
 * @param args Full argument list including the program name
 * @return Exit code (see ExitCode namespace)
 */
int runArguments(const QStringList& args);

/**
 * @brief CLI entry point from main().
 *
 * Installs Ctrl+C handling, then calls runArguments().
 */
int run(QCoreApplication& app);

} // namespace Cli

#endif // CLIPARSER_H
