#include "CliParser.h"
#include "CliHandler.h"
#include "CliSignal.h"

#include <QCoreApplication>
#include <QTextStream>

/**
 * @file CliParser.cpp
 * @brief Implementation of CLI argument parsing.
 *
 * @see CliParser.h for API documentation
 */

namespace Cli {

// Application version (from CMakeLists.txt project VERSION)
static const char* APP_VERSION = SLIDEHANDOUT_VERSION;

// =============================================================================
// Command Detection
// =============================================================================

Command parseCommand(const QStringList& args)
{
    if (args.size() < 2) {
        return Command::None;
    }

    const QString& arg1 = args.at(1);

    if (arg1 == QLatin1String("build")) {
        return Command::Build;
    }
    if (arg1 == QLatin1String("--help") || arg1 == QLatin1String("-h") ||
        arg1 == QLatin1String("help")) {
        return Command::Help;
    }
    if (arg1 == QLatin1String("--version") || arg1 == QLatin1String("-v")) {
        return Command::Version;
    }

    return Command::None;
}

QString commandName(Command cmd)
{
    switch (cmd) {
        case Command::Build:   return QStringLiteral("build");
        case Command::Help:    return QStringLiteral("help");
        case Command::Version: return QStringLiteral("version");
        default:               return QString();
    }
}

// =============================================================================
// Option Values
// =============================================================================

bool parseTilesOption(const QString& value, TilingMode& mode)
{
    return TilingMode::parse(value, mode);
}

bool parseDpiOption(const QString& value, int& dpi)
{
    bool ok = false;
    const int parsed = value.trimmed().toInt(&ok);
    if (!ok || parsed <= 0) {
        return false;
    }
    dpi = parsed;
    return true;
}

// =============================================================================
// Parser Setup
// =============================================================================

void setupParser(QCommandLineParser& parser, Command cmd)
{
    parser.setApplicationDescription(
        QCoreApplication::translate("CLI", "SlideHandout - Print handouts from slide decks"));

    parser.addHelpOption();
    parser.addVersionOption();

    if (cmd != Command::Build) {
        return;
    }

    parser.addPositionalArgument(
        QStringLiteral("input"),
        QCoreApplication::translate("CLI", "Slide decks (.pdf, .ppt, .pptx, .odp) or directories"),
        QStringLiteral("[input...]"));

    parser.addOption(QCommandLineOption(
        {QStringLiteral("o"), QStringLiteral("output")},
        QCoreApplication::translate("CLI", "Output file (single) or directory (batch)"),
        QStringLiteral("path")));

    parser.addOption(QCommandLineOption(
        {QStringLiteral("t"), QStringLiteral("tiles")},
        QCoreApplication::translate("CLI", "Slides per page: auto, 1, 2, 4, 6 or 9"),
        QStringLiteral("mode")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("dpi"),
        QCoreApplication::translate("CLI", "Rasterization DPI (capped at the configured maximum)"),
        QStringLiteral("N")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("overwrite"),
        QCoreApplication::translate("CLI", "Overwrite existing output files")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("recursive"),
        QCoreApplication::translate("CLI", "Search input directories recursively")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("fail-fast"),
        QCoreApplication::translate("CLI", "Stop on first error")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("verbose"),
        QCoreApplication::translate("CLI", "Show detailed progress")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("json"),
        QCoreApplication::translate("CLI", "Output results as JSON")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("dry-run"),
        QCoreApplication::translate("CLI", "Preview without creating files")));
}

// =============================================================================
// Help and Version
// =============================================================================

void showHelp(const QCommandLineParser& parser, Command cmd)
{
    QTextStream out(stdout);

    if (cmd == Command::None || cmd == Command::Help) {
        out << QCoreApplication::translate("CLI",
            "Usage: slidehandout <command> [options] [files...]\n"
            "\n"
            "SlideHandout - Lays out slide decks several slides per page\n"
            "as a printable US Letter PDF handout.\n"
            "\n"
            "COMMANDS:\n"
            "  build           Build handouts from slide decks\n"
            "\n"
            "GLOBAL OPTIONS:\n"
            "  -h, --help      Show this help message\n"
            "  -v, --version   Show version information\n"
            "\n"
            "QUICK START:\n"
            "  # One deck, default layout (2 per page for wide slides, else 4)\n"
            "  slidehandout build lecture.pdf -o lecture-handout.pdf\n"
            "\n"
            "  # A folder of presentations, 6 per page\n"
            "  slidehandout build ~/Talks/ -o ~/Handouts/ --tiles 6\n"
            "\n"
            "EXIT CODES:\n"
            "  0   All operations succeeded\n"
            "  1   Some files failed or were skipped\n"
            "  2   All files failed\n"
            "  3   Invalid arguments\n"
            "  4   Output could not be written\n"
            "  5   Cancelled (Ctrl+C)\n"
            "\n"
            "Run 'slidehandout build --help' for build options.\n");
    } else if (cmd == Command::Build) {
        out << QCoreApplication::translate("CLI",
            "Usage: slidehandout build [OPTIONS] <input>... -o <output>\n"
            "\n"
            "Render every slide and lay them out on US Letter pages.\n"
            "PowerPoint and OpenDocument decks are converted with LibreOffice first.\n"
            "\n"
            "ARGUMENTS:\n"
            "  <input>...              Deck files or directories containing them\n"
            "\n"
            "OUTPUT OPTIONS:\n"
            "  -o, --output <path>     Output file (single) or directory (batch) [required]\n"
            "  --overwrite             Overwrite existing files\n"
            "\n"
            "LAYOUT OPTIONS:\n"
            "  -t, --tiles <mode>      auto (default), 1, 2, 4, 6 or 9 slides per page\n"
            "                          auto: 2 for landscape slides, 4 otherwise\n"
            "  --dpi <N>               Rasterization resolution (default: 200, max: 300)\n"
            "\n"
            "DISCOVERY OPTIONS:\n"
            "  --recursive             Search directories recursively\n"
            "\n"
            "COMMON OPTIONS:\n"
            "  --verbose               Show detailed progress\n"
            "  --json                  Output results as JSON\n"
            "  --fail-fast             Stop on first error\n"
            "  --dry-run               Preview without creating files\n"
            "  -h, --help              Show this help\n"
            "\n"
            "EXAMPLES:\n"
            "  # Custom output name\n"
            "  slidehandout build talk.pptx -o ~/Desktop/talk-notes.pdf\n"
            "\n"
            "  # Draft quality, 9 per page\n"
            "  slidehandout build deck.pdf -o out/ --tiles 9 --dpi 100\n"
            "\n"
            "  # Preview what would be built\n"
            "  slidehandout build ~/Talks/ -o ~/Handouts/ --recursive --dry-run\n");
    } else {
        out << parser.helpText();
    }
}

QString versionString()
{
    return QString::fromLatin1(APP_VERSION);
}

void showVersion()
{
    QTextStream out(stdout);
    out << "SlideHandout " << APP_VERSION << "\n";
}

// =============================================================================
// Main Entry Point
// =============================================================================

int runArguments(const QStringList& args)
{
    const Command cmd = parseCommand(args);

    if (cmd == Command::Version) {
        showVersion();
        return ExitCode::Success;
    }

    if (cmd == Command::Help || cmd == Command::None) {
        QCommandLineParser parser;
        setupParser(parser, Command::None);
        showHelp(parser, cmd);
        return (cmd == Command::Help) ? ExitCode::Success : ExitCode::InvalidArgs;
    }

    QCommandLineParser parser;
    setupParser(parser, cmd);

    // QCommandLineParser doesn't understand subcommands; drop the keyword
    QStringList commandArgs = args;
    commandArgs.removeAt(1);

    if (!parser.parse(commandArgs)) {
        QTextStream err(stderr);
        err << QCoreApplication::translate("CLI", "Error: ")
            << parser.errorText() << "\n\n";
        err.flush();
        showHelp(parser, cmd);
        return ExitCode::InvalidArgs;
    }

    if (parser.isSet(QStringLiteral("help"))) {
        showHelp(parser, cmd);
        return ExitCode::Success;
    }

    if (parser.isSet(QStringLiteral("version"))) {
        showVersion();
        return ExitCode::Success;
    }

    switch (cmd) {
        case Command::Build:
            return handleBuild(parser);
        default:
            return ExitCode::InvalidArgs;
    }
}

int run(QCoreApplication& app)
{
    installSignalHandlers();
    const int exitCode = runArguments(app.arguments());
    restoreSignalHandlers();
    return exitCode;
}

} // namespace Cli
