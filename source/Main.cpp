#include <QCoreApplication>
#include <QDebug>
#include <QTest>

#include "cli/CliParser.h"

// Test includes
#include "handout/LayoutPlannerTests.h"
#include "handout/HandoutBuilderTests.h"
#include "pdf/MuPdfComposerTests.h"
#include "batch/BatchOperationsTests.h"
#include "cli/CliTests.h"

#ifdef Q_OS_WIN
#include <windows.h>
#include <cstdio>
#endif

// ============================================================================
// Test Runners
// ============================================================================

static int runTests(const QString& testType, const QString& program)
{
#ifdef Q_OS_WIN
    if (AttachConsole(ATTACH_PARENT_PROCESS)) {
        freopen("CONOUT$", "w", stdout);
        freopen("CONOUT$", "w", stderr);
    }
#endif

    bool success = false;

    if (testType == "layout") {
        LayoutPlannerTests tests;
        // Only the program name: our own --test-* flag is not a QTest option
        return QTest::qExec(&tests, QStringList{program});
    } else if (testType == "composer") {
        success = MuPdfComposerTests::runAllTests();
    } else if (testType == "pipeline") {
        success = HandoutBuilderTests::runAllTests();
    } else if (testType == "batch") {
        success = BatchOperationsTests::runAllTests();
    } else if (testType == "cli") {
        success = CliTests::runAllTests();
    } else {
        qWarning() << "Unknown test suite:" << testType;
        return 1;
    }

    return success ? 0 : 1;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setOrganizationName("SlideHandout");
    app.setApplicationName("App");
    app.setApplicationVersion(QStringLiteral(SLIDEHANDOUT_VERSION));

    const QStringList args = app.arguments();
    if (args.size() == 2 && args.at(1).startsWith("--test-")) {
        return runTests(args.at(1).mid(7), args.at(0));
    }

    return Cli::run(app);
}
