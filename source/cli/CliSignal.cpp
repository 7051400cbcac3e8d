#include "CliSignal.h"

#include <QCoreApplication>
#include <QTextStream>

#ifdef Q_OS_WIN
#include <windows.h>
#else
#include <csignal>
#endif

/**
 * @file CliSignal.cpp
 * @brief Implementation of Ctrl+C handling for the CLI.
 *
 * @see CliSignal.h for API documentation
 */

namespace Cli {

static std::atomic<bool> g_cancelled(false);
static std::atomic<bool> g_noticePrinted(false);
static bool g_installed = false;

#ifdef Q_OS_WIN

static BOOL WINAPI consoleCtrlHandler(DWORD ctrlType)
{
    if (ctrlType == CTRL_C_EVENT || ctrlType == CTRL_BREAK_EVENT) {
        g_cancelled = true;
        return TRUE;    // handled; keep the process alive
    }
    return FALSE;       // close/logoff/shutdown: default handling
}

void installSignalHandlers()
{
    if (g_installed) {
        return;
    }
    g_installed = SetConsoleCtrlHandler(consoleCtrlHandler, TRUE) != 0;
}

void restoreSignalHandlers()
{
    if (!g_installed) {
        return;
    }
    SetConsoleCtrlHandler(consoleCtrlHandler, FALSE);
    g_installed = false;
}

#else

static struct sigaction g_previousInt;
static struct sigaction g_previousTerm;

// Async-signal-safe: store to a lock-free atomic only
static void cancelHandler(int)
{
    g_cancelled = true;
}

void installSignalHandlers()
{
    if (g_installed) {
        return;
    }

    struct sigaction sa;
    sa.sa_handler = cancelHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;    // no SA_RESTART: blocking waits return early

    sigaction(SIGINT, &sa, &g_previousInt);
    sigaction(SIGTERM, &sa, &g_previousTerm);
    g_installed = true;
}

void restoreSignalHandlers()
{
    if (!g_installed) {
        return;
    }
    sigaction(SIGINT, &g_previousInt, nullptr);
    sigaction(SIGTERM, &g_previousTerm, nullptr);
    g_installed = false;
}

#endif

std::atomic<bool>* getCancellationFlag()
{
    return &g_cancelled;
}

bool wasCancelled()
{
    return g_cancelled.load();
}

void requestCancellation()
{
    g_cancelled = true;
}

void resetCancellation()
{
    g_cancelled = false;
    g_noticePrinted = false;
}

bool noticeCancellation()
{
    if (!g_cancelled.load()) {
        return false;
    }
    if (!g_noticePrinted.exchange(true)) {
        QTextStream err(stderr);
        err << QCoreApplication::translate("CLI",
                   "\nCancellation requested. Finishing current deck...\n");
        err.flush();
    }
    return true;
}

} // namespace Cli
