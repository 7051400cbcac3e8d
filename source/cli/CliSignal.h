#ifndef CLISIGNAL_H
#define CLISIGNAL_H

/**
 * @file CliSignal.h
 * @brief Ctrl+C handling for handout batches.
 *
 * A signal only raises a flag. BatchOps checks it between decks, so the
 * deck being built always finishes and its output is either complete or
 * absent. The notice for the user is printed from normal code, never from
 * the handler.
 */

#include <atomic>

namespace Cli {

/**
 * @brief Route SIGINT/SIGTERM (CTRL_C_EVENT/CTRL_BREAK_EVENT on Windows)
 * to the cancellation flag.
 *
 * Call once at CLI startup. Safe to call again; later calls do nothing.
 */
void installSignalHandlers();

/**
 * @brief Put back the handlers that were active before installSignalHandlers().
 */
void restoreSignalHandlers();

/**
 * @brief The flag set by the handlers (never null).
 */
std::atomic<bool>* getCancellationFlag();

/**
 * @brief Check if cancellation was requested.
 */
bool wasCancelled();

/**
 * @brief Request cancellation from code (same effect as Ctrl+C).
 */
void requestCancellation();

/**
 * @brief Clear the flag, e.g. between test runs.
 */
void resetCancellation();

/**
 * @brief Print "finishing current deck" to stderr the first time a
 * cancellation is seen. Returns true if a cancellation is pending.
 */
bool noticeCancellation();

} // namespace Cli

#endif // CLISIGNAL_H
