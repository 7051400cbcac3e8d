#ifndef INPUTDISCOVERY_H
#define INPUTDISCOVERY_H

/**
 * @file InputDiscovery.h
 * @brief Finds slide decks to turn into handouts.
 *
 * Supported inputs are PDF files and presentations that can be converted
 * to PDF (.ppt, .pptx, .odp).
 */

#include <QString>
#include <QStringList>

namespace BatchOps {

/**
 * @brief Check if a file has a supported deck extension.
 * @param path File path (only the suffix is inspected)
 * @return true for .pdf, .ppt, .pptx, .odp (case-insensitive)
 */
bool isSupportedInput(const QString& path);

/**
 * @brief Find supported decks in a directory.
 *
 * @param directory Directory to search
 * @param recursive Search subdirectories
 * @return Absolute file paths, sorted alphabetically
 */
QStringList discoverInputs(const QString& directory, bool recursive = false);

/**
 * @brief Expand CLI input paths to a deck list.
 *
 * - Supported files -> included as-is
 * - Directories -> decks inside are discovered
 * - Unsupported files and non-existent paths -> skipped with a warning
 *
 * Glob patterns are expanded by the shell before reaching this function.
 *
 * @param inputPaths List of input paths from CLI
 * @param recursive Search subdirectories when an input is a directory
 * @return Absolute file paths, deduplicated and sorted
 */
QStringList expandInputPaths(const QStringList& inputPaths, bool recursive = false);

} // namespace BatchOps

#endif // INPUTDISCOVERY_H
