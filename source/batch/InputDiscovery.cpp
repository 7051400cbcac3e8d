#include "InputDiscovery.h"

#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QSet>
#include <QDebug>

/**
 * @file InputDiscovery.cpp
 * @brief Implementation of deck discovery utilities.
 *
 * @see InputDiscovery.h for API documentation
 */

namespace BatchOps {

static const QStringList kInputFilters = {
    QStringLiteral("*.pdf"), QStringLiteral("*.ppt"),
    QStringLiteral("*.pptx"), QStringLiteral("*.odp")
};

bool isSupportedInput(const QString& path)
{
    const QString suffix = QFileInfo(path).suffix().toLower();
    return suffix == QLatin1String("pdf") || suffix == QLatin1String("ppt") ||
           suffix == QLatin1String("pptx") || suffix == QLatin1String("odp");
}

// ============================================================================
// Directory Discovery
// ============================================================================

QStringList discoverInputs(const QString& directory, bool recursive)
{
    QStringList results;

    QDir dir(directory);
    if (!dir.exists()) {
        qWarning() << "[InputDiscovery] Directory does not exist:" << directory;
        return results;
    }

    const QString absPath = dir.absolutePath();

    // Name filters on QDir are case-insensitive on every platform
    QDirIterator it(absPath, kInputFilters, QDir::Files,
                    recursive ? QDirIterator::Subdirectories : QDirIterator::NoIteratorFlags);
    while (it.hasNext()) {
        results.append(QFileInfo(it.next()).absoluteFilePath());
    }

    results.sort(Qt::CaseInsensitive);
    return results;
}

// ============================================================================
// Path Expansion
// ============================================================================

QStringList expandInputPaths(const QStringList& inputPaths, bool recursive)
{
    QSet<QString> seen;  // For deduplication
    QStringList results;

    auto addUnique = [&](const QString& path) {
        if (!seen.contains(path)) {
            seen.insert(path);
            results.append(path);
        }
    };

    for (const QString& inputPath : inputPaths) {
        QFileInfo info(inputPath);

        if (!info.exists()) {
            qWarning() << "[InputDiscovery] Path does not exist:" << inputPath;
            continue;
        }

        if (info.isDir()) {
            const QStringList found = discoverInputs(info.absoluteFilePath(), recursive);
            for (const QString& file : found) {
                addUnique(file);
            }
        } else if (isSupportedInput(inputPath)) {
            addUnique(info.absoluteFilePath());
        } else {
            qWarning() << "[InputDiscovery] Unsupported file type, skipping:" << inputPath;
        }
    }

    results.sort(Qt::CaseInsensitive);
    return results;
}

} // namespace BatchOps
