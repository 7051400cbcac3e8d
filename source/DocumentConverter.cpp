#include "DocumentConverter.h"
#include <QFileInfo>
#include <QDir>
#include <QStandardPaths>
#include <QDebug>

bool DocumentConverter::needsConversion(const QString &filePath)
{
    if (filePath.isEmpty()) {
        return false;
    }

    const QString suffix = QFileInfo(filePath).suffix().toLower();
    return suffix == QLatin1String("ppt") ||
           suffix == QLatin1String("pptx") ||
           suffix == QLatin1String("odp");  // OpenDocument Presentation
}

QString DocumentConverter::statusName(ConversionStatus status)
{
    switch (status) {
        case Success:             return QStringLiteral("success");
        case LibreOfficeNotFound: return QStringLiteral("libreoffice_not_found");
        case ConversionFailed:    return QStringLiteral("conversion_failed");
        case Timeout:             return QStringLiteral("timeout");
        case InvalidFile:         return QStringLiteral("invalid_file");
    }
    return QStringLiteral("unknown");
}

// ============================================================================
// LibreOfficeConverter
// ============================================================================

LibreOfficeConverter::LibreOfficeConverter(QObject *parent)
    : QObject(parent)
{
}

LibreOfficeConverter::~LibreOfficeConverter()
{
    if (m_process) {
        if (m_process->state() != QProcess::NotRunning) {
            m_process->kill();
            m_process->waitForFinished(1000);
        }
        delete m_process;
    }
}

bool LibreOfficeConverter::isLibreOfficeAvailable()
{
    return !getLibreOfficePath().isEmpty();
}

QString LibreOfficeConverter::getLibreOfficePath()
{
    // PATH first, then the usual install locations
    const QStringList names = { QStringLiteral("soffice"), QStringLiteral("libreoffice") };
    for (const QString &name : names) {
        const QString found = QStandardPaths::findExecutable(name);
        if (!found.isEmpty()) {
            return found;
        }
    }

    QStringList possiblePaths;

#ifdef Q_OS_WIN
    possiblePaths << "C:/Program Files/LibreOffice/program/soffice.exe"
                  << "C:/Program Files (x86)/LibreOffice/program/soffice.exe"
                  << "C:/Program Files/LibreOffice/program/soffice.com"
                  << "C:/Program Files (x86)/LibreOffice/program/soffice.com";
#elif defined(Q_OS_MACOS)
    possiblePaths << "/Applications/LibreOffice.app/Contents/MacOS/soffice";
#else
    possiblePaths << "/usr/bin/soffice"
                  << "/usr/local/bin/soffice"
                  << "/usr/bin/libreoffice"
                  << "/usr/local/bin/libreoffice"
                  << "/usr/lib/libreoffice/program/soffice"
                  << "/opt/libreoffice/program/soffice"
                  << "/snap/bin/libreoffice";
#endif

    for (const QString &path : possiblePaths) {
        QFileInfo fileInfo(path);
        if (fileInfo.exists() && fileInfo.isExecutable()) {
            return path;
        }
    }

    return QString(); // Not found
}

QString LibreOfficeConverter::getInstallationInstructions()
{
#ifdef Q_OS_WIN
    return QObject::tr(
        "LibreOffice is required to convert presentation files.\n"
        "Download it from https://www.libreoffice.org/download/download/"
    );
#elif defined(Q_OS_MACOS)
    return QObject::tr(
        "LibreOffice is required to convert presentation files.\n"
        "Install it with: brew install --cask libreoffice"
    );
#else
    return QObject::tr(
        "LibreOffice is required to convert presentation files.\n"
        "Ubuntu/Debian: sudo apt install libreoffice-impress\n"
        "Fedora: sudo dnf install libreoffice-impress\n"
        "Arch: sudo pacman -S libreoffice-fresh"
    );
#endif
}

QString LibreOfficeConverter::convertToPdf(const QString &inputPath, const QString &outputDir,
                                           ConversionStatus &status)
{
    m_lastError.clear();

    QFileInfo inputFile(inputPath);
    if (!inputFile.exists() || !inputFile.isFile()) {
        m_lastError = tr("Input file does not exist or is not a file: %1").arg(inputPath);
        status = InvalidFile;
        return QString();
    }

    if (outputDir.isEmpty() || !QDir(outputDir).exists()) {
        m_lastError = tr("Output directory does not exist: %1").arg(outputDir);
        status = ConversionFailed;
        return QString();
    }

    const QString executable = getLibreOfficePath();
    if (executable.isEmpty()) {
        m_lastError = tr("LibreOffice not found on system");
        status = LibreOfficeNotFound;
        return QString();
    }

#ifdef SLIDEHANDOUT_DEBUG
    qDebug() << "[LibreOfficeConverter] Converting" << inputFile.fileName();
#endif

    const QString outputPdfPath = runConversion(executable, inputFile.absoluteFilePath(),
                                                outputDir, status);
    if (outputPdfPath.isEmpty()) {
        return QString();
    }

    QFileInfo outputFile(outputPdfPath);
    if (!outputFile.exists() || outputFile.size() == 0) {
        m_lastError = tr("Conversion completed but output PDF was not created or is empty");
        status = ConversionFailed;
        return QString();
    }

    status = Success;
    return outputPdfPath;
}

QString LibreOfficeConverter::runConversion(const QString &executable, const QString &inputPath,
                                            const QString &outputDir, ConversionStatus &status)
{
    QStringList args;
    args << "--headless"                    // Run without GUI
         << "--convert-to" << "pdf"
         << "--outdir" << outputDir
         << inputPath;

    delete m_process;
    m_process = new QProcess(this);
    m_process->setWorkingDirectory(outputDir);

#ifdef SLIDEHANDOUT_DEBUG
    qDebug() << "[LibreOfficeConverter] Starting:" << executable << args;
#endif

    m_process->start(executable, args);
    if (!m_process->waitForStarted()) {
        m_lastError = tr("Failed to start LibreOffice: %1").arg(m_process->errorString());
        status = ConversionFailed;
        qWarning() << "[LibreOfficeConverter]" << m_lastError;
        return QString();
    }

    if (!m_process->waitForFinished(m_timeoutMs)) {
        m_lastError = tr("Conversion timed out after %1 seconds").arg(m_timeoutMs / 1000);
        status = Timeout;
        qWarning() << "[LibreOfficeConverter] Conversion timeout for" << inputPath;
        m_process->kill();
        m_process->waitForFinished(1000);
        return QString();
    }

    const int exitCode = m_process->exitCode();
    if (m_process->exitStatus() != QProcess::NormalExit || exitCode != 0) {
        const QString errorOutput = QString::fromUtf8(m_process->readAllStandardError()).trimmed();
        m_lastError = tr("LibreOffice conversion failed with exit code %1: %2")
                          .arg(exitCode)
                          .arg(errorOutput.isEmpty() ? tr("(no error message)") : errorOutput);
        status = ConversionFailed;
        qWarning() << "[LibreOfficeConverter]" << m_lastError;
        return QString();
    }

    // soffice names the output after the input's base name
    QString outputPdfPath = QDir(outputDir).filePath(
        QFileInfo(inputPath).completeBaseName() + QStringLiteral(".pdf"));

    if (!QFile::exists(outputPdfPath)) {
        const QStringList pdfFiles = QDir(outputDir).entryList(QStringList() << "*.pdf", QDir::Files);
        if (pdfFiles.isEmpty()) {
            m_lastError = tr("Conversion appeared successful but no PDF was produced in %1")
                              .arg(outputDir);
            status = ConversionFailed;
            return QString();
        }
        outputPdfPath = QDir(outputDir).filePath(pdfFiles.first());
    }

    return outputPdfPath;
}
