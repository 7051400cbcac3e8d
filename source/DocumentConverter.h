#ifndef DOCUMENTCONVERTER_H
#define DOCUMENTCONVERTER_H

#include <QString>
#include <QObject>
#include <QProcess>

// Converts presentation files (.ppt/.pptx/.odp) into PDF before they are
// rasterized. HandoutBuilder only talks to this interface so tests can
// substitute their own converter.
class DocumentConverter {
public:
    enum ConversionStatus {
        Success,
        LibreOfficeNotFound,
        ConversionFailed,
        Timeout,
        InvalidFile
    };

    virtual ~DocumentConverter() = default;

    // Convert inputPath into a PDF inside outputDir.
    // Returns the path to the converted PDF on success, empty string on failure
    virtual QString convertToPdf(const QString &inputPath, const QString &outputDir,
                                 ConversionStatus &status) = 0;

    // Get the last error message
    virtual QString lastError() const = 0;

    // Check if a file needs conversion (is it a presentation file?)
    static bool needsConversion(const QString &filePath);

    static QString statusName(ConversionStatus status);
};

// Runs LibreOffice headless to do the conversion.
class LibreOfficeConverter : public QObject, public DocumentConverter {
    Q_OBJECT

public:
    explicit LibreOfficeConverter(QObject *parent = nullptr);
    ~LibreOfficeConverter() override;

    // Check if LibreOffice is available on the system
    static bool isLibreOfficeAvailable();

    // Get the path to LibreOffice executable (empty if not found)
    static QString getLibreOfficePath();

    // Get user-friendly installation instructions based on platform
    static QString getInstallationInstructions();

    QString convertToPdf(const QString &inputPath, const QString &outputDir,
                         ConversionStatus &status) override;

    QString lastError() const override { return m_lastError; }

    // Milliseconds to wait for soffice before giving up (default 120 s)
    void setTimeoutMs(int timeoutMs) { m_timeoutMs = timeoutMs; }

private:
    QString runConversion(const QString &executable, const QString &inputPath,
                          const QString &outputDir, ConversionStatus &status);

    QString m_lastError;
    QProcess* m_process = nullptr;
    int m_timeoutMs = 120000;
};

#endif // DOCUMENTCONVERTER_H
