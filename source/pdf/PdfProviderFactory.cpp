// ============================================================================
// PdfProviderFactory - Platform-specific PDF provider creation
// ============================================================================
// Selects the rendering backend at compile time:
//   - SLIDEHANDOUT_FORCE_MUPDF: MuPDF everywhere
//   - Alpine Linux (musl): MuPDF (avoids symbol collision with Poppler/OpenJPEG)
//   - Desktop (glibc, Windows, macOS): Poppler
// ============================================================================

#include "PdfProvider.h"

#include <QFileInfo>
#include <QObject>

#include <memory>

// On musl, MuPDF and Poppler both pull in OpenJPEG. When both are loaded as
// shared libraries MuPDF's custom allocators get called by Poppler's copy,
// so only MuPDF is used there. musl does not define __GLIBC__.

#if defined(SLIDEHANDOUT_FORCE_MUPDF)
    #define SLIDEHANDOUT_USE_MUPDF 1

#elif defined(__linux__) && !defined(__GLIBC__)
    #define SLIDEHANDOUT_USE_MUPDF 1

#else
    #define SLIDEHANDOUT_USE_POPPLER 1

#endif

#ifdef SLIDEHANDOUT_USE_MUPDF
#include "MuPdfProvider.h"
using PdfProviderImpl = MuPdfProvider;
static const char* BACKEND_NAME = "MuPDF";
#else
#include "PopplerPdfProvider.h"
using PdfProviderImpl = PopplerPdfProvider;
static const char* BACKEND_NAME = "Poppler";
#endif

// ============================================================================
// Factory Methods
// ============================================================================

std::unique_ptr<PdfProvider> PdfProvider::create(const QString& pdfPath, QString* errorMessage)
{
    QFileInfo info(pdfPath);
    if (!info.exists() || !info.isFile()) {
        if (errorMessage) {
            *errorMessage = QObject::tr("File not found: %1").arg(pdfPath);
        }
        return nullptr;
    }

    auto provider = std::make_unique<PdfProviderImpl>(pdfPath);
    if (provider->isValid()) {
        return provider;
    }

    if (errorMessage) {
        *errorMessage = provider->isLocked()
            ? QObject::tr("PDF is password-protected: %1").arg(info.fileName())
            : QObject::tr("Cannot open PDF (corrupt or unsupported): %1").arg(info.fileName());
    }
    return nullptr;
}

QString PdfProvider::backendName()
{
    return QString::fromLatin1(BACKEND_NAME);
}
