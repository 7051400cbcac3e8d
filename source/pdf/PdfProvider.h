#pragma once

// ============================================================================
// PdfProvider - Abstract interface for reading source PDFs
// ============================================================================
// The rasterizer only talks to this interface, so the rendering backend can
// be swapped per platform:
//   - Poppler-Qt6 on desktop Linux/macOS/Windows (glibc)
//   - MuPDF on musl systems, or when built with SLIDEHANDOUT_FORCE_MUPDF
//
// Page sizes are in PDF points (1/72 inch). Page indices are 0-based.
// ============================================================================

#include <QString>
#include <QSizeF>
#include <QImage>
#include <memory>

/**
 * @brief Abstract interface for PDF document access.
 *
 * One instance wraps one opened file. Instances are read-only and are
 * dropped as soon as all pages have been rendered.
 */
class PdfProvider {
public:
    virtual ~PdfProvider() = default;

    // ===== Document Info =====

    /**
     * @brief Check if the PDF was loaded successfully.
     * @return True if the file opened and is not locked.
     *
     * A document with zero pages is still valid.
     */
    virtual bool isValid() const = 0;

    /**
     * @brief Check if the PDF is password-protected and locked.
     */
    virtual bool isLocked() const = 0;

    /**
     * @brief Get the total number of pages.
     * @return Page count, or 0 if invalid.
     */
    virtual int pageCount() const = 0;

    /**
     * @brief Document Info title, trimmed; empty when the deck has none.
     */
    virtual QString title() const = 0;

    /**
     * @brief Get the file path this provider was loaded from.
     */
    virtual QString filePath() const = 0;

    // ===== Page Info =====

    /**
     * @brief Get the size of a page in points (1/72 inch).
     * @param pageIndex 0-based page index.
     * @return Page size in points, or empty QSizeF if out of range.
     */
    virtual QSizeF pageSize(int pageIndex) const = 0;

    // ===== Rendering =====

    /**
     * @brief Render a page to a QImage.
     * @param pageIndex 0-based page index.
     * @param dpi Resolution in dots per inch (zoom = dpi / 72).
     * @return Rendered image on a white background, or null QImage on error.
     *
     * No clamping is applied; callers pass an already bounded DPI.
     */
    virtual QImage renderPageToImage(int pageIndex, qreal dpi) const = 0;

    // ===== Factory =====

    /**
     * @brief Create a PdfProvider for the given file.
     * @param pdfPath Path to the PDF file.
     * @param errorMessage Optional; receives the reason when nullptr is returned.
     * @return Provider instance, or nullptr if the file is missing, corrupt
     *         or password-locked.
     *
     * The backend is chosen at compile time (see PdfProviderFactory.cpp).
     */
    static std::unique_ptr<PdfProvider> create(const QString& pdfPath,
                                               QString* errorMessage = nullptr);

    /**
     * @brief Name of the compiled-in backend ("MuPDF" or "Poppler").
     */
    static QString backendName();
};
