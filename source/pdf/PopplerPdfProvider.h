#pragma once

// ============================================================================
// PopplerPdfProvider - Slide deck access through Poppler-Qt6
// ============================================================================
// Default backend on glibc desktops. Renders with full antialiasing and
// slight hinting so slide text survives being shrunk onto a handout tile.
// ============================================================================

#include "PdfProvider.h"

#include <poppler/qt6/poppler-qt6.h>

#include <memory>

class PopplerPdfProvider : public PdfProvider {
public:
    /**
     * @brief Open a deck. Check isValid() before use.
     */
    explicit PopplerPdfProvider(const QString& pdfPath);

    bool isValid() const override { return m_document && !m_document->isLocked(); }
    bool isLocked() const override { return m_document && m_document->isLocked(); }
    int pageCount() const override { return isValid() ? m_document->numPages() : 0; }

    QString title() const override { return m_title; }
    QString filePath() const override { return m_path; }

    QSizeF pageSize(int pageIndex) const override;
    QImage renderPageToImage(int pageIndex, qreal dpi) const override;

private:
    std::unique_ptr<Poppler::Page> loadPage(int pageIndex) const;

    std::unique_ptr<Poppler::Document> m_document;
    QString m_path;

    QString m_title;
};
