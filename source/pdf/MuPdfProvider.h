#pragma once

// ============================================================================
// MuPdfProvider - Slide deck access through MuPDF
// ============================================================================
// Selected on musl systems and by SLIDEHANDOUT_FORCE_MUPDF. The deck's
// metadata is read once when the file is opened; pages are loaded on demand
// for every size query or render.
// ============================================================================

#include "PdfProvider.h"

struct fz_context;
struct fz_document;
struct fz_rect;

class MuPdfProvider : public PdfProvider {
public:
    /**
     * @brief Open a deck. Check isValid() before use.
     */
    explicit MuPdfProvider(const QString& pdfPath);
    ~MuPdfProvider() override;

    MuPdfProvider(const MuPdfProvider&) = delete;
    MuPdfProvider& operator=(const MuPdfProvider&) = delete;

    bool isValid() const override { return m_doc != nullptr && !m_locked; }
    bool isLocked() const override { return m_locked; }
    int pageCount() const override { return isValid() ? m_pageCount : 0; }

    QString title() const override { return m_title; }
    QString filePath() const override { return m_path; }

    QSizeF pageSize(int pageIndex) const override;
    QImage renderPageToImage(int pageIndex, qreal dpi) const override;

private:
    bool open();
    QString lookupMetadata(const char* key) const;
    bool pageBounds(int pageIndex, fz_rect* bounds) const;
    bool hasPage(int pageIndex) const;

    fz_context* m_ctx = nullptr;
    fz_document* m_doc = nullptr;
    QString m_path;
    int m_pageCount = 0;
    bool m_locked = false;

    // Cached at open time
    QString m_title;
};
