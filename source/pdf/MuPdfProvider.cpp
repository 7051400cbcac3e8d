// ============================================================================
// MuPdfProvider - Slide deck access through MuPDF
// ============================================================================

#include "MuPdfProvider.h"

#include <mupdf/fitz.h>

#include <QDebug>

#include <cstring>

MuPdfProvider::MuPdfProvider(const QString& pdfPath)
    : m_path(pdfPath)
{
    m_ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!m_ctx) {
        qWarning() << "[MuPdfProvider] Cannot allocate a MuPDF context";
        return;
    }

    if (!open()) {
        if (m_doc) {
            fz_drop_document(m_ctx, m_doc);
            m_doc = nullptr;
        }
        m_pageCount = 0;
        return;
    }

    m_title = lookupMetadata(FZ_META_INFO_TITLE);

#ifdef SLIDEHANDOUT_DEBUG
    qDebug() << "[MuPdfProvider]" << pdfPath << ":" << m_pageCount << "slides, title" << m_title;
#endif
}

MuPdfProvider::~MuPdfProvider()
{
    if (m_ctx) {
        if (m_doc) {
            fz_drop_document(m_ctx, m_doc);
        }
        fz_drop_context(m_ctx);
    }
}

// ============================================================================
// Opening
// ============================================================================

bool MuPdfProvider::open()
{
    const QByteArray path = m_path.toUtf8();
    bool opened = false;

    fz_try(m_ctx) {
        fz_register_document_handlers(m_ctx);
        m_doc = fz_open_document(m_ctx, path.constData());
        opened = true;
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfProvider] Cannot open" << m_path << "-" << fz_caught_message(m_ctx);
    }
    if (!opened) {
        return false;
    }

    // An empty user password still counts as unlocked
    if (fz_needs_password(m_ctx, m_doc) && !fz_authenticate_password(m_ctx, m_doc, "")) {
        qWarning() << "[MuPdfProvider]" << m_path << "needs a password";
        m_locked = true;
        return true;
    }

    bool counted = false;
    fz_try(m_ctx) {
        m_pageCount = fz_count_pages(m_ctx, m_doc);
        counted = true;
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfProvider] Cannot count pages of" << m_path
                   << "-" << fz_caught_message(m_ctx);
    }
    return counted;
}

QString MuPdfProvider::lookupMetadata(const char* key) const
{
    if (!isValid()) {
        return QString();
    }

    char value[512] = {0};
    int length = -1;
    fz_try(m_ctx) {
        length = fz_lookup_metadata(m_ctx, m_doc, key, value, sizeof(value));
    }
    fz_catch(m_ctx) {
        length = -1;
    }

    return length > 0 ? QString::fromUtf8(value).trimmed() : QString();
}

// ============================================================================
// Pages
// ============================================================================

bool MuPdfProvider::hasPage(int pageIndex) const
{
    return isValid() && pageIndex >= 0 && pageIndex < m_pageCount;
}

bool MuPdfProvider::pageBounds(int pageIndex, fz_rect* bounds) const
{
    fz_page* page = nullptr;
    bool ok = false;

    fz_var(page);
    fz_try(m_ctx) {
        page = fz_load_page(m_ctx, m_doc, pageIndex);
        *bounds = fz_bound_page(m_ctx, page);
        ok = true;
    }
    fz_always(m_ctx) {
        fz_drop_page(m_ctx, page);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfProvider] Cannot load page" << pageIndex + 1
                   << "-" << fz_caught_message(m_ctx);
    }
    return ok;
}

QSizeF MuPdfProvider::pageSize(int pageIndex) const
{
    fz_rect bounds = fz_empty_rect;
    if (!hasPage(pageIndex) || !pageBounds(pageIndex, &bounds)) {
        return QSizeF();
    }
    return QSizeF(bounds.x1 - bounds.x0, bounds.y1 - bounds.y0);
}

QImage MuPdfProvider::renderPageToImage(int pageIndex, qreal dpi) const
{
    if (!hasPage(pageIndex) || dpi <= 0) {
        return QImage();
    }

    const float zoom = static_cast<float>(dpi / 72.0);
    fz_pixmap* pix = nullptr;
    QImage slide;

    fz_var(pix);
    fz_try(m_ctx) {
        // No alpha channel: the page is drawn onto white, 3 bytes per pixel
        pix = fz_new_pixmap_from_page_number(m_ctx, m_doc, pageIndex,
                                             fz_scale(zoom, zoom), fz_device_rgb(m_ctx), 0);

        const int w = fz_pixmap_width(m_ctx, pix);
        const int h = fz_pixmap_height(m_ctx, pix);
        const ptrdiff_t stride = fz_pixmap_stride(m_ctx, pix);
        const unsigned char* samples = fz_pixmap_samples(m_ctx, pix);

        slide = QImage(w, h, QImage::Format_RGB888);
        for (int row = 0; row < h; ++row) {
            std::memcpy(slide.scanLine(row), samples + row * stride, static_cast<size_t>(w) * 3);
        }
    }
    fz_always(m_ctx) {
        fz_drop_pixmap(m_ctx, pix);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfProvider] Cannot render page" << pageIndex + 1
                   << "at" << dpi << "dpi -" << fz_caught_message(m_ctx);
        slide = QImage();
    }

    return slide;
}
