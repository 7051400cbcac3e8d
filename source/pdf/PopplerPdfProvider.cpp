// ============================================================================
// PopplerPdfProvider - Slide deck access through Poppler-Qt6
// ============================================================================

#include "PopplerPdfProvider.h"

#include <QColor>
#include <QDebug>

PopplerPdfProvider::PopplerPdfProvider(const QString& pdfPath)
    : m_path(pdfPath)
{
    m_document = Poppler::Document::load(pdfPath);
    if (!m_document) {
        qWarning() << "[PopplerPdfProvider] Cannot open" << pdfPath;
        return;
    }
    if (m_document->isLocked()) {
        qWarning() << "[PopplerPdfProvider]" << pdfPath << "needs a password";
        return;
    }

    m_title = m_document->title().trimmed();

    m_document->setPaperColor(Qt::white);
    m_document->setRenderHint(Poppler::Document::Antialiasing, true);
    m_document->setRenderHint(Poppler::Document::TextAntialiasing, true);
    m_document->setRenderHint(Poppler::Document::TextSlightHinting, true);

#ifdef SLIDEHANDOUT_DEBUG
    qDebug() << "[PopplerPdfProvider]" << pdfPath << ":" << m_document->numPages()
             << "slides, title" << m_title;
#endif
}

std::unique_ptr<Poppler::Page> PopplerPdfProvider::loadPage(int pageIndex) const
{
    if (pageIndex < 0 || pageIndex >= pageCount()) {
        return nullptr;
    }
    return m_document->page(pageIndex);
}

QSizeF PopplerPdfProvider::pageSize(int pageIndex) const
{
    const auto page = loadPage(pageIndex);
    return page ? page->pageSizeF() : QSizeF();
}

QImage PopplerPdfProvider::renderPageToImage(int pageIndex, qreal dpi) const
{
    const auto page = loadPage(pageIndex);
    if (!page || dpi <= 0) {
        return QImage();
    }

    QImage slide = page->renderToImage(dpi, dpi);
    if (slide.isNull()) {
        qWarning() << "[PopplerPdfProvider] Cannot render page" << pageIndex + 1 << "at" << dpi << "dpi";
    }
    return slide;
}
