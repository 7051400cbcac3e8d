// ============================================================================
// MuPdfComposer - Builds the handout PDF with MuPDF
// ============================================================================

#include "MuPdfComposer.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QBuffer>
#include <QDebug>
#include <QPainter>

#include <cstdio>

/**
 * @brief Format a number for a PDF content stream.
 *
 * QByteArray::number() ignores the C locale, unlike printf("%f"), so a
 * decimal comma can never end up in the stream.
 */
static QByteArray pdfNumber(qreal value)
{
    return QByteArray::number(value, 'f', 4);
}

// ============================================================================
// Construction / Destruction
// ============================================================================

MuPdfComposer::MuPdfComposer(QObject* parent)
    : QObject(parent)
{
}

MuPdfComposer::~MuPdfComposer()
{
    dropPendingPage();
    cleanup();
}

// ============================================================================
// Public API
// ============================================================================

bool MuPdfComposer::begin(const GridSpec& grid, const ComposeOptions& options)
{
    if (m_outputDoc || m_sealed) {
        fail(tr("Composer already holds a document"));
        return false;
    }

    if (!grid.isValid() || grid.tilesPerPage <= 0) {
        fail(tr("Invalid page layout"));
        return false;
    }

    m_grid = grid;
    m_options = options;
    m_pagesSealed = 0;
    m_tilesPlaced = 0;
    m_lastError.clear();

    if (!initContext()) {
        fail(tr("Failed to initialize PDF engine"));
        return false;
    }

    qDebug() << "[MuPdfComposer] New handout:" << grid.columns << "x" << grid.rows
             << "per page, tile" << grid.scaledWidth << "x" << grid.scaledHeight << "pt";
    return true;
}

bool MuPdfComposer::addTile(const QImage& image)
{
    if (m_sealed) {
        fail(tr("Document is already finalized"));
        return false;
    }
    if (!m_outputDoc) {
        fail(tr("No document in progress"));
        return false;
    }
    if (image.isNull()) {
        fail(tr("Cannot place an empty image (slide %1)").arg(m_tilesPlaced + 1));
        return false;
    }

    if (!m_pageOpen && !beginPage()) {
        return false;
    }

    const QRectF rect = m_grid.tileRect(m_slotOnPage);

    QByteArray encoded = compressImage(image, m_options.imageFormat, m_options.jpegQuality);
    if (encoded.isEmpty()) {
        fail(tr("Failed to encode slide %1").arg(m_tilesPlaced + 1));
        return false;
    }

    char imgName[16];
    snprintf(imgName, sizeof(imgName), "Img%d", m_slotOnPage);

    fz_buffer* imgBuf = nullptr;
    fz_image* fzImage = nullptr;
    pdf_obj* imgObj = nullptr;
    bool embedded = true;

    fz_var(imgBuf);
    fz_var(fzImage);
    fz_var(imgObj);
    fz_try(m_ctx) {
        imgBuf = fz_new_buffer_from_copied_data(m_ctx,
            reinterpret_cast<const unsigned char*>(encoded.constData()),
            static_cast<size_t>(encoded.size()));
        fzImage = fz_new_image_from_buffer(m_ctx, imgBuf);
        imgObj = pdf_add_image(m_ctx, m_outputDoc, fzImage);
        pdf_dict_puts(m_ctx, m_pageXObjects, imgName, imgObj);
    }
    fz_always(m_ctx) {
        pdf_drop_obj(m_ctx, imgObj);
        fz_drop_image(m_ctx, fzImage);
        fz_drop_buffer(m_ctx, imgBuf);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfComposer] Failed to add image:" << fz_caught_message(m_ctx);
        embedded = false;
    }

    if (!embedded) {
        fail(tr("Failed to embed slide %1").arg(m_tilesPlaced + 1));
        return false;
    }

    // Image XObjects are 1x1 unit; scale and move into place
    const QByteArray x = pdfNumber(rect.x());
    const QByteArray y = pdfNumber(rect.y());
    const QByteArray w = pdfNumber(rect.width());
    const QByteArray h = pdfNumber(rect.height());

    m_pageContent += "q\n";
    m_pageContent += w + " 0 0 " + h + " " + x + " " + y + " cm\n";
    m_pageContent += QByteArray("/") + imgName + " Do\n";
    m_pageContent += "Q\n";

    if (m_options.borderWidth > 0) {
        const QColor c = m_options.borderColor;
        m_pageContent += "q\n";
        m_pageContent += pdfNumber(c.redF()) + " " + pdfNumber(c.greenF()) + " "
                         + pdfNumber(c.blueF()) + " RG\n";
        m_pageContent += pdfNumber(m_options.borderWidth) + " w\n";
        m_pageContent += x + " " + y + " " + w + " " + h + " re S\n";
        m_pageContent += "Q\n";
    }

#ifdef SLIDEHANDOUT_DEBUG
    qDebug() << "[MuPdfComposer] Slide" << (m_tilesPlaced + 1) << "-> page" << (m_pagesSealed + 1)
             << "slot" << m_slotOnPage << "at" << rect;
#endif

    ++m_slotOnPage;
    ++m_tilesPlaced;

    if (m_slotOnPage >= m_grid.tilesPerPage) {
        return sealPage();
    }
    return true;
}

bool MuPdfComposer::finalize(QByteArray* pdfData)
{
    if (m_sealed) {
        fail(tr("Document is already finalized"));
        return false;
    }
    if (!m_outputDoc) {
        fail(tr("No document in progress"));
        return false;
    }

    // Sealed from here on, whatever the outcome
    m_sealed = true;

    bool ok = true;
    if (m_pageOpen) {
        ok = sealPage();
    }

    if (ok && !writeMetadata()) {
        qWarning() << "[MuPdfComposer] Failed to write metadata (non-fatal)";
    }

    QByteArray bytes;
    if (ok) {
        ok = saveToBuffer(&bytes);
    }

    dropPendingPage();
    cleanup();

    if (!ok) {
        return false;
    }

    if (pdfData) {
        *pdfData = bytes;
    }

    qDebug() << "[MuPdfComposer] Finalized:" << m_pagesSealed << "pages,"
             << m_tilesPlaced << "tiles," << (bytes.size() / 1024) << "KB";
    return true;
}

ComposeResult MuPdfComposer::compose(const QVector<QImage>& images, const GridSpec& grid,
                                     const ComposeOptions& options)
{
    ComposeResult result;

    if (!begin(grid, options)) {
        result.errorMessage = m_lastError;
        return result;
    }

    const int total = images.size();
    for (int i = 0; i < total; ++i) {
        if (!addTile(images.at(i))) {
            result.errorMessage = m_lastError;
            m_sealed = true;
            dropPendingPage();
            cleanup();
            return result;
        }
        emit progressUpdated(i + 1, total);
    }

    if (!finalize(&result.pdfData)) {
        result.errorMessage = m_lastError;
        result.pdfData.clear();
        return result;
    }

    result.success = true;
    result.pagesComposed = m_pagesSealed;
    result.tilesPlaced = m_tilesPlaced;
    return result;
}

QByteArray MuPdfComposer::compressImage(const QImage& image, const QString& format, int jpegQuality)
{
    if (image.isNull()) {
        return QByteArray();
    }

    // Flatten onto white; the handout has no use for transparency
    QImage opaque = image;
    if (opaque.hasAlphaChannel()) {
        QImage rgb(opaque.size(), QImage::Format_RGB888);
        rgb.fill(Qt::white);
        QPainter painter(&rgb);
        painter.drawImage(0, 0, opaque);
        painter.end();
        opaque = rgb;
    } else if (opaque.format() != QImage::Format_RGB888 &&
               opaque.format() != QImage::Format_RGB32) {
        opaque = opaque.convertToFormat(QImage::Format_RGB888);
    }

    QByteArray result;
    QBuffer buffer(&result);
    buffer.open(QIODevice::WriteOnly);

    const bool jpeg = format.compare(QLatin1String("JPEG"), Qt::CaseInsensitive) == 0;
    const bool saved = jpeg ? opaque.save(&buffer, "JPEG", qBound(1, jpegQuality, 100))
                            : opaque.save(&buffer, "PNG");
    buffer.close();

    if (!saved) {
        qWarning() << "[MuPdfComposer] Failed to compress image as" << (jpeg ? "JPEG" : "PNG");
        return QByteArray();
    }
    return result;
}

// ============================================================================
// Initialization
// ============================================================================

bool MuPdfComposer::initContext()
{
    m_ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!m_ctx) {
        qWarning() << "[MuPdfComposer] Failed to create MuPDF context";
        return false;
    }

    // Needed so fz_new_image_from_buffer recognises PNG/JPEG data
    fz_try(m_ctx) {
        fz_register_document_handlers(m_ctx);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfComposer] Failed to register handlers:" << fz_caught_message(m_ctx);
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
        return false;
    }

    fz_try(m_ctx) {
        m_outputDoc = pdf_create_document(m_ctx);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfComposer] Failed to create output PDF:" << fz_caught_message(m_ctx);
        m_outputDoc = nullptr;
    }

    if (!m_outputDoc) {
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
        return false;
    }
    return true;
}

void MuPdfComposer::cleanup()
{
    if (m_outputDoc) {
        pdf_drop_document(m_ctx, m_outputDoc);
        m_outputDoc = nullptr;
    }

    if (m_ctx) {
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
    }
}

// ============================================================================
// Page Processing
// ============================================================================

bool MuPdfComposer::beginPage()
{
    bool ok = true;

    fz_try(m_ctx) {
        m_pageResources = pdf_new_dict(m_ctx, m_outputDoc, 2);
        m_pageXObjects = pdf_new_dict(m_ctx, m_outputDoc, m_grid.tilesPerPage);
        pdf_dict_put(m_ctx, m_pageResources, PDF_NAME(XObject), m_pageXObjects);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfComposer] Failed to start page:" << fz_caught_message(m_ctx);
        ok = false;
    }

    if (!ok) {
        dropPendingPage();
        fail(tr("Failed to start output page %1").arg(m_pagesSealed + 1));
        return false;
    }

    m_pageContent.clear();
    m_slotOnPage = 0;
    m_pageOpen = true;
    return true;
}

bool MuPdfComposer::sealPage()
{
    if (!m_pageOpen) {
        return true;
    }

    fz_buffer* contents = nullptr;
    pdf_obj* pageObj = nullptr;
    bool ok = true;

    fz_var(contents);
    fz_var(pageObj);
    fz_try(m_ctx) {
        contents = fz_new_buffer_from_copied_data(m_ctx,
            reinterpret_cast<const unsigned char*>(m_pageContent.constData()),
            static_cast<size_t>(m_pageContent.size()));

        fz_rect mediabox = fz_make_rect(0, 0,
                                        static_cast<float>(m_grid.pageSize.width()),
                                        static_cast<float>(m_grid.pageSize.height()));
        pageObj = pdf_add_page(m_ctx, m_outputDoc, mediabox, 0, m_pageResources, contents);
        pdf_insert_page(m_ctx, m_outputDoc, -1, pageObj);
    }
    fz_always(m_ctx) {
        pdf_drop_obj(m_ctx, pageObj);
        fz_drop_buffer(m_ctx, contents);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfComposer] Failed to add page:" << fz_caught_message(m_ctx);
        ok = false;
    }

    dropPendingPage();

    if (!ok) {
        fail(tr("Failed to write output page %1").arg(m_pagesSealed + 1));
        return false;
    }

    ++m_pagesSealed;
    return true;
}

void MuPdfComposer::dropPendingPage()
{
    if (m_ctx) {
        pdf_drop_obj(m_ctx, m_pageXObjects);
        pdf_drop_obj(m_ctx, m_pageResources);
    }
    m_pageXObjects = nullptr;
    m_pageResources = nullptr;
    m_pageContent.clear();
    m_slotOnPage = 0;
    m_pageOpen = false;
}

// ============================================================================
// Finalization
// ============================================================================

bool MuPdfComposer::writeMetadata()
{
    if (!m_outputDoc || !m_ctx) {
        return false;
    }

    const QByteArray producer = m_options.producer.toUtf8();
    const QByteArray title = m_options.title.toUtf8();
    pdf_obj* info = nullptr;
    bool ok = true;

    fz_var(info);
    fz_try(m_ctx) {
        info = pdf_add_new_dict(m_ctx, m_outputDoc, 4);
        pdf_dict_put_text_string(m_ctx, info, PDF_NAME(Producer), producer.constData());
        if (!title.isEmpty()) {
            pdf_dict_put_text_string(m_ctx, info, PDF_NAME(Title), title.constData());
        }
        pdf_dict_put(m_ctx, pdf_trailer(m_ctx, m_outputDoc), PDF_NAME(Info), info);
    }
    fz_always(m_ctx) {
        pdf_drop_obj(m_ctx, info);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfComposer] Failed to write metadata:" << fz_caught_message(m_ctx);
        ok = false;
    }

    return ok;
}

bool MuPdfComposer::saveToBuffer(QByteArray* pdfData)
{
    fz_buffer* buf = nullptr;
    fz_output* out = nullptr;
    bool ok = true;

    fz_var(buf);
    fz_var(out);
    fz_try(m_ctx) {
        buf = fz_new_buffer(m_ctx, 64 * 1024);
        out = fz_new_output_with_buffer(m_ctx, buf);

        pdf_write_options opts = pdf_default_write_options;
        opts.do_compress = 1;        // Compress streams
        opts.do_compress_images = 1; // Compress images
        opts.do_garbage = 1;         // Drop unused objects

        pdf_write_document(m_ctx, m_outputDoc, out, &opts);
        fz_close_output(m_ctx, out);

        unsigned char* data = nullptr;
        size_t len = fz_buffer_storage(m_ctx, buf, &data);
        *pdfData = QByteArray(reinterpret_cast<const char*>(data), static_cast<qsizetype>(len));
    }
    fz_always(m_ctx) {
        fz_drop_output(m_ctx, out);
        fz_drop_buffer(m_ctx, buf);
    }
    fz_catch(m_ctx) {
        qWarning() << "[MuPdfComposer] Failed to serialize document:" << fz_caught_message(m_ctx);
        ok = false;
    }

    if (!ok) {
        fail(tr("Failed to serialize PDF"));
    }
    return ok;
}

void MuPdfComposer::fail(const QString& message)
{
    m_lastError = message;
    qWarning() << "[MuPdfComposer]" << message;
}
