// ============================================================================
// MuPdfPageEditor - Implementation
// ============================================================================

#include "MuPdfPageEditor.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QDebug>
#include <QSet>

#include <algorithm>
#include <functional>

namespace {

// ============================================================================
// RAII handles
// ============================================================================

/**
 * @brief Owns one fz_context for the duration of a single edit.
 */
class MuPdfContext {
public:
    MuPdfContext()
        : m_ctx(fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT))
    {
    }
    ~MuPdfContext()
    {
        if (m_ctx) {
            fz_drop_context(m_ctx);
        }
    }
    MuPdfContext(const MuPdfContext&) = delete;
    MuPdfContext& operator=(const MuPdfContext&) = delete;

    fz_context* get() const { return m_ctx; }
    bool isValid() const { return m_ctx != nullptr; }

private:
    fz_context* m_ctx;
};

/**
 * @brief Drops a pdf_document when leaving scope. Must not outlive its context.
 */
class PdfDocumentHandle {
public:
    PdfDocumentHandle(fz_context* ctx, pdf_document* doc) : m_ctx(ctx), m_doc(doc) {}
    ~PdfDocumentHandle()
    {
        if (m_doc) {
            pdf_drop_document(m_ctx, m_doc);
        }
    }
    PdfDocumentHandle(const PdfDocumentHandle&) = delete;
    PdfDocumentHandle& operator=(const PdfDocumentHandle&) = delete;

    pdf_document* get() const { return m_doc; }
    explicit operator bool() const { return m_doc != nullptr; }

private:
    fz_context* m_ctx;
    pdf_document* m_doc;
};

// ============================================================================
// Helpers
// ============================================================================

int normalizeRotation(int degrees)
{
    return ((degrees % 360) + 360) % 360;
}

pdf_document* openPayload(fz_context* ctx, const QByteArray& payload, QString* errorMessage)
{
    if (payload.isEmpty()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Empty PDF payload");
        }
        return nullptr;
    }

    fz_buffer* buf = nullptr;
    fz_stream* stm = nullptr;
    pdf_document* doc = nullptr;
    fz_var(buf);
    fz_var(stm);
    fz_var(doc);

    fz_try(ctx) {
        buf = fz_new_buffer_from_copied_data(ctx,
                                             reinterpret_cast<const unsigned char*>(payload.constData()),
                                             static_cast<size_t>(payload.size()));
        stm = fz_open_buffer(ctx, buf);
        // The document keeps its own reference to the stream
        doc = pdf_open_document_with_stream(ctx, stm);
    }
    fz_always(ctx) {
        fz_drop_stream(ctx, stm);
        fz_drop_buffer(ctx, buf);
    }
    fz_catch(ctx) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Cannot open PDF: %1")
                                .arg(QString::fromUtf8(fz_caught_message(ctx)));
        }
        qWarning() << "[MuPdfPageEditor] Failed to open payload:" << fz_caught_message(ctx);
        doc = nullptr;
    }
    return doc;
}

int countPages(fz_context* ctx, pdf_document* doc, QString* errorMessage)
{
    int count = -1;
    fz_var(count);
    fz_try(ctx) {
        count = pdf_count_pages(ctx, doc);
    }
    fz_catch(ctx) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Cannot count pages: %1")
                                .arg(QString::fromUtf8(fz_caught_message(ctx)));
        }
        count = -1;
    }
    return count;
}

int pageRotation(fz_context* ctx, pdf_obj* pageObj)
{
    pdf_obj* rotateObj = pdf_dict_get_inheritable(ctx, pageObj, PDF_NAME(Rotate));
    if (!rotateObj) {
        return 0;
    }
    return normalizeRotation(pdf_to_int(ctx, rotateObj));
}

bool serialize(fz_context* ctx, pdf_document* doc, const PdfWriteOptions& options,
               QByteArray* out, QString* errorMessage)
{
    fz_buffer* buf = nullptr;
    fz_output* output = nullptr;
    bool ok = true;
    fz_var(buf);
    fz_var(output);

    fz_try(ctx) {
        buf = fz_new_buffer(ctx, 8192);
        output = fz_new_output_with_buffer(ctx, buf);

        pdf_write_options opts = pdf_default_write_options;
        opts.do_garbage = options.garbageCollect ? 1 : 0;
        opts.do_compress = options.compress ? 1 : 0;
        opts.do_compress_images = options.compress ? 1 : 0;
        opts.do_compress_fonts = options.compress ? 1 : 0;

        pdf_write_document(ctx, doc, output, &opts);
        fz_close_output(ctx, output);

        unsigned char* data = nullptr;
        size_t len = fz_buffer_storage(ctx, buf, &data);
        *out = QByteArray(reinterpret_cast<const char*>(data), static_cast<qsizetype>(len));
    }
    fz_always(ctx) {
        fz_drop_output(ctx, output);
        fz_drop_buffer(ctx, buf);
    }
    fz_catch(ctx) {
        ok = false;
        if (errorMessage) {
            *errorMessage = QStringLiteral("Cannot write PDF: %1")
                                .arg(QString::fromUtf8(fz_caught_message(ctx)));
        }
        qWarning() << "[MuPdfPageEditor] Failed to serialize:" << fz_caught_message(ctx);
    }
    return ok;
}

bool checkRange(const QVector<int>& numbers, int total, QString* errorMessage)
{
    for (int n : numbers) {
        if (n < 1 || n > total) {
            if (errorMessage) {
                *errorMessage = QStringLiteral("Page %1 is out of range 1..%2").arg(n).arg(total);
            }
            return false;
        }
    }
    return true;
}

bool hasDuplicates(const QVector<int>& numbers)
{
    QSet<int> seen;
    for (int n : numbers) {
        if (seen.contains(n)) {
            return true;
        }
        seen.insert(n);
    }
    return false;
}

/**
 * @brief Serialize doc into result and record its final page count.
 */
void finish(fz_context* ctx, pdf_document* doc, const PdfWriteOptions& options, PdfEditResult& result)
{
    int pages = countPages(ctx, doc, &result.errorMessage);
    if (pages < 0) {
        return;
    }
    if (!serialize(ctx, doc, options, &result.payload, &result.errorMessage)) {
        return;
    }
    result.pageCount = pages;
    result.success = true;
}

} // anonymous namespace

// ============================================================================
// MuPdfPageEditor
// ============================================================================

MuPdfPageEditor::MuPdfPageEditor(const PdfWriteOptions& options)
    : m_options(options)
{
}

int MuPdfPageEditor::pageCount(const QByteArray& payload, QString* errorMessage) const
{
    MuPdfContext ctx;
    if (!ctx.isValid()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Failed to create MuPDF context");
        }
        return -1;
    }
    PdfDocumentHandle doc(ctx.get(), openPayload(ctx.get(), payload, errorMessage));
    if (!doc) {
        return -1;
    }
    return countPages(ctx.get(), doc.get(), errorMessage);
}

QVector<PdfPageInfo> MuPdfPageEditor::inspect(const QByteArray& payload, QString* errorMessage) const
{
    QVector<PdfPageInfo> infos;

    MuPdfContext ctx;
    if (!ctx.isValid()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Failed to create MuPDF context");
        }
        return infos;
    }
    PdfDocumentHandle doc(ctx.get(), openPayload(ctx.get(), payload, errorMessage));
    if (!doc) {
        return infos;
    }
    const int total = countPages(ctx.get(), doc.get(), errorMessage);
    if (total < 0) {
        return infos;
    }

    fz_context* c = ctx.get();
    fz_try(c) {
        for (int i = 0; i < total; ++i) {
            pdf_obj* pageObj = pdf_lookup_page_obj(c, doc.get(), i);
            fz_rect box = pdf_to_rect(c, pdf_dict_get_inheritable(c, pageObj, PDF_NAME(MediaBox)));

            PdfPageInfo info;
            info.size = QSizeF(box.x1 - box.x0, box.y1 - box.y0);
            info.rotation = pageRotation(c, pageObj);
            infos.append(info);
        }
    }
    fz_catch(c) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Cannot read page geometry: %1")
                                .arg(QString::fromUtf8(fz_caught_message(c)));
        }
        infos.clear();
    }
    return infos;
}

PdfEditResult MuPdfPageEditor::remove(const QByteArray& payload, const QVector<int>& pageNumbers) const
{
    PdfEditResult result;
    MuPdfContext ctx;
    if (!ctx.isValid()) {
        result.errorMessage = QStringLiteral("Failed to create MuPDF context");
        return result;
    }
    fz_context* c = ctx.get();

    PdfDocumentHandle doc(c, openPayload(c, payload, &result.errorMessage));
    if (!doc) {
        return result;
    }
    const int total = countPages(c, doc.get(), &result.errorMessage);
    if (total < 0 || !checkRange(pageNumbers, total, &result.errorMessage)) {
        return result;
    }

    QVector<int> doomed = QSet<int>(pageNumbers.begin(), pageNumbers.end()).values();
    if (doomed.isEmpty()) {
        result.errorMessage = QStringLiteral("No pages to remove");
        return result;
    }
    if (doomed.size() >= total) {
        result.errorMessage = QStringLiteral("Cannot remove every page of a document");
        return result;
    }

    // Delete from the back so earlier indices stay valid
    std::sort(doomed.begin(), doomed.end(), std::greater<int>());

    bool ok = true;
    fz_try(c) {
        for (int n : doomed) {
            pdf_delete_page(c, doc.get(), n - 1);
        }
    }
    fz_catch(c) {
        ok = false;
        result.errorMessage = QStringLiteral("Cannot remove pages: %1")
                                  .arg(QString::fromUtf8(fz_caught_message(c)));
        qWarning() << "[MuPdfPageEditor] remove failed:" << fz_caught_message(c);
    }
    if (!ok) {
        return result;
    }

#ifdef FOLIO_DEBUG
    qDebug() << "[MuPdfPageEditor] Removed" << doomed.size() << "of" << total << "pages";
#endif

    finish(c, doc.get(), m_options, result);
    return result;
}

PdfEditResult MuPdfPageEditor::reorder(const QByteArray& payload, const QVector<int>& oldNumbers) const
{
    PdfEditResult result;
    {
        QString error;
        const int total = pageCount(payload, &error);
        if (total < 0) {
            result.errorMessage = error;
            return result;
        }
        if (oldNumbers.size() != total || hasDuplicates(oldNumbers)
            || !checkRange(oldNumbers, total, &error)) {
            result.errorMessage = error.isEmpty()
                ? QStringLiteral("Reorder must name each of the %1 pages exactly once").arg(total)
                : error;
            return result;
        }
    }
    return graftInto(payload, oldNumbers, "reorder");
}

PdfEditResult MuPdfPageEditor::rotate(const QByteArray& payload, const QMap<int, int>& angles) const
{
    PdfEditResult result;
    MuPdfContext ctx;
    if (!ctx.isValid()) {
        result.errorMessage = QStringLiteral("Failed to create MuPDF context");
        return result;
    }
    fz_context* c = ctx.get();

    PdfDocumentHandle doc(c, openPayload(c, payload, &result.errorMessage));
    if (!doc) {
        return result;
    }
    const int total = countPages(c, doc.get(), &result.errorMessage);
    if (total < 0 || !checkRange(angles.keys(), total, &result.errorMessage)) {
        return result;
    }
    for (auto it = angles.constBegin(); it != angles.constEnd(); ++it) {
        if (it.value() % 90 != 0) {
            result.errorMessage = QStringLiteral("Angle %1 for page %2 is not a multiple of 90")
                                      .arg(it.value()).arg(it.key());
            return result;
        }
    }

    bool ok = true;
    fz_try(c) {
        for (auto it = angles.constBegin(); it != angles.constEnd(); ++it) {
            pdf_obj* pageObj = pdf_lookup_page_obj(c, doc.get(), it.key() - 1);
            const int rotation = normalizeRotation(pageRotation(c, pageObj) + it.value());
            pdf_dict_put_int(c, pageObj, PDF_NAME(Rotate), rotation);
        }
    }
    fz_catch(c) {
        ok = false;
        result.errorMessage = QStringLiteral("Cannot rotate pages: %1")
                                  .arg(QString::fromUtf8(fz_caught_message(c)));
        qWarning() << "[MuPdfPageEditor] rotate failed:" << fz_caught_message(c);
    }
    if (!ok) {
        return result;
    }

    finish(c, doc.get(), m_options, result);
    return result;
}

PdfEditResult MuPdfPageEditor::insert(const QByteArray& destination, const QByteArray& source,
                                      const QVector<int>& sourceNumbers, int insertAfter) const
{
    PdfEditResult result;
    MuPdfContext ctx;
    if (!ctx.isValid()) {
        result.errorMessage = QStringLiteral("Failed to create MuPDF context");
        return result;
    }
    fz_context* c = ctx.get();

    PdfDocumentHandle dst(c, openPayload(c, destination, &result.errorMessage));
    if (!dst) {
        return result;
    }
    PdfDocumentHandle src(c, openPayload(c, source, &result.errorMessage));
    if (!src) {
        return result;
    }

    const int dstTotal = countPages(c, dst.get(), &result.errorMessage);
    const int srcTotal = countPages(c, src.get(), &result.errorMessage);
    if (dstTotal < 0 || srcTotal < 0) {
        return result;
    }
    if (sourceNumbers.isEmpty()) {
        result.errorMessage = QStringLiteral("No pages to insert");
        return result;
    }
    if (!checkRange(sourceNumbers, srcTotal, &result.errorMessage)) {
        return result;
    }
    if (insertAfter < 0 || insertAfter > dstTotal) {
        result.errorMessage = QStringLiteral("Insert position %1 is out of range 0..%2")
                                  .arg(insertAfter).arg(dstTotal);
        return result;
    }

    pdf_graft_map* map = nullptr;
    bool ok = true;
    fz_var(map);

    fz_try(c) {
        map = pdf_new_graft_map(c, dst.get());
        for (int i = 0; i < sourceNumbers.size(); ++i) {
            pdf_graft_mapped_page(c, map, insertAfter + i, src.get(), sourceNumbers.at(i) - 1);
        }
    }
    fz_always(c) {
        pdf_drop_graft_map(c, map);
    }
    fz_catch(c) {
        ok = false;
        result.errorMessage = QStringLiteral("Cannot insert pages: %1")
                                  .arg(QString::fromUtf8(fz_caught_message(c)));
        qWarning() << "[MuPdfPageEditor] insert failed:" << fz_caught_message(c);
    }
    if (!ok) {
        return result;
    }

    finish(c, dst.get(), m_options, result);
    return result;
}

PdfEditResult MuPdfPageEditor::extract(const QByteArray& payload, const QVector<int>& pageNumbers) const
{
    PdfEditResult result;
    if (pageNumbers.isEmpty()) {
        result.errorMessage = QStringLiteral("No pages to extract");
        return result;
    }
    if (hasDuplicates(pageNumbers)) {
        result.errorMessage = QStringLiteral("Extracted pages must be distinct");
        return result;
    }
    return graftInto(payload, pageNumbers, "extract");
}

PdfEditResult MuPdfPageEditor::graftInto(const QByteArray& payload, const QVector<int>& pageNumbers,
                                         const char* operation) const
{
    PdfEditResult result;
    MuPdfContext ctx;
    if (!ctx.isValid()) {
        result.errorMessage = QStringLiteral("Failed to create MuPDF context");
        return result;
    }
    fz_context* c = ctx.get();

    PdfDocumentHandle src(c, openPayload(c, payload, &result.errorMessage));
    if (!src) {
        return result;
    }
    const int total = countPages(c, src.get(), &result.errorMessage);
    if (total < 0 || !checkRange(pageNumbers, total, &result.errorMessage)) {
        return result;
    }

    pdf_document* created = nullptr;
    pdf_graft_map* map = nullptr;
    bool ok = true;
    fz_var(created);
    fz_var(map);

    fz_try(c) {
        created = pdf_create_document(c);
        map = pdf_new_graft_map(c, created);
        for (int n : pageNumbers) {
            pdf_graft_mapped_page(c, map, -1, src.get(), n - 1);
        }
    }
    fz_always(c) {
        pdf_drop_graft_map(c, map);
    }
    fz_catch(c) {
        ok = false;
        result.errorMessage = QStringLiteral("Cannot %1 pages: %2")
                                  .arg(QLatin1String(operation),
                                       QString::fromUtf8(fz_caught_message(c)));
        qWarning() << "[MuPdfPageEditor]" << operation << "failed:" << fz_caught_message(c);
    }

    PdfDocumentHandle out(c, created);
    if (!ok) {
        return result;
    }

    finish(c, out.get(), m_options, result);
    return result;
}
