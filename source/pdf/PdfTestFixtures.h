#pragma once

// ============================================================================
// PdfTestFixtures - In-memory PDFs for unit tests
// ============================================================================
// Page n of a generated document is (100 + n) points wide and 200 points
// tall, so tests can tell pages apart after structural edits by looking at
// PdfPageEditor::inspect().
// ============================================================================

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QByteArray>
#include <QDebug>

namespace PdfTestFixtures {

inline QByteArray makePdf(int pageCount)
{
    QByteArray result;
    fz_context* ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!ctx) {
        return result;
    }

    pdf_document* doc = nullptr;
    fz_buffer* contents = nullptr;
    fz_buffer* out = nullptr;
    fz_output* output = nullptr;
    fz_var(doc);
    fz_var(contents);
    fz_var(out);
    fz_var(output);

    fz_try(ctx) {
        doc = pdf_create_document(ctx);
        for (int n = 1; n <= pageCount; ++n) {
            contents = fz_new_buffer(ctx, 16);
            fz_append_string(ctx, contents, "q Q\n");
            pdf_obj* resources = pdf_new_dict(ctx, doc, 1);
            fz_rect mediabox = fz_make_rect(0, 0, 100.0f + n, 200.0f);
            pdf_obj* page = pdf_add_page(ctx, doc, mediabox, 0, resources, contents);
            pdf_insert_page(ctx, doc, -1, page);
            pdf_drop_obj(ctx, page);
            pdf_drop_obj(ctx, resources);
            fz_drop_buffer(ctx, contents);
            contents = nullptr;
        }

        out = fz_new_buffer(ctx, 4096);
        output = fz_new_output_with_buffer(ctx, out);
        pdf_write_options opts = pdf_default_write_options;
        pdf_write_document(ctx, doc, output, &opts);
        fz_close_output(ctx, output);

        unsigned char* data = nullptr;
        size_t len = fz_buffer_storage(ctx, out, &data);
        result = QByteArray(reinterpret_cast<const char*>(data), static_cast<qsizetype>(len));
    }
    fz_always(ctx) {
        fz_drop_output(ctx, output);
        fz_drop_buffer(ctx, out);
        fz_drop_buffer(ctx, contents);
        pdf_drop_document(ctx, doc);
    }
    fz_catch(ctx) {
        qWarning() << "[PdfTestFixtures] Failed to build test PDF:" << fz_caught_message(ctx);
        result.clear();
    }

    fz_drop_context(ctx);
    return result;
}

} // namespace PdfTestFixtures
