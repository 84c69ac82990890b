// ============================================================================
// PdfPageEditorFactory - Backend selection for PdfPageEditor
// ============================================================================
// MuPDF is the only page-editing backend. It is a compile-time dependency,
// so the factory never fails.
// ============================================================================

#include "PdfPageEditor.h"
#include "MuPdfPageEditor.h"

#include <memory>

std::unique_ptr<PdfPageEditor> PdfPageEditor::create(const PdfWriteOptions& options)
{
    return std::make_unique<MuPdfPageEditor>(options);
}
