#pragma once

// ============================================================================
// MuPdfPageEditor - PdfPageEditor implementation using MuPDF
// ============================================================================
// Each call opens the payload from memory in a private fz_context, edits or
// grafts pages, and serializes the result back to memory. Nothing touches
// the file system.
// ============================================================================

#include "PdfPageEditor.h"

class MuPdfPageEditor : public PdfPageEditor {
public:
    explicit MuPdfPageEditor(const PdfWriteOptions& options = PdfWriteOptions());
    ~MuPdfPageEditor() override = default;

    int pageCount(const QByteArray& payload, QString* errorMessage = nullptr) const override;
    QVector<PdfPageInfo> inspect(const QByteArray& payload, QString* errorMessage = nullptr) const override;

    PdfEditResult remove(const QByteArray& payload, const QVector<int>& pageNumbers) const override;
    PdfEditResult reorder(const QByteArray& payload, const QVector<int>& oldNumbers) const override;
    PdfEditResult rotate(const QByteArray& payload, const QMap<int, int>& angles) const override;
    PdfEditResult insert(const QByteArray& destination, const QByteArray& source,
                         const QVector<int>& sourceNumbers, int insertAfter) const override;
    PdfEditResult extract(const QByteArray& payload, const QVector<int>& pageNumbers) const override;

private:
    /**
     * @brief Graft pages of a payload into a brand-new document.
     */
    PdfEditResult graftInto(const QByteArray& payload, const QVector<int>& pageNumbers,
                            const char* operation) const;

    PdfWriteOptions m_options;
};
