#pragma once

// ============================================================================
// PdfPageEditor - Abstract interface for structural PDF page edits
// ============================================================================
// Part of the Folio versioning layer
//
// Every operation takes payload bytes and returns new payload bytes; the
// input is never modified. Page numbers are 1-based throughout.
//
// Design: Uses simple data structs instead of backend-specific types, like
// the rest of the PDF layer, so the backend stays swappable.
// ============================================================================

#include <QByteArray>
#include <QMap>
#include <QSizeF>
#include <QString>
#include <QVector>

#include <memory>

/**
 * @brief Geometry of one page as stored in the PDF.
 */
struct PdfPageInfo {
    QSizeF size;        ///< MediaBox size in points, unrotated
    int rotation = 0;   ///< /Rotate value normalized to 0, 90, 180 or 270
};

/**
 * @brief Result of a structural edit.
 */
struct PdfEditResult {
    bool success = false;
    QString errorMessage;
    QByteArray payload;     ///< Serialized output document
    int pageCount = 0;      ///< Page count of the output document
};

/**
 * @brief Serialization options for output payloads.
 */
struct PdfWriteOptions {
    bool garbageCollect = true;     ///< Drop objects no longer referenced
    bool compress = true;           ///< Deflate streams
};

class PdfPageEditor {
public:
    virtual ~PdfPageEditor() = default;

    /**
     * @brief Count the pages of a payload.
     * @return Page count, or -1 if the payload cannot be opened.
     */
    virtual int pageCount(const QByteArray& payload, QString* errorMessage = nullptr) const = 0;

    /**
     * @brief Per-page geometry of a payload, in page order.
     * @return Empty vector if the payload cannot be opened.
     */
    virtual QVector<PdfPageInfo> inspect(const QByteArray& payload,
                                         QString* errorMessage = nullptr) const = 0;

    /**
     * @brief Remove pages. Survivors keep their order.
     */
    virtual PdfEditResult remove(const QByteArray& payload, const QVector<int>& pageNumbers) const = 0;

    /**
     * @brief Rebuild the document in a new order.
     * @param oldNumbers oldNumbers[i] is the page that becomes page i+1.
     *                   Must name every page exactly once.
     */
    virtual PdfEditResult reorder(const QByteArray& payload, const QVector<int>& oldNumbers) const = 0;

    /**
     * @brief Rotate pages relative to their current orientation.
     * @param angles Page number to angle in degrees (multiple of 90).
     */
    virtual PdfEditResult rotate(const QByteArray& payload, const QMap<int, int>& angles) const = 0;

    /**
     * @brief Insert source pages into a destination document.
     * @param sourceNumbers Source pages, in insertion order.
     * @param insertAfter Destination page the insertion follows; 0 inserts first.
     */
    virtual PdfEditResult insert(const QByteArray& destination, const QByteArray& source,
                                 const QVector<int>& sourceNumbers, int insertAfter) const = 0;

    /**
     * @brief New document holding only the named pages, in the given order.
     */
    virtual PdfEditResult extract(const QByteArray& payload, const QVector<int>& pageNumbers) const = 0;

    /**
     * @brief Create the editor for the available backend.
     */
    static std::unique_ptr<PdfPageEditor> create(const PdfWriteOptions& options = PdfWriteOptions());
};
