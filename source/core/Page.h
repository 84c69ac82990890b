#pragma once

// ============================================================================
// Page - A single page of a document version
// ============================================================================
// Part of the Folio document-version model
//
// A Page belongs to exactly one DocumentVersion. It carries the side data
// that does not live inside the PDF payload itself:
// - Extracted text (populated lazily by an external OCR collaborator)
// - Language of that text
// - Reference to the page's rendering artifacts in storage
//
// Side data fields are explicit optionals: an absent value means "not yet
// produced", which is different from an empty value.
// ============================================================================

#include <QString>
#include <QJsonObject>

#include <memory>
#include <optional>

/**
 * @brief A single page of a document version.
 *
 * Page is a pure data class. Its number is 1-based and unique within the
 * owning version; numbers are assigned by the version, never by callers.
 */
class Page {
public:
    // ===== Identity =====
    QString id;                             ///< UUID, stable for the lifetime of the page record
    int number = 0;                         ///< 1-based position within the owning version

    // ===== Side Data =====
    std::optional<QString> text;            ///< Extracted text, absent until OCR ran
    std::optional<QString> language;        ///< Language of the text (e.g. "deu")
    std::optional<QString> artifactPath;    ///< Storage directory holding rendering artifacts

    // ===== Constructors =====

    /**
     * @brief Default constructor.
     * Creates a page with a fresh UUID and number 0 (unassigned).
     */
    Page();

    /**
     * @brief Constructor with page number.
     * @param pageNumber 1-based position within the version.
     */
    explicit Page(int pageNumber);

    // ===== Utility =====

    /**
     * @brief Check if the page has non-empty text.
     */
    bool hasText() const { return text.has_value() && !text->isEmpty(); }

    /**
     * @brief Check if rendering artifacts have been produced for this page.
     */
    bool hasArtifact() const { return artifactPath.has_value() && !artifactPath->isEmpty(); }

    /**
     * @brief Get the text, or an empty string if absent.
     */
    QString textOrEmpty() const { return text.value_or(QString()); }

    // ===== Serialization =====

    /**
     * @brief Serialize page to JSON.
     * @return JSON object; absent optionals are omitted.
     */
    QJsonObject toJson() const;

    /**
     * @brief Deserialize page from JSON.
     * @param obj JSON object produced by toJson().
     * @return Page with data loaded, or nullptr if the id or number is missing.
     */
    static std::unique_ptr<Page> fromJson(const QJsonObject& obj);
};
