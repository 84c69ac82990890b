#pragma once

// ============================================================================
// DocumentVersion - Immutable snapshot of a document's pages and payload
// ============================================================================
// Part of the Folio document-version model
//
// A version owns its pages (in number order) and references the binary
// payload in storage. Versions move through a small lifecycle:
//
//   Staged  ->  Current  ->  Archived
//
// A staged version is invisible to readers until VersionManager::commit()
// flips it to Current; the previous current version becomes Archived in the
// same step. Archived versions are never modified again.
// ============================================================================

#include "Page.h"

#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QJsonObject>

#include <memory>
#include <vector>

/**
 * @brief An immutable, numbered snapshot of a document.
 */
class DocumentVersion {
public:
    /**
     * @brief Lifecycle state of a version.
     */
    enum class State {
        Staged,     ///< Being built by a mutation, not visible to readers
        Current,    ///< The document's live version
        Archived    ///< Superseded by a later version, read-only
    };

    // ===== Identity =====
    QString id;                         ///< UUID
    QString documentId;                 ///< Owning document
    int versionNumber = 1;              ///< Monotonically increasing from 1 per document

    // ===== Content =====
    QString payloadPath;                ///< Storage path of the PDF payload (relative to storage root)
    QString text;                       ///< Aggregate text of all pages, space separated

    // ===== Lifecycle =====
    State state = State::Staged;
    QDateTime created;

    DocumentVersion();

    // Non-copyable: owns pages
    DocumentVersion(const DocumentVersion&) = delete;
    DocumentVersion& operator=(const DocumentVersion&) = delete;

    // ===== Lifecycle Helpers =====
    bool isStaged() const { return state == State::Staged; }
    bool isCurrent() const { return state == State::Current; }
    bool isArchived() const { return state == State::Archived; }

    // ===== Page Access =====

    /**
     * @brief Number of pages in this version.
     */
    int pageCount() const { return static_cast<int>(m_pages.size()); }

    /**
     * @brief Get a page by its 1-based number.
     * @return Pointer to the page, or nullptr if out of range.
     */
    Page* page(int number);
    const Page* page(int number) const;

    /**
     * @brief Find a page by id.
     * @return Pointer to the page, or nullptr if not part of this version.
     */
    Page* pageById(const QString& pageId);
    const Page* pageById(const QString& pageId) const;

    /**
     * @brief Append a page. Its number is set to pageCount() after insertion.
     * @return Pointer to the added page (owned by this version).
     */
    Page* addPage(std::unique_ptr<Page> page);

    /**
     * @brief All pages, ordered by number.
     */
    std::vector<const Page*> pages() const;

    /**
     * @brief True if page numbers are exactly 1..pageCount() in order.
     */
    bool hasContiguousNumbers() const;

    // ===== Text =====

    /**
     * @brief Assign per-page texts and rebuild the aggregate text.
     *
     * texts[i] is assigned to page i+1. Fails on archived versions and when
     * the list length does not match pageCount().
     *
     * @param texts One entry per page.
     * @param errorMessage Optional output for the failure reason.
     * @return true on success.
     */
    bool updateText(const QStringList& texts, QString* errorMessage = nullptr);

    /**
     * @brief Rebuild the aggregate text from the page texts.
     *
     * Non-empty page texts are joined with a single space in page order.
     */
    void rebuildText();

    // ===== Serialization =====
    QJsonObject toJson() const;

    /**
     * @brief Restore a version from its snapshot object.
     * @return nullptr if the page numbers are not exactly 1..pageCount in order.
     */
    static std::unique_ptr<DocumentVersion> fromJson(const QJsonObject& obj);

    static QString stateToString(State s);
    static State stringToState(const QString& str);

private:
    std::vector<std::unique_ptr<Page>> m_pages;
};
