#pragma once

// ============================================================================
// PageMutator - Structural page edits producing new document versions
// ============================================================================
// Part of the Folio versioning layer
//
// Every entry point runs the same state machine:
//
//   Lock -> Validate -> Stage -> Edit PDF -> Page Map -> Replicate -> Commit
//
// All validation happens before the first write. A failure after that leaves
// the previous version current; the staged version and its payload stay
// behind until VersionManager::sweepOrphans().
//
// Cross-document moves run two independent stage/commit sequences (source
// delete, then destination insert or extraction) with no atomicity between
// them.
// ============================================================================

#include "../core/EngineConfig.h"
#include "DocumentLocks.h"
#include "PageMap.h"

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QVector>

#include <vector>

class Document;
class DocumentStore;
class DocumentVersion;
class Page;
class PageStorage;
class PdfPageEditor;
struct PdfEditResult;

/**
 * @brief Failure categories of a mutation.
 */
enum class MutationError {
    None,
    InvalidRequest,         ///< Empty or malformed selection, unknown ids, bad permutation
    ArchivedEditConflict,   ///< A targeted page is not on the current version
    InvariantViolation,     ///< The edit would leave a version without pages
    IOFailure,              ///< Storage or PDF failure after validation
    ConcurrentEdit          ///< Another mutation holds the document
};

QString mutationErrorName(MutationError error);

/**
 * @brief Outcome of a mutation.
 */
struct MutationResult {
    bool success = false;
    MutationError error = MutationError::None;
    QString errorMessage;
    QStringList versionIds;             ///< Committed versions, in commit order
    QStringList documentIds;            ///< Documents that received a new version
    QStringList pagesNeedingArtifacts;  ///< New page ids left without artifacts (rotated pages)
};

/**
 * @brief One page of a reorder request.
 */
struct PageReorderItem {
    QString pageId;
    int oldNumber = 0;      ///< Must equal the page's current number
    int newNumber = 0;
};

/**
 * @brief One page of a rotate request.
 */
struct PageRotateItem {
    QString pageId;
    int angle = 0;          ///< Degrees, non-zero multiple of 90, relative to the current orientation
};

class PageMutator {
public:
    /**
     * @param store Record store (not owned).
     * @param storage Payload and artifact storage (not owned).
     * @param editor PDF backend (not owned).
     * @param config Engine settings.
     */
    PageMutator(DocumentStore* store, PageStorage* storage, const PdfPageEditor* editor,
                const EngineConfig& config = EngineConfig());

    /**
     * @brief Share a lock table with other mutators.
     * @param locks Lock table (not owned), or nullptr to use the mutator's own.
     */
    void setLocks(DocumentLocks* locks);
    DocumentLocks* locks() const { return m_locks; }

    // ===== Entry Points =====

    /**
     * @brief Delete pages of one version.
     */
    MutationResult deletePages(const QStringList& pageIds);

    /**
     * @brief Reorder all pages of one version.
     */
    MutationResult reorderPages(const QVector<PageReorderItem>& items);

    /**
     * @brief Rotate pages of one version.
     *
     * Text of every page is preserved. Artifacts are copied for the pages
     * that were not rotated; the rotated pages get none and are listed in
     * MutationResult::pagesNeedingArtifacts.
     */
    MutationResult rotatePages(const QVector<PageRotateItem>& items);

    /**
     * @brief Move pages into new documents in a folder.
     * @param singlePage true creates one document per page, false one document for all.
     */
    MutationResult moveToFolder(const QStringList& pageIds, const QString& folderId, bool singlePage);

    /**
     * @brief Move pages into another document.
     * @param position Insert after this destination page; 0 inserts first, negative appends.
     */
    MutationResult moveToDocument(const QStringList& pageIds, const QString& documentId,
                                  int position = -1);

private:
    /**
     * @brief Resolved, validated page selection within one version.
     */
    struct Selection {
        Document* document = nullptr;
        DocumentVersion* version = nullptr;
        QVector<int> numbers;                   ///< Ascending page numbers
        std::vector<const Page*> pages;         ///< Pages in ascending number order
    };

    bool lookupDocuments(const QStringList& pageIds, QStringList& documentIds, MutationResult& result);
    bool resolveSelection(const QStringList& pageIds, Selection& selection, MutationResult& result);
    bool validateDelete(const Selection& selection, PageMapping& mapping, MutationResult& result);

    bool runDeleteFlow(const Selection& selection, const PageMapping& mapping,
                       const QByteArray& oldPayload, MutationResult& result);
    bool runExtractFlow(const Selection& selection, const QVector<int>& numbers,
                        const QString& folderId, const QString& title,
                        const QByteArray& sourcePayload, MutationResult& result);
    bool runInsertFlow(Document& destination, const Selection& selection, int position,
                       const PageMapping& mapping, const QByteArray& destinationPayload,
                       const QByteArray& sourcePayload, MutationResult& result);

    bool readPayload(const DocumentVersion& version, QByteArray* payload, MutationResult& result);
    bool writePayload(DocumentVersion& version, const PdfEditResult& edit, MutationResult& result);
    bool commit(Document& document, DocumentVersion* version, MutationResult& result);

    void fail(MutationResult& result, MutationError error, const QString& message) const;

    DocumentStore* m_store;
    PageStorage* m_storage;
    const PdfPageEditor* m_editor;
    EngineConfig m_config;

    DocumentLocks m_ownLocks;
    DocumentLocks* m_locks;
};
