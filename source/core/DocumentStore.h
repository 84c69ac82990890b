#pragma once

// ============================================================================
// DocumentStore - Record store for folders, documents, versions and pages
// ============================================================================
// Part of the Folio document-version model
//
// Holds every Folder and Document in memory and persists the whole set as a
// single JSON snapshot (library.json). Lookups return raw pointers owned by
// the store; they stay valid until the record is removed or the store is
// reloaded.
// ============================================================================

#include "Document.h"
#include "Folder.h"

#include <QString>
#include <QJsonObject>

#include <memory>
#include <vector>

/**
 * @brief Where a page lives: its document, version and the page itself.
 */
struct PageLocation {
    Document* document = nullptr;
    DocumentVersion* version = nullptr;
    Page* page = nullptr;

    bool isValid() const { return document && version && page; }
};

/**
 * @brief In-memory record store with JSON snapshot persistence.
 */
class DocumentStore {
public:
    static constexpr int SNAPSHOT_VERSION = 1;

    DocumentStore() = default;

    DocumentStore(const DocumentStore&) = delete;
    DocumentStore& operator=(const DocumentStore&) = delete;

    // ===== Folders =====

    Folder* createFolder(const QString& title, const QString& parentId = QString());
    Folder* folder(const QString& folderId);
    std::vector<const Folder*> folders() const;

    // ===== Documents =====

    /**
     * @brief Create a document without versions.
     * @return Pointer to the new document (owned by the store), or nullptr if
     *         folderId does not name a known folder.
     */
    Document* createDocument(const QString& title, const QString& language, const QString& folderId);

    Document* document(const QString& documentId);
    std::vector<Document*> documents();
    std::vector<Document*> documentsInFolder(const QString& folderId);

    /**
     * @brief Find a page in any version of any document.
     * @return Location with all pointers set, or an invalid location if unknown.
     */
    PageLocation findPage(const QString& pageId);

    // ===== Persistence =====

    QJsonObject toJson() const;

    /**
     * @brief Replace the store content with a snapshot.
     *
     * The store is left unchanged when the snapshot is rejected.
     *
     * @return false if the snapshot is newer than supported or holds a
     *         version whose page numbers are not 1..N.
     */
    bool loadFromJson(const QJsonObject& root, QString* errorMessage = nullptr);

    /**
     * @brief Write the snapshot atomically to a file.
     */
    bool save(const QString& filePath, QString* errorMessage = nullptr) const;

    /**
     * @brief Load the snapshot from a file.
     *
     * A missing file yields an empty store and succeeds.
     */
    bool load(const QString& filePath, QString* errorMessage = nullptr);

    void clear();

private:
    std::vector<std::unique_ptr<Folder>> m_folders;
    std::vector<std::unique_ptr<Document>> m_documents;
};
