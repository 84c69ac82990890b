#pragma once

// ============================================================================
// Document - Mutable container of an append-only version history
// ============================================================================
// Part of the Folio document-version model
//
// Document owns:
// - Metadata (title, language, parent folder)
// - All DocumentVersions, ordered by version number
//
// Exactly one version is Current once the document has a committed version.
// Versions are only appended; committed versions are never removed.
// Staged versions left behind by a failed mutation may be removed by
// VersionManager::sweepOrphans().
// ============================================================================

#include "DocumentVersion.h"

#include <QString>
#include <QDateTime>
#include <QJsonObject>

#include <memory>
#include <vector>

/**
 * @brief A document with its ordered version history.
 */
class Document {
public:
    // ===== Metadata =====
    QString id;                 ///< UUID
    QString title;              ///< Display title, also used as the payload file name
    QString language;           ///< Default language for new pages (e.g. "eng")
    QString folderId;           ///< Parent folder
    QDateTime created;

    Document();

    // Non-copyable: owns versions
    Document(const Document&) = delete;
    Document& operator=(const Document&) = delete;

    /**
     * @brief Create a new document without any version.
     * @param docTitle Title (and payload file name).
     * @param lang Language inherited by the pages of new versions.
     * @param parentFolderId Folder the document lives in.
     */
    static std::unique_ptr<Document> createNew(const QString& docTitle,
                                               const QString& lang,
                                               const QString& parentFolderId);

    // ===== Versions =====

    int versionCount() const { return static_cast<int>(m_versions.size()); }

    /**
     * @brief All versions, ordered by version number.
     */
    std::vector<const DocumentVersion*> versions() const;

    DocumentVersion* versionByNumber(int number);
    DocumentVersion* versionById(const QString& versionId);

    /**
     * @brief The live version.
     * @return Pointer to the current version, or nullptr if nothing was committed yet.
     */
    DocumentVersion* currentVersion();
    const DocumentVersion* currentVersion() const;

    /**
     * @brief Version number the next staged version will receive.
     */
    int nextVersionNumber() const;

    /**
     * @brief Append a version to the history. Ownership is transferred.
     * @return Pointer to the appended version.
     */
    DocumentVersion* appendVersion(std::unique_ptr<DocumentVersion> version);

    /**
     * @brief Make a staged version current and archive the previous current one.
     * @return false if the version does not belong to this document or is not staged.
     */
    bool setCurrent(DocumentVersion* version);

    /**
     * @brief Remove a staged version from the history.
     * @return false if the version is unknown or not staged.
     */
    bool removeStagedVersion(const QString& versionId);

    /**
     * @brief File name used for the payload of this document's versions.
     *
     * Only the last path component of the title is used, so a payload
     * always stays inside its version directory. Titles without a usable
     * name ("", ".", "..", "a/") give "document.pdf".
     */
    QString fileName() const;

    // ===== Serialization =====
    QJsonObject toJson() const;

    /**
     * @brief Restore a document and its version history.
     * @return nullptr if any version fails to load.
     */
    static std::unique_ptr<Document> fromJson(const QJsonObject& obj);

private:
    std::vector<std::unique_ptr<DocumentVersion>> m_versions;
};
