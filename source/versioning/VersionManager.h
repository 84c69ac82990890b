#pragma once

// ============================================================================
// VersionManager - Creation and promotion of document versions
// ============================================================================
// Part of the Folio versioning layer
//
// A new version is first staged (invisible, not current), filled with its
// payload and side data, then committed: the staged version becomes current
// and the previous current version is archived in the same step. bump() and
// bumpFromPages() do both at once for callers with nothing to fill in.
//
// There is no locking here. Callers hold the document's DocumentLockGuard.
// ============================================================================

#include <QByteArray>
#include <QString>

#include <vector>

class Document;
class DocumentVersion;
class Page;
class PageStorage;
class PdfPageEditor;

namespace VersionManager {

/**
 * @brief Stage a version with placeholder pages 1..pageCount.
 *
 * Pages inherit the document's language. The payload path is reserved but
 * nothing is written.
 *
 * @return The staged version (owned by the document), or nullptr if pageCount < 1.
 */
DocumentVersion* stage(Document& document, int pageCount, QString* errorMessage = nullptr);

/**
 * @brief Stage a version whose pages are seeded from an existing page set.
 *
 * One new page per entry, in the given order, with the seed's language.
 * Text is not copied; SideDataReplicator relocates it.
 *
 * @return The staged version, or nullptr if pages is empty.
 */
DocumentVersion* stageFromPages(Document& document, const std::vector<const Page*>& pages,
                                QString* errorMessage = nullptr);

/**
 * @brief Make a staged version current and archive the previous one.
 */
bool commit(Document& document, DocumentVersion* version, QString* errorMessage = nullptr);

/**
 * @brief stage() followed by commit().
 */
DocumentVersion* bump(Document& document, int pageCount, QString* errorMessage = nullptr);

/**
 * @brief stageFromPages() followed by commit().
 */
DocumentVersion* bumpFromPages(Document& document, const std::vector<const Page*>& pages,
                               QString* errorMessage = nullptr);

/**
 * @brief Remove staged versions left behind by failed mutations.
 *
 * Their payload and side-data directories are removed from storage too.
 * Committed versions are never touched.
 *
 * @return Number of versions removed, or -1 if storage cleanup failed.
 */
int sweepOrphans(Document& document, PageStorage* storage,
                 const QString& sidecarDirName = QStringLiteral("sidecars"),
                 QString* errorMessage = nullptr);

/**
 * @brief Upload a PDF as the document's next version.
 *
 * Counts the pages, stages a version with that many pages, writes the
 * payload and commits.
 *
 * @return The new current version, or nullptr on failure (nothing committed).
 */
DocumentVersion* importPayload(Document& document, const QByteArray& payload,
                               PageStorage* storage, const PdfPageEditor* editor,
                               QString* errorMessage = nullptr);

} // namespace VersionManager
