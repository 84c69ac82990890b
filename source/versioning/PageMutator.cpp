// ============================================================================
// PageMutator - Implementation
// ============================================================================

#include "PageMutator.h"

#include "SideDataReplicator.h"
#include "VersionManager.h"

#include "../core/DocumentStore.h"
#include "../pdf/PdfPageEditor.h"
#include "../storage/PageStorage.h"

#include <QDebug>
#include <QFileInfo>
#include <QMap>
#include <QSet>

#include <algorithm>

QString mutationErrorName(MutationError error)
{
    switch (error) {
        case MutationError::None:                 return QStringLiteral("None");
        case MutationError::InvalidRequest:       return QStringLiteral("InvalidRequest");
        case MutationError::ArchivedEditConflict: return QStringLiteral("ArchivedEditConflict");
        case MutationError::InvariantViolation:   return QStringLiteral("InvariantViolation");
        case MutationError::IOFailure:            return QStringLiteral("IOFailure");
        case MutationError::ConcurrentEdit:       return QStringLiteral("ConcurrentEdit");
    }
    return QStringLiteral("Unknown");
}

PageMutator::PageMutator(DocumentStore* store, PageStorage* storage, const PdfPageEditor* editor,
                         const EngineConfig& config)
    : m_store(store)
    , m_storage(storage)
    , m_editor(editor)
    , m_config(config)
    , m_locks(&m_ownLocks)
{
}

void PageMutator::setLocks(DocumentLocks* locks)
{
    m_locks = locks ? locks : &m_ownLocks;
}

// ============================================================================
// Entry Points
// ============================================================================

MutationResult PageMutator::deletePages(const QStringList& pageIds)
{
    MutationResult result;

    QStringList documentIds;
    if (!lookupDocuments(pageIds, documentIds, result)) {
        return result;
    }
    DocumentLockGuard guard(m_locks, documentIds);
    if (!guard.isLocked()) {
        fail(result, MutationError::ConcurrentEdit, QStringLiteral("Document is being edited"));
        return result;
    }

    Selection selection;
    if (!resolveSelection(pageIds, selection, result)) {
        return result;
    }
    PageMapping mapping;
    if (!validateDelete(selection, mapping, result)) {
        return result;
    }

    QByteArray payload;
    if (!readPayload(*selection.version, &payload, result)) {
        return result;
    }
    if (!runDeleteFlow(selection, mapping, payload, result)) {
        return result;
    }

    qDebug() << "[PageMutator] Deleted" << selection.numbers.size() << "pages from"
             << selection.document->id;
    result.success = true;
    return result;
}

MutationResult PageMutator::reorderPages(const QVector<PageReorderItem>& items)
{
    MutationResult result;

    QStringList pageIds;
    QVector<PageAssignment> assignments;
    for (const PageReorderItem& item : items) {
        pageIds.append(item.pageId);
        assignments.append({item.oldNumber, item.newNumber});
    }

    QStringList documentIds;
    if (!lookupDocuments(pageIds, documentIds, result)) {
        return result;
    }
    DocumentLockGuard guard(m_locks, documentIds);
    if (!guard.isLocked()) {
        fail(result, MutationError::ConcurrentEdit, QStringLiteral("Document is being edited"));
        return result;
    }

    Selection selection;
    if (!resolveSelection(pageIds, selection, result)) {
        return result;
    }
    for (const PageReorderItem& item : items) {
        const Page* page = selection.version->pageById(item.pageId);
        if (page->number != item.oldNumber) {
            fail(result, MutationError::InvalidRequest,
                 QStringLiteral("Page %1 is number %2, not %3")
                     .arg(item.pageId).arg(page->number).arg(item.oldNumber));
            return result;
        }
    }

    DocumentVersion* oldVersion = selection.version;
    const int total = oldVersion->pageCount();
    QString error;
    const PageMapping mapping = PageMap::forReorder(total, assignments, &error);
    if (mapping.isEmpty()) {
        fail(result, MutationError::InvalidRequest, error);
        return result;
    }

    QByteArray payload;
    if (!readPayload(*oldVersion, &payload, result)) {
        return result;
    }

    Document& document = *selection.document;
    DocumentVersion* newVersion = VersionManager::stage(document, total, &error);
    if (!newVersion) {
        fail(result, MutationError::InvariantViolation, error);
        return result;
    }

    const PdfEditResult edit = m_editor->reorder(payload, PageMap::oldNumbers(mapping));
    if (!writePayload(*newVersion, edit, result)) {
        return result;
    }

    SideDataReplicator replicator(m_storage, m_config.sidecarDirName);
    if (!replicator.replicateText(*oldVersion, *newVersion, mapping)) {
        fail(result, MutationError::IOFailure, replicator.errorMessage());
        return result;
    }

    if (!commit(document, newVersion, result)) {
        return result;
    }

    qDebug() << "[PageMutator] Reordered" << total << "pages of" << document.id;
    result.success = true;
    return result;
}

MutationResult PageMutator::rotatePages(const QVector<PageRotateItem>& items)
{
    MutationResult result;

    QStringList pageIds;
    for (const PageRotateItem& item : items) {
        pageIds.append(item.pageId);
    }

    QStringList documentIds;
    if (!lookupDocuments(pageIds, documentIds, result)) {
        return result;
    }
    DocumentLockGuard guard(m_locks, documentIds);
    if (!guard.isLocked()) {
        fail(result, MutationError::ConcurrentEdit, QStringLiteral("Document is being edited"));
        return result;
    }

    Selection selection;
    if (!resolveSelection(pageIds, selection, result)) {
        return result;
    }

    QMap<int, int> angles;
    for (const PageRotateItem& item : items) {
        if (item.angle == 0 || item.angle % 90 != 0) {
            fail(result, MutationError::InvalidRequest,
                 QStringLiteral("Angle %1 is not a non-zero multiple of 90").arg(item.angle));
            return result;
        }
        angles.insert(selection.version->pageById(item.pageId)->number, item.angle);
    }

    DocumentVersion* oldVersion = selection.version;
    const int total = oldVersion->pageCount();

    QByteArray payload;
    if (!readPayload(*oldVersion, &payload, result)) {
        return result;
    }

    Document& document = *selection.document;
    QString error;
    DocumentVersion* newVersion = VersionManager::stage(document, total, &error);
    if (!newVersion) {
        fail(result, MutationError::InvariantViolation, error);
        return result;
    }

    const PdfEditResult edit = m_editor->rotate(payload, angles);
    if (!writePayload(*newVersion, edit, result)) {
        return result;
    }

    // Artifacts of rotated pages no longer match their orientation; only the
    // untouched pages keep theirs
    const PageMapping mapping = PageMap::forRotate(total);
    PageMapping unrotated;
    for (const PageMapEntry& entry : mapping) {
        if (!angles.contains(entry.oldNumber)) {
            unrotated.append(entry);
        }
    }

    SideDataReplicator replicator(m_storage, m_config.sidecarDirName);
    if (!replicator.copyArtifacts(*oldVersion, *newVersion, unrotated)
        || !replicator.replicateText(*oldVersion, *newVersion, mapping)) {
        fail(result, MutationError::IOFailure, replicator.errorMessage());
        return result;
    }

    if (!commit(document, newVersion, result)) {
        return result;
    }

    for (auto it = angles.constBegin(); it != angles.constEnd(); ++it) {
        result.pagesNeedingArtifacts.append(newVersion->page(it.key())->id);
    }
    qWarning() << "[PageMutator] Rendering artifacts of rotated pages are not carried over;"
               << result.pagesNeedingArtifacts.size() << "pages of" << document.id
               << "need new artifacts";

    result.success = true;
    return result;
}

MutationResult PageMutator::moveToFolder(const QStringList& pageIds, const QString& folderId,
                                         bool singlePage)
{
    MutationResult result;

    QStringList documentIds;
    if (!lookupDocuments(pageIds, documentIds, result)) {
        return result;
    }
    DocumentLockGuard guard(m_locks, documentIds);
    if (!guard.isLocked()) {
        fail(result, MutationError::ConcurrentEdit, QStringLiteral("Document is being edited"));
        return result;
    }

    Selection selection;
    if (!resolveSelection(pageIds, selection, result)) {
        return result;
    }
    if (!m_store->folder(folderId)) {
        fail(result, MutationError::InvalidRequest, QStringLiteral("Folder %1 not found").arg(folderId));
        return result;
    }
    PageMapping mapping;
    if (!validateDelete(selection, mapping, result)) {
        return result;
    }

    QByteArray sourcePayload;
    if (!readPayload(*selection.version, &sourcePayload, result)) {
        return result;
    }

    if (!runDeleteFlow(selection, mapping, sourcePayload, result)) {
        return result;
    }

    if (singlePage) {
        const QFileInfo titleInfo(m_config.extractedTitle);
        for (size_t i = 0; i < selection.pages.size(); ++i) {
            const Page* page = selection.pages[i];
            const QString title = QStringLiteral("%1-%2.%3")
                                      .arg(titleInfo.completeBaseName(), page->id,
                                           titleInfo.suffix().isEmpty() ? QStringLiteral("pdf")
                                                                        : titleInfo.suffix());
            if (!runExtractFlow(selection, {selection.numbers.at(static_cast<int>(i))},
                                folderId, title, sourcePayload, result)) {
                return result;
            }
        }
    } else {
        if (!runExtractFlow(selection, selection.numbers, folderId, m_config.extractedTitle,
                            sourcePayload, result)) {
            return result;
        }
    }

    qDebug() << "[PageMutator] Moved" << selection.numbers.size() << "pages of"
             << selection.document->id << "to folder" << folderId;
    result.success = true;
    return result;
}

MutationResult PageMutator::moveToDocument(const QStringList& pageIds, const QString& documentId,
                                           int position)
{
    MutationResult result;

    QStringList documentIds;
    if (!lookupDocuments(pageIds, documentIds, result)) {
        return result;
    }
    documentIds.append(documentId);
    DocumentLockGuard guard(m_locks, documentIds);
    if (!guard.isLocked()) {
        fail(result, MutationError::ConcurrentEdit, QStringLiteral("Document is being edited"));
        return result;
    }

    Selection selection;
    if (!resolveSelection(pageIds, selection, result)) {
        return result;
    }

    Document* destination = m_store->document(documentId);
    if (!destination) {
        fail(result, MutationError::InvalidRequest, QStringLiteral("Document %1 not found").arg(documentId));
        return result;
    }
    if (destination == selection.document) {
        fail(result, MutationError::InvalidRequest,
             QStringLiteral("Destination must differ from the source document"));
        return result;
    }
    DocumentVersion* destinationVersion = destination->currentVersion();
    if (!destinationVersion) {
        fail(result, MutationError::InvalidRequest,
             QStringLiteral("Document %1 has no current version").arg(documentId));
        return result;
    }

    const int destinationTotal = destinationVersion->pageCount();
    if (position < 0) {
        position = destinationTotal;
    }
    QString error;
    const PageMapping insertMapping = PageMap::forInsert(position, selection.numbers,
                                                         destinationTotal, &error);
    if (insertMapping.isEmpty()) {
        fail(result, MutationError::InvalidRequest, error);
        return result;
    }

    PageMapping deleteMapping;
    if (!validateDelete(selection, deleteMapping, result)) {
        return result;
    }

    QByteArray sourcePayload;
    QByteArray destinationPayload;
    if (!readPayload(*selection.version, &sourcePayload, result)
        || !readPayload(*destinationVersion, &destinationPayload, result)) {
        return result;
    }

    if (!runDeleteFlow(selection, deleteMapping, sourcePayload, result)) {
        return result;
    }
    if (!runInsertFlow(*destination, selection, position, insertMapping, destinationPayload,
                       sourcePayload, result)) {
        return result;
    }

    qDebug() << "[PageMutator] Moved" << selection.numbers.size() << "pages of"
             << selection.document->id << "into" << destination->id << "after page" << position;
    result.success = true;
    return result;
}

// ============================================================================
// Validation
// ============================================================================

bool PageMutator::lookupDocuments(const QStringList& pageIds, QStringList& documentIds,
                                  MutationResult& result)
{
    if (pageIds.isEmpty()) {
        fail(result, MutationError::InvalidRequest, QStringLiteral("No pages selected"));
        return false;
    }
    if (QSet<QString>(pageIds.begin(), pageIds.end()).size() != pageIds.size()) {
        fail(result, MutationError::InvalidRequest, QStringLiteral("A page is selected more than once"));
        return false;
    }

    for (const QString& pageId : pageIds) {
        const PageLocation location = m_store->findPage(pageId);
        if (!location.isValid() || location.version->isStaged()) {
            fail(result, MutationError::InvalidRequest, QStringLiteral("Page %1 not found").arg(pageId));
            return false;
        }
        if (!documentIds.contains(location.document->id)) {
            documentIds.append(location.document->id);
        }
    }
    return true;
}

bool PageMutator::resolveSelection(const QStringList& pageIds, Selection& selection,
                                   MutationResult& result)
{
    std::vector<PageLocation> locations;
    for (const QString& pageId : pageIds) {
        const PageLocation location = m_store->findPage(pageId);
        if (!location.isValid() || location.version->isStaged()) {
            fail(result, MutationError::InvalidRequest, QStringLiteral("Page %1 not found").arg(pageId));
            return false;
        }
        locations.push_back(location);
    }

    for (const PageLocation& location : locations) {
        if (location.version->isArchived()) {
            fail(result, MutationError::ArchivedEditConflict,
                 QStringLiteral("Editing archived page is not allowed"));
            return false;
        }
    }

    selection.document = locations.front().document;
    selection.version = locations.front().version;
    for (const PageLocation& location : locations) {
        if (location.version != selection.version) {
            fail(result, MutationError::InvalidRequest,
                 QStringLiteral("Pages must belong to the same document version"));
            return false;
        }
    }

    std::sort(locations.begin(), locations.end(),
              [](const PageLocation& a, const PageLocation& b) {
                  return a.page->number < b.page->number;
              });
    selection.numbers.clear();
    selection.pages.clear();
    for (const PageLocation& location : locations) {
        selection.numbers.append(location.page->number);
        selection.pages.push_back(location.page);
    }
    return true;
}

bool PageMutator::validateDelete(const Selection& selection, PageMapping& mapping,
                                 MutationResult& result)
{
    const int total = selection.version->pageCount();
    if (selection.numbers.size() >= total) {
        fail(result, MutationError::InvariantViolation,
             QStringLiteral("Document version must have at least one page"));
        return false;
    }

    QString error;
    mapping = PageMap::forDelete(total, selection.numbers, &error);
    if (mapping.isEmpty()) {
        fail(result, MutationError::InvalidRequest, error);
        return false;
    }
    return true;
}

// ============================================================================
// Flows
// ============================================================================

bool PageMutator::runDeleteFlow(const Selection& selection, const PageMapping& mapping,
                                const QByteArray& oldPayload, MutationResult& result)
{
    Document& document = *selection.document;
    const DocumentVersion& oldVersion = *selection.version;

    QString error;
    DocumentVersion* newVersion = VersionManager::stage(document, static_cast<int>(mapping.size()), &error);
    if (!newVersion) {
        fail(result, MutationError::InvariantViolation, error);
        return false;
    }

    const PdfEditResult edit = m_editor->remove(oldPayload, selection.numbers);
    if (!writePayload(*newVersion, edit, result)) {
        return false;
    }

    SideDataReplicator replicator(m_storage, m_config.sidecarDirName);
    if (!replicator.copyArtifacts(oldVersion, *newVersion, mapping)
        || !replicator.replicateText(oldVersion, *newVersion, mapping)) {
        fail(result, MutationError::IOFailure, replicator.errorMessage());
        return false;
    }

    return commit(document, newVersion, result);
}

bool PageMutator::runExtractFlow(const Selection& selection, const QVector<int>& numbers,
                                 const QString& folderId, const QString& title,
                                 const QByteArray& sourcePayload, MutationResult& result)
{
    const DocumentVersion& sourceVersion = *selection.version;

    Document* created = m_store->createDocument(title, selection.document->language, folderId);
    if (!created) {
        fail(result, MutationError::InvalidRequest, QStringLiteral("Folder %1 not found").arg(folderId));
        return false;
    }

    std::vector<const Page*> seeds;
    for (int n : numbers) {
        seeds.push_back(sourceVersion.page(n));
    }

    QString error;
    DocumentVersion* newVersion = VersionManager::stageFromPages(*created, seeds, &error);
    if (!newVersion) {
        fail(result, MutationError::InvariantViolation, error);
        return false;
    }

    const PdfEditResult edit = m_editor->extract(sourcePayload, numbers);
    if (!writePayload(*newVersion, edit, result)) {
        return false;
    }

    const PageMapping mapping = PageMap::fromSelection(numbers);
    SideDataReplicator replicator(m_storage, m_config.sidecarDirName);
    if (!replicator.copyArtifacts(sourceVersion, *newVersion, mapping, &sourceVersion)
        || !replicator.replicateText(sourceVersion, *newVersion, mapping, &sourceVersion)) {
        fail(result, MutationError::IOFailure, replicator.errorMessage());
        return false;
    }

    return commit(*created, newVersion, result);
}

bool PageMutator::runInsertFlow(Document& destination, const Selection& selection, int position,
                                const PageMapping& mapping, const QByteArray& destinationPayload,
                                const QByteArray& sourcePayload, MutationResult& result)
{
    DocumentVersion* oldVersion = destination.currentVersion();

    QString error;
    DocumentVersion* newVersion = VersionManager::stage(destination, static_cast<int>(mapping.size()), &error);
    if (!newVersion) {
        fail(result, MutationError::InvariantViolation, error);
        return false;
    }

    const PdfEditResult edit = m_editor->insert(destinationPayload, sourcePayload,
                                                selection.numbers, position);
    if (!writePayload(*newVersion, edit, result)) {
        return false;
    }

    // Before and after the insertion point come from the destination's old
    // version, the inserted range from the source version
    SideDataReplicator replicator(m_storage, m_config.sidecarDirName);
    if (!replicator.copyArtifacts(*oldVersion, *newVersion, mapping, selection.version)
        || !replicator.replicateText(*oldVersion, *newVersion, mapping, selection.version)) {
        fail(result, MutationError::IOFailure, replicator.errorMessage());
        return false;
    }

    return commit(destination, newVersion, result);
}

// ============================================================================
// Storage and commit
// ============================================================================

bool PageMutator::readPayload(const DocumentVersion& version, QByteArray* payload,
                              MutationResult& result)
{
    bool ok = false;
    *payload = m_storage->read(version.payloadPath, &ok);
    if (!ok) {
        fail(result, MutationError::IOFailure, m_storage->errorMessage());
        return false;
    }
    return true;
}

bool PageMutator::writePayload(DocumentVersion& version, const PdfEditResult& edit,
                               MutationResult& result)
{
    if (!edit.success) {
        fail(result, MutationError::IOFailure, edit.errorMessage);
        return false;
    }
    if (edit.pageCount != version.pageCount()) {
        fail(result, MutationError::IOFailure,
             QStringLiteral("Edited PDF has %1 pages, version %2 expects %3")
                 .arg(edit.pageCount).arg(version.versionNumber).arg(version.pageCount()));
        return false;
    }
    if (!m_storage->write(version.payloadPath, edit.payload)) {
        fail(result, MutationError::IOFailure, m_storage->errorMessage());
        return false;
    }
    return true;
}

bool PageMutator::commit(Document& document, DocumentVersion* version, MutationResult& result)
{
    QString error;
    if (!VersionManager::commit(document, version, &error)) {
        fail(result, MutationError::IOFailure, error);
        return false;
    }
    result.versionIds.append(version->id);
    if (!result.documentIds.contains(document.id)) {
        result.documentIds.append(document.id);
    }
    return true;
}

void PageMutator::fail(MutationResult& result, MutationError error, const QString& message) const
{
    result.success = false;
    result.error = error;
    result.errorMessage = message;
    qWarning() << "[PageMutator]" << mutationErrorName(error) << ":" << message;
}
