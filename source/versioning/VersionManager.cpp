// ============================================================================
// VersionManager - Implementation
// ============================================================================

#include "VersionManager.h"

#include "../core/Document.h"
#include "../pdf/PdfPageEditor.h"
#include "../storage/PagePath.h"
#include "../storage/PageStorage.h"

#include <QDebug>

#include <memory>

namespace {

void setError(QString* errorMessage, const QString& message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
}

std::unique_ptr<DocumentVersion> newStagedVersion(const Document& document)
{
    auto version = std::make_unique<DocumentVersion>();
    version->documentId = document.id;
    version->versionNumber = document.nextVersionNumber();
    version->state = DocumentVersion::State::Staged;
    version->payloadPath = PagePath::documentPathFor(document.id, version->versionNumber,
                                                     document.fileName());
    return version;
}

} // anonymous namespace

namespace VersionManager {

DocumentVersion* stage(Document& document, int pageCount, QString* errorMessage)
{
    if (pageCount < 1) {
        setError(errorMessage, QStringLiteral("Document version must have at least one page"));
        return nullptr;
    }

    auto version = newStagedVersion(document);
    for (int n = 1; n <= pageCount; ++n) {
        auto page = std::make_unique<Page>(n);
        if (!document.language.isEmpty()) {
            page->language = document.language;
        }
        version->addPage(std::move(page));
    }

#ifdef FOLIO_DEBUG
    qDebug() << "[VersionManager] Staged version" << version->versionNumber
             << "of" << document.id << "with" << pageCount << "pages";
#endif
    return document.appendVersion(std::move(version));
}

DocumentVersion* stageFromPages(Document& document, const std::vector<const Page*>& pages,
                                QString* errorMessage)
{
    if (pages.empty()) {
        setError(errorMessage, QStringLiteral("Document version must have at least one page"));
        return nullptr;
    }

    auto version = newStagedVersion(document);
    for (const Page* seed : pages) {
        auto page = std::make_unique<Page>();
        if (seed && seed->language) {
            page->language = seed->language;
        } else if (!document.language.isEmpty()) {
            page->language = document.language;
        }
        version->addPage(std::move(page));
    }
    return document.appendVersion(std::move(version));
}

bool commit(Document& document, DocumentVersion* version, QString* errorMessage)
{
    if (!version) {
        setError(errorMessage, QStringLiteral("No version to commit"));
        return false;
    }
    if (!version->isStaged()) {
        setError(errorMessage, QStringLiteral("Version %1 is not staged").arg(version->versionNumber));
        return false;
    }
    if (!version->hasContiguousNumbers() || version->pageCount() < 1) {
        setError(errorMessage, QStringLiteral("Version %1 has invalid page numbering")
                                   .arg(version->versionNumber));
        return false;
    }
    if (!document.setCurrent(version)) {
        setError(errorMessage, QStringLiteral("Version %1 does not belong to document %2")
                                   .arg(version->versionNumber).arg(document.id));
        return false;
    }

    qDebug() << "[VersionManager] Document" << document.id << "is now at version"
             << version->versionNumber;
    return true;
}

DocumentVersion* bump(Document& document, int pageCount, QString* errorMessage)
{
    DocumentVersion* version = stage(document, pageCount, errorMessage);
    if (!version) {
        return nullptr;
    }
    if (!commit(document, version, errorMessage)) {
        document.removeStagedVersion(version->id);
        return nullptr;
    }
    return version;
}

DocumentVersion* bumpFromPages(Document& document, const std::vector<const Page*>& pages,
                               QString* errorMessage)
{
    DocumentVersion* version = stageFromPages(document, pages, errorMessage);
    if (!version) {
        return nullptr;
    }
    if (!commit(document, version, errorMessage)) {
        document.removeStagedVersion(version->id);
        return nullptr;
    }
    return version;
}

int sweepOrphans(Document& document, PageStorage* storage, const QString& sidecarDirName,
                 QString* errorMessage)
{
    QStringList staged;
    for (const DocumentVersion* v : document.versions()) {
        if (v->isStaged()) {
            staged.append(v->id);
        }
    }

    int removed = 0;
    for (const QString& versionId : staged) {
        DocumentVersion* version = document.versionById(versionId);
        const int number = version->versionNumber;

        if (storage) {
            const QString payloadDir = PagePath::versionPayloadDir(document.id, number);
            const QString sidecarDir = PagePath::versionSidecarDir(document.id, number, sidecarDirName);
            if (!storage->removeTree(payloadDir) || !storage->removeTree(sidecarDir)) {
                setError(errorMessage, storage->errorMessage());
                qWarning() << "[VersionManager] Failed to clean up orphan version" << number
                           << "of" << document.id << ":" << storage->errorMessage();
                return -1;
            }
        }

        document.removeStagedVersion(versionId);
        ++removed;
        qDebug() << "[VersionManager] Swept orphan version" << number << "of" << document.id;
    }
    return removed;
}

DocumentVersion* importPayload(Document& document, const QByteArray& payload,
                               PageStorage* storage, const PdfPageEditor* editor,
                               QString* errorMessage)
{
    if (!storage || !editor) {
        setError(errorMessage, QStringLiteral("Storage and PDF editor are required"));
        return nullptr;
    }

    QString error;
    const int pages = editor->pageCount(payload, &error);
    if (pages < 1) {
        setError(errorMessage, error.isEmpty() ? QStringLiteral("PDF has no pages") : error);
        return nullptr;
    }

    DocumentVersion* version = stage(document, pages, errorMessage);
    if (!version) {
        return nullptr;
    }
    if (!storage->write(version->payloadPath, payload)) {
        setError(errorMessage, storage->errorMessage());
        qWarning() << "[VersionManager] Failed to write payload" << version->payloadPath;
        return nullptr;    // Left staged for sweepOrphans()
    }
    if (!commit(document, version, errorMessage)) {
        return nullptr;
    }
    return version;
}

} // namespace VersionManager
