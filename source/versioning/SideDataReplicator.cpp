// ============================================================================
// SideDataReplicator - Implementation
// ============================================================================

#include "SideDataReplicator.h"

#include "../core/DocumentVersion.h"
#include "../storage/PageStorage.h"

#include <QDebug>

SideDataReplicator::SideDataReplicator(PageStorage* storage, const QString& sidecarDirName)
    : m_storage(storage)
    , m_sidecarDirName(sidecarDirName)
{
}

const DocumentVersion* SideDataReplicator::originVersion(const PageMapEntry& entry,
                                                         const DocumentVersion& oldVersion,
                                                         const DocumentVersion* source)
{
    if (entry.origin == PageOrigin::Source) {
        if (!source) {
            m_lastError = QStringLiteral("Page map references a source version but none was given");
        }
        return source;
    }
    return &oldVersion;
}

bool SideDataReplicator::copyArtifacts(const DocumentVersion& oldVersion, DocumentVersion& newVersion,
                                       const PageMapping& mapping, const DocumentVersion* source)
{
    m_lastError.clear();
    if (!m_storage) {
        m_lastError = QStringLiteral("No storage configured");
        return false;
    }
    if (newVersion.isArchived()) {
        m_lastError = QStringLiteral("Cannot replicate into an archived version");
        return false;
    }

    for (const PageMapEntry& entry : mapping) {
        const DocumentVersion* from = originVersion(entry, oldVersion, source);
        if (!from) {
            return false;
        }
        Page* target = newVersion.page(entry.newNumber);
        if (!target || !from->page(entry.oldNumber)) {
            m_lastError = QStringLiteral("Page map entry (%1, %2) names a missing page")
                              .arg(entry.newNumber).arg(entry.oldNumber);
            return false;
        }

        const PagePath src(from->documentId, from->versionNumber, entry.oldNumber, m_sidecarDirName);
        const PagePath dst(newVersion.documentId, newVersion.versionNumber, entry.newNumber,
                           m_sidecarDirName);

        if (!m_storage->copyPage(src, dst)) {
            m_lastError = m_storage->errorMessage();
            qWarning() << "[SideDataReplicator] Artifact copy failed:" << m_lastError;
            return false;
        }
        if (m_storage->exists(dst.directory())) {
            target->artifactPath = dst.directory();
        }
    }
    return true;
}

bool SideDataReplicator::replicateText(const DocumentVersion& oldVersion, DocumentVersion& newVersion,
                                       const PageMapping& mapping, const DocumentVersion* source)
{
    m_lastError.clear();
    if (newVersion.isArchived()) {
        m_lastError = QStringLiteral("Cannot replicate into an archived version");
        return false;
    }

    for (const PageMapEntry& entry : mapping) {
        const DocumentVersion* from = originVersion(entry, oldVersion, source);
        if (!from) {
            return false;
        }
        const Page* origin = from->page(entry.oldNumber);
        Page* target = newVersion.page(entry.newNumber);
        if (!origin || !target) {
            m_lastError = QStringLiteral("Page map entry (%1, %2) names a missing page")
                              .arg(entry.newNumber).arg(entry.oldNumber);
            return false;
        }

        target->text = origin->text;
        if (origin->language) {
            target->language = origin->language;
        }
    }

    newVersion.rebuildText();

#ifdef FOLIO_DEBUG
    qDebug() << "[SideDataReplicator] Replicated text of" << mapping.size()
             << "pages into version" << newVersion.versionNumber;
#endif
    return true;
}
