#pragma once

// ============================================================================
// SideDataReplicator - Carries per-page side data into a new version
// ============================================================================
// Part of the Folio versioning layer
//
// Two channels, both driven by a PageMapping:
// - Rendering artifacts: copied slot by slot in storage
// - Text: per-page text and language copied onto the new pages, then the
//   version's aggregate text is rebuilt
//
// Entries with PageOrigin::Source read from the foreign source version
// instead of the edited document's previous version.
// ============================================================================

#include "PageMap.h"

#include <QString>

class DocumentVersion;
class PageStorage;

class SideDataReplicator {
public:
    /**
     * @param storage Storage holding the artifact slots (not owned).
     * @param sidecarDirName Top-level storage directory of artifact slots.
     */
    SideDataReplicator(PageStorage* storage, const QString& sidecarDirName = QStringLiteral("sidecars"));

    /**
     * @brief Copy rendering artifacts from old slots to new slots.
     *
     * Slots without artifacts are skipped. A new page receives an artifact
     * reference only if something was copied into its slot.
     *
     * @param oldVersion Previous version of the edited document.
     * @param newVersion Version being built; must not be archived.
     * @param mapping Position correspondence.
     * @param source Foreign version for PageOrigin::Source entries.
     * @return false on storage failure or an entry naming a missing page.
     */
    bool copyArtifacts(const DocumentVersion& oldVersion, DocumentVersion& newVersion,
                       const PageMapping& mapping, const DocumentVersion* source = nullptr);

    /**
     * @brief Copy page texts and rebuild the aggregate text.
     * @return false if an entry names a missing page or the new version is archived.
     */
    bool replicateText(const DocumentVersion& oldVersion, DocumentVersion& newVersion,
                       const PageMapping& mapping, const DocumentVersion* source = nullptr);

    QString errorMessage() const { return m_lastError; }

private:
    const DocumentVersion* originVersion(const PageMapEntry& entry,
                                         const DocumentVersion& oldVersion,
                                         const DocumentVersion* source);

    PageStorage* m_storage;
    QString m_sidecarDirName;
    QString m_lastError;
};
