#pragma once

// ============================================================================
// VersionManagerTests - Unit tests for version creation and side data
// ============================================================================
// Tests VersionManager (stage, commit, bump, sweep, import) and
// SideDataReplicator (artifact and text relocation) against a FileStorage in
// a temporary directory.
// ============================================================================

#include "SideDataReplicator.h"
#include "VersionManager.h"

#include "../core/Document.h"
#include "../pdf/MuPdfPageEditor.h"
#include "../pdf/PdfTestFixtures.h"
#include "../storage/FileStorage.h"

#include <QDebug>
#include <QTemporaryDir>

namespace VersionManagerTests {

/**
 * @brief Test stage(), commit() and bump().
 *
 * Tests:
 * - Staged pages are numbered 1..N with the document language
 * - Commit archives the previous version
 * - Zero-page versions are refused
 */
inline bool testStageCommit()
{
    qDebug() << "=== Test: Stage / Commit ===";
    bool success = true;

    auto doc = Document::createNew("a.pdf", "deu", "folder");

    DocumentVersion* v1 = VersionManager::bump(*doc, 3);
    if (!v1 || !v1->isCurrent() || v1->pageCount() != 3 || !v1->hasContiguousNumbers()
        || v1->page(2)->language.value_or(QString()) != "deu"
        || v1->payloadPath != QStringLiteral("docs/%1/v1/a.pdf").arg(doc->id)) {
        qDebug() << "FAIL: bump did not produce a current 3-page version";
        return false;
    }
    qDebug() << "  - Bump: OK";

    DocumentVersion* v2 = VersionManager::stage(*doc, 2);
    if (!v2 || !v2->isStaged() || doc->currentVersion() != v1) {
        qDebug() << "FAIL: staging must not change the current version";
        success = false;
    }
    QString error;
    if (!VersionManager::commit(*doc, v2, &error) || !v1->isArchived() || doc->currentVersion() != v2) {
        qDebug() << "FAIL: commit:" << error;
        success = false;
    } else {
        qDebug() << "  - Stage then commit: OK";
    }

    if (VersionManager::commit(*doc, v2, &error)) {
        qDebug() << "FAIL: committing twice succeeded";
        success = false;
    }
    if (VersionManager::stage(*doc, 0, &error) != nullptr || error.isEmpty()) {
        qDebug() << "FAIL: zero-page version staged";
        success = false;
    } else {
        qDebug() << "  - Zero pages refused: OK";
    }

    // Pages seeded from another version keep their language
    Page seed(1);
    seed.language = QStringLiteral("fra");
    DocumentVersion* v3 = VersionManager::bumpFromPages(*doc, {&seed, v2->page(1)});
    if (!v3 || v3->pageCount() != 2 || v3->page(1)->language.value_or(QString()) != "fra"
        || v3->page(1)->id == seed.id || v3->page(1)->hasText()) {
        qDebug() << "FAIL: bumpFromPages seeds";
        success = false;
    } else {
        qDebug() << "  - Seeded pages: OK";
    }

    return success;
}

/**
 * @brief Test importPayload() and sweepOrphans().
 */
inline bool testImportAndSweep()
{
    qDebug() << "=== Test: Import / Sweep ===";
    bool success = true;

    QTemporaryDir tempDir;
    FileStorage storage(tempDir.path());
    MuPdfPageEditor editor;
    auto doc = Document::createNew("scan.pdf", "eng", "folder");

    QString error;
    DocumentVersion* v1 = VersionManager::importPayload(*doc, PdfTestFixtures::makePdf(4),
                                                        &storage, &editor, &error);
    if (!v1 || v1->pageCount() != 4 || !storage.exists(v1->payloadPath)) {
        qDebug() << "FAIL: import:" << error;
        return false;
    }
    qDebug() << "  - Import: OK";

    if (VersionManager::importPayload(*doc, QByteArray("garbage"), &storage, &editor, &error)
        || doc->versionCount() != 1) {
        qDebug() << "FAIL: broken payload imported";
        success = false;
    } else {
        qDebug() << "  - Broken payload refused: OK";
    }

    // Leave an orphan with a payload and an artifact slot behind
    DocumentVersion* orphan = VersionManager::stage(*doc, 2);
    const int orphanNumber = orphan->versionNumber;
    storage.write(orphan->payloadPath, QByteArray("partial"));
    storage.write(PagePath(doc->id, orphanNumber, 1).directory() + "/preview.jpg", QByteArray("x"));

    const int removed = VersionManager::sweepOrphans(*doc, &storage, QStringLiteral("sidecars"), &error);
    if (removed != 1 || doc->versionCount() != 1 || doc->currentVersion() != v1
        || storage.exists(PagePath::versionPayloadDir(doc->id, orphanNumber))
        || storage.exists(PagePath::versionSidecarDir(doc->id, orphanNumber))
        || !storage.exists(v1->payloadPath)) {
        qDebug() << "FAIL: sweep removed" << removed << error;
        success = false;
    } else {
        qDebug() << "  - Sweep orphans: OK";
    }

    if (VersionManager::sweepOrphans(*doc, &storage) != 0) {
        qDebug() << "FAIL: second sweep found orphans";
        success = false;
    }

    return success;
}

/**
 * @brief Test SideDataReplicator with a delete mapping.
 *
 * Old version: 3 pages, texts "a" "b" "c", artifacts on pages 1 and 3.
 * Delete page 2: new page 2 must carry page 3's text and artifact.
 */
inline bool testReplicateDelete()
{
    qDebug() << "=== Test: Replicate After Delete ===";
    bool success = true;

    QTemporaryDir tempDir;
    FileStorage storage(tempDir.path());
    auto doc = Document::createNew("a.pdf", "eng", "folder");

    DocumentVersion* oldVersion = VersionManager::bump(*doc, 3);
    oldVersion->updateText({"a", "b", "c"});
    oldVersion->page(3)->language = QStringLiteral("deu");
    storage.write(PagePath(doc->id, 1, 1).directory() + "/preview.jpg", QByteArray("one"));
    storage.write(PagePath(doc->id, 1, 3).directory() + "/preview.jpg", QByteArray("three"));

    DocumentVersion* newVersion = VersionManager::stage(*doc, 2);
    const PageMapping mapping = PageMap::forDelete(3, {2});

    SideDataReplicator replicator(&storage);
    if (!replicator.copyArtifacts(*oldVersion, *newVersion, mapping)
        || !replicator.replicateText(*oldVersion, *newVersion, mapping)) {
        qDebug() << "FAIL: replication failed:" << replicator.errorMessage();
        return false;
    }

    if (newVersion->text != "a c" || newVersion->page(2)->textOrEmpty() != "c"
        || newVersion->page(2)->language.value_or(QString()) != "deu") {
        qDebug() << "FAIL: text after delete is" << newVersion->text;
        success = false;
    } else {
        qDebug() << "  - Text relocated: OK";
    }

    const PagePath moved(doc->id, 2, 2);
    if (storage.read(moved.directory() + "/preview.jpg") != "three"
        || newVersion->page(2)->artifactPath.value_or(QString()) != moved.directory()) {
        qDebug() << "FAIL: artifact of old page 3 not at new page 2";
        success = false;
    } else {
        qDebug() << "  - Artifact relocated: OK";
    }

    // Old version untouched
    if (oldVersion->text != "a b c" || storage.read(PagePath(doc->id, 1, 3).directory() + "/preview.jpg") != "three") {
        qDebug() << "FAIL: old version side data changed";
        success = false;
    }

    return success;
}

/**
 * @brief Test SideDataReplicator with an insert mapping and a foreign source.
 */
inline bool testReplicateInsert()
{
    qDebug() << "=== Test: Replicate After Insert ===";
    bool success = true;

    QTemporaryDir tempDir;
    FileStorage storage(tempDir.path());

    auto source = Document::createNew("src.pdf", "eng", "folder");
    DocumentVersion* sourceVersion = VersionManager::bump(*source, 2);
    sourceVersion->updateText({"s1", "s2"});
    storage.write(PagePath(source->id, 1, 2).directory() + "/preview.jpg", QByteArray("s2"));

    auto destination = Document::createNew("dst.pdf", "eng", "folder");
    DocumentVersion* oldVersion = VersionManager::bump(*destination, 2);
    oldVersion->updateText({"d1", "d2"});

    const PageMapping mapping = PageMap::forInsert(1, {2}, 2);
    DocumentVersion* newVersion = VersionManager::stage(*destination, 3);

    SideDataReplicator replicator(&storage);
    if (replicator.replicateText(*oldVersion, *newVersion, mapping)) {
        qDebug() << "FAIL: source entries without a source version accepted";
        success = false;
    }
    if (!replicator.copyArtifacts(*oldVersion, *newVersion, mapping, sourceVersion)
        || !replicator.replicateText(*oldVersion, *newVersion, mapping, sourceVersion)) {
        qDebug() << "FAIL: replication failed:" << replicator.errorMessage();
        return false;
    }

    if (newVersion->text != "d1 s2 d2") {
        qDebug() << "FAIL: text after insert is" << newVersion->text;
        success = false;
    } else {
        qDebug() << "  - Text from two versions: OK";
    }
    if (!newVersion->page(2)->hasArtifact() || newVersion->page(1)->hasArtifact()
        || newVersion->page(3)->hasArtifact()) {
        qDebug() << "FAIL: artifact references after insert";
        success = false;
    } else {
        qDebug() << "  - Artifact references: OK";
    }

    return success;
}

inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running VersionManager Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testStageCommit();
    qDebug() << "";

    allPass &= testImportAndSweep();
    qDebug() << "";

    allPass &= testReplicateDelete();
    qDebug() << "";

    allPass &= testReplicateInsert();
    qDebug() << "";

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL VERSION MANAGER TESTS PASSED!";
    } else {
        qDebug() << "SOME VERSION MANAGER TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace VersionManagerTests
