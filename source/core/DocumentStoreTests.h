#pragma once

// ============================================================================
// DocumentStoreTests - Unit tests for the document-version model
// ============================================================================
// Covers Page, DocumentVersion, Document and DocumentStore:
// - Version lifecycle (staged -> current -> archived)
// - Aggregate text
// - Page lookup across versions
// - JSON snapshot save/load
// - EngineConfig settings round trip
// ============================================================================

#include "DocumentStore.h"
#include "EngineConfig.h"

#include <QDebug>
#include <QJsonArray>
#include <QDir>
#include <QFile>
#include <QSettings>
#include <QTemporaryDir>

#include <functional>

namespace DocumentStoreTests {

/**
 * @brief Build a version with the given page texts (empty string = no text).
 */
inline std::unique_ptr<DocumentVersion> makeVersion(const QStringList& texts)
{
    auto version = std::make_unique<DocumentVersion>();
    for (int i = 0; i < texts.size(); ++i) {
        auto page = std::make_unique<Page>(i + 1);
        if (!texts[i].isEmpty()) {
            page->text = texts[i];
        }
        version->addPage(std::move(page));
    }
    version->rebuildText();
    return version;
}

/**
 * @brief Test the version lifecycle on a Document.
 *
 * Tests:
 * - Appended versions start staged and get increasing numbers
 * - setCurrent() archives the previous current version
 * - Only staged versions can be promoted or removed
 */
inline bool testVersionLifecycle()
{
    qDebug() << "=== Test: Version Lifecycle ===";
    bool success = true;

    auto doc = Document::createNew("invoice.pdf", "deu", "folder-1");

    DocumentVersion* v1 = doc->appendVersion(makeVersion({"a"}));
    if (!v1 || v1->versionNumber != 1 || !v1->isStaged() || v1->documentId != doc->id) {
        qDebug() << "FAIL: first version not staged as number 1";
        return false;
    }
    if (doc->currentVersion() != nullptr) {
        qDebug() << "FAIL: staged version must not be current";
        success = false;
    }

    doc->setCurrent(v1);
    DocumentVersion* v2 = doc->appendVersion(makeVersion({"b"}));
    if (v2->versionNumber != 2) {
        qDebug() << "FAIL: second version number is" << v2->versionNumber;
        success = false;
    }
    if (!doc->setCurrent(v2) || !v1->isArchived() || !v2->isCurrent()
        || doc->currentVersion() != v2) {
        qDebug() << "FAIL: promoting v2 should archive v1";
        success = false;
    } else {
        qDebug() << "  - Promote and archive: OK";
    }

    if (doc->setCurrent(v1) || doc->removeStagedVersion(v2->id)) {
        qDebug() << "FAIL: committed versions must not be promoted or removed";
        success = false;
    } else {
        qDebug() << "  - Committed versions are final: OK";
    }

    DocumentVersion* v3 = doc->appendVersion(makeVersion({"c"}));
    const QString v3Id = v3->id;
    if (!doc->removeStagedVersion(v3Id) || doc->versionById(v3Id) || doc->versionCount() != 2) {
        qDebug() << "FAIL: staged version should be removable";
        success = false;
    } else {
        qDebug() << "  - Staged version removal: OK";
    }

    if (doc->fileName() != "invoice.pdf" || Document::createNew("scan", "eng", "f")->fileName() != "scan.pdf") {
        qDebug() << "FAIL: unexpected payload file names";
        success = false;
    } else {
        qDebug() << "  - File names: OK";
    }

    // Titles never name a location outside the version directory
    {
        const QStringList titles = {"../x.pdf", "../../etc/passwd", "a\\..\\b.pdf", "..", ".", "dir/", ""};
        const QStringList expected = {"x.pdf", "passwd.pdf", "b.pdf", "document.pdf",
                                      "document.pdf", "document.pdf", "document.pdf"};
        for (int i = 0; i < titles.size(); ++i) {
            const QString name = Document::createNew(titles[i], "eng", "f")->fileName();
            if (name != expected[i] || name.contains(QLatin1Char('/'))) {
                qDebug() << "FAIL: title" << titles[i] << "gave file name" << name;
                success = false;
            }
        }
        if (success) {
            qDebug() << "  - Path components stripped from titles: OK";
        }
    }

    return success;
}

/**
 * @brief Test aggregate text and updateText().
 */
inline bool testAggregateText()
{
    qDebug() << "=== Test: Aggregate Text ===";
    bool success = true;

    auto version = makeVersion({"fish", "", "cat"});
    if (version->text != "fish cat") {
        qDebug() << "FAIL: aggregate text is" << version->text;
        success = false;
    } else {
        qDebug() << "  - Empty pages skipped: OK";
    }

    QString error;
    if (version->updateText({"one", "two"}, &error)) {
        qDebug() << "FAIL: length mismatch should be rejected";
        success = false;
    }
    if (!version->updateText({"one", "two", "three"}, &error) || version->text != "one two three"
        || version->page(2)->textOrEmpty() != "two") {
        qDebug() << "FAIL: updateText did not apply:" << error;
        success = false;
    } else {
        qDebug() << "  - updateText: OK";
    }

    version->state = DocumentVersion::State::Archived;
    if (version->updateText({"x", "y", "z"}, &error)) {
        qDebug() << "FAIL: archived version text must be immutable";
        success = false;
    } else {
        qDebug() << "  - Archived text immutable: OK";
    }

    return success;
}

/**
 * @brief Test DocumentStore records and page lookup.
 */
inline bool testStoreLookup()
{
    qDebug() << "=== Test: Store Lookup ===";
    bool success = true;

    DocumentStore store;
    Folder* inbox = store.createFolder("Inbox");
    if (store.createDocument("orphan.pdf", "eng", "no-such-folder") != nullptr) {
        qDebug() << "FAIL: document created in unknown folder";
        success = false;
    }

    Document* doc = store.createDocument("a.pdf", "eng", inbox->id);
    DocumentVersion* v1 = doc->appendVersion(makeVersion({"x", "y"}));
    doc->setCurrent(v1);
    const QString pageId = v1->page(2)->id;

    PageLocation location = store.findPage(pageId);
    if (!location.isValid() || location.document != doc || location.version != v1
        || location.page->number != 2) {
        qDebug() << "FAIL: findPage did not locate page 2";
        success = false;
    } else {
        qDebug() << "  - findPage: OK";
    }

    if (store.findPage("missing").isValid()) {
        qDebug() << "FAIL: unknown page id resolved";
        success = false;
    }
    if (store.documentsInFolder(inbox->id).size() != 1) {
        qDebug() << "FAIL: documentsInFolder count";
        success = false;
    } else {
        qDebug() << "  - documentsInFolder: OK";
    }

    return success;
}

/**
 * @brief Test snapshot save and load.
 *
 * Tests:
 * - Round trip keeps ids, states, numbers, texts and artifacts
 * - Missing file loads as an empty store
 * - Newer snapshot versions are rejected
 */
inline bool testSnapshot()
{
    qDebug() << "=== Test: Snapshot Persistence ===";
    bool success = true;

    QTemporaryDir tempDir;
    if (!tempDir.isValid()) {
        qDebug() << "FAIL: could not create temp dir";
        return false;
    }
    const QString path = tempDir.filePath("nested/library.json");

    QString docId;
    QString pageId;
    {
        DocumentStore store;
        Folder* folder = store.createFolder("Inbox");
        Document* doc = store.createDocument("a.pdf", "deu", folder->id);
        DocumentVersion* v1 = doc->appendVersion(makeVersion({"old"}));
        doc->setCurrent(v1);
        DocumentVersion* v2 = doc->appendVersion(makeVersion({"new", "page"}));
        v2->page(1)->language = QStringLiteral("fra");
        v2->page(2)->artifactPath = QStringLiteral("sidecars/x/v2/pages/000002");
        doc->setCurrent(v2);
        doc->appendVersion(makeVersion({"staged"}));
        docId = doc->id;
        pageId = v2->page(2)->id;

        QString error;
        if (!store.save(path, &error)) {
            qDebug() << "FAIL: save failed:" << error;
            return false;
        }
    }

    DocumentStore loaded;
    QString error;
    if (!loaded.load(path, &error)) {
        qDebug() << "FAIL: load failed:" << error;
        return false;
    }

    Document* doc = loaded.document(docId);
    if (!doc || doc->versionCount() != 3 || doc->language != "deu") {
        qDebug() << "FAIL: document not restored";
        return false;
    }
    const DocumentVersion* current = doc->currentVersion();
    if (!current || current->versionNumber != 2 || current->text != "new page"
        || !doc->versionByNumber(1)->isArchived() || !doc->versionByNumber(3)->isStaged()) {
        qDebug() << "FAIL: version states not restored";
        success = false;
    } else {
        qDebug() << "  - Version states: OK";
    }

    PageLocation location = loaded.findPage(pageId);
    if (!location.isValid() || location.page->number != 2 || !location.page->hasArtifact()
        || current->page(1)->language.value_or(QString()) != "fra") {
        qDebug() << "FAIL: page fields not restored";
        success = false;
    } else {
        qDebug() << "  - Page fields: OK";
    }

    DocumentStore empty;
    if (!empty.load(tempDir.filePath("missing.json")) || !empty.documents().empty()) {
        qDebug() << "FAIL: missing snapshot should load as empty";
        success = false;
    } else {
        qDebug() << "  - Missing snapshot: OK";
    }

    QJsonObject future = loaded.toJson();
    future["version"] = DocumentStore::SNAPSHOT_VERSION + 1;
    if (empty.loadFromJson(future)) {
        qDebug() << "FAIL: newer snapshot accepted";
        success = false;
    } else {
        qDebug() << "  - Newer snapshot rejected: OK";
    }

    return success;
}

/**
 * @brief Test that snapshots with broken page numbering are rejected.
 *
 * Tests:
 * - Duplicate page number
 * - Gap left by a removed page
 * - The store keeps its previous content after a rejected load
 */
inline bool testCorruptSnapshot()
{
    qDebug() << "=== Test: Corrupt Snapshot ===";
    bool success = true;

    DocumentStore source;
    Folder* folder = source.createFolder("Inbox");
    Document* doc = source.createDocument("a.pdf", "eng", folder->id);
    doc->setCurrent(doc->appendVersion(makeVersion({"one", "two", "three"})));
    const QJsonObject good = source.toJson();

    // Edit pages of the first version of the first document
    auto corrupt = [&good](const std::function<void(QJsonArray&)>& edit) {
        QJsonObject root = good;
        QJsonArray documents = root["documents"].toArray();
        QJsonObject docObj = documents[0].toObject();
        QJsonArray versions = docObj["versions"].toArray();
        QJsonObject versionObj = versions[0].toObject();
        QJsonArray pages = versionObj["pages"].toArray();
        edit(pages);
        versionObj["pages"] = pages;
        versions[0] = versionObj;
        docObj["versions"] = versions;
        documents[0] = docObj;
        root["documents"] = documents;
        return root;
    };

    DocumentStore target;
    Folder* kept = target.createFolder("Kept");
    const QString keptId = kept->id;

    // Test 1: duplicate number
    {
        const QJsonObject root = corrupt([](QJsonArray& pages) {
            QJsonObject page = pages[2].toObject();
            page["number"] = 2;
            pages[2] = page;
        });
        QString error;
        if (target.loadFromJson(root, &error) || error.isEmpty()) {
            qDebug() << "FAIL: duplicate page number accepted";
            success = false;
        } else {
            qDebug() << "  - Duplicate number rejected: OK";
        }
    }

    // Test 2: gap
    {
        const QJsonObject root = corrupt([](QJsonArray& pages) {
            pages.removeAt(1);
        });
        if (target.loadFromJson(root)) {
            qDebug() << "FAIL: page number gap accepted";
            success = false;
        } else {
            qDebug() << "  - Gap rejected: OK";
        }
    }

    // Test 3: previous content survives, the intact snapshot still loads
    {
        if (!target.folder(keptId) || !target.documents().empty()) {
            qDebug() << "FAIL: rejected load modified the store";
            success = false;
        } else if (!target.loadFromJson(good) || target.documents().size() != 1) {
            qDebug() << "FAIL: intact snapshot rejected";
            success = false;
        } else {
            qDebug() << "  - Store unchanged on rejection: OK";
        }
    }

    return success;
}

/**
 * @brief Test EngineConfig save() and load().
 *
 * Tests:
 * - Values written to folio.ini are read back
 * - A relative storage root is resolved against the library directory
 * - Empty values fall back to the defaults
 */
inline bool testEngineConfig()
{
    qDebug() << "=== Test: EngineConfig ===";
    bool success = true;

    QTemporaryDir tempDir;
    if (!tempDir.isValid()) {
        qDebug() << "FAIL: could not create temp dir";
        return false;
    }
    const QString iniPath = QDir(tempDir.path()).filePath("folio.ini");

    // Test 1: round trip through the library's INI file
    {
        EngineConfig config;
        config.storageRoot = QStringLiteral("blobs");
        config.defaultLanguage = QStringLiteral("deu");
        config.extractedTitle = QStringLiteral("split.pdf");
        config.sidecarDirName = QStringLiteral("thumbs");
        config.pdfGarbageCollect = false;
        config.pdfCompress = false;
        {
            QSettings settings(iniPath, QSettings::IniFormat);
            config.save(settings);
            settings.sync();
        }

        const EngineConfig loaded = EngineConfig::load(tempDir.path());
        if (loaded.defaultLanguage != "deu" || loaded.extractedTitle != "split.pdf"
            || loaded.sidecarDirName != "thumbs" || loaded.pdfGarbageCollect || loaded.pdfCompress) {
            qDebug() << "FAIL: saved values not read back";
            success = false;
        } else {
            qDebug() << "  - Round trip: OK";
        }
        if (loaded.storageRoot != QDir(tempDir.path()).filePath("blobs")) {
            qDebug() << "FAIL: storage root resolved to" << loaded.storageRoot;
            success = false;
        } else {
            qDebug() << "  - Relative storage root: OK";
        }
    }

    // Test 2: empty values fall back to defaults, empty root goes below the library
    {
        EngineConfig blank;
        blank.defaultLanguage.clear();
        blank.extractedTitle.clear();
        blank.sidecarDirName.clear();
        {
            QSettings settings(iniPath, QSettings::IniFormat);
            blank.save(settings);
            settings.sync();
        }

        const EngineConfig loaded = EngineConfig::load(tempDir.path());
        if (loaded.defaultLanguage != "eng" || loaded.extractedTitle != "noname.pdf"
            || loaded.sidecarDirName != "sidecars"
            || loaded.storageRoot != QDir(tempDir.path()).filePath("storage")) {
            qDebug() << "FAIL: defaults not restored";
            success = false;
        } else {
            qDebug() << "  - Defaults: OK";
        }
    }

    return success;
}

inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running DocumentStore Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testVersionLifecycle();
    qDebug() << "";

    allPass &= testAggregateText();
    qDebug() << "";

    allPass &= testStoreLookup();
    qDebug() << "";

    allPass &= testSnapshot();
    qDebug() << "";

    allPass &= testCorruptSnapshot();
    qDebug() << "";

    allPass &= testEngineConfig();
    qDebug() << "";

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL DOCUMENT STORE TESTS PASSED!";
    } else {
        qDebug() << "SOME DOCUMENT STORE TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace DocumentStoreTests
