#pragma once

// ============================================================================
// FileStorageTests - Unit tests for FileStorage and PagePath
// ============================================================================

#include "FileStorage.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>

namespace FileStorageTests {

/**
 * @brief Test PagePath layout strings.
 */
inline bool testPagePath()
{
    qDebug() << "=== Test: PagePath ===";
    bool success = true;

    PagePath path("doc-1", 3, 12);
    if (path.directory() != "sidecars/doc-1/v3/pages/000012") {
        qDebug() << "FAIL: page directory is" << path.directory();
        success = false;
    }
    if (PagePath::documentPathFor("doc-1", 3, "a.pdf") != "docs/doc-1/v3/a.pdf") {
        qDebug() << "FAIL: payload path is" << PagePath::documentPathFor("doc-1", 3, "a.pdf");
        success = false;
    }
    if (PagePath("d", 1, 1, "thumbs").directory() != "thumbs/d/v1/pages/000001") {
        qDebug() << "FAIL: custom sidecar dir not used";
        success = false;
    }
    if (success) {
        qDebug() << "  - Layout: OK";
    }
    return success;
}

/**
 * @brief Test read/write/exists/removeTree.
 */
inline bool testReadWrite()
{
    qDebug() << "=== Test: Read / Write ===";
    bool success = true;

    QTemporaryDir tempDir;
    FileStorage storage(tempDir.path());

    if (!storage.write("docs/d/v1/a.pdf", QByteArray("payload"))) {
        qDebug() << "FAIL: write failed:" << storage.errorMessage();
        return false;
    }

    bool ok = false;
    QByteArray data = storage.read("docs/d/v1/a.pdf", &ok);
    if (!ok || data != "payload" || !storage.exists("docs/d/v1/a.pdf")) {
        qDebug() << "FAIL: read back" << data;
        success = false;
    } else {
        qDebug() << "  - Write creates parents: OK";
    }

    storage.read("docs/d/v1/missing.pdf", &ok);
    if (ok || storage.errorMessage().isEmpty()) {
        qDebug() << "FAIL: missing file read reported success";
        success = false;
    } else {
        qDebug() << "  - Missing file: OK";
    }

    if (!storage.write("docs/d/v1/a.pdf", QByteArray("replaced"))
        || storage.read("docs/d/v1/a.pdf") != "replaced") {
        qDebug() << "FAIL: overwrite";
        success = false;
    }

    if (!storage.removeTree("docs/d") || storage.exists("docs/d/v1/a.pdf")
        || !storage.removeTree("docs/never")) {
        qDebug() << "FAIL: removeTree";
        success = false;
    } else {
        qDebug() << "  - removeTree: OK";
    }

    return success;
}

/**
 * @brief Test copyPage() between artifact slots.
 */
inline bool testCopyPage()
{
    qDebug() << "=== Test: copyPage() ===";
    bool success = true;

    QTemporaryDir tempDir;
    FileStorage storage(tempDir.path());

    const PagePath src("d", 1, 2);
    const PagePath dst("d", 2, 1);
    storage.write(src.directory() + "/preview.jpg", QByteArray("jpg"));
    storage.write(src.directory() + "/hocr.html", QByteArray("<html/>"));

    if (!storage.copyPage(src, dst)) {
        qDebug() << "FAIL: copyPage failed:" << storage.errorMessage();
        return false;
    }
    if (storage.read(dst.directory() + "/preview.jpg") != "jpg"
        || storage.read(dst.directory() + "/hocr.html") != "<html/>") {
        qDebug() << "FAIL: artifacts not copied";
        success = false;
    } else {
        qDebug() << "  - Copy slot: OK";
    }

    // Copying onto an existing slot replaces its files
    storage.write(src.directory() + "/preview.jpg", QByteArray("jpg2"));
    if (!storage.copyPage(src, dst) || storage.read(dst.directory() + "/preview.jpg") != "jpg2") {
        qDebug() << "FAIL: existing artifact not replaced";
        success = false;
    } else {
        qDebug() << "  - Replace existing: OK";
    }

    // A slot without artifacts copies nothing and creates nothing
    const PagePath empty("d", 1, 9);
    const PagePath target("d", 2, 9);
    if (!storage.copyPage(empty, target) || storage.exists(target.directory())) {
        qDebug() << "FAIL: empty slot should be a no-op";
        success = false;
    } else {
        qDebug() << "  - Empty slot: OK";
    }

    return success;
}

inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running FileStorage Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testPagePath();
    qDebug() << "";

    allPass &= testReadWrite();
    qDebug() << "";

    allPass &= testCopyPage();
    qDebug() << "";

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL FILE STORAGE TESTS PASSED!";
    } else {
        qDebug() << "SOME FILE STORAGE TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace FileStorageTests
