// ============================================================================
// Folio - Unit Test Runner
// ============================================================================
// Usage: folio_tests <suite>
// Suites: pagemap, pdfeditor, store, storage, versionmanager, mutator, all
// ============================================================================

#include <QCoreApplication>
#include <QDebug>
#include <QTest>

#include "core/DocumentStoreTests.h"
#include "pdf/MuPdfPageEditorTests.h"
#include "storage/FileStorageTests.h"
#include "versioning/PageMapTests.h"
#include "versioning/PageMutatorTests.h"
#include "versioning/VersionManagerTests.h"

static int runTests(const QString& testType)
{
    bool success = false;

    if (testType == "pagemap") {
        success = PageMapTests::runAllTests();
    } else if (testType == "pdfeditor") {
        success = MuPdfPageEditorTests::runAllTests();
    } else if (testType == "store") {
        success = DocumentStoreTests::runAllTests();
    } else if (testType == "storage") {
        success = FileStorageTests::runAllTests();
    } else if (testType == "versionmanager") {
        success = VersionManagerTests::runAllTests();
    } else if (testType == "mutator") {
        PageMutatorTests tests;
        return QTest::qExec(&tests);
    } else if (testType == "all") {
        success = PageMapTests::runAllTests();
        success &= MuPdfPageEditorTests::runAllTests();
        success &= DocumentStoreTests::runAllTests();
        success &= FileStorageTests::runAllTests();
        success &= VersionManagerTests::runAllTests();
        PageMutatorTests tests;
        success &= (QTest::qExec(&tests) == 0);
    } else {
        qWarning() << "Unknown test suite:" << testType;
    }

    return success ? 0 : 1;
}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setOrganizationName("Folio");
    app.setApplicationName("folio_tests");

    const QStringList args = app.arguments();
    const QString testType = args.size() > 1 ? args.at(1) : QStringLiteral("all");
    return runTests(testType);
}
