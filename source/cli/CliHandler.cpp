#include "CliHandler.h"
#include "CliReporter.h"

#include "../core/DocumentStore.h"
#include "../core/EngineConfig.h"
#include "../pdf/PdfPageEditor.h"
#include "../storage/PageStorage.h"
#include "../versioning/PageMutator.h"
#include "../versioning/VersionManager.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <memory>

/**
 * @file CliHandler.cpp
 * @brief Implementation of CLI command handlers.
 *
 * @see CliHandler.h for API documentation
 */

namespace Cli {

namespace {

// =============================================================================
// Library Session
// =============================================================================

/**
 * @brief Everything a command needs to work on one library directory.
 */
class LibrarySession {
public:
    /**
     * @brief Load configuration, record store, storage and PDF backend.
     * @return ExitCode::Success, or the code to exit with.
     */
    int open(const QCommandLineParser& parser, ConsoleReporter& reporter)
    {
        m_dir = parser.value(QStringLiteral("library"));
        if (m_dir.isEmpty()) {
            reporter.reportError(QCoreApplication::translate("CLI",
                "Library directory required. Use -l or --library to specify it."));
            return ExitCode::InvalidArgs;
        }
        m_dir = QDir::cleanPath(QDir::current().absoluteFilePath(m_dir));

        if (!QDir().mkpath(m_dir)) {
            reporter.reportError(QCoreApplication::translate("CLI",
                "Cannot create library directory %1").arg(m_dir));
            return ExitCode::IoError;
        }

        config = EngineConfig::load(m_dir);

        QString error;
        if (!store.load(libraryFile(), &error)) {
            reporter.reportError(error);
            return ExitCode::IoError;
        }

        storage = PageStorage::createFileStorage(config.storageRoot);

        PdfWriteOptions writeOptions;
        writeOptions.garbageCollect = config.pdfGarbageCollect;
        writeOptions.compress = config.pdfCompress;
        editor = PdfPageEditor::create(writeOptions);

        return ExitCode::Success;
    }

    bool save(ConsoleReporter& reporter)
    {
        QString error;
        if (!store.save(libraryFile(), &error)) {
            reporter.reportError(error);
            return false;
        }
        return true;
    }

    QString libraryFile() const { return QDir(m_dir).filePath(QStringLiteral("library.json")); }

    EngineConfig config;
    DocumentStore store;
    std::unique_ptr<PageStorage> storage;
    std::unique_ptr<PdfPageEditor> editor;

private:
    QString m_dir;
};

/**
 * @brief Report, save and map a mutation result to an exit code.
 *
 * The store is saved even after a failure so staged versions stay visible
 * to the sweep command.
 */
int finishMutation(LibrarySession& session, ConsoleReporter& reporter,
                   const QString& command, const MutationResult& result)
{
    reporter.reportMutation(command, result);
    if (!session.save(reporter)) {
        return ExitCode::IoError;
    }
    return exitCodeFromResult(result);
}

QString describeDocument(const Document* doc)
{
    const DocumentVersion* current = doc->currentVersion();
    if (!current) {
        return QStringLiteral("  document %1 \"%2\" (no version)").arg(doc->id, doc->title);
    }
    return QStringLiteral("  document %1 \"%2\" v%3, %4 pages")
        .arg(doc->id, doc->title)
        .arg(current->versionNumber)
        .arg(current->pageCount());
}

} // anonymous namespace

// =============================================================================
// Helper Functions
// =============================================================================

OutputMode getOutputMode(const QCommandLineParser& parser)
{
    if (parser.isSet(QStringLiteral("json"))) {
        return OutputMode::Json;
    }
    if (parser.isSet(QStringLiteral("verbose"))) {
        return OutputMode::Verbose;
    }
    return OutputMode::Simple;
}

int exitCodeFromResult(const MutationResult& result)
{
    if (result.success) {
        return ExitCode::Success;
    }
    if (result.error == MutationError::IOFailure) {
        return ExitCode::IoError;
    }
    return ExitCode::OperationFailed;
}

// =============================================================================
// Library Handlers
// =============================================================================

int handleInitFolder(const QCommandLineParser& parser)
{
    ConsoleReporter reporter(getOutputMode(parser));
    LibrarySession session;
    int code = session.open(parser, reporter);
    if (code != ExitCode::Success) {
        return code;
    }

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        reporter.reportError(QCoreApplication::translate("CLI",
            "Exactly one folder title expected. Use 'folio init-folder --help' for usage."));
        return ExitCode::InvalidArgs;
    }

    const QString parentId = parser.value(QStringLiteral("parent"));
    if (!parentId.isEmpty() && !session.store.folder(parentId)) {
        reporter.reportError(QCoreApplication::translate("CLI", "Folder %1 not found").arg(parentId));
        return ExitCode::InvalidArgs;
    }

    Folder* folder = session.store.createFolder(args.first(), parentId);
    if (!session.save(reporter)) {
        return ExitCode::IoError;
    }

    reporter.reportRecord(QStringLiteral("folder"), folder->toJson(),
                          QStringLiteral("folder %1 \"%2\"").arg(folder->id, folder->title));
    return ExitCode::Success;
}

int handleImport(const QCommandLineParser& parser)
{
    ConsoleReporter reporter(getOutputMode(parser));
    LibrarySession session;
    int code = session.open(parser, reporter);
    if (code != ExitCode::Success) {
        return code;
    }

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        reporter.reportError(QCoreApplication::translate("CLI",
            "Exactly one PDF file expected. Use 'folio import --help' for usage."));
        return ExitCode::InvalidArgs;
    }
    const QString folderId = parser.value(QStringLiteral("folder"));
    if (folderId.isEmpty() || !session.store.folder(folderId)) {
        reporter.reportError(QCoreApplication::translate("CLI",
            "A valid destination folder is required. Use --folder to specify it."));
        return ExitCode::InvalidArgs;
    }

    QFile file(args.first());
    if (!file.open(QIODevice::ReadOnly)) {
        reporter.reportError(QCoreApplication::translate("CLI", "Cannot read %1: %2")
                                 .arg(args.first(), file.errorString()));
        return ExitCode::IoError;
    }
    const QByteArray payload = file.readAll();
    file.close();

    QString title = parser.value(QStringLiteral("title"));
    if (title.isEmpty()) {
        title = QFileInfo(args.first()).fileName();
    }
    QString language = parser.value(QStringLiteral("lang"));
    if (language.isEmpty()) {
        language = session.config.defaultLanguage;
    }

    Document* doc = session.store.createDocument(title, language, folderId);
    QString error;
    DocumentVersion* version = VersionManager::importPayload(*doc, payload, session.storage.get(),
                                                             session.editor.get(), &error);
    if (!version) {
        // The snapshot is not saved, so the half-created document is dropped
        reporter.reportError(error);
        return ExitCode::IoError;
    }
    if (!session.save(reporter)) {
        return ExitCode::IoError;
    }

    reporter.reportRecord(QStringLiteral("document"), doc->toJson(), describeDocument(doc).trimmed());
    return ExitCode::Success;
}

int handleSetText(const QCommandLineParser& parser)
{
    ConsoleReporter reporter(getOutputMode(parser));
    LibrarySession session;
    int code = session.open(parser, reporter);
    if (code != ExitCode::Success) {
        return code;
    }

    QStringList args = parser.positionalArguments();
    if (args.size() < 2) {
        reporter.reportError(QCoreApplication::translate("CLI",
            "A document id and one text per page expected."));
        return ExitCode::InvalidArgs;
    }

    Document* doc = session.store.document(args.takeFirst());
    DocumentVersion* current = doc ? doc->currentVersion() : nullptr;
    if (!current) {
        reporter.reportError(QCoreApplication::translate("CLI", "Document not found or has no version"));
        return ExitCode::InvalidArgs;
    }

    QString error;
    if (!current->updateText(args, &error)) {
        reporter.reportError(error);
        return ExitCode::OperationFailed;
    }
    if (!session.save(reporter)) {
        return ExitCode::IoError;
    }

    reporter.reportRecord(QStringLiteral("version"), current->toJson(),
                          QStringLiteral("version %1: \"%2\"").arg(current->versionNumber).arg(current->text));
    return ExitCode::Success;
}

int handleList(const QCommandLineParser& parser)
{
    ConsoleReporter reporter(getOutputMode(parser));
    LibrarySession session;
    int code = session.open(parser, reporter);
    if (code != ExitCode::Success) {
        return code;
    }

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        for (const Folder* folder : session.store.folders()) {
            reporter.reportRecord(QStringLiteral("folder"), folder->toJson(),
                                  QStringLiteral("folder %1 \"%2\"").arg(folder->id, folder->title));
            for (const Document* doc : session.store.documentsInFolder(folder->id)) {
                QJsonObject fields;
                fields["id"] = doc->id;
                fields["title"] = doc->title;
                fields["folder_id"] = doc->folderId;
                if (const DocumentVersion* current = doc->currentVersion()) {
                    fields["version"] = current->versionNumber;
                    fields["pages"] = current->pageCount();
                }
                reporter.reportRecord(QStringLiteral("document"), fields, describeDocument(doc));
            }
        }
        return ExitCode::Success;
    }

    Document* doc = session.store.document(args.first());
    if (!doc) {
        reporter.reportError(QCoreApplication::translate("CLI", "Document %1 not found").arg(args.first()));
        return ExitCode::InvalidArgs;
    }

    for (const DocumentVersion* version : doc->versions()) {
        reporter.reportRecord(QStringLiteral("version"), version->toJson(),
                              QStringLiteral("version %1 [%2] %3 pages %4")
                                  .arg(version->versionNumber)
                                  .arg(DocumentVersion::stateToString(version->state))
                                  .arg(version->pageCount())
                                  .arg(version->id));
        if (reporter.mode() == OutputMode::Json) {
            continue;   // Pages are part of the version object
        }
        for (const Page* page : version->pages()) {
            reporter.reportRecord(QStringLiteral("page"), page->toJson(),
                                  QStringLiteral("  page %1 %2 \"%3\"")
                                      .arg(page->number)
                                      .arg(page->id)
                                      .arg(page->textOrEmpty()));
        }
    }
    return ExitCode::Success;
}

// =============================================================================
// Mutation Handlers
// =============================================================================

int handleDelete(const QCommandLineParser& parser)
{
    ConsoleReporter reporter(getOutputMode(parser));
    LibrarySession session;
    int code = session.open(parser, reporter);
    if (code != ExitCode::Success) {
        return code;
    }

    PageMutator mutator(&session.store, session.storage.get(), session.editor.get(), session.config);
    const MutationResult result = mutator.deletePages(parser.positionalArguments());
    return finishMutation(session, reporter, QStringLiteral("delete"), result);
}

int handleReorder(const QCommandLineParser& parser)
{
    ConsoleReporter reporter(getOutputMode(parser));
    LibrarySession session;
    int code = session.open(parser, reporter);
    if (code != ExitCode::Success) {
        return code;
    }

    QVector<PageReorderItem> items;
    for (const QString& arg : parser.positionalArguments()) {
        const QStringList parts = arg.split(QLatin1Char(':'));
        bool oldOk = false;
        bool newOk = false;
        PageReorderItem item;
        if (parts.size() == 3) {
            item.pageId = parts.at(0);
            item.oldNumber = parts.at(1).toInt(&oldOk);
            item.newNumber = parts.at(2).toInt(&newOk);
        }
        if (!oldOk || !newOk) {
            reporter.reportError(QCoreApplication::translate("CLI",
                "Invalid reorder item \"%1\", expected page:old:new").arg(arg));
            return ExitCode::InvalidArgs;
        }
        items.append(item);
    }

    PageMutator mutator(&session.store, session.storage.get(), session.editor.get(), session.config);
    const MutationResult result = mutator.reorderPages(items);
    return finishMutation(session, reporter, QStringLiteral("reorder"), result);
}

int handleRotate(const QCommandLineParser& parser)
{
    ConsoleReporter reporter(getOutputMode(parser));
    LibrarySession session;
    int code = session.open(parser, reporter);
    if (code != ExitCode::Success) {
        return code;
    }

    QVector<PageRotateItem> items;
    for (const QString& arg : parser.positionalArguments()) {
        const QStringList parts = arg.split(QLatin1Char(':'));
        bool ok = false;
        PageRotateItem item;
        if (parts.size() == 2) {
            item.pageId = parts.at(0);
            item.angle = parts.at(1).toInt(&ok);
        }
        if (!ok) {
            reporter.reportError(QCoreApplication::translate("CLI",
                "Invalid rotate item \"%1\", expected page:angle").arg(arg));
            return ExitCode::InvalidArgs;
        }
        items.append(item);
    }

    PageMutator mutator(&session.store, session.storage.get(), session.editor.get(), session.config);
    const MutationResult result = mutator.rotatePages(items);
    return finishMutation(session, reporter, QStringLiteral("rotate"), result);
}

int handleMoveToFolder(const QCommandLineParser& parser)
{
    ConsoleReporter reporter(getOutputMode(parser));
    LibrarySession session;
    int code = session.open(parser, reporter);
    if (code != ExitCode::Success) {
        return code;
    }

    const QString folderId = parser.value(QStringLiteral("folder"));
    if (folderId.isEmpty()) {
        reporter.reportError(QCoreApplication::translate("CLI",
            "Destination folder required. Use --folder to specify it."));
        return ExitCode::InvalidArgs;
    }

    PageMutator mutator(&session.store, session.storage.get(), session.editor.get(), session.config);
    const MutationResult result = mutator.moveToFolder(parser.positionalArguments(), folderId,
                                                       parser.isSet(QStringLiteral("single-page")));
    return finishMutation(session, reporter, QStringLiteral("move-to-folder"), result);
}

int handleMoveToDocument(const QCommandLineParser& parser)
{
    ConsoleReporter reporter(getOutputMode(parser));
    LibrarySession session;
    int code = session.open(parser, reporter);
    if (code != ExitCode::Success) {
        return code;
    }

    const QString documentId = parser.value(QStringLiteral("document"));
    if (documentId.isEmpty()) {
        reporter.reportError(QCoreApplication::translate("CLI",
            "Destination document required. Use --document to specify it."));
        return ExitCode::InvalidArgs;
    }
    bool positionOk = false;
    const int position = parser.value(QStringLiteral("position")).toInt(&positionOk);
    if (!positionOk) {
        reporter.reportError(QCoreApplication::translate("CLI", "Invalid --position value"));
        return ExitCode::InvalidArgs;
    }

    PageMutator mutator(&session.store, session.storage.get(), session.editor.get(), session.config);
    const MutationResult result = mutator.moveToDocument(parser.positionalArguments(), documentId, position);
    return finishMutation(session, reporter, QStringLiteral("move-to-document"), result);
}

int handleSweep(const QCommandLineParser& parser)
{
    ConsoleReporter reporter(getOutputMode(parser));
    LibrarySession session;
    int code = session.open(parser, reporter);
    if (code != ExitCode::Success) {
        return code;
    }

    int removed = 0;
    for (Document* doc : session.store.documents()) {
        QString error;
        const int count = VersionManager::sweepOrphans(*doc, session.storage.get(),
                                                       session.config.sidecarDirName, &error);
        if (count < 0) {
            // Not saved: records of versions already swept are removed again next time
            reporter.reportError(error);
            return ExitCode::IoError;
        }
        removed += count;
    }
    if (!session.save(reporter)) {
        return ExitCode::IoError;
    }

    QJsonObject fields;
    fields["removed"] = removed;
    reporter.reportRecord(QStringLiteral("sweep"), fields,
                          QStringLiteral("sweep... OK (%1 orphaned versions removed)").arg(removed));
    return ExitCode::Success;
}

} // namespace Cli
