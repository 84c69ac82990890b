#include "CliParser.h"
#include "CliHandler.h"

#include <QCoreApplication>
#include <QTextStream>
#include <cstring>

/**
 * @file CliParser.cpp
 * @brief Implementation of CLI argument parsing.
 *
 * @see CliParser.h for API documentation
 */

namespace Cli {

// Application version (matches CMakeLists.txt project VERSION)
static const char* APP_VERSION = "1.0.0";

namespace {

struct CommandEntry {
    const char* name;
    Command command;
};

const CommandEntry COMMANDS[] = {
    {"init-folder", Command::InitFolder},
    {"import", Command::Import},
    {"set-text", Command::SetText},
    {"list", Command::List},
    {"delete", Command::Delete},
    {"reorder", Command::Reorder},
    {"rotate", Command::Rotate},
    {"move-to-folder", Command::MoveToFolder},
    {"move-to-document", Command::MoveToDocument},
    {"sweep", Command::Sweep},
};

void addOutputOptions(QCommandLineParser& parser)
{
    parser.addOption(QCommandLineOption(
        QStringLiteral("verbose"),
        QCoreApplication::translate("CLI", "Show detailed output")));

    parser.addOption(QCommandLineOption(
        QStringLiteral("json"),
        QCoreApplication::translate("CLI", "Output results as JSON")));
}

} // anonymous namespace

// =============================================================================
// Command Detection
// =============================================================================

Command parseCommand(int argc, char* argv[])
{
    if (argc < 2) {
        return Command::None;
    }

    const char* arg1 = argv[1];

    for (const CommandEntry& entry : COMMANDS) {
        if (std::strcmp(arg1, entry.name) == 0) {
            return entry.command;
        }
    }

    // Check for global flags
    if (std::strcmp(arg1, "--help") == 0 || std::strcmp(arg1, "-h") == 0) {
        return Command::Help;
    }
    if (std::strcmp(arg1, "--version") == 0 || std::strcmp(arg1, "-v") == 0) {
        return Command::Version;
    }

    return Command::None;
}

QString commandName(Command cmd)
{
    for (const CommandEntry& entry : COMMANDS) {
        if (entry.command == cmd) {
            return QString::fromLatin1(entry.name);
        }
    }
    if (cmd == Command::Help) {
        return QStringLiteral("help");
    }
    if (cmd == Command::Version) {
        return QStringLiteral("version");
    }
    return QString();
}

// =============================================================================
// Parser Setup
// =============================================================================

void setupParser(QCommandLineParser& parser, Command cmd)
{
    parser.setApplicationDescription(
        QCoreApplication::translate("CLI", "Folio - Versioned PDF page editing"));

    parser.addHelpOption();
    parser.addVersionOption();

    if (cmd == Command::None || cmd == Command::Help || cmd == Command::Version) {
        return;
    }

    parser.addOption(QCommandLineOption(
        {QStringLiteral("l"), QStringLiteral("library")},
        QCoreApplication::translate("CLI", "Library directory [required]"),
        QStringLiteral("dir")));
    addOutputOptions(parser);

    switch (cmd) {
        case Command::InitFolder:
            parser.addPositionalArgument(
                QStringLiteral("title"),
                QCoreApplication::translate("CLI", "Folder title"));
            parser.addOption(QCommandLineOption(
                QStringLiteral("parent"),
                QCoreApplication::translate("CLI", "Parent folder id"),
                QStringLiteral("id")));
            break;

        case Command::Import:
            parser.addPositionalArgument(
                QStringLiteral("pdf"),
                QCoreApplication::translate("CLI", "PDF file to import"));
            parser.addOption(QCommandLineOption(
                QStringLiteral("folder"),
                QCoreApplication::translate("CLI", "Destination folder id [required]"),
                QStringLiteral("id")));
            parser.addOption(QCommandLineOption(
                QStringLiteral("title"),
                QCoreApplication::translate("CLI", "Document title (default: file name)"),
                QStringLiteral("title")));
            parser.addOption(QCommandLineOption(
                QStringLiteral("lang"),
                QCoreApplication::translate("CLI", "Document language (default: from folio.ini)"),
                QStringLiteral("code")));
            break;

        case Command::SetText:
            parser.addPositionalArgument(
                QStringLiteral("document"),
                QCoreApplication::translate("CLI", "Document id"));
            parser.addPositionalArgument(
                QStringLiteral("text"),
                QCoreApplication::translate("CLI", "One text per page, in page order"),
                QStringLiteral("text..."));
            break;

        case Command::List:
            parser.addPositionalArgument(
                QStringLiteral("document"),
                QCoreApplication::translate("CLI", "Document id; lists its versions and pages"),
                QStringLiteral("[document]"));
            break;

        case Command::Delete:
            parser.addPositionalArgument(
                QStringLiteral("pages"),
                QCoreApplication::translate("CLI", "Page ids to delete"),
                QStringLiteral("page..."));
            break;

        case Command::Reorder:
            parser.addPositionalArgument(
                QStringLiteral("moves"),
                QCoreApplication::translate("CLI", "One page:old:new triple per page"),
                QStringLiteral("page:old:new..."));
            break;

        case Command::Rotate:
            parser.addPositionalArgument(
                QStringLiteral("rotations"),
                QCoreApplication::translate("CLI", "page:angle pairs, angle a multiple of 90"),
                QStringLiteral("page:angle..."));
            break;

        case Command::MoveToFolder:
            parser.addPositionalArgument(
                QStringLiteral("pages"),
                QCoreApplication::translate("CLI", "Page ids to move"),
                QStringLiteral("page..."));
            parser.addOption(QCommandLineOption(
                QStringLiteral("folder"),
                QCoreApplication::translate("CLI", "Destination folder id [required]"),
                QStringLiteral("id")));
            parser.addOption(QCommandLineOption(
                QStringLiteral("single-page"),
                QCoreApplication::translate("CLI", "Create one document per moved page")));
            break;

        case Command::MoveToDocument:
            parser.addPositionalArgument(
                QStringLiteral("pages"),
                QCoreApplication::translate("CLI", "Page ids to move"),
                QStringLiteral("page..."));
            parser.addOption(QCommandLineOption(
                QStringLiteral("document"),
                QCoreApplication::translate("CLI", "Destination document id [required]"),
                QStringLiteral("id")));
            parser.addOption(QCommandLineOption(
                QStringLiteral("position"),
                QCoreApplication::translate("CLI", "Insert after this page; 0 inserts first (default: append)"),
                QStringLiteral("N"),
                QStringLiteral("-1")));
            break;

        case Command::Sweep:
            break;

        default:
            break;
    }
}

// =============================================================================
// Help and Version
// =============================================================================

void showHelp(const QCommandLineParser& parser, Command cmd)
{
    QTextStream out(stdout);

    if (cmd == Command::None || cmd == Command::Help) {
        out << QCoreApplication::translate("CLI",
            "Usage: folio <command> --library <dir> [options] [arguments...]\n"
            "\n"
            "Folio - Versioned PDF page editing. Every edit produces a new\n"
            "immutable document version; page text and rendering artifacts\n"
            "follow their pages.\n"
            "\n"
            "COMMANDS:\n"
            "  init-folder       Create a folder\n"
            "  import            Import a PDF as a new document\n"
            "  set-text          Assign extracted text to the current version's pages\n"
            "  list              List folders and documents, or one document's pages\n"
            "  delete            Delete pages\n"
            "  reorder           Reorder all pages of a document\n"
            "  rotate            Rotate pages\n"
            "  move-to-folder    Move pages into new documents in a folder\n"
            "  move-to-document  Move pages into another document\n"
            "  sweep             Remove versions left behind by failed edits\n"
            "\n"
            "GLOBAL OPTIONS:\n"
            "  -h, --help        Show this help message\n"
            "  -v, --version     Show version information\n"
            "\n"
            "COMMON OPTIONS:\n"
            "  -l, --library <dir>  Library directory\n"
            "  --verbose            Show detailed output\n"
            "  --json               Output results as JSON (for scripting)\n"
            "\n"
            "EXAMPLES:\n"
            "  folio init-folder Inbox -l ~/library\n"
            "  folio import scan.pdf --folder <folder-id> -l ~/library\n"
            "  folio reorder <p1>:1:2 <p2>:2:1 -l ~/library\n"
            "  folio move-to-document <p1> <p2> --document <doc-id> --position 0 -l ~/library\n"
            "\n"
            "EXIT CODES:\n"
            "  0   Operation succeeded\n"
            "  2   Operation rejected\n"
            "  3   Invalid arguments\n"
            "  4   I/O error\n"
            "\n"
            "Run 'folio <command> --help' for command-specific options.\n");
    } else {
        out << parser.helpText();
    }
}

void showVersion()
{
    QTextStream out(stdout);
    out << "folio " << APP_VERSION << "\n";
}

// =============================================================================
// Main Entry Point
// =============================================================================

int run(QCoreApplication& app, int argc, char* argv[])
{
    Q_UNUSED(app)

    Command cmd = parseCommand(argc, argv);

    // Handle help and version immediately
    if (cmd == Command::Version) {
        showVersion();
        return ExitCode::Success;
    }

    if (cmd == Command::Help || cmd == Command::None) {
        QCommandLineParser parser;
        setupParser(parser, Command::None);
        showHelp(parser, cmd);
        return (cmd == Command::Help) ? ExitCode::Success : ExitCode::InvalidArgs;
    }

    QCommandLineParser parser;
    setupParser(parser, cmd);

    // Build argument list without the command name
    // (QCommandLineParser doesn't understand subcommands)
    QStringList args;
    args << QString::fromLocal8Bit(argv[0]);
    for (int i = 2; i < argc; ++i) {
        args << QString::fromLocal8Bit(argv[i]);
    }

    if (!parser.parse(args)) {
        QTextStream err(stderr);
        err << QCoreApplication::translate("CLI", "Error: ")
            << parser.errorText() << "\n\n";
        showHelp(parser, cmd);
        return ExitCode::InvalidArgs;
    }

    if (parser.isSet(QStringLiteral("help"))) {
        showHelp(parser, cmd);
        return ExitCode::Success;
    }

    if (parser.isSet(QStringLiteral("version"))) {
        showVersion();
        return ExitCode::Success;
    }

    switch (cmd) {
        case Command::InitFolder:
            return handleInitFolder(parser);
        case Command::Import:
            return handleImport(parser);
        case Command::SetText:
            return handleSetText(parser);
        case Command::List:
            return handleList(parser);
        case Command::Delete:
            return handleDelete(parser);
        case Command::Reorder:
            return handleReorder(parser);
        case Command::Rotate:
            return handleRotate(parser);
        case Command::MoveToFolder:
            return handleMoveToFolder(parser);
        case Command::MoveToDocument:
            return handleMoveToDocument(parser);
        case Command::Sweep:
            return handleSweep(parser);
        default:
            // Help/Version/None handled above
            return ExitCode::InvalidArgs;
    }
}

} // namespace Cli
