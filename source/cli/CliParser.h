#ifndef CLIPARSER_H
#define CLIPARSER_H

/**
 * @file CliParser.h
 * @brief Command-line argument parsing for the folio tool.
 *
 * Every command operates on a library directory holding the record store
 * snapshot (library.json), an optional folio.ini and the storage root.
 *
 * Supported commands:
 * - init-folder: Create a folder
 * - import: Upload a PDF as a new document
 * - set-text: Assign extracted page text to a document's current version
 * - list: Show folders, documents, versions and pages
 * - delete, reorder, rotate: Structural edits within one document
 * - move-to-folder, move-to-document: Move pages out of a document
 * - sweep: Remove staged versions left behind by failed edits
 */

#include <QString>
#include <QStringList>
#include <QCommandLineParser>

class QCoreApplication;

namespace Cli {

// =============================================================================
// CLI Commands
// =============================================================================

/**
 * @brief Known CLI commands.
 */
enum class Command {
    None,           ///< No command given
    Help,           ///< Show help message
    Version,        ///< Show version information
    InitFolder,     ///< Create a folder
    Import,         ///< Import a PDF as a new document
    SetText,        ///< Assign page texts
    List,           ///< List library content
    Delete,         ///< Delete pages
    Reorder,        ///< Reorder pages
    Rotate,         ///< Rotate pages
    MoveToFolder,   ///< Move pages into new documents in a folder
    MoveToDocument, ///< Move pages into another document
    Sweep           ///< Remove orphaned staged versions
};

/**
 * @brief Output mode for CLI results.
 */
enum class OutputMode {
    Simple,         ///< One line per result (default)
    Verbose,        ///< Detailed info
    Json            ///< JSON format for scripting
};

// =============================================================================
// Exit Codes
// =============================================================================

/**
 * @brief Exit codes for CLI operations.
 */
namespace ExitCode {
    constexpr int Success = 0;          ///< Operation succeeded
    constexpr int OperationFailed = 2;  ///< Request rejected or conflicting
    constexpr int InvalidArgs = 3;      ///< Bad command line arguments
    constexpr int IoError = 4;          ///< Can't read/write library or storage
}

// =============================================================================
// Command Detection
// =============================================================================

/**
 * @brief Parse the command from command-line arguments.
 *
 * Extracts the command keyword from argv[1] if present.
 *
 * @return The detected command, or Command::None if there is none
 */
Command parseCommand(int argc, char* argv[]);

/**
 * @brief Get command name as string.
 * @return Command name string (e.g., "move-to-folder")
 */
QString commandName(Command cmd);

// =============================================================================
// Parser Setup
// =============================================================================

/**
 * @brief Configure QCommandLineParser for a specific command.
 */
void setupParser(QCommandLineParser& parser, Command cmd);

/**
 * @brief Show help message for a command.
 *
 * If cmd is Command::None or Command::Help, shows general help with the
 * available commands. Otherwise shows the parser's command-specific help.
 */
void showHelp(const QCommandLineParser& parser, Command cmd);

/**
 * @brief Show version information.
 */
void showVersion();

// =============================================================================
// Main Entry Point
// =============================================================================

/**
 * @brief Run the CLI.
 *
 * Parses arguments, executes the requested command, and returns an exit code.
 *
 * @return Exit code (see ExitCode namespace)
 */
int run(QCoreApplication& app, int argc, char* argv[]);

} // namespace Cli

#endif // CLIPARSER_H
