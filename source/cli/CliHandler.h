#ifndef CLIHANDLER_H
#define CLIHANDLER_H

/**
 * @file CliHandler.h
 * @brief Command handlers for the folio CLI.
 *
 * Each handler opens the library named by --library, runs one operation,
 * saves the record store when something changed, and reports the result.
 */

#include "CliParser.h"

#include <QCommandLineParser>

struct MutationResult;

namespace Cli {

int handleInitFolder(const QCommandLineParser& parser);
int handleImport(const QCommandLineParser& parser);
int handleSetText(const QCommandLineParser& parser);
int handleList(const QCommandLineParser& parser);

/**
 * @brief Handle the delete command.
 *
 * Positional arguments are page ids of one version.
 */
int handleDelete(const QCommandLineParser& parser);

/**
 * @brief Handle the reorder command.
 *
 * Positional arguments are "page:old:new" triples covering every page.
 */
int handleReorder(const QCommandLineParser& parser);

/**
 * @brief Handle the rotate command.
 *
 * Positional arguments are "page:angle" pairs.
 */
int handleRotate(const QCommandLineParser& parser);

int handleMoveToFolder(const QCommandLineParser& parser);
int handleMoveToDocument(const QCommandLineParser& parser);

/**
 * @brief Handle the sweep command.
 *
 * Removes staged versions of every document in the library.
 */
int handleSweep(const QCommandLineParser& parser);

/**
 * @brief Determine the output mode from parser options.
 *
 * Priority: --json > --verbose > Simple
 */
OutputMode getOutputMode(const QCommandLineParser& parser);

/**
 * @brief Map a mutation result to an exit code.
 *
 * IOFailure maps to IoError, every other failure to OperationFailed.
 */
int exitCodeFromResult(const MutationResult& result);

} // namespace Cli

#endif // CLIHANDLER_H
