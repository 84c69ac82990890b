#ifndef CLIREPORTER_H
#define CLIREPORTER_H

/**
 * @file CliReporter.h
 * @brief Console reporter for CLI results.
 *
 * Formats mutation results and library listings for terminal display.
 * Supports three output modes:
 * - Simple: One line per result (`delete... OK (version 3f2a...)`)
 * - Verbose: Every committed version, document and affected page
 * - JSON: One JSON object per line for scripting
 */

#include "CliParser.h"

#include <QJsonObject>
#include <QTextStream>

struct MutationResult;

namespace Cli {

/**
 * @brief Reporter for console output.
 *
 * Usage:
 * @code
 *   ConsoleReporter reporter(OutputMode::Simple);
 *   MutationResult result = mutator.deletePages(ids);
 *   reporter.reportMutation("delete", result);
 * @endcode
 */
class ConsoleReporter {
public:
    explicit ConsoleReporter(OutputMode mode = OutputMode::Simple);

    /**
     * @brief Report the outcome of a page mutation.
     *
     * Failures go to stderr with their error category.
     */
    void reportMutation(const QString& command, const MutationResult& result);

    /**
     * @brief Report one record (folder, document, version or page).
     *
     * In JSON mode fields are printed with an added "type" key; otherwise
     * text is printed as is.
     *
     * @param type Record type, e.g. "folder"
     * @param fields JSON fields of the record
     * @param text Human readable line
     */
    void reportRecord(const QString& type, const QJsonObject& fields, const QString& text);

    /**
     * @brief Report an error message to stderr.
     */
    void reportError(const QString& message);

    /**
     * @brief Report a warning message to stderr.
     */
    void reportWarning(const QString& message);

    OutputMode mode() const { return m_mode; }

private:
    void reportMutationText(const QString& command, const MutationResult& result);
    void reportMutationJson(const QString& command, const MutationResult& result);

private:
    OutputMode m_mode;
    QTextStream m_out;      ///< stdout stream
    QTextStream m_err;      ///< stderr stream
};

} // namespace Cli

#endif // CLIREPORTER_H
