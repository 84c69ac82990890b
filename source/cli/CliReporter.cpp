#include "CliReporter.h"

#include "../versioning/PageMutator.h"

#include <QCoreApplication>
#include <QJsonArray>
#include <QJsonDocument>

/**
 * @file CliReporter.cpp
 * @brief Implementation of the console reporter.
 *
 * @see CliReporter.h for API documentation
 */

namespace Cli {

// =============================================================================
// Constructor
// =============================================================================

ConsoleReporter::ConsoleReporter(OutputMode mode)
    : m_mode(mode)
    , m_out(stdout)
    , m_err(stderr)
{
}

// =============================================================================
// Mutation Reporting
// =============================================================================

void ConsoleReporter::reportMutation(const QString& command, const MutationResult& result)
{
    if (m_mode == OutputMode::Json) {
        reportMutationJson(command, result);
    } else {
        reportMutationText(command, result);
    }
}

void ConsoleReporter::reportMutationText(const QString& command, const MutationResult& result)
{
    // Format: delete... OK (1 version)
    // Format: rotate... ERROR [ArchivedEditConflict]: message

    if (!result.success) {
        m_err << QStringLiteral("%1... ").arg(command)
              << QCoreApplication::translate("CLI", "ERROR")
              << " [" << mutationErrorName(result.error) << "]: "
              << result.errorMessage << "\n";
        m_err.flush();
        return;
    }

    m_out << QStringLiteral("%1... ").arg(command)
          << QCoreApplication::translate("CLI", "OK")
          << QStringLiteral(" (%1 versions)").arg(result.versionIds.size()) << "\n";

    if (m_mode == OutputMode::Verbose) {
        for (const QString& id : result.documentIds) {
            m_out << QCoreApplication::translate("CLI", "  Document: ") << id << "\n";
        }
        for (const QString& id : result.versionIds) {
            m_out << QCoreApplication::translate("CLI", "  Version:  ") << id << "\n";
        }
    }
    if (!result.pagesNeedingArtifacts.isEmpty()) {
        m_out << QCoreApplication::translate("CLI", "  Pages needing new artifacts: ")
              << result.pagesNeedingArtifacts.join(QStringLiteral(", ")) << "\n";
    }
    m_out.flush();
}

void ConsoleReporter::reportMutationJson(const QString& command, const MutationResult& result)
{
    // {"type":"mutation","command":"delete","success":true,"versions":[...],...}

    QJsonObject obj;
    obj["type"] = QStringLiteral("mutation");
    obj["command"] = command;
    obj["success"] = result.success;
    if (!result.success) {
        obj["error"] = mutationErrorName(result.error);
        obj["message"] = result.errorMessage;
    }
    obj["versions"] = QJsonArray::fromStringList(result.versionIds);
    obj["documents"] = QJsonArray::fromStringList(result.documentIds);
    if (!result.pagesNeedingArtifacts.isEmpty()) {
        obj["pages_needing_artifacts"] = QJsonArray::fromStringList(result.pagesNeedingArtifacts);
    }

    m_out << QJsonDocument(obj).toJson(QJsonDocument::Compact) << "\n";
    m_out.flush();
}

// =============================================================================
// Record Reporting
// =============================================================================

void ConsoleReporter::reportRecord(const QString& type, const QJsonObject& fields, const QString& text)
{
    if (m_mode == OutputMode::Json) {
        QJsonObject obj = fields;
        obj["type"] = type;
        m_out << QJsonDocument(obj).toJson(QJsonDocument::Compact) << "\n";
    } else {
        m_out << text << "\n";
    }
    m_out.flush();
}

// =============================================================================
// Error/Warning Reporting
// =============================================================================

void ConsoleReporter::reportError(const QString& message)
{
    if (m_mode == OutputMode::Json) {
        QJsonObject obj;
        obj["type"] = QStringLiteral("error");
        obj["message"] = message;
        m_err << QJsonDocument(obj).toJson(QJsonDocument::Compact) << "\n";
    } else {
        m_err << QCoreApplication::translate("CLI", "Error: ") << message << "\n";
    }
    m_err.flush();
}

void ConsoleReporter::reportWarning(const QString& message)
{
    if (m_mode == OutputMode::Json) {
        QJsonObject obj;
        obj["type"] = QStringLiteral("warning");
        obj["message"] = message;
        m_err << QJsonDocument(obj).toJson(QJsonDocument::Compact) << "\n";
    } else {
        m_err << QCoreApplication::translate("CLI", "Warning: ") << message << "\n";
    }
    m_err.flush();
}

} // namespace Cli
