// ============================================================================
// Folio - Main Entry Point
// ============================================================================

#include <QCoreApplication>

#include "cli/CliParser.h"

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setOrganizationName("Folio");
    app.setApplicationName("folio");
    app.setApplicationVersion("1.0.0");

    return Cli::run(app, argc, argv);
}
