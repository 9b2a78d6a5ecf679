#include <QCoreApplication>
#include <QTextStream>

#include "cli/CLIHandler.h"
#include "settings/Settings.h"
#include "version.h"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Set application metadata
    app.setApplicationName(WearStitch::kApplicationName);
    app.setOrganizationName(WearStitch::kOrganizationName);
    app.setApplicationVersion(WEARSTITCH_VERSION);

    WearStitch::CLI::CLIHandler handler;
    const WearStitch::CLI::CLIResult result = handler.process(app.arguments());

    if (!result.message.isEmpty()) {
        QTextStream stream(result.isSuccess() ? stdout : stderr);
        stream << result.message;
        if (!result.message.endsWith('\n')) {
            stream << '\n';
        }
    }

    return static_cast<int>(result.code);
}
