/*
wsbridge — main.cpp
Role: Entry point of the bridge process launched by the host's plugin_start_cmd.
Exit codes: 0 after an orderly shutdown, 1 when the host channel cannot be opened, 2 on a bad command line.
*/
#include "BridgeConfig.hpp"
#include "BridgeLogging.hpp"
#include "bridge/BridgeCore.hpp"
#include <QCoreApplication>
#include <QString>
#include <csignal>
#include <iostream>
#include <unistd.h>

int main(int argc, char* argv[])
{
    // A host that goes away must surface as a failed write, not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    // No Qt event loop runs; the application object provides arguments and names for the CLI
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("wsbridge");
    QCoreApplication::setApplicationVersion(WSBRIDGE_VERSION_STRING);

    const auto parsed = parseBridgeConfig(QCoreApplication::arguments());
    switch (parsed.action) {
        case ConfigParseResult::Action::ShowHelp:
        case ConfigParseResult::Action::ShowVersion:
            std::cout << parsed.message << std::endl;
            return 0;
        case ConfigParseResult::Action::Error:
            std::cerr << "wsbridge: " << parsed.message << "\n"
                      << "Try 'wsbridge --help' for more information." << std::endl;
            return 2;
        case ConfigParseResult::Action::Run:
            break;
    }

    std::string logError;
    const bool logOk = wsbridge::logging::install(parsed.config.logging, &logError);

    bLog_App(QString("[wsbridge %1 starting, log level %2]")
        .arg(WSBRIDGE_VERSION_STRING)
        .arg(wsbridge::logging::toString(parsed.config.logging.level)));
    if (!logOk) {
        bLog_Warning(QString::fromStdString(logError));
    }
    for (const auto& warning : parsed.warnings) {
        bLog_Warning(QString::fromStdString(warning));
    }

    int exitCode = 0;
    {
        BridgeCore core(parsed.config);
        std::string error;
        if (!core.start(STDIN_FILENO, &error)) {
            bLog_Error(QString("Cannot start bridge: %1").arg(QString::fromStdString(error)));
            exitCode = 1;
        } else {
            const auto reason = core.waitForShutdown();
            bLog_App(QString("Exiting (%1)").arg(QString::fromStdString(reason)));
            core.stop();
        }
    }

    bLog_App("[wsbridge stopped]");
    wsbridge::logging::shutdown();
    return exitCode;
}
