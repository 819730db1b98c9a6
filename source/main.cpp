#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>

#include "AppConfig.hpp"
#include "ConsoleUi.hpp"
#include "ErrorHandler.hpp"
#include "Logger.hpp"
#include "StorageFactory.hpp"
#include "TaskRepository.hpp"
#include "TaskServiceImpl.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("taskline");

    QCommandLineParser parser;
    parser.setApplicationDescription("Task manager with file or PostgreSQL storage");
    parser.addHelpOption();
    QCommandLineOption configOption({"c", "config"}, "Path to the INI configuration file.",
                                    "file", "config.ini");
    parser.addOption(configOption);
    QCommandLineOption verboseOption({"v", "verbose"}, "Echo log messages to stderr.");
    parser.addOption(verboseOption);
    parser.process(app);

    const AppConfig config = AppConfig::load(parser.value(configOption));
    initLogging(config.logFile, parser.isSet(verboseOption));

    QTextStream in(stdin);
    QTextStream out(stdout);

    try {
        // ──────────────────────────────
        // 1. Storage and repository
        // ──────────────────────────────
        auto repository = std::make_shared<TaskRepository>(makeStorage(config));

        // ──────────────────────────────
        // 2. Service
        // ──────────────────────────────
        auto service = std::make_shared<TaskServiceImpl>(repository);

        // ──────────────────────────────
        // 3. Console loop
        // ──────────────────────────────
        ConsoleUi ui(service, in, out);
        ui.run();
    } catch (const PersistenceError &e) {
        qCritical(appCore) << "Startup failed:" << e.what();
        out << "Database connection failed: " << e.message() << Qt::endl;
        shutdownLogging();
        return 1;
    } catch (const std::exception &e) {
        qCritical(appCore) << "Fatal error:" << e.what();
        out << "A critical error occurred. Please check the logs." << Qt::endl;
        shutdownLogging();
        return 1;
    }

    shutdownLogging();
    return 0;
}
