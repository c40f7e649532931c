#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QTextStream>
#include <csignal>
#include <memory>

#include "core/catalog/CatalogLoader.hpp"
#include "core/common/CancellationToken.hpp"
#include "core/common/Config.hpp"
#include "core/common/Logger.hpp"
#include "core/network/HttpRemoteStore.hpp"
#include "core/sync/SyncOrchestrator.hpp"
#include "app/ConsoleProgressSink.hpp"
#include "app/SyncController.hpp"

namespace {

ReelSync::CancellationToken interruptToken;

void onInterrupt(int) {
    interruptToken.cancel();
}

void installSignalHandlers() {
#ifdef Q_OS_UNIX
    // No SA_RESTART so a blocking read at the prompt returns; a second
    // Ctrl+C falls through to the default action.
    struct sigaction action = {};
    action.sa_handler = onInterrupt;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESETHAND;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
#else
    std::signal(SIGINT, onInterrupt);
    std::signal(SIGTERM, onInterrupt);
#endif
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("reelsync");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("ReelSync");

    QCommandLineParser parser;
    parser.setApplicationDescription("Downloads the media items of a sync job to a local destination, "
                                     "resuming partial downloads and skipping complete ones.");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption("config", "Read settings from this INI file.", "file");
    QCommandLineOption serverOption("server", "Base URL of the media server.", "url");
    QCommandLineOption tokenOption("token", "Access token sent with every request.", "token");
    QCommandLineOption destinationOption(QStringList() << "d" << "destination",
                                         "Destination directory for downloaded items.", "path");
    QCommandLineOption yesOption(QStringList() << "y" << "yes", "Do not ask before downloading.");
    QCommandLineOption dryRunOption("dry-run", "Only list what would be downloaded.");
    QCommandLineOption logLevelOption("log-level", "trace, debug, info, warn, error or critical.", "level");
    parser.addOptions({configOption, serverOption, tokenOption, destinationOption,
                       yesOption, dryRunOption, logLevelOption});
    parser.addPositionalArgument("job", "JSON file listing the items to sync.");

    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);
    QTextStream in(stdin);

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        err << "Expected exactly one job file.\n\n" << parser.helpText();
        err.flush();
        return ReelSync::ExitFailure;
    }

    try {
        ReelSync::Config& config = ReelSync::Config::instance();
        if (parser.isSet(configOption)) {
            config.initializeFromFile(parser.value(configOption));
        } else {
            config.initialize();
        }

        const auto logging = config.getLoggingSettings();
        const QString levelName = parser.isSet(logLevelOption) ? parser.value(logLevelOption) : logging.level;
        ReelSync::Logger::Level level = ReelSync::Logger::Level::Info;
        if (!ReelSync::Logger::parseLevel(levelName.toStdString(), level)) {
            err << "Unknown log level: " << levelName << '\n';
            err.flush();
            return ReelSync::ExitFailure;
        }
        ReelSync::Logger::instance().initialize(logging.filePath.toStdString(), level);
        ReelSync::Logger::instance().info("Starting reelsync v{} (settings: {})",
                    app.applicationVersion().toStdString(), config.fileName().toStdString());

        auto connection = config.getConnectionSettings();
        if (parser.isSet(serverOption)) {
            connection.baseUrl = parser.value(serverOption);
        }
        if (parser.isSet(tokenOption)) {
            connection.token = parser.value(tokenOption);
        }
        if (connection.baseUrl.trimmed().isEmpty()) {
            err << "No server URL; pass --server or set connection/baseUrl in " << config.fileName() << '\n';
            err.flush();
            return ReelSync::ExitFailure;
        }

        ReelSync::SyncController::Options options;
        options.destination = parser.isSet(destinationOption) ? parser.value(destinationOption)
                                                              : config.getDefaultDestination();
        options.assumeYes = parser.isSet(yesOption);
        options.dryRun = parser.isSet(dryRunOption);

        ReelSync::CatalogLoader loader;
        auto job = loader.loadFromFile(positional.first());
        if (job.hasError()) {
            err << "Cannot load " << positional.first() << ": " << loader.lastErrorMessage() << '\n';
            err.flush();
            return ReelSync::ExitFailure;
        }

        installSignalHandlers();

        ReelSync::HttpRemoteStore store(connection);
        ReelSync::SyncOrchestrator orchestrator(store, config.getTransferSettings(),
            [&err](const QString& label) -> std::unique_ptr<ReelSync::ProgressSink> {
                return std::make_unique<ReelSync::ConsoleProgressSink>(label, err);
            });
        ReelSync::SyncController controller(orchestrator, out, in, interruptToken);

        return controller.run(job.value().items, options);

    } catch (const std::exception& e) {
        ReelSync::Logger::instance().critical("Fatal error: {}", e.what());
        return ReelSync::ExitFailure;
    }
}
