#include "core/DeviceCatalog.hpp"
#include "core/DeviceMonitor.hpp"
#include "core/EventBroadcaster.hpp"
#include "core/Logger.hpp"
#include "core/MountResolver.hpp"
#include "core/StatusRegistry.hpp"
#include "core/UsbEventSource.hpp"
#include "http/HttpServer.hpp"
#include "utils/ConfigManager.hpp"
#include "utils/TerminationSignals.hpp"
#include <sampler-monitor/Constants.hpp>
#include <QCoreApplication>
#include <QCommandLineParser>
#include <QCommandLineOption>
#include <QFile>
#include <csignal>
#include <iostream>

using namespace sampler_monitor;

namespace {

void setupCommandLineParser(QCommandLineParser& parser) {
    parser.setApplicationDescription("Sampler device monitor for OP-Z and OP-1");
    parser.addHelpOption();
    parser.addVersionOption();

    parser.addOption(QCommandLineOption(
        QStringList() << "c" << "config",
        "Specify configuration file path.",
        "config"
    ));

    parser.addOption(QCommandLineOption(
        QStringList() << "l" << "log-file",
        "Specify log file path.",
        "log-file"
    ));

    parser.addOption(QCommandLineOption(
        QStringList() << "log-max-size",
        "Rotate the log file once it reaches this many bytes.",
        "bytes"
    ));

    parser.addOption(QCommandLineOption(
        QStringList() << "v" << "verbosity",
        "Set log level (0-4: debug, info, warning, error, critical).",
        "level",
        "1"
    ));

    parser.addOption(QCommandLineOption(
        QStringList() << "host",
        "Address the HTTP server binds to.",
        "host",
        "127.0.0.1"
    ));

    parser.addOption(QCommandLineOption(
        QStringList() << "p" << "port",
        "Port the HTTP server listens on.",
        "port",
        QString::number(DEFAULT_HTTP_PORT)
    ));

    parser.addOption(QCommandLineOption(
        QStringList() << "poll-attempts",
        "Mount lookups after a storage connect before giving up.",
        "count",
        QString::number(POLL_MAX_ATTEMPTS)
    ));

    parser.addOption(QCommandLineOption(
        QStringList() << "poll-interval-ms",
        "Delay between mount lookups.",
        "ms",
        QString::number(POLL_INTERVAL)
    ));
}

void initializeLogger(const QCommandLineParser& parser) {
    auto& logger = Logger::instance();

    if (parser.isSet("log-file")) {
        logger.setLogFile(parser.value("log-file").toStdString());
        logger.setLogDestination(LogDestination::All);
    }

    if (parser.isSet("log-max-size")) {
        bool ok = false;
        qulonglong bytes = parser.value("log-max-size").toULongLong(&ok);
        if (ok && bytes > 0) {
            logger.setMaxFileSize(static_cast<size_t>(bytes));
        } else {
            std::cerr << "Ignoring invalid --log-max-size value" << std::endl;
        }
    }

    QObject::connect(&logger, &Logger::logFileRotated,
        [](const std::string& oldFile, const std::string& newFile) {
            LOG_INFO("Log file " + oldFile + " rotated to " + newFile);
        });

    switch (parser.value("verbosity").toInt()) {
        case 0: logger.setLogLevel(LogLevel::Debug); break;
        case 1: logger.setLogLevel(LogLevel::Info); break;
        case 2: logger.setLogLevel(LogLevel::Warning); break;
        case 3: logger.setLogLevel(LogLevel::Error); break;
        case 4: logger.setLogLevel(LogLevel::Critical); break;
        default: logger.setLogLevel(LogLevel::Info); break;
    }

    LOG_INFO("Application starting...");
}

bool loadConfiguration(ConfigManager& config, const QCommandLineParser& parser) {
    std::string configPath = parser.isSet("config")
        ? parser.value("config").toStdString()
        : ConfigManager::defaultConfigPath();

    if (QFile::exists(QString::fromStdString(configPath))) {
        if (!config.loadFromFile(configPath)) {
            LOG_WARNING("Failed to load configuration from " + configPath);
            return false;
        }
        LOG_INFO("Loaded configuration from " + configPath);
        return true;
    }

    // Start from defaults and create the file on first write
    config.setStorageFile(configPath);
    LOG_INFO("No configuration file found at " + configPath + ", using defaults");
    return true;
}

MonitorSettings monitorSettings(const QCommandLineParser& parser) {
    MonitorSettings settings;

    bool ok = false;
    int attempts = parser.value("poll-attempts").toInt(&ok);
    if (ok && attempts > 0) {
        settings.poll.maxAttempts = attempts;
    }
    int interval = parser.value("poll-interval-ms").toInt(&ok);
    if (ok && interval > 0) {
        settings.poll.interval = std::chrono::milliseconds(interval);
    }
    return settings;
}

} // namespace

int main(int argc, char *argv[]) {
    try {
        QCoreApplication app(argc, argv);
        app.setApplicationName("sampler-monitor");
        app.setApplicationVersion("1.0.0");
        app.setOrganizationName("OP-1Z Sample Manager");

        QCommandLineParser parser;
        setupCommandLineParser(parser);
        parser.process(app);

        initializeLogger(parser);

        ConfigManager configManager;
        if (!loadConfiguration(configManager, parser)) {
            return 1;
        }

        const DeviceCatalog& catalog = DeviceCatalog::instance();
        StatusRegistry registry(catalog);
        EventBroadcaster broadcaster;
        MountResolver resolver;

        DeviceMonitor monitor(catalog, registry, broadcaster, configManager, resolver,
                              createPlatformUsbEventSource(), monitorSettings(parser));
        monitor.initialize();

        HttpServer server(monitor);
        bool portOk = false;
        int port = parser.value("port").toInt(&portOk);
        if (!portOk || !server.start(parser.value("host").toStdString(), port)) {
            LOG_CRITICAL("Could not start the HTTP server");
            return 1;
        }

        TerminationSignals termination;
        QObject::connect(&termination, &TerminationSignals::terminationRequested,
                         &app, &QCoreApplication::quit);
        if (!termination.install({SIGINT, SIGTERM})) {
            LOG_WARNING("SIGINT/SIGTERM will not trigger an orderly shutdown");
        }

        QObject::connect(&app, &QCoreApplication::aboutToQuit, [&]() {
            LOG_INFO("Shutting down...");
            server.stop();
            monitor.stopMonitoring();
            Logger::instance().flush();
        });

        LOG_INFO("Application initialized successfully");

        return app.exec();

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        LOG_CRITICAL("Fatal error: " + std::string(e.what()));
        return 1;
    }
}
