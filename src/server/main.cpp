#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QDir>
#include <QtCore/QTimer>
#include <QtNetwork/QHostAddress>

#include <csignal>

#include "bridge_service.hpp"
#include "common/config_store.hpp"
#include "common/logger.hpp"

using ab::common::LogLevel;
using ab::common::Logger;

namespace {

volatile std::sig_atomic_t g_running = 1;

void handle_signal(int) {
    g_running = 0;
}

}  // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("automator-bridge"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Routes TCP trigger strings to Automator HTTP actions."));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption configOption(QStringList{QStringLiteral("c"), QStringLiteral("config")},
                                          QStringLiteral("Configuration file."), QStringLiteral("path"),
                                          ab::config::ConfigStore::defaultConfigPath());
    const QCommandLineOption cacheOption(QStringLiteral("cache"), QStringLiteral("Automator catalog store."),
                                         QStringLiteral("path"), ab::automator::CatalogCache::defaultCachePath());
    const QCommandLineOption logFileOption(
        QStringLiteral("log-file"), QStringLiteral("Append log records to this file."), QStringLiteral("path"),
        QDir(ab::config::ConfigStore::defaultDirectory()).filePath(QStringLiteral("logs/automator_bridge.log")));
    const QCommandLineOption bindOption(QStringLiteral("bind"), QStringLiteral("Address the listeners bind to."),
                                        QStringLiteral("address"), QStringLiteral("0.0.0.0"));
    const QCommandLineOption verboseOption(QStringList{QStringLiteral("v"), QStringLiteral("verbose")},
                                           QStringLiteral("Log debug records."));
    const QCommandLineOption refreshOption(QStringLiteral("refresh"),
                                           QStringLiteral("Refresh every enabled Automator catalog at startup."));
    const QCommandLineOption noWatchOption(QStringLiteral("no-watch"),
                                           QStringLiteral("Do not reload the configuration when the file changes."));
    parser.addOption(configOption);
    parser.addOption(cacheOption);
    parser.addOption(logFileOption);
    parser.addOption(bindOption);
    parser.addOption(verboseOption);
    parser.addOption(refreshOption);
    parser.addOption(noWatchOption);
    parser.process(app);

    Logger &logger = Logger::instance();
    if (parser.isSet(verboseOption)) {
        logger.setMinimumLevel(LogLevel::Debug);
    }
    QString error;
    if (!logger.setLogFile(parser.value(logFileOption), &error)) {
        logger.log(LogLevel::Warn, QStringLiteral("bridge"), QStringLiteral("File logging disabled: %1").arg(error));
    }

    QHostAddress bindAddress;
    if (!bindAddress.setAddress(parser.value(bindOption))) {
        logger.log(LogLevel::Error, QStringLiteral("bridge"),
                   QStringLiteral("Invalid bind address %1").arg(parser.value(bindOption)));
        return 1;
    }

    ab::config::ConfigStore store(parser.value(configOption));
    if (!store.load(&error)) {
        logger.log(LogLevel::Error, QStringLiteral("bridge"),
                   QStringLiteral("Cannot load configuration %1: %2").arg(store.path(), error));
        return 1;
    }
    store.setWatchEnabled(!parser.isSet(noWatchOption));

    BridgeOptions options;
    options.cachePath = parser.value(cacheOption);
    options.bindAddress = bindAddress;
    BridgeService bridge(store, options);
    if (!bridge.start(&error)) {
        // Listeners that did bind keep running.
        logger.log(LogLevel::Warn, QStringLiteral("bridge"), error);
    }
    if (parser.isSet(refreshOption)) {
        bridge.refreshAllCatalogs();
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    QTimer signalPoll;
    signalPoll.setInterval(200);
    QObject::connect(&signalPoll, &QTimer::timeout, &app, [&app]() {
        if (!g_running) {
            app.quit();
        }
    });
    signalPoll.start();

    const int code = app.exec();
    bridge.shutdown();
    store.setWatchEnabled(false);
    return code;
}
