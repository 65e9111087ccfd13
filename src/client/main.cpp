#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>

#include "common/logger.hpp"
#include "trigger_client.hpp"

using ab::common::LogLevel;
using ab::common::Logger;

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("automator-bridge-send"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Sends trigger lines to an automator-bridge listener."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("host"), QStringLiteral("Bridge host."));
    parser.addPositionalArgument(QStringLiteral("port"), QStringLiteral("Listener port."));
    parser.addPositionalArgument(QStringLiteral("triggers"), QStringLiteral("Trigger strings, one line each."),
                                 QStringLiteral("trigger..."));
    const QCommandLineOption intervalOption(QStringList{QStringLiteral("i"), QStringLiteral("interval")},
                                            QStringLiteral("Repeat the triggers every ms milliseconds."),
                                            QStringLiteral("ms"), QStringLiteral("0"));
    const QCommandLineOption countOption(QStringList{QStringLiteral("n"), QStringLiteral("count")},
                                         QStringLiteral("Rounds to send when repeating, 0 for no limit."),
                                         QStringLiteral("rounds"), QStringLiteral("0"));
    const QCommandLineOption reconnectOption(QStringLiteral("reconnect"),
                                             QStringLiteral("Reconnect when the connection drops."));
    const QCommandLineOption verboseOption(QStringList{QStringLiteral("v"), QStringLiteral("verbose")},
                                           QStringLiteral("Log debug records."));
    parser.addOption(intervalOption);
    parser.addOption(countOption);
    parser.addOption(reconnectOption);
    parser.addOption(verboseOption);
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.size() < 3) {
        parser.showHelp(1);
    }
    bool ok = false;
    const uint port = args.at(1).toUInt(&ok);
    if (!ok || port == 0 || port > 65535) {
        Logger::instance().log(LogLevel::Error, QStringLiteral("client"),
                               QStringLiteral("Invalid port %1").arg(args.at(1)));
        return 1;
    }
    if (parser.isSet(verboseOption)) {
        Logger::instance().setMinimumLevel(LogLevel::Debug);
    }

    TriggerClient client;
    client.setTriggers(args.mid(2));
    client.setRepeat(parser.value(intervalOption).toInt(), parser.value(countOption).toInt());
    client.setReconnect(parser.isSet(reconnectOption));

    int exitCode = 0;
    bool done = false;
    QObject::connect(&client, &TriggerClient::finished, &app, [&client, &done]() {
        done = true;
        client.disconnectFromHost();
    });
    QObject::connect(&client, &TriggerClient::disconnected, &app, [&app, &done]() {
        if (done) {
            app.quit();
        }
    });
    QObject::connect(&client, &TriggerClient::failed, &app, [&app, &exitCode](const QString &) {
        exitCode = 1;
        app.quit();
    });

    client.connectToHost(args.at(0), static_cast<quint16>(port));
    const int code = app.exec();
    return exitCode != 0 ? exitCode : code;
}
