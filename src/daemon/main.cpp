#include <memory>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/nettrack_version.hpp"
#include "daemon/iproute_state_query.hpp"
#include "daemon/nettrack_daemon.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    QCoreApplication::setApplicationName(QStringLiteral("nettrackd"));
    QCoreApplication::setApplicationVersion(QStringLiteral(NETTRACK_VERSION));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Network state tracking daemon"));
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption(QStringLiteral("config"),
                                    QStringLiteral("JSON configuration file."),
                                    QStringLiteral("path"));
    QCommandLineOption traceOption(QStringLiteral("trace"),
                                   QStringLiteral("Write debug events and a trace log."));
    QCommandLineOption trackConfigOption(QStringLiteral("track-config-dir"),
                                         QStringLiteral("Track changes under the configuration directory."));
    QCommandLineOption socketOption(QStringLiteral("socket"),
                                    QStringLiteral("API socket path."),
                                    QStringLiteral("path"));
    parser.addOption(configOption);
    parser.addOption(traceOption);
    parser.addOption(trackConfigOption);
    parser.addOption(socketOption);
    parser.process(app);

    const bool trace = parser.isSet(traceOption)
        || qEnvironmentVariableIntValue("NETTRACK_TRACE") == 1;
    nettrack::logging::initLogging(QStringLiteral("nettrackd"), trace);

    nettrack::TrackingConfig config;
    try {
        config = nettrack::loadTrackingConfig(parser.value(configOption));
    } catch (const nettrack::ConfigError &ex) {
        qCritical() << "nettrackd: invalid configuration:" << ex.what();
        return 2;
    }
    if (parser.isSet(trackConfigOption)) {
        config.trackConfigDirectory = true;
    }
    if (parser.isSet(socketOption)) {
        config.socketPath = parser.value(socketOption).toStdString();
    }

    NTLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("daemon_start"),
               QStringLiteral("user_start"),
               parser.isSet(configOption) ? QStringLiteral("config_file")
                                          : QStringLiteral("default_config"),
               nettrack::logging::defaultWho(),
               QString(),
               nlohmann::json::object());

    // The daemon lives for the lifetime of the process.
    nettrack::NettrackDaemon daemon(config, std::make_unique<nettrack::IprouteStateQuery>());
    if (!daemon.start()) {
        qCritical() << "nettrackd: failed to start the API server";
        return 1;
    }

    return app.exec();
}
