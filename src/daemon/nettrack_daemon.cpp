#include "daemon/nettrack_daemon.hpp"

#include <QDebug>
#include <QDir>
#include <QFileInfo>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/nettrack_version.hpp"
#include "daemon/config_dir_watcher.hpp"
#include "daemon/ip_monitor.hpp"
#include "daemon/nettrack_api_server.hpp"
#include "tracking/tracking_coordinator.hpp"

namespace nettrack {

namespace {

constexpr const char *kBootCheckpointLabel = "boot";

} // namespace

NettrackDaemon::NettrackDaemon(const TrackingConfig &config,
                               std::unique_ptr<StateQuery> stateQuery,
                               QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_stateQuery(std::move(stateQuery))
{
    m_volatileStore = openStore(Track::Volatile, m_config.volatilePath);
    m_nonVolatileStore = openStore(Track::NonVolatile, m_config.nonVolatilePath);

    m_coordinator = std::make_unique<TrackingCoordinator>(
        m_config, *m_stateQuery, m_volatileStore.get(), m_nonVolatileStore.get());

    connect(m_coordinator.get(), &TrackingCoordinator::trackingFailed,
            this, [](const QString &kind, const QString &message) {
                qWarning() << "nettrack:" << kind << message;
            });
    connect(m_coordinator.get(), &TrackingCoordinator::degradedChanged,
            this, [](const QString &track, bool degraded, const QString &reason) {
                if (degraded) {
                    qWarning() << "nettrack:" << track << "track degraded:" << reason;
                }
            });
}

NettrackDaemon::~NettrackDaemon() = default;

std::unique_ptr<CheckpointStore> NettrackDaemon::openStore(Track track, const std::string &path)
{
    const QFileInfo info(QString::fromStdString(path));
    if (!QDir().mkpath(info.absolutePath())) {
        qWarning() << "nettrack: failed to create store directory" << info.absolutePath();
    }

    CheckpointStoreOptions options;
    options.path = path;
    options.track = track;
    options.clearOnBoot = track == Track::Volatile;

    try {
        auto store = std::make_unique<CheckpointStore>(options);
        if (store->wasClearedAtOpen()) {
            NTLOG_INFO(QStringLiteral("NettrackDaemon"),
                       QStringLiteral("openStore"),
                       QStringLiteral("store_cleared"),
                       QStringLiteral("boot_id_changed"),
                       QString::fromStdString(toTrackString(track)),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"path", path}}));
        }
        return store;
    } catch (const StoreError &ex) {
        // The coordinator runs this track degraded; the other one is unaffected.
        NTLOG_ERROR(QStringLiteral("NettrackDaemon"),
                    QStringLiteral("openStore"),
                    QStringLiteral("store_open_failed"),
                    QString::fromLatin1(toString(ex.kind())),
                    QString::fromStdString(toTrackString(track)),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"path", path}, {"error", ex.what()}}));
        return nullptr;
    }
}

void NettrackDaemon::runConfigBootstrap()
{
    // Untracked configuration is only honoured once, by the apply engine at start.
    const QDir dir(QString::fromStdString(m_config.configDirectory));
    nlohmann::json files = nlohmann::json::array();
    if (dir.exists()) {
        for (const QString &name : dir.entryList(QDir::Files, QDir::Name)) {
            files.push_back(name.toStdString());
        }
    }
    NTLOG_INFO(QStringLiteral("NettrackDaemon"),
               QStringLiteral("runConfigBootstrap"),
               QStringLiteral("config_bootstrap"),
               QStringLiteral("daemon_start"),
               QStringLiteral("one_shot"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"directory", m_config.configDirectory},
                              {"files", files}}));
}

bool NettrackDaemon::start()
{
    qInfo() << "nettrack: daemon starting (version" << NETTRACK_VERSION << ")";

    NTLOG_INFO(QStringLiteral("NettrackDaemon"),
               QStringLiteral("start"),
               QStringLiteral("daemon_config"),
               QStringLiteral("daemon_start"),
               QStringLiteral("resolved_config"),
               logging::defaultWho(),
               QString(),
               configToJson(m_config));

    if (!m_config.trackConfigDirectory) {
        runConfigBootstrap();
    }

    m_coordinator->captureBaseline(kBootCheckpointLabel);

    m_ipMonitor = std::make_unique<IpMonitor>();
    connect(m_ipMonitor.get(), &IpMonitor::changeDetected,
            m_coordinator.get(), &TrackingCoordinator::notify);
    m_ipMonitor->start();

    if (m_config.trackConfigDirectory) {
        m_configWatcher = std::make_unique<ConfigDirWatcher>(
            QString::fromStdString(m_config.configDirectory));
        connect(m_configWatcher.get(), &ConfigDirWatcher::changeDetected,
                m_coordinator.get(), &TrackingCoordinator::notify);
        m_configWatcher->start();
    }

    m_apiServer = std::make_unique<NettrackApiServer>(
        *m_coordinator, QString::fromStdString(m_config.socketPath));
    return m_apiServer->start();
}

} // namespace nettrack
