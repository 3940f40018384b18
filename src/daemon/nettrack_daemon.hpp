#pragma once

#include <memory>

#include <QObject>

#include "common/config.hpp"
#include "tracking/checkpoint_store.hpp"
#include "tracking/state_query.hpp"

namespace nettrack {

class ConfigDirWatcher;
class IpMonitor;
class NettrackApiServer;
class TrackingCoordinator;

/**
 * NettrackDaemon owns the tracking subsystem for the process:
 * - opens the volatile and non-volatile checkpoint stores
 * - feeds ip monitor and configuration directory events to the coordinator
 * - serves the query API on the local socket
 *
 * It is designed to be owned from main() and driven by Qt's event loop.
 */
class NettrackDaemon : public QObject
{
    Q_OBJECT
public:
    explicit NettrackDaemon(const TrackingConfig &config,
                            std::unique_ptr<StateQuery> stateQuery,
                            QObject *parent = nullptr);
    ~NettrackDaemon() override;

    // Capture the boot baseline, start the event sources and the API server.
    // Returns false if the API socket could not be opened.
    bool start();

    TrackingCoordinator &coordinator()
    {
        return *m_coordinator;
    }

private:
    std::unique_ptr<CheckpointStore> openStore(Track track, const std::string &path);
    void runConfigBootstrap();

    TrackingConfig m_config;
    std::unique_ptr<StateQuery> m_stateQuery;
    std::unique_ptr<CheckpointStore> m_volatileStore;
    std::unique_ptr<CheckpointStore> m_nonVolatileStore;
    std::unique_ptr<TrackingCoordinator> m_coordinator;
    std::unique_ptr<IpMonitor> m_ipMonitor;
    std::unique_ptr<ConfigDirWatcher> m_configWatcher;
    // Declared last: its suspension tokens refer to the coordinator's gate.
    std::unique_ptr<NettrackApiServer> m_apiServer;
};

} // namespace nettrack
