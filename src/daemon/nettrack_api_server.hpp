#pragma once

#include <map>

#include <QLocalServer>
#include <QLocalSocket>
#include <QObject>

#include <nlohmann/json.hpp>

#include "tracking/suspension_gate.hpp"
#include "tracking/tracking_coordinator.hpp"

namespace nettrack {

/**
 * NettrackApiServer exposes the tracking coordinator over a local UNIX
 * socket using a minimal JSON-RPC-like protocol: one request object
 * {"id", "method", "params"} per connection, answered with
 * {"id", "result"} or {"id", "error", "kind"}.
 *
 * Suspensions requested over the socket are held here until the client
 * releases them or the gate force-releases them at the leak ceiling.
 */
class NettrackApiServer : public QObject
{
    Q_OBJECT
public:
    NettrackApiServer(TrackingCoordinator &coordinator, const QString &socketPath,
                      QObject *parent = nullptr);
    ~NettrackApiServer() override;

    bool start();

    // Process a single JSON-RPC payload without a socket round-trip.
    QByteArray handleRequestPayload(const QByteArray &payload);

    std::size_t heldSuspensions() const
    {
        return m_suspensions.size();
    }

private slots:
    void handleNewConnection();
    void handleClientReadyRead();

private:
    nlohmann::json dispatch(const std::string &method, const nlohmann::json &params);
    QByteArray makeErrorResponse(const QString &message, int id = -1,
                                 const std::string &kind = "invalid_request") const;
    QByteArray makeResultResponse(const nlohmann::json &result, int id) const;

    TrackingCoordinator &m_coordinator;
    QString m_socketPath;
    QLocalServer m_server;
    std::map<quint64, SuspensionToken> m_suspensions;
};

} // namespace nettrack
