#pragma once

#include <optional>
#include <string>

#include <QByteArray>
#include <QObject>
#include <QProcess>
#include <QTimer>

#include "common/metatypes.hpp"
#include "common/models.hpp"

namespace nettrack {

/**
 * IpMonitor follows `ip -o monitor label link address route` and turns each
 * line into a ChangeEvent:
 * - [LINK] lines become netlink-link-status events with the up/down flag
 * - [ADDR] lines flagged dynamic become DHCP-lease events
 * - other [ADDR] and [ROUTE] lines become external-tool events
 *
 * The monitor process is restarted if it exits while the monitor is running.
 */
class IpMonitor : public QObject
{
    Q_OBJECT
public:
    explicit IpMonitor(const QString &ipBinary = QStringLiteral("ip"), QObject *parent = nullptr);
    ~IpMonitor() override;

    bool start();
    void stop();

    bool isRunning() const
    {
        return m_process.state() != QProcess::NotRunning;
    }

    // Nullopt for lines that do not describe a tracked change.
    static std::optional<ChangeEvent> parseMonitorLine(const std::string &line);

signals:
    void changeDetected(const nettrack::ChangeEvent &event);

private slots:
    void handleReadyRead();
    void handleFinished(int exitCode, QProcess::ExitStatus status);

private:
    QString m_ipBinary;
    QProcess m_process;
    QTimer m_restartTimer;
    QByteArray m_buffer;
    bool m_wanted = false;
};

} // namespace nettrack
