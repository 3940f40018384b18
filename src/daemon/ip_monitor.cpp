#include "daemon/ip_monitor.hpp"

#include <chrono>
#include <regex>

#include "common/logging.hpp"

namespace nettrack {

namespace {

constexpr int kRestartDelayMs = 5000;

bool hasWord(const std::string &line, const std::string &word)
{
    static const std::string separators = " \t\\<>,";
    std::string::size_type pos = 0;
    while ((pos = line.find(word, pos)) != std::string::npos) {
        const bool startOk = pos == 0 || separators.find(line[pos - 1]) != std::string::npos;
        const auto end = pos + word.size();
        const bool endOk = end == line.size() || separators.find(line[end]) != std::string::npos;
        if (startOk && endOk) {
            return true;
        }
        pos = end;
    }
    return false;
}

} // namespace

IpMonitor::IpMonitor(const QString &ipBinary, QObject *parent)
    : QObject(parent)
    , m_ipBinary(ipBinary)
{
    qRegisterMetaType<nettrack::ChangeEvent>();

    m_restartTimer.setSingleShot(true);
    m_restartTimer.setInterval(kRestartDelayMs);
    connect(&m_restartTimer, &QTimer::timeout, this, [this]() {
        if (m_wanted) {
            start();
        }
    });
    connect(&m_process, &QProcess::readyReadStandardOutput,
            this, &IpMonitor::handleReadyRead);
    connect(&m_process, &QProcess::finished, this, &IpMonitor::handleFinished);
}

IpMonitor::~IpMonitor()
{
    stop();
}

bool IpMonitor::start()
{
    m_wanted = true;
    if (isRunning()) {
        return true;
    }

    m_buffer.clear();
    m_process.start(m_ipBinary, {QStringLiteral("-o"), QStringLiteral("monitor"),
                                 QStringLiteral("label"), QStringLiteral("link"),
                                 QStringLiteral("address"), QStringLiteral("route")});
    if (!m_process.waitForStarted()) {
        NTLOG_WARN(QStringLiteral("IpMonitor"),
                   QStringLiteral("start"),
                   QStringLiteral("monitor_start_failed"),
                   m_process.errorString(),
                   m_ipBinary,
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
        m_restartTimer.start();
        return false;
    }

    NTLOG_INFO(QStringLiteral("IpMonitor"),
               QStringLiteral("start"),
               QStringLiteral("monitor_started"),
               QStringLiteral("daemon_start"),
               m_ipBinary,
               logging::defaultWho(),
               QString(),
               nlohmann::json::object());
    return true;
}

void IpMonitor::stop()
{
    m_wanted = false;
    m_restartTimer.stop();
    if (m_process.state() != QProcess::NotRunning) {
        m_process.terminate();
        if (!m_process.waitForFinished(1000)) {
            m_process.kill();
            m_process.waitForFinished();
        }
    }
}

void IpMonitor::handleReadyRead()
{
    m_buffer.append(m_process.readAllStandardOutput());

    qsizetype newline = 0;
    while ((newline = m_buffer.indexOf('\n')) >= 0) {
        const std::string line = m_buffer.left(newline).toStdString();
        m_buffer.remove(0, newline + 1);

        if (auto event = parseMonitorLine(line)) {
            emit changeDetected(*event);
        }
    }
}

void IpMonitor::handleFinished(int exitCode, QProcess::ExitStatus status)
{
    if (!m_wanted) {
        return;
    }
    NTLOG_WARN(QStringLiteral("IpMonitor"),
               QStringLiteral("handleFinished"),
               QStringLiteral("monitor_exited"),
               status == QProcess::CrashExit ? QStringLiteral("crashed")
                                             : QStringLiteral("exited"),
               QStringLiteral("restart_later"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"exitCode", exitCode}}));
    m_restartTimer.start();
}

std::optional<ChangeEvent> IpMonitor::parseMonitorLine(const std::string &line)
{
    // [LINK]3: wlan0: <BROADCAST,MULTICAST,UP,LOWER_UP> mtu 1500 ... state UP ...
    // [ADDR]2: eth0    inet 10.0.0.5/24 brd 10.0.0.255 scope global dynamic eth0 ...
    // [ROUTE]default via 10.0.0.1 dev eth0 proto dhcp ...
    static const std::regex labelPattern(R"(^\[(LINK|ADDR|ROUTE)\](Deleted\s+)?(.*)$)");
    static const std::regex linkPattern(R"(^\d+:\s+([^:@\s]+)(@[^:\s]+)?:\s+<([^>]*)>(.*)$)");
    static const std::regex addrPattern(R"(^\d+:\s+(\S+)\s+(inet6?)\s+(\S+))");
    static const std::regex statePattern(R"(\sstate\s+(\S+))");
    static const std::regex devPattern(R"(\sdev\s+(\S+))");

    std::smatch label;
    if (!std::regex_match(line, label, labelPattern)) {
        return std::nullopt;
    }

    const std::string kind = label[1].str();
    const bool deleted = label[2].matched;
    const std::string body = label[3].str();

    ChangeEvent event;
    event.timestamp = std::chrono::system_clock::now();
    event.detail = line;

    if (kind == "LINK") {
        std::smatch match;
        if (!std::regex_search(body, match, linkPattern)) {
            return std::nullopt;
        }
        event.source = ChangeSource::NetlinkLinkStatus;
        event.interfaceName = match[1].str();

        const std::string flags = match[3].str();
        const std::string rest = match[4].str();
        bool up = hasWord(flags, "UP") && hasWord(flags, "LOWER_UP");
        std::smatch state;
        if (std::regex_search(rest, state, statePattern)) {
            const std::string operState = state[1].str();
            if (operState == "UP") {
                up = true;
            } else if (operState == "DOWN" || operState == "LOWERLAYERDOWN") {
                up = false;
            }
        }
        event.linkUp = deleted ? false : up;
        return event;
    }

    if (kind == "ADDR") {
        std::smatch match;
        if (!std::regex_search(body, match, addrPattern)) {
            return std::nullopt;
        }
        event.interfaceName = match[1].str();
        event.source = hasWord(body, "dynamic") ? ChangeSource::DhcpLease
                                                : ChangeSource::ExternalTool;
        return event;
    }

    // Routes belong to the global settings.
    event.source = ChangeSource::ExternalTool;
    std::smatch dev;
    if (std::regex_search(body, dev, devPattern)) {
        event.detail = "route via " + dev[1].str() + ": " + body;
    }
    return event;
}

} // namespace nettrack
