#include "daemon/iproute_state_query.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>

#include <QFile>
#include <QProcess>
#include <QSysInfo>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace nettrack {

namespace {

constexpr int kIpTimeoutMs = 5000;

// Link attributes that are interesting for history but have no dedicated field.
const std::vector<std::string> kExtraLinkKeys = {
    "master",
    "link",
    "qdisc",
    "group",
    "link_kind",
};

std::vector<std::string> splitWords(const std::string &line)
{
    std::istringstream in(line);
    std::vector<std::string> words;
    std::string word;
    while (in >> word) {
        words.push_back(word);
    }
    return words;
}

std::string stringField(const nlohmann::json &object, const char *key)
{
    if (object.contains(key) && object.at(key).is_string()) {
        return object.at(key).get<std::string>();
    }
    return {};
}

InterfaceRecord parseLink(const nlohmann::json &link)
{
    InterfaceRecord iface;
    iface.name = stringField(link, "ifname");
    iface.type = stringField(link, "link_type");
    if (link.contains("linkinfo") && link.at("linkinfo").is_object()) {
        const std::string kind = stringField(link.at("linkinfo"), "info_kind");
        if (!kind.empty()) {
            iface.type = kind;
        }
    }
    iface.state = stringField(link, "operstate");
    std::transform(iface.state.begin(), iface.state.end(), iface.state.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (link.contains("mtu") && link.at("mtu").is_number_integer()) {
        iface.mtu = link.at("mtu").get<int>();
    }
    iface.macAddress = stringField(link, "address");

    if (link.contains("addr_info") && link.at("addr_info").is_array()) {
        for (const auto &addr : link.at("addr_info")) {
            const std::string local = stringField(addr, "local");
            if (local.empty()) {
                continue;
            }
            std::string cidr = local;
            if (addr.contains("prefixlen") && addr.at("prefixlen").is_number_integer()) {
                cidr += "/" + std::to_string(addr.at("prefixlen").get<int>());
            }
            const std::string family = stringField(addr, "family");
            if (family == "inet") {
                iface.ipv4Addresses.push_back(cidr);
            } else if (family == "inet6") {
                iface.ipv6Addresses.push_back(cidr);
            }
        }
    }

    for (const auto &key : kExtraLinkKeys) {
        if (link.contains(key) && !link.at(key).is_null()) {
            iface.extra[key] = link.at(key);
        }
    }
    return iface;
}

} // namespace

std::vector<InterfaceRecord> parseIpAddressJson(const std::string &output)
{
    const auto parsed = nlohmann::json::parse(output, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_array()) {
        throw CaptureError("ip address output is not a JSON array");
    }

    std::vector<InterfaceRecord> interfaces;
    for (const auto &link : parsed) {
        if (!link.is_object()) {
            continue;
        }
        InterfaceRecord iface = parseLink(link);
        if (!iface.name.empty()) {
            interfaces.push_back(std::move(iface));
        }
    }
    std::sort(interfaces.begin(), interfaces.end(),
              [](const InterfaceRecord &a, const InterfaceRecord &b) {
                  return a.name < b.name;
              });
    return interfaces;
}

nlohmann::json parseIpRouteJson(const std::string &output)
{
    const auto parsed = nlohmann::json::parse(output, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_array()) {
        throw CaptureError("ip route output is not a JSON array");
    }

    nlohmann::json routes = nlohmann::json::array();
    for (auto route : parsed) {
        if (!route.is_object()) {
            continue;
        }
        // Kernel bookkeeping that changes without any configuration change.
        route.erase("expires");
        route.erase("cache");
        routes.push_back(std::move(route));
    }
    return routes;
}

void parseResolvConf(const std::string &text, GlobalSettings &globals)
{
    globals.dnsServers.clear();
    globals.dnsSearch.clear();
    globals.dnsOptions.clear();

    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        const auto comment = line.find_first_of("#;");
        if (comment != std::string::npos) {
            line.erase(comment);
        }
        const auto words = splitWords(line);
        if (words.size() < 2) {
            continue;
        }
        const std::string &keyword = words.front();
        if (keyword == "nameserver") {
            globals.dnsServers.push_back(words[1]);
        } else if (keyword == "search" || keyword == "domain") {
            // The last search or domain line wins.
            globals.dnsSearch.assign(words.begin() + 1, words.end());
        } else if (keyword == "options") {
            globals.dnsOptions.insert(globals.dnsOptions.end(), words.begin() + 1, words.end());
        }
    }
}

IprouteStateQuery::IprouteStateQuery(const QString &ipBinary, const QString &resolvConfPath)
    : m_ipBinary(ipBinary)
    , m_resolvConfPath(resolvConfPath)
{
}

QByteArray IprouteStateQuery::runIp(const QStringList &arguments) const
{
    QProcess process;
    process.start(m_ipBinary, arguments);
    if (!process.waitForStarted(kIpTimeoutMs)) {
        throw CaptureError("failed to start " + m_ipBinary.toStdString());
    }
    process.closeWriteChannel();
    if (!process.waitForFinished(kIpTimeoutMs)) {
        process.kill();
        process.waitForFinished();
        throw CaptureError(m_ipBinary.toStdString() + " timed out");
    }
    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        throw CaptureError(m_ipBinary.toStdString() + " "
                           + arguments.join(QLatin1Char(' ')).toStdString() + " failed: "
                           + QString::fromUtf8(process.readAllStandardError()).trimmed().toStdString());
    }
    return process.readAllStandardOutput();
}

NetworkState IprouteStateQuery::capture(const ChangeScope &scope)
{
    NetworkState state;
    state.capturedAt = std::chrono::system_clock::now();

    const bool wantInterfaces = scope.full || !scope.interfaces.empty();
    const bool wantGlobals = scope.full || scope.global;

    if (wantInterfaces) {
        QStringList args = {QStringLiteral("-j"), QStringLiteral("-d"),
                            QStringLiteral("address"), QStringLiteral("show")};
        state.interfaces = parseIpAddressJson(runIp(args).toStdString());
        if (!scope.full) {
            state.interfaces.erase(
                std::remove_if(state.interfaces.begin(), state.interfaces.end(),
                               [&scope](const InterfaceRecord &iface) {
                                   return scope.interfaces.count(iface.name) == 0;
                               }),
                state.interfaces.end());
        }
    }

    if (wantGlobals) {
        state.globals.hostname = QSysInfo::machineHostName().toStdString();
        state.globals.routes = parseIpRouteJson(
            runIp({QStringLiteral("-j"), QStringLiteral("route"), QStringLiteral("show")})
                .toStdString());

        QFile resolvConf(m_resolvConfPath);
        if (resolvConf.open(QIODevice::ReadOnly | QIODevice::Text)) {
            parseResolvConf(QString::fromUtf8(resolvConf.readAll()).toStdString(), state.globals);
        } else {
            // No resolver configuration is a valid state, not a failed capture.
            NTLOG_DEBUG(QStringLiteral("IprouteStateQuery"),
                        QStringLiteral("capture"),
                        QStringLiteral("resolv_conf_missing"),
                        resolvConf.errorString(),
                        m_resolvConfPath,
                        logging::defaultWho(),
                        logging::currentCorrelationId(),
                        nlohmann::json::object());
        }
    }

    NTLOG_DEBUG(QStringLiteral("IprouteStateQuery"),
                QStringLiteral("capture"),
                QStringLiteral("state_captured"),
                QStringLiteral("settle"),
                m_ipBinary,
                logging::defaultWho(),
                logging::currentCorrelationId(),
                (nlohmann::json{{"interfaces", state.interfaces.size()},
                               {"full", scope.full},
                               {"global", scope.global}}));
    return state;
}

} // namespace nettrack
