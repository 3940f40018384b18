#pragma once

#include <string>
#include <vector>

#include <QString>
#include <QStringList>

#include <nlohmann/json.hpp>

#include "common/models.hpp"
#include "tracking/state_query.hpp"

namespace nettrack {

/**
 * IprouteStateQuery reads the live network state with iproute2:
 * - interfaces from `ip -j address show`
 * - routes from `ip -j route show`
 * - DNS settings from resolv.conf and the host name from the kernel
 *
 * Any tool that fails to start, times out or exits non-zero makes the
 * capture throw CaptureError.
 */
class IprouteStateQuery : public StateQuery
{
public:
    explicit IprouteStateQuery(const QString &ipBinary = QStringLiteral("ip"),
                               const QString &resolvConfPath = QStringLiteral("/etc/resolv.conf"));

    NetworkState capture(const ChangeScope &scope) override;

private:
    QByteArray runIp(const QStringList &arguments) const;

    QString m_ipBinary;
    QString m_resolvConfPath;
};

// Parse `ip -j address show` output into interface records. Throws
// CaptureError on malformed JSON.
std::vector<InterfaceRecord> parseIpAddressJson(const std::string &output);

// Parse `ip -j route show` output. Volatile per-route fields are dropped.
nlohmann::json parseIpRouteJson(const std::string &output);

// Fill the DNS fields of globals from resolv.conf text.
void parseResolvConf(const std::string &text, GlobalSettings &globals);

} // namespace nettrack
