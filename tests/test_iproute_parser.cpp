#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "daemon/iproute_state_query.hpp"

namespace {

const char *kAddressJson = R"([
  {"ifindex":2,"ifname":"eth0","flags":["BROADCAST","MULTICAST","UP","LOWER_UP"],
   "mtu":1500,"qdisc":"fq_codel","operstate":"UP","group":"default",
   "link_type":"ether","address":"52:54:00:12:34:56",
   "addr_info":[
     {"family":"inet","local":"192.168.1.10","prefixlen":24,"scope":"global",
      "valid_life_time":86000,"preferred_life_time":86000},
     {"family":"inet6","local":"fe80::5054:ff:fe12:3456","prefixlen":64,"scope":"link"}]},
  {"ifindex":1,"ifname":"lo","flags":["LOOPBACK","UP","LOWER_UP"],"mtu":65536,
   "qdisc":"noqueue","operstate":"UNKNOWN","link_type":"loopback",
   "address":"00:00:00:00:00:00",
   "addr_info":[{"family":"inet","local":"127.0.0.1","prefixlen":8,"scope":"host"}]},
  {"ifindex":3,"ifname":"br0","flags":["BROADCAST","MULTICAST"],"mtu":1500,
   "operstate":"DOWN","link_type":"ether","address":"aa:bb:cc:dd:ee:ff",
   "linkinfo":{"info_kind":"bridge"},"addr_info":[]}
])";

const char *kRouteJson = R"([
  {"dst":"default","gateway":"192.168.1.1","dev":"eth0","protocol":"dhcp","metric":100,"flags":[]},
  {"dst":"10.8.0.0/24","dev":"tun0","flags":[],"expires":273,"cache":["expires"]}
])";

} // namespace

class IprouteParserTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void testParseAddresses();
    void testLinkKindOverridesLinkType();
    void testMalformedAddressJson();
    void testRoutesDropVolatileFields();
    void testResolvConf();
    void testResolvConfLastSearchWins();
    void testCaptureWithScriptedIp();
    void testCaptureFailsWithoutIp();

private:
    QTemporaryDir m_tempDir;
};

void IprouteParserTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    qputenv("NETTRACK_LOG_DIR", m_tempDir.filePath("logs").toUtf8());
}

void IprouteParserTests::testParseAddresses()
{
    const auto interfaces = nettrack::parseIpAddressJson(kAddressJson);
    QCOMPARE(interfaces.size(), static_cast<size_t>(3));

    // Sorted by name.
    QCOMPARE(QString::fromStdString(interfaces[0].name), QStringLiteral("br0"));
    QCOMPARE(QString::fromStdString(interfaces[1].name), QStringLiteral("eth0"));
    QCOMPARE(QString::fromStdString(interfaces[2].name), QStringLiteral("lo"));

    const auto &eth0 = interfaces[1];
    QCOMPARE(QString::fromStdString(eth0.type), QStringLiteral("ether"));
    QCOMPARE(QString::fromStdString(eth0.state), QStringLiteral("up"));
    QCOMPARE(eth0.mtu, 1500);
    QCOMPARE(QString::fromStdString(eth0.macAddress), QStringLiteral("52:54:00:12:34:56"));
    QCOMPARE(eth0.ipv4Addresses.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(eth0.ipv4Addresses[0]), QStringLiteral("192.168.1.10/24"));
    QCOMPARE(eth0.ipv6Addresses.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(eth0.ipv6Addresses[0]),
             QStringLiteral("fe80::5054:ff:fe12:3456/64"));
    QCOMPARE(eth0.extra.value("qdisc", std::string()), std::string("fq_codel"));
    QCOMPARE(eth0.extra.value("group", std::string()), std::string("default"));
    // Lifetimes count down on their own and are not part of the record.
    QVERIFY(!eth0.extra.contains("valid_life_time"));

    QCOMPARE(QString::fromStdString(interfaces[2].state), QStringLiteral("unknown"));
}

void IprouteParserTests::testLinkKindOverridesLinkType()
{
    const auto interfaces = nettrack::parseIpAddressJson(kAddressJson);
    QCOMPARE(QString::fromStdString(interfaces[0].type), QStringLiteral("bridge"));
    QCOMPARE(QString::fromStdString(interfaces[0].state), QStringLiteral("down"));
    QVERIFY(interfaces[0].ipv4Addresses.empty());
}

void IprouteParserTests::testMalformedAddressJson()
{
    bool thrown = false;
    try {
        nettrack::parseIpAddressJson("{not json");
    } catch (const nettrack::CaptureError &) {
        thrown = true;
    }
    QVERIFY(thrown);

    thrown = false;
    try {
        nettrack::parseIpAddressJson(R"({"ifname":"eth0"})");
    } catch (const nettrack::CaptureError &) {
        thrown = true;
    }
    QVERIFY(thrown);
}

void IprouteParserTests::testRoutesDropVolatileFields()
{
    const auto routes = nettrack::parseIpRouteJson(kRouteJson);
    QVERIFY(routes.is_array());
    QCOMPARE(routes.size(), static_cast<size_t>(2));
    QCOMPARE(routes[0].value("gateway", std::string()), std::string("192.168.1.1"));
    QVERIFY(!routes[1].contains("expires"));
    QVERIFY(!routes[1].contains("cache"));
    QCOMPARE(routes[1].value("dev", std::string()), std::string("tun0"));
}

void IprouteParserTests::testResolvConf()
{
    const std::string text =
        "# Generated by NetworkManager\n"
        "nameserver 192.168.1.1\n"
        "nameserver 2001:db8::1 ; secondary\n"
        "search lan example.org\n"
        "options edns0 trust-ad\n"
        "options rotate\n"
        "nameserver\n";

    nettrack::GlobalSettings globals;
    globals.dnsServers = {"stale"};
    nettrack::parseResolvConf(text, globals);

    QVERIFY(globals.dnsServers == (std::vector<std::string>{"192.168.1.1", "2001:db8::1"}));
    QVERIFY(globals.dnsSearch == (std::vector<std::string>{"lan", "example.org"}));
    QVERIFY(globals.dnsOptions == (std::vector<std::string>{"edns0", "trust-ad", "rotate"}));
}

void IprouteParserTests::testResolvConfLastSearchWins()
{
    nettrack::GlobalSettings globals;
    nettrack::parseResolvConf("search a.example b.example\ndomain corp.example\n", globals);
    QVERIFY(globals.dnsSearch == (std::vector<std::string>{"corp.example"}));
    QVERIFY(globals.dnsServers.empty());
}

void IprouteParserTests::testCaptureWithScriptedIp()
{
    const QString addressFile = m_tempDir.filePath("address.json");
    const QString routeFile = m_tempDir.filePath("route.json");
    const QString resolvFile = m_tempDir.filePath("resolv.conf");
    const QString script = m_tempDir.filePath("ip");

    auto writeFile = [](const QString &path, const QByteArray &content) {
        QFile file(path);
        if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            return false;
        }
        return file.write(content) == content.size();
    };

    QVERIFY(writeFile(addressFile, kAddressJson));
    QVERIFY(writeFile(routeFile, kRouteJson));
    // Latin-1 bytes, not UTF-8.
    QVERIFY(writeFile(resolvFile, "nameserver 9.9.9.9\nsearch caf\xe9.lan\n"));
    const QByteArray body = "#!/bin/sh\n"
                            "case \"$*\" in\n"
                            "  *address*) cat '" + addressFile.toUtf8() + "' ;;\n"
                            "  *route*) cat '" + routeFile.toUtf8() + "' ;;\n"
                            "  *) exit 1 ;;\n"
                            "esac\n";
    QVERIFY(writeFile(script, body));
    QVERIFY(QFile::setPermissions(script, QFile::ReadOwner | QFile::WriteOwner | QFile::ExeOwner));

    nettrack::IprouteStateQuery query(script, resolvFile);

    nettrack::ChangeScope full;
    full.full = true;
    const auto state = query.capture(full);
    QCOMPARE(state.interfaces.size(), static_cast<size_t>(3));
    QVERIFY(state.globals.dnsServers == (std::vector<std::string>{"9.9.9.9"}));
    QCOMPARE(state.globals.routes.size(), static_cast<size_t>(2));
    QVERIFY(!state.globals.hostname.empty());
    QCOMPARE(state.globals.dnsSearch.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(state.globals.dnsSearch[0]),
             QString::fromUtf8("caf\xef\xbf\xbd.lan"));
    const std::string serialized = nlohmann::json(state).dump();
    QVERIFY(serialized.find("caf\xef\xbf\xbd.lan") != std::string::npos);

    nettrack::ChangeScope scoped;
    scoped.interfaces = {"eth0", "missing0"};
    const auto partial = query.capture(scoped);
    QCOMPARE(partial.interfaces.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(partial.interfaces[0].name), QStringLiteral("eth0"));
    QVERIFY(partial.globals.dnsServers.empty());
}

void IprouteParserTests::testCaptureFailsWithoutIp()
{
    nettrack::IprouteStateQuery query(m_tempDir.filePath("no-such-ip"));
    nettrack::ChangeScope full;
    full.full = true;

    bool thrown = false;
    try {
        query.capture(full);
    } catch (const nettrack::CaptureError &) {
        thrown = true;
    }
    QVERIFY(thrown);
}

QTEST_MAIN(IprouteParserTests)
#include "test_iproute_parser.moc"
