#include <QtTest/QtTest>

#include <QFile>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "common/json_utils.hpp"
#include "daemon/ip_monitor.hpp"

class IpMonitorTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void testLinkLines_data();
    void testLinkLines();
    void testAddressLines();
    void testRouteLine();
    void testUnrelatedLinesIgnored();
    void testMonitorProcessEmitsEvents();
    void testMissingBinary();

private:
    QTemporaryDir m_tempDir;
};

void IpMonitorTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    qputenv("NETTRACK_LOG_DIR", m_tempDir.filePath("logs").toUtf8());
}

void IpMonitorTests::testLinkLines_data()
{
    QTest::addColumn<QString>("line");
    QTest::addColumn<QString>("iface");
    QTest::addColumn<bool>("up");

    QTest::newRow("up")
        << QStringLiteral("[LINK]2: eth0: <BROADCAST,MULTICAST,UP,LOWER_UP> mtu 1500 qdisc fq_codel state UP mode DEFAULT group default")
        << QStringLiteral("eth0") << true;
    QTest::newRow("carrier lost")
        << QStringLiteral("[LINK]2: eth0: <NO-CARRIER,BROADCAST,MULTICAST,UP> mtu 1500 qdisc fq_codel state DOWN mode DEFAULT group default")
        << QStringLiteral("eth0") << false;
    QTest::newRow("lower layer down")
        << QStringLiteral("[LINK]5: vlan10@eth0: <BROADCAST,MULTICAST,UP,LOWER_UP> mtu 1500 qdisc noqueue state LOWERLAYERDOWN mode DEFAULT")
        << QStringLiteral("vlan10") << false;
    QTest::newRow("flags only")
        << QStringLiteral("[LINK]4: wg0: <POINTOPOINT,NOARP,UP,LOWER_UP> mtu 1420 qdisc noqueue state UNKNOWN mode DEFAULT")
        << QStringLiteral("wg0") << true;
    QTest::newRow("deleted")
        << QStringLiteral("[LINK]Deleted 6: veth1: <BROADCAST,MULTICAST,UP,LOWER_UP> mtu 1500 qdisc noqueue state UP")
        << QStringLiteral("veth1") << false;
}

void IpMonitorTests::testLinkLines()
{
    QFETCH(QString, line);
    QFETCH(QString, iface);
    QFETCH(bool, up);

    const auto event = nettrack::IpMonitor::parseMonitorLine(line.toStdString());
    QVERIFY(event.has_value());
    QCOMPARE(event->source, nettrack::ChangeSource::NetlinkLinkStatus);
    QCOMPARE(QString::fromStdString(event->interfaceName), iface);
    QVERIFY(event->linkUp.has_value());
    QCOMPARE(*event->linkUp, up);
}

void IpMonitorTests::testAddressLines()
{
    const auto lease = nettrack::IpMonitor::parseMonitorLine(
        "[ADDR]2: eth0    inet 10.0.0.5/24 brd 10.0.0.255 scope global dynamic noprefixroute eth0\\       valid_lft 86400sec preferred_lft 86400sec");
    QVERIFY(lease.has_value());
    QCOMPARE(lease->source, nettrack::ChangeSource::DhcpLease);
    QCOMPARE(QString::fromStdString(lease->interfaceName), QStringLiteral("eth0"));
    QVERIFY(!lease->linkUp.has_value());

    const auto manual = nettrack::IpMonitor::parseMonitorLine(
        "[ADDR]3: br0    inet6 fd00::1/64 scope global \\       valid_lft forever preferred_lft forever");
    QVERIFY(manual.has_value());
    QCOMPARE(manual->source, nettrack::ChangeSource::ExternalTool);
    QCOMPARE(QString::fromStdString(manual->interfaceName), QStringLiteral("br0"));

    const auto removed = nettrack::IpMonitor::parseMonitorLine(
        "[ADDR]Deleted 2: eth0    inet 10.0.0.5/24 scope global dynamic eth0");
    QVERIFY(removed.has_value());
    QCOMPARE(removed->source, nettrack::ChangeSource::DhcpLease);
}

void IpMonitorTests::testRouteLine()
{
    const auto event = nettrack::IpMonitor::parseMonitorLine(
        "[ROUTE]default via 10.0.0.1 dev eth0 proto dhcp src 10.0.0.5 metric 100");
    QVERIFY(event.has_value());
    QCOMPARE(event->source, nettrack::ChangeSource::ExternalTool);
    QVERIFY(event->interfaceName.empty());
    QVERIFY(QString::fromStdString(event->detail).startsWith(QStringLiteral("route via eth0: ")));
}

void IpMonitorTests::testUnrelatedLinesIgnored()
{
    QVERIFY(!nettrack::IpMonitor::parseMonitorLine("").has_value());
    QVERIFY(!nettrack::IpMonitor::parseMonitorLine("[NEIGH]10.0.0.1 dev eth0 lladdr 00:11:22:33:44:55 REACHABLE").has_value());
    QVERIFY(!nettrack::IpMonitor::parseMonitorLine("2: eth0: <UP> mtu 1500").has_value());
    QVERIFY(!nettrack::IpMonitor::parseMonitorLine("[LINK]garbage").has_value());
}

void IpMonitorTests::testMonitorProcessEmitsEvents()
{
    const QString script = m_tempDir.filePath("ip");
    {
        QFile file(script);
        QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
        file.write("#!/bin/sh\n"
                   "echo '[LINK]2: eth0: <BROADCAST,MULTICAST> mtu 1500 qdisc fq_codel state DOWN mode DEFAULT'\n"
                   "echo '[NEIGH]10.0.0.1 dev eth0 lladdr 00:11:22:33:44:55 STALE'\n"
                   "echo '[ROUTE]10.1.0.0/16 dev eth0 scope link'\n"
                   "exec sleep 30\n");
    }
    QVERIFY(QFile::setPermissions(script, QFile::ReadOwner | QFile::WriteOwner | QFile::ExeOwner));

    nettrack::IpMonitor monitor(script);
    QSignalSpy spy(&monitor, &nettrack::IpMonitor::changeDetected);
    QVERIFY(monitor.start());
    QVERIFY(monitor.isRunning());

    QTRY_COMPARE_WITH_TIMEOUT(spy.count(), 2, 5000);
    const auto first = qvariant_cast<nettrack::ChangeEvent>(spy.at(0).at(0));
    QCOMPARE(first.source, nettrack::ChangeSource::NetlinkLinkStatus);
    QCOMPARE(QString::fromStdString(first.interfaceName), QStringLiteral("eth0"));
    QVERIFY(first.linkUp.has_value() && !*first.linkUp);

    monitor.stop();
    QVERIFY(!monitor.isRunning());
}

void IpMonitorTests::testMissingBinary()
{
    nettrack::IpMonitor monitor(m_tempDir.filePath("no-such-ip"));
    QVERIFY(!monitor.start());
    monitor.stop();
}

QTEST_MAIN(IpMonitorTests)
#include "test_ip_monitor.moc"
