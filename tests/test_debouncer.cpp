#include <QtTest/QtTest>

#include <QElapsedTimer>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "tracking/debouncer.hpp"

using namespace std::chrono_literals;

class DebouncerTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void testBurstSettlesOnce();
    void testSeparateBurstsSettleSeparately();
    void testScopeCoalescing();
    void testTracksKeptApart();
    void testConfigEventRefreshesEverything();
    void testDiscardPending();
    void testFlushNow();
    void testRestartAfterDiscardIsQuiet();
    void testUserApplyScenario();

private:
    QTemporaryDir m_tempDir;

    static nettrack::ChangeEvent event(nettrack::ChangeSource source, const std::string &iface)
    {
        nettrack::ChangeEvent e;
        e.source = source;
        e.interfaceName = iface;
        e.timestamp = std::chrono::system_clock::now();
        return e;
    }

    static nettrack::SettleRequest requestAt(const QSignalSpy &spy, int index)
    {
        return spy.at(index).at(0).value<nettrack::SettleRequest>();
    }
};

void DebouncerTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    qputenv("NETTRACK_LOG_DIR", m_tempDir.path().toUtf8());
    qRegisterMetaType<nettrack::SettleRequest>();
}

void DebouncerTests::testBurstSettlesOnce()
{
    nettrack::Debouncer debouncer(QStringLiteral("network"), 150ms);
    QSignalSpy spy(&debouncer, &nettrack::Debouncer::settled);

    // Gaps well below the quiet period: the whole burst is one settle.
    for (int i = 0; i < 8; ++i) {
        debouncer.notify(event(nettrack::ChangeSource::ExternalTool, "eth0"),
                         nettrack::Track::Volatile);
        QTest::qWait(30);
    }
    QCOMPARE(spy.count(), 0);
    QVERIFY(debouncer.isPending());

    QTRY_COMPARE_WITH_TIMEOUT(spy.count(), 1, 2000);
    QTest::qWait(300);
    QCOMPARE(spy.count(), 1);
    QCOMPARE(requestAt(spy, 0).eventCount, 8);
    QCOMPARE(requestAt(spy, 0).origin, QStringLiteral("network"));
    QVERIFY(!debouncer.isPending());
}

void DebouncerTests::testSeparateBurstsSettleSeparately()
{
    nettrack::Debouncer debouncer(QStringLiteral("network"), 50ms);
    QSignalSpy spy(&debouncer, &nettrack::Debouncer::settled);

    for (int burst = 0; burst < 3; ++burst) {
        for (int i = 0; i < 3; ++i) {
            debouncer.notify(event(nettrack::ChangeSource::DhcpLease, "eth0"),
                             nettrack::Track::Volatile);
        }
        QTRY_COMPARE_WITH_TIMEOUT(spy.count(), burst + 1, 2000);
    }
    QTest::qWait(150);
    QCOMPARE(spy.count(), 3);
}

void DebouncerTests::testScopeCoalescing()
{
    nettrack::Debouncer debouncer(QStringLiteral("network"), 50ms);
    QSignalSpy spy(&debouncer, &nettrack::Debouncer::settled);

    debouncer.notify(event(nettrack::ChangeSource::ExternalTool, "eth0"), nettrack::Track::Volatile);
    debouncer.notify(event(nettrack::ChangeSource::ExternalTool, "eth1"), nettrack::Track::Volatile);
    debouncer.notify(event(nettrack::ChangeSource::ExternalTool, "eth0"), nettrack::Track::Volatile);
    debouncer.notify(event(nettrack::ChangeSource::ExternalTool, ""), nettrack::Track::Volatile);

    QTRY_COMPARE_WITH_TIMEOUT(spy.count(), 1, 2000);
    const auto request = requestAt(spy, 0);
    QCOMPARE(request.scopes.size(), static_cast<size_t>(1));
    const auto &scope = request.scopes.at(nettrack::Track::Volatile);
    QVERIFY(scope.interfaces == (std::set<std::string>{"eth0", "eth1"}));
    QVERIFY(scope.global);
    QVERIFY(!scope.full);
}

void DebouncerTests::testTracksKeptApart()
{
    nettrack::Debouncer debouncer(QStringLiteral("network"), 50ms);
    QSignalSpy spy(&debouncer, &nettrack::Debouncer::settled);

    debouncer.notify(event(nettrack::ChangeSource::UserRequest, "eth0"), nettrack::Track::NonVolatile);
    debouncer.notify(event(nettrack::ChangeSource::NetlinkLinkStatus, "wlan0"), nettrack::Track::Volatile);
    QVERIFY(debouncer.hasPendingFor(nettrack::Track::NonVolatile));
    QVERIFY(debouncer.hasPendingFor(nettrack::Track::Volatile));

    QTRY_COMPARE_WITH_TIMEOUT(spy.count(), 1, 2000);
    const auto request = requestAt(spy, 0);
    QVERIFY(request.scopes.at(nettrack::Track::NonVolatile).interfaces
            == (std::set<std::string>{"eth0"}));
    QVERIFY(request.scopes.at(nettrack::Track::Volatile).interfaces
            == (std::set<std::string>{"wlan0"}));
}

void DebouncerTests::testConfigEventRefreshesEverything()
{
    auto configEvent = event(nettrack::ChangeSource::ConfigDirectory, "");
    QVERIFY(nettrack::Debouncer::scopeForEvent(configEvent).full);
    QVERIFY(nettrack::Debouncer::scopeForEvent(event(nettrack::ChangeSource::ExternalTool, "")).global);
    QVERIFY(!nettrack::Debouncer::scopeForEvent(event(nettrack::ChangeSource::ExternalTool, "eth0")).global);
}

void DebouncerTests::testDiscardPending()
{
    nettrack::Debouncer debouncer(QStringLiteral("config"), 50ms);
    QSignalSpy spy(&debouncer, &nettrack::Debouncer::settled);

    debouncer.notify(event(nettrack::ChangeSource::ConfigDirectory, ""), nettrack::Track::NonVolatile);
    debouncer.discardPending();
    QVERIFY(!debouncer.isPending());

    QTest::qWait(200);
    QCOMPARE(spy.count(), 0);
}

void DebouncerTests::testFlushNow()
{
    nettrack::Debouncer debouncer(QStringLiteral("network"), 10s);
    QSignalSpy spy(&debouncer, &nettrack::Debouncer::settled);

    debouncer.flushNow();
    QCOMPARE(spy.count(), 0);

    debouncer.notify(event(nettrack::ChangeSource::ExternalTool, "eth0"), nettrack::Track::Volatile);
    debouncer.flushNow();
    QCOMPARE(spy.count(), 1);
    QVERIFY(!debouncer.isPending());
}

void DebouncerTests::testRestartAfterDiscardIsQuiet()
{
    nettrack::Debouncer debouncer(QStringLiteral("network"), 50ms);
    QSignalSpy spy(&debouncer, &nettrack::Debouncer::settled);

    debouncer.notify(event(nettrack::ChangeSource::ExternalTool, "eth0"), nettrack::Track::Volatile);
    debouncer.discardPending();
    debouncer.restart();
    QTest::qWait(200);
    QCOMPARE(spy.count(), 0);

    // A fresh event after the restart starts a fresh quiet period.
    debouncer.notify(event(nettrack::ChangeSource::ExternalTool, "eth1"), nettrack::Track::Volatile);
    QTRY_COMPARE_WITH_TIMEOUT(spy.count(), 1, 2000);
    QVERIFY(requestAt(spy, 0).scopes.at(nettrack::Track::Volatile).interfaces
            == (std::set<std::string>{"eth1"}));
}

void DebouncerTests::testUserApplyScenario()
{
    // user-apply at t=0, t=2, t=3 with a 10 unit quiet period: one settle at t=13.
    constexpr int unitMs = 20;
    nettrack::Debouncer debouncer(QStringLiteral("network"), std::chrono::milliseconds(10 * unitMs));
    QSignalSpy spy(&debouncer, &nettrack::Debouncer::settled);

    QElapsedTimer clock;
    clock.start();
    qint64 settledAt = -1;
    connect(&debouncer, &nettrack::Debouncer::settled, this, [&]() {
        settledAt = clock.elapsed();
    });

    debouncer.notify(event(nettrack::ChangeSource::UserRequest, "eth0"), nettrack::Track::NonVolatile);
    QTest::qWait(2 * unitMs);
    debouncer.notify(event(nettrack::ChangeSource::UserRequest, "eth0"), nettrack::Track::NonVolatile);
    QTest::qWait(unitMs);
    debouncer.notify(event(nettrack::ChangeSource::UserRequest, "eth0"), nettrack::Track::NonVolatile);

    QTRY_COMPARE_WITH_TIMEOUT(spy.count(), 1, 3000);
    QVERIFY(settledAt >= 12 * unitMs);
    QCOMPARE(requestAt(spy, 0).eventCount, 3);
    QCOMPARE(requestAt(spy, 0).scopes.count(nettrack::Track::NonVolatile), static_cast<size_t>(1));
    QCOMPARE(requestAt(spy, 0).scopes.count(nettrack::Track::Volatile), static_cast<size_t>(0));
}

QTEST_MAIN(DebouncerTests)
#include "test_debouncer.moc"
