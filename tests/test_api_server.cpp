#include <QtTest/QtTest>

#include <QCoreApplication>
#include <QElapsedTimer>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLocalSocket>
#include <QTemporaryDir>

#include <memory>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "daemon/nettrack_api_server.hpp"
#include "tracking/checkpoint_store.hpp"
#include "tracking/tracking_coordinator.hpp"

using namespace std::chrono_literals;

namespace {

class StaticStateQuery : public nettrack::StateQuery
{
public:
    nettrack::NetworkState live;
    bool fail = false;

    nettrack::NetworkState capture(const nettrack::ChangeScope &) override
    {
        if (fail) {
            throw nettrack::CaptureError("ip not available");
        }
        return live;
    }
};

nettrack::InterfaceRecord makeInterface(const std::string &name, const std::string &state)
{
    nettrack::InterfaceRecord iface;
    iface.name = name;
    iface.type = "ether";
    iface.state = state;
    iface.mtu = 1500;
    return iface;
}

} // namespace

class ApiServerTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void init();
    void cleanup();

    void testStatus();
    void testMalformedRequests();
    void testSuspendAndRelease();
    void testNotifyWhileSuspended();
    void testCheckpointLifecycle();
    void testHistoryAndDiff();
    void testStoreErrorsCarryKind();
    void testDegradedTrackReported();
    void testSocketRoundTrip();

private:
    QTemporaryDir m_tempDir;
    int m_counter = 0;
    StaticStateQuery m_query;
    std::unique_ptr<nettrack::CheckpointStore> m_volatile;
    std::unique_ptr<nettrack::CheckpointStore> m_nonVolatile;
    std::unique_ptr<nettrack::TrackingCoordinator> m_coordinator;
    std::unique_ptr<nettrack::NettrackApiServer> m_server;

    nlohmann::json call(const std::string &method,
                        const nlohmann::json &params = nlohmann::json::object());
    QJsonObject sendOverSocket(const QString &method, const QJsonObject &params = {});
    QString socketPath() const;
};

void ApiServerTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    qputenv("NETTRACK_LOG_DIR", m_tempDir.filePath("logs").toUtf8());
}

void ApiServerTests::init()
{
    ++m_counter;
    m_query.fail = false;
    m_query.live = nettrack::NetworkState();
    m_query.live.interfaces = {makeInterface("eth0", "up")};
    m_query.live.globals.dnsServers = {"192.168.1.1"};

    nettrack::CheckpointStoreOptions volatileOptions;
    volatileOptions.path =
        m_tempDir.filePath(QStringLiteral("run-%1/volatile.db").arg(m_counter)).toStdString();
    volatileOptions.track = nettrack::Track::Volatile;
    volatileOptions.clearOnBoot = true;
    volatileOptions.bootId = "boot-a";
    m_volatile = std::make_unique<nettrack::CheckpointStore>(volatileOptions);

    nettrack::CheckpointStoreOptions durableOptions;
    durableOptions.path =
        m_tempDir.filePath(QStringLiteral("data-%1/nonvolatile.db").arg(m_counter)).toStdString();
    m_nonVolatile = std::make_unique<nettrack::CheckpointStore>(durableOptions);

    nettrack::TrackingConfig config;
    config.configQuietPeriod = 50ms;
    config.networkQuietPeriod = 50ms;
    config.captureAttempts = 1;
    config.suspensionCeiling = 0ms;
    m_coordinator = std::make_unique<nettrack::TrackingCoordinator>(
        config, m_query, m_volatile.get(), m_nonVolatile.get());
    m_server = std::make_unique<nettrack::NettrackApiServer>(*m_coordinator, socketPath());
}

void ApiServerTests::cleanup()
{
    m_server.reset();
    m_coordinator.reset();
    m_volatile.reset();
    m_nonVolatile.reset();
}

QString ApiServerTests::socketPath() const
{
    return m_tempDir.filePath(QStringLiteral("sock-%1/nettrack.sock").arg(m_counter));
}

nlohmann::json ApiServerTests::call(const std::string &method, const nlohmann::json &params)
{
    const nlohmann::json request{{"id", 7}, {"method", method}, {"params", params}};
    const QByteArray response =
        m_server->handleRequestPayload(QByteArray::fromStdString(request.dump()));
    return nlohmann::json::parse(response.toStdString(), nullptr, false);
}

// Empty object when the exchange fails; callers check for "id".
QJsonObject ApiServerTests::sendOverSocket(const QString &method, const QJsonObject &params)
{
    QLocalSocket socket;
    socket.connectToServer(socketPath());
    if (!socket.waitForConnected(1000)) {
        return {};
    }

    QJsonObject root;
    root["id"] = 1;
    root["method"] = method;
    root["params"] = params;
    socket.write(QJsonDocument(root).toJson(QJsonDocument::Compact));
    if (!socket.waitForBytesWritten(1000)) {
        return {};
    }

    QByteArray response;
    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < 3000) {
        QCoreApplication::processEvents();
        if (socket.waitForReadyRead(50)) {
            response += socket.readAll();
        }
        if (!response.isEmpty() && socket.state() == QLocalSocket::UnconnectedState) {
            break;
        }
        if (!response.isEmpty()
            && QJsonDocument::fromJson(response).isObject()) {
            break;
        }
    }

    const QJsonDocument doc = QJsonDocument::fromJson(response);
    return doc.isObject() ? doc.object() : QJsonObject();
}

void ApiServerTests::testStatus()
{
    const auto response = call("status");
    QCOMPARE(response.value("id", 0), 7);
    const auto &result = response.at("result");
    QCOMPARE(result.at("suspended").get<bool>(), false);
    QCOMPARE(result.at("suspensions").get<int>(), 0);
    QCOMPARE(result.at("tracks").size(), static_cast<size_t>(2));
    QCOMPARE(result.at("tracks")[0].at("track").get<std::string>(), std::string("volatile"));
    QCOMPARE(result.at("tracks")[1].at("phase").get<std::string>(), std::string("idle"));
}

void ApiServerTests::testMalformedRequests()
{
    auto response = nlohmann::json::parse(m_server->handleRequestPayload("not json").toStdString());
    QCOMPARE(response.at("kind").get<std::string>(), std::string("invalid_request"));
    QCOMPARE(response.at("id").get<int>(), -1);

    response = nlohmann::json::parse(
        m_server->handleRequestPayload(R"({"id":3,"params":{}})").toStdString());
    QVERIFY(response.contains("error"));
    QCOMPARE(response.at("id").get<int>(), 3);

    response = call("no_such_method");
    QCOMPARE(response.at("kind").get<std::string>(), std::string("invalid_request"));

    response = call("list_checkpoints", {{"track", "sideways"}});
    QCOMPARE(response.at("kind").get<std::string>(), std::string("invalid_request"));

    response = call("rollback", nlohmann::json::object());
    QCOMPARE(response.at("kind").get<std::string>(), std::string("invalid_request"));

    response = call("release", {{"token", "abc"}});
    QCOMPARE(response.at("kind").get<std::string>(), std::string("invalid_request"));
}

void ApiServerTests::testSuspendAndRelease()
{
    const auto first = call("suspend", {{"label", "apply"}});
    const auto second = call("suspend", {{"label", "nested"}});
    const auto firstToken = first.at("result").at("token").get<quint64>();
    const auto secondToken = second.at("result").at("token").get<quint64>();
    QVERIFY(firstToken != secondToken);
    QCOMPARE(m_server->heldSuspensions(), static_cast<std::size_t>(2));
    QVERIFY(m_coordinator->gate().isSuspended());

    // Release out of order; tracking resumes only after the last one.
    auto released = call("release", {{"token", secondToken}});
    QCOMPARE(released.at("result").at("released").get<bool>(), true);
    QCOMPARE(released.at("result").at("suspended").get<bool>(), true);

    released = call("release", {{"token", firstToken}});
    QCOMPARE(released.at("result").at("suspended").get<bool>(), false);
    QCOMPARE(m_server->heldSuspensions(), static_cast<std::size_t>(0));

    // A second release of the same token is a no-op.
    released = call("release", {{"token", firstToken}});
    QCOMPARE(released.at("result").at("released").get<bool>(), false);
    QCOMPARE(released.at("result").at("suspended").get<bool>(), false);
}

void ApiServerTests::testNotifyWhileSuspended()
{
    QSignalSpy committed(m_coordinator.get(), &nettrack::TrackingCoordinator::committed);

    const auto token = call("suspend").at("result").at("token").get<quint64>();
    auto response = call("notify", {{"interface", "eth0"}});
    QCOMPARE(response.at("result").at("accepted").get<bool>(), false);
    call("release", {{"token", token}});
    QTest::qWait(200);
    QCOMPARE(committed.count(), 0);

    response = call("notify", {{"source", "netlink-link-status"},
                               {"interface", "eth0"},
                               {"linkUp", false}});
    QCOMPARE(response.at("result").at("accepted").get<bool>(), true);
    QTRY_COMPARE_WITH_TIMEOUT(committed.count(), 1, 2000);
    QCOMPARE(committed.at(0).at(0).toString(), QStringLiteral("volatile"));

    response = call("notify", {{"source", "carrier-pigeon"}});
    QCOMPARE(response.at("kind").get<std::string>(), std::string("invalid_request"));
}

void ApiServerTests::testCheckpointLifecycle()
{
    QVERIFY(m_coordinator->captureBaseline("boot"));

    const auto opened = call("open_checkpoint", {{"label", "before-vpn"}});
    const std::string id = opened.at("result").at("id").get<std::string>();
    QVERIFY(!id.empty());

    auto listed = call("list_checkpoints");
    QCOMPARE(listed.at("result").at("checkpoints").size(), static_cast<size_t>(2));
    const std::string bootId = listed.at("result").at("current").get<std::string>();
    QVERIFY(bootId != id);

    QVERIFY(call("commit_checkpoint", {{"id", id}}).at("result").at("ok").get<bool>());
    listed = call("list_checkpoints", {{"track", "nonvolatile"}});
    QCOMPARE(listed.at("result").at("current").get<std::string>(), id);

    const auto state = call("rollback", {{"id", bootId}}).at("result").at("state");
    QCOMPARE(state.at("interfaces").size(), static_cast<size_t>(1));

    QVERIFY(call("delete_checkpoint", {{"id", id}}).at("result").at("ok").get<bool>());
    listed = call("list_checkpoints");
    QVERIFY(listed.at("result").at("current").is_null());

    const auto gc = call("gc", {{"track", "volatile"}});
    QCOMPARE(gc.at("result").at("removed").get<int>(), 0);
}

void ApiServerTests::testHistoryAndDiff()
{
    QVERIFY(m_coordinator->captureBaseline("boot"));
    const std::string boot = *m_coordinator->status(nettrack::Track::NonVolatile).currentCheckpoint;

    QSignalSpy committed(m_coordinator.get(), &nettrack::TrackingCoordinator::committed);
    m_query.live.interfaces = {makeInterface("eth0", "down"), makeInterface("eth1", "up")};
    call("notify", {{"interface", "eth0"}});
    call("notify", {{"interface", "eth1"}});
    QVERIFY(call("flush").at("result").at("ok").get<bool>());
    QTRY_COMPARE_WITH_TIMEOUT(committed.count(), 1, 2000);

    auto history = call("history", {{"since", boot}});
    QCOMPARE(history.at("result").at("commits").size(), static_cast<size_t>(1));
    QVERIFY(!history.at("result").at("commits")[0].contains("state"));
    history = call("history", {{"includeState", true}});
    QCOMPARE(history.at("result").at("commits").size(), static_cast<size_t>(2));
    QVERIFY(history.at("result").at("commits")[1].contains("state"));

    const std::string head = *m_coordinator->status(nettrack::Track::NonVolatile).head;
    const auto diff = call("diff", {{"from", boot}, {"to", head}});
    const auto &changes = diff.at("result").at("changes");
    QCOMPARE(changes.size(), static_cast<size_t>(2));
    QCOMPARE(changes[0].at("summary").get<std::string>(),
             std::string("modified eth0 (state: up -> down)"));
    QCOMPARE(changes[1].at("summary").get<std::string>(), std::string("added eth1"));

    QVERIFY(call("diff", {{"from", head}}).at("result").at("changes").empty());

    const auto plan = call("revert_plan", {{"id", boot}});
    QCOMPARE(plan.at("result").at("changes").size(), static_cast<size_t>(2));
    QCOMPARE(plan.at("result").at("changes")[1].at("summary").get<std::string>(),
             std::string("removed eth1"));
}

void ApiServerTests::testStoreErrorsCarryKind()
{
    auto response = call("rollback", {{"id", "missing"}});
    QCOMPARE(response.at("kind").get<std::string>(), std::string("checkpoint_not_found"));

    response = call("open_checkpoint", {{"label", "too-early"}});
    QCOMPARE(response.at("kind").get<std::string>(), std::string("empty_history"));

    QVERIFY(m_coordinator->captureBaseline("boot"));
    m_query.fail = true;
    const std::string boot = *m_coordinator->status(nettrack::Track::NonVolatile).currentCheckpoint;
    response = call("diff", {{"from", boot}});
    QCOMPARE(response.at("kind").get<std::string>(), std::string("capture_failed"));
}

void ApiServerTests::testDegradedTrackReported()
{
    m_server.reset();
    m_coordinator.reset();

    nettrack::TrackingConfig config;
    config.suspensionCeiling = 0ms;
    m_coordinator = std::make_unique<nettrack::TrackingCoordinator>(
        config, m_query, m_volatile.get(), nullptr);
    m_server = std::make_unique<nettrack::NettrackApiServer>(*m_coordinator, socketPath());

    const auto status = call("status").at("result").at("tracks");
    QCOMPARE(status[0].at("degraded").get<bool>(), false);
    QCOMPARE(status[1].at("degraded").get<bool>(), true);

    const auto response = call("list_checkpoints");
    QCOMPARE(response.at("kind").get<std::string>(), std::string("track_degraded"));
    QVERIFY(call("list_checkpoints", {{"track", "volatile"}}).contains("result"));
}

void ApiServerTests::testSocketRoundTrip()
{
    QVERIFY(m_server->start());

    const QJsonObject status = sendOverSocket(QStringLiteral("status"));
    QCOMPARE(status.value("id").toInt(), 1);
    QVERIFY(status.value("result").toObject().contains("tracks"));

    const QJsonObject unknown = sendOverSocket(QStringLiteral("unknown_method"));
    QVERIFY(unknown.contains("error"));
    QCOMPARE(unknown.value("kind").toString(), QStringLiteral("invalid_request"));
}

QTEST_MAIN(ApiServerTests)
#include "test_api_server.moc"
