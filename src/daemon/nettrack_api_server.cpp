#include "daemon/nettrack_api_server.hpp"

#include <chrono>
#include <iterator>
#include <optional>
#include <stdexcept>

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QUuid>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "tracking/diff_engine.hpp"

namespace nettrack {

namespace {

// Malformed or missing parameters.
class RequestError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

Track trackParam(const nlohmann::json &params)
{
    const std::string value = params.value("track", "nonvolatile");
    const auto track = parseTrackString(value);
    if (!track.has_value()) {
        throw RequestError("Unknown track: " + value);
    }
    return *track;
}

std::string requiredString(const nlohmann::json &params, const char *key)
{
    if (!params.contains(key) || !params.at(key).is_string()
        || params.at(key).get<std::string>().empty()) {
        throw RequestError(std::string("Missing ") + key);
    }
    return params.at(key).get<std::string>();
}

std::optional<std::string> optionalString(const nlohmann::json &params, const char *key)
{
    if (params.contains(key) && params.at(key).is_string()
        && !params.at(key).get<std::string>().empty()) {
        return params.at(key).get<std::string>();
    }
    return std::nullopt;
}

nlohmann::json changesToJson(const std::vector<FieldChange> &changes)
{
    nlohmann::json list = nlohmann::json::array();
    for (const auto &change : changes) {
        nlohmann::json entry = change;
        entry["summary"] = describeChange(change);
        list.push_back(std::move(entry));
    }
    return list;
}

} // namespace

NettrackApiServer::NettrackApiServer(TrackingCoordinator &coordinator,
                                     const QString &socketPath,
                                     QObject *parent)
    : QObject(parent)
    , m_coordinator(coordinator)
    , m_socketPath(socketPath)
{
}

NettrackApiServer::~NettrackApiServer() = default;

bool NettrackApiServer::start()
{
    if (m_socketPath.contains('/')) {
        const QFileInfo socketInfo(m_socketPath);
        if (!QDir().mkpath(socketInfo.absolutePath())) {
            qWarning() << "Failed to create runtime socket directory"
                       << socketInfo.absolutePath();
            return false;
        }

        if (QFile::exists(m_socketPath)) {
            if (!QLocalServer::removeServer(m_socketPath)) {
                qWarning() << "Failed to remove existing nettrack socket" << m_socketPath;
                return false;
            }
        }
    } else {
        QLocalServer::removeServer(m_socketPath);
    }

    if (!m_server.listen(m_socketPath)) {
        qWarning() << "Failed to listen on nettrack socket" << m_socketPath
                   << m_server.errorString();
        return false;
    }

    connect(&m_server, &QLocalServer::newConnection,
            this, &NettrackApiServer::handleNewConnection);

    qInfo() << "nettrack API server listening on" << m_socketPath;
    return true;
}

void NettrackApiServer::handleNewConnection()
{
    while (m_server.hasPendingConnections()) {
        QLocalSocket *socket = m_server.nextPendingConnection();
        if (!socket) {
            continue;
        }
        connect(socket, &QLocalSocket::readyRead,
                this, &NettrackApiServer::handleClientReadyRead);
        connect(socket, &QLocalSocket::disconnected,
                socket, &QObject::deleteLater);
    }
}

void NettrackApiServer::handleClientReadyRead()
{
    auto *socket = qobject_cast<QLocalSocket *>(sender());
    if (!socket) {
        return;
    }

    const QByteArray payload = socket->readAll();
    if (payload.isEmpty()) {
        return;
    }

    socket->write(handleRequestPayload(payload));
    socket->flush();
    socket->disconnectFromServer();
}

QByteArray NettrackApiServer::handleRequestPayload(const QByteArray &payload)
{
    const QString corrId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    logging::CorrelationScope corrScope(corrId);
    const auto parsed = nlohmann::json::parse(payload.toStdString(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        NTLOG_WARN(QStringLiteral("NettrackApiServer"),
                   QStringLiteral("handleRequest"),
                   QStringLiteral("api_request_error"),
                   QStringLiteral("parse_payload"),
                   QStringLiteral("json_parse"),
                   logging::defaultWho(),
                   corrId,
                   nlohmann::json::object());
        return makeErrorResponse(QStringLiteral("Invalid JSON payload"));
    }

    int id = -1;
    if (parsed.contains("id") && parsed["id"].is_number_integer()) {
        id = parsed["id"].get<int>();
    }

    if (!parsed.contains("method") || !parsed["method"].is_string()) {
        return makeErrorResponse(QStringLiteral("Missing method"), id);
    }

    const std::string method = parsed["method"].get<std::string>();
    nlohmann::json params = nlohmann::json::object();
    if (parsed.contains("params")) {
        if (!parsed["params"].is_object()) {
            return makeErrorResponse(QStringLiteral("Invalid params"), id);
        }
        params = parsed["params"];
    }

    NTLOG_INFO(QStringLiteral("NettrackApiServer"),
               QStringLiteral("handleRequest"),
               QStringLiteral("api_request_received"),
               QStringLiteral("client_call"),
               QStringLiteral("json_rpc"),
               logging::defaultWho(),
               corrId,
               (nlohmann::json{{"method", method}}));

    const auto start = std::chrono::steady_clock::now();
    try {
        const nlohmann::json result = dispatch(method, params);
        NTLOG_INFO(QStringLiteral("NettrackApiServer"),
                   QStringLiteral("handleRequest"),
                   QStringLiteral("api_request_completed"),
                   QStringLiteral("client_call"),
                   QStringLiteral("json_rpc"),
                   logging::defaultWho(),
                   corrId,
                   (nlohmann::json{{"method", method},
                                  {"durationMs",
                                   std::chrono::duration_cast<std::chrono::milliseconds>(
                                       std::chrono::steady_clock::now() - start).count()}}));
        return makeResultResponse(result, id);
    } catch (const RequestError &ex) {
        return makeErrorResponse(QString::fromUtf8(ex.what()), id);
    } catch (const StoreError &ex) {
        NTLOG_WARN(QStringLiteral("NettrackApiServer"),
                   QStringLiteral("handleRequest"),
                   QStringLiteral("api_request_error"),
                   QString::fromLatin1(toString(ex.kind())),
                   QStringLiteral("json_rpc"),
                   logging::defaultWho(),
                   corrId,
                   (nlohmann::json{{"method", method}, {"what", ex.what()}}));
        return makeErrorResponse(QString::fromUtf8(ex.what()), id, toString(ex.kind()));
    } catch (const TrackingError &ex) {
        NTLOG_WARN(QStringLiteral("NettrackApiServer"),
                   QStringLiteral("handleRequest"),
                   QStringLiteral("api_request_error"),
                   QString::fromLatin1(toString(ex.kind())),
                   QStringLiteral("json_rpc"),
                   logging::defaultWho(),
                   corrId,
                   (nlohmann::json{{"method", method}, {"what", ex.what()}}));
        return makeErrorResponse(QString::fromUtf8(ex.what()), id, toString(ex.kind()));
    } catch (const std::exception &ex) {
        NTLOG_ERROR(QStringLiteral("NettrackApiServer"),
                    QStringLiteral("handleRequest"),
                    QStringLiteral("api_request_error"),
                    QStringLiteral("exception"),
                    QStringLiteral("json_rpc"),
                    logging::defaultWho(),
                    corrId,
                    (nlohmann::json{{"method", method}, {"what", ex.what()}}));
        return makeErrorResponse(QString::fromUtf8(ex.what()), id, "internal");
    }
}

nlohmann::json NettrackApiServer::dispatch(const std::string &method,
                                           const nlohmann::json &params)
{
    // Tokens the gate already force-released are of no further use.
    for (auto it = m_suspensions.begin(); it != m_suspensions.end();) {
        it = it->second.isActive() ? std::next(it) : m_suspensions.erase(it);
    }

    if (method == "status") {
        nlohmann::json result;
        result["suspended"] = m_coordinator.gate().isSuspended();
        result["suspensions"] = m_coordinator.gate().activeCount();
        result["tracks"] = nlohmann::json::array({m_coordinator.status(Track::Volatile),
                                                  m_coordinator.status(Track::NonVolatile)});
        return result;
    }

    if (method == "notify") {
        ChangeEvent event;
        const std::string source = params.value("source", "user-request");
        const auto parsedSource = parseSourceString(source);
        if (!parsedSource.has_value()) {
            throw RequestError("Unknown source: " + source);
        }
        event.source = *parsedSource;
        event.interfaceName = params.value("interface", "");
        event.detail = params.value("detail", "");
        event.timestamp = std::chrono::system_clock::now();
        if (params.contains("linkUp") && params.at("linkUp").is_boolean()) {
            event.linkUp = params.at("linkUp").get<bool>();
        }
        m_coordinator.notify(event);
        return nlohmann::json{{"accepted", !m_coordinator.gate().isSuspended()}};
    }

    if (method == "suspend") {
        SuspensionToken token =
            m_coordinator.suspend(QString::fromStdString(params.value("label", "")));
        const quint64 tokenId = token.id();
        m_suspensions.emplace(tokenId, std::move(token));
        return nlohmann::json{{"token", tokenId}};
    }

    if (method == "release") {
        if (!params.contains("token") || !params.at("token").is_number_unsigned()) {
            throw RequestError("Missing token");
        }
        const auto tokenId = params.at("token").get<quint64>();
        auto it = m_suspensions.find(tokenId);
        const bool released = it != m_suspensions.end() && it->second.isActive();
        if (it != m_suspensions.end()) {
            m_suspensions.erase(it);
        }
        return nlohmann::json{{"released", released},
                              {"suspended", m_coordinator.gate().isSuspended()}};
    }

    if (method == "flush") {
        m_coordinator.flushNow();
        return nlohmann::json{{"ok", true}};
    }

    if (method == "list_checkpoints") {
        const Track track = trackParam(params);
        nlohmann::json result;
        result["checkpoints"] = m_coordinator.listCheckpoints(track);
        if (const auto current = m_coordinator.status(track).currentCheckpoint) {
            result["current"] = *current;
        } else {
            result["current"] = nullptr;
        }
        return result;
    }

    if (method == "open_checkpoint") {
        const Track track = trackParam(params);
        return nlohmann::json{
            {"id", m_coordinator.openCheckpoint(track, params.value("label", ""))}};
    }

    if (method == "commit_checkpoint") {
        m_coordinator.commitCheckpoint(trackParam(params), requiredString(params, "id"));
        return nlohmann::json{{"ok", true}};
    }

    if (method == "delete_checkpoint") {
        m_coordinator.deleteCheckpoint(trackParam(params), requiredString(params, "id"));
        return nlohmann::json{{"ok", true}};
    }

    if (method == "rollback") {
        const NetworkState state =
            m_coordinator.rollback(trackParam(params), requiredString(params, "id"));
        return nlohmann::json{{"state", state}};
    }

    if (method == "history") {
        const auto commits =
            m_coordinator.history(trackParam(params), optionalString(params, "since"));
        nlohmann::json list = nlohmann::json::array();
        for (const auto &commit : commits) {
            nlohmann::json entry = commit;
            if (!params.value("includeState", false)) {
                entry.erase("state");
            }
            list.push_back(std::move(entry));
        }
        return nlohmann::json{{"commits", list}};
    }

    if (method == "diff") {
        const Track track = trackParam(params);
        const std::string from = requiredString(params, "from");
        const std::string to = params.value("to", "live");
        const auto changes = to == "live" ? m_coordinator.diffWithLive(track, from)
                                          : m_coordinator.diff(track, from, to);
        return nlohmann::json{{"changes", changesToJson(changes)}};
    }

    if (method == "revert_plan") {
        const auto changes =
            m_coordinator.revertPlan(trackParam(params), requiredString(params, "id"));
        return nlohmann::json{{"changes", changesToJson(changes)}};
    }

    if (method == "gc") {
        return nlohmann::json{{"removed", m_coordinator.collectGarbage(trackParam(params))}};
    }

    throw RequestError("Unknown method");
}

QByteArray NettrackApiServer::makeErrorResponse(const QString &message, int id,
                                                const std::string &kind) const
{
    nlohmann::json response;
    response["error"] = message.toStdString();
    response["kind"] = kind;
    response["id"] = id;
    return QByteArray::fromStdString(dumpJson(response));
}

QByteArray NettrackApiServer::makeResultResponse(const nlohmann::json &result,
                                                 int id) const
{
    nlohmann::json response;
    response["result"] = result;
    response["id"] = id;
    return QByteArray::fromStdString(dumpJson(response));
}

} // namespace nettrack
