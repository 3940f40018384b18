#include "tracking/tracking_coordinator.hpp"

#include <algorithm>
#include <chrono>

#include <QTimer>
#include <QUuid>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "tracking/diff_engine.hpp"

namespace nettrack {

namespace {

QString newCorrelationId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

QString trackName(Track track)
{
    return QString::fromStdString(toTrackString(track));
}

nlohmann::json scopeSummary(const std::map<Track, ChangeScope> &scopes)
{
    nlohmann::json summary = nlohmann::json::object();
    for (const auto &[track, scope] : scopes) {
        summary[toTrackString(track)] = scope;
    }
    return summary;
}

} // namespace

TrackingCoordinator::TrackingCoordinator(const TrackingConfig &config,
                                         StateQuery &stateQuery,
                                         CheckpointStore *volatileStore,
                                         CheckpointStore *nonVolatileStore,
                                         QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_stateQuery(stateQuery)
    , m_gate(config.suspensionCeiling)
    , m_classifier(config.trackConfigDirectory)
    , m_configDebouncer(QStringLiteral("config"), config.configQuietPeriod)
    , m_networkDebouncer(QStringLiteral("network"), config.networkQuietPeriod)
{
    qRegisterMetaType<nettrack::SettleRequest>();
    qRegisterMetaType<nettrack::ChangeEvent>();

    m_tracks[Track::Volatile].store = volatileStore;
    m_tracks[Track::NonVolatile].store = nonVolatileStore;
    for (auto &[track, slot] : m_tracks) {
        if (!slot.store) {
            slot.degraded = true;
            slot.degradedReason = "store unavailable";
        }
    }

    // Settles reach the coordinator as queued messages, never as a nested call
    // from inside the timer.
    connect(&m_configDebouncer, &Debouncer::settled,
            this, &TrackingCoordinator::onSettled, Qt::QueuedConnection);
    connect(&m_networkDebouncer, &Debouncer::settled,
            this, &TrackingCoordinator::onSettled, Qt::QueuedConnection);

    connect(&m_gate, &SuspensionGate::suspended, this, &TrackingCoordinator::onSuspended);
    connect(&m_gate, &SuspensionGate::resumed, this, &TrackingCoordinator::onResumed);
    connect(&m_gate, &SuspensionGate::suspensionLeaked,
            this, &TrackingCoordinator::onSuspensionLeaked);
}

TrackingCoordinator::~TrackingCoordinator() = default;

template<typename Fn>
auto TrackingCoordinator::withStore(Track track, Fn &&fn)
    -> decltype(fn(std::declval<CheckpointStore &>()))
{
    CheckpointStore &store = storeFor(track);
    try {
        return fn(store);
    } catch (const StoreError &ex) {
        if (ex.kind() == StoreError::Kind::StoreIOFailure) {
            markDegraded(track, ex.what());
        }
        throw;
    }
}

CheckpointStore &TrackingCoordinator::storeFor(Track track) const
{
    const TrackSlot &slot = m_tracks.at(track);
    if (!slot.store || slot.degraded) {
        throw TrackingError(TrackingError::Kind::TrackDegraded,
                            toTrackString(track) + " track is degraded: "
                                + slot.degradedReason);
    }
    return *slot.store;
}

SuspensionToken TrackingCoordinator::suspend(const QString &label)
{
    return m_gate.suspend(label);
}

void TrackingCoordinator::notify(const ChangeEvent &event)
{
    const QString source = QString::fromStdString(toSourceString(event.source));

    if (m_gate.isSuspended()) {
        NTLOG_DEBUG(QStringLiteral("TrackingCoordinator"),
                    QStringLiteral("notify"),
                    QStringLiteral("event_dropped"),
                    QStringLiteral("suspended"),
                    source,
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"interface", event.interfaceName}}));
        return;
    }

    const TrackRoute route = m_classifier.classify(event);
    const auto track = StateClassifier::trackFor(route);
    if (!track.has_value()) {
        // Only the one-shot apply at start consumes these.
        NTLOG_INFO(QStringLiteral("TrackingCoordinator"),
                   QStringLiteral("notify"),
                   QStringLiteral("event_not_tracked"),
                   QStringLiteral("config_directory_untracked"),
                   source,
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"detail", event.detail}}));
        return;
    }

    if (m_tracks.at(*track).degraded) {
        NTLOG_WARN(QStringLiteral("TrackingCoordinator"),
                   QStringLiteral("notify"),
                   QStringLiteral("event_dropped"),
                   QStringLiteral("track_degraded"),
                   source,
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"track", toTrackString(*track)}}));
        return;
    }

    Debouncer &debouncer = event.source == ChangeSource::ConfigDirectory
        ? m_configDebouncer
        : m_networkDebouncer;
    debouncer.notify(event, *track);
}

void TrackingCoordinator::flushNow()
{
    m_configDebouncer.flushNow();
    m_networkDebouncer.flushNow();
}

void TrackingCoordinator::onSuspended()
{
    ++m_generation;
    m_configDebouncer.discardPending();
    m_networkDebouncer.discardPending();
    for (auto &[track, slot] : m_tracks) {
        slot.capturing = false;
    }
}

void TrackingCoordinator::onResumed()
{
    m_configDebouncer.restart();
    m_networkDebouncer.restart();
}

void TrackingCoordinator::onSuspensionLeaked(quint64 tokenId, const QString &label)
{
    const std::string message = "suspension token " + std::to_string(tokenId)
        + " (" + label.toStdString() + ") exceeded the ceiling and was released";
    emit trackingFailed(QString::fromLatin1(toString(TrackingError::Kind::SuspensionLeak)),
                        QString::fromStdString(message));
}

void TrackingCoordinator::onSettled(const SettleRequest &request)
{
    if (m_gate.isSuspended()) {
        return;
    }

    PendingCapture pending;
    pending.request = request;
    pending.generation = m_generation;
    pending.correlationId = newCorrelationId();
    for (auto &[track, scope] : pending.request.scopes) {
        // The first commit of a track must be a complete state.
        if (!hasHistory(track)) {
            scope.full = true;
        }
        pending.scope.merge(scope);
        m_tracks.at(track).capturing = true;
    }

    logging::CorrelationScope corrScope(pending.correlationId);
    NTLOG_INFO(QStringLiteral("TrackingCoordinator"),
               QStringLiteral("onSettled"),
               QStringLiteral("settle_received"),
               QStringLiteral("quiet_period_elapsed"),
               request.origin,
               logging::defaultWho(),
               pending.correlationId,
               (nlohmann::json{{"events", request.eventCount},
                              {"scopes", scopeSummary(pending.request.scopes)}}));

    attemptCapture(std::move(pending));
}

void TrackingCoordinator::attemptCapture(PendingCapture pending)
{
    logging::CorrelationScope corrScope(pending.correlationId);

    if (pending.generation != m_generation || m_gate.isSuspended()) {
        NTLOG_INFO(QStringLiteral("TrackingCoordinator"),
                   QStringLiteral("attemptCapture"),
                   QStringLiteral("settle_dropped"),
                   QStringLiteral("suspended_during_capture"),
                   pending.request.origin,
                   logging::defaultWho(),
                   pending.correlationId,
                   nlohmann::json::object());
        return;
    }

    ++pending.attempt;
    NetworkState captured;
    try {
        captured = m_stateQuery.capture(pending.scope);
    } catch (const CaptureError &ex) {
        if (pending.attempt >= std::max(1, m_config.captureAttempts)) {
            NTLOG_ERROR(QStringLiteral("TrackingCoordinator"),
                        QStringLiteral("attemptCapture"),
                        QStringLiteral("capture_failed"),
                        QStringLiteral("retries_exhausted"),
                        QStringLiteral("drop_settle"),
                        logging::defaultWho(),
                        pending.correlationId,
                        (nlohmann::json{{"attempts", pending.attempt},
                                       {"error", ex.what()}}));
            finishCapture(pending.request);
            emit trackingFailed(
                QString::fromLatin1(toString(TrackingError::Kind::CaptureFailed)),
                QString::fromUtf8(ex.what()));
            return;
        }

        // 1x, 2x, 4x ... the base backoff, capped.
        const int shift = std::min(pending.attempt - 1, 20);
        const std::chrono::milliseconds delay = std::min(
            std::chrono::milliseconds(m_config.captureBackoff.count() << shift),
            m_config.captureBackoffMax);
        NTLOG_WARN(QStringLiteral("TrackingCoordinator"),
                   QStringLiteral("attemptCapture"),
                   QStringLiteral("capture_retry"),
                   QStringLiteral("state_query_unreachable"),
                   QStringLiteral("backoff"),
                   logging::defaultWho(),
                   pending.correlationId,
                   (nlohmann::json{{"attempt", pending.attempt},
                                  {"delayMs", delay.count()},
                                  {"error", ex.what()}}));
        QTimer::singleShot(delay, this, [this, pending]() {
            attemptCapture(pending);
        });
        return;
    }

    for (const auto &[track, scope] : pending.request.scopes) {
        commitCaptured(track, captured, scope);
    }
    finishCapture(pending.request);
}

void TrackingCoordinator::finishCapture(const SettleRequest &request)
{
    for (const auto &[track, scope] : request.scopes) {
        m_tracks.at(track).capturing = false;
    }
}

void TrackingCoordinator::commitCaptured(Track track, const NetworkState &captured,
                                         const ChangeScope &scope)
{
    if (m_tracks.at(track).degraded) {
        return;
    }

    try {
        const std::string commitId = withStore(track, [&](CheckpointStore &store) {
            const auto head = store.head();
            NetworkState base;
            if (head.has_value()) {
                if (const auto commit = store.getCommit(*head)) {
                    base = commit->state;
                }
            }

            const NetworkState next = mergeScopedCapture(base, captured, scope);
            if (m_config.skipUnchangedStates && head.has_value() && next == base) {
                return std::string();
            }
            return store.commit(next, head);
        });

        if (commitId.empty()) {
            NTLOG_DEBUG(QStringLiteral("TrackingCoordinator"),
                        QStringLiteral("commitCaptured"),
                        QStringLiteral("commit_skipped"),
                        QStringLiteral("state_unchanged"),
                        trackName(track),
                        logging::defaultWho(),
                        logging::currentCorrelationId(),
                        nlohmann::json::object());
            return;
        }

        NTLOG_INFO(QStringLiteral("TrackingCoordinator"),
                   QStringLiteral("commitCaptured"),
                   QStringLiteral("state_committed"),
                   QStringLiteral("settle"),
                   trackName(track),
                   logging::defaultWho(),
                   logging::currentCorrelationId(),
                   (nlohmann::json{{"commit", commitId},
                                  {"interfaces", captured.interfaces.size()}}));
        emit committed(trackName(track), QString::fromStdString(commitId));
    } catch (const StoreError &ex) {
        // The I/O case already degraded the track; nothing is committed.
        NTLOG_ERROR(QStringLiteral("TrackingCoordinator"),
                    QStringLiteral("commitCaptured"),
                    QStringLiteral("commit_failed"),
                    QString::fromLatin1(toString(ex.kind())),
                    trackName(track),
                    logging::defaultWho(),
                    logging::currentCorrelationId(),
                    (nlohmann::json{{"error", ex.what()}}));
    }
}

void TrackingCoordinator::markDegraded(Track track, const std::string &reason)
{
    TrackSlot &slot = m_tracks.at(track);
    if (slot.degraded) {
        return;
    }
    slot.degraded = true;
    slot.degradedReason = reason;
    slot.capturing = false;

    NTLOG_ERROR(QStringLiteral("TrackingCoordinator"),
                QStringLiteral("markDegraded"),
                QStringLiteral("track_degraded"),
                QStringLiteral("store_io_failure"),
                trackName(track),
                logging::defaultWho(),
                logging::currentCorrelationId(),
                (nlohmann::json{{"reason", reason}}));
    emit degradedChanged(trackName(track), true, QString::fromStdString(reason));
}

NetworkState TrackingCoordinator::captureLive()
{
    ChangeScope full;
    full.full = true;
    try {
        return m_stateQuery.capture(full);
    } catch (const CaptureError &ex) {
        throw TrackingError(TrackingError::Kind::CaptureFailed, ex.what());
    }
}

bool TrackingCoordinator::captureBaseline(const std::string &label)
{
    NetworkState live;
    try {
        live = captureLive();
    } catch (const TrackingError &ex) {
        NTLOG_ERROR(QStringLiteral("TrackingCoordinator"),
                    QStringLiteral("captureBaseline"),
                    QStringLiteral("baseline_failed"),
                    QString::fromLatin1(toString(ex.kind())),
                    QString::fromStdString(label),
                    logging::defaultWho(),
                    logging::currentCorrelationId(),
                    (nlohmann::json{{"error", ex.what()}}));
        emit trackingFailed(QString::fromLatin1(toString(ex.kind())),
                            QString::fromUtf8(ex.what()));
        return false;
    }

    ChangeScope full;
    full.full = true;
    for (auto &[track, slot] : m_tracks) {
        if (slot.degraded) {
            continue;
        }
        commitCaptured(track, live, full);
        if (slot.degraded) {
            continue;
        }
        try {
            withStore(track, [&](CheckpointStore &store) {
                const std::string checkpointId = store.openCheckpoint(label);
                store.commitCheckpoint(checkpointId);
                return 0;
            });
        } catch (const StoreError &ex) {
            NTLOG_ERROR(QStringLiteral("TrackingCoordinator"),
                        QStringLiteral("captureBaseline"),
                        QStringLiteral("baseline_checkpoint_failed"),
                        QString::fromLatin1(toString(ex.kind())),
                        trackName(track),
                        logging::defaultWho(),
                        logging::currentCorrelationId(),
                        (nlohmann::json{{"error", ex.what()}}));
        }
    }
    return true;
}

std::vector<Checkpoint> TrackingCoordinator::listCheckpoints(Track track) const
{
    return storeFor(track).listCheckpoints();
}

std::string TrackingCoordinator::openCheckpoint(Track track, const std::string &label)
{
    return withStore(track, [&](CheckpointStore &store) {
        return store.openCheckpoint(label);
    });
}

void TrackingCoordinator::commitCheckpoint(Track track, const std::string &checkpointId)
{
    withStore(track, [&](CheckpointStore &store) {
        store.commitCheckpoint(checkpointId);
        return 0;
    });
}

void TrackingCoordinator::deleteCheckpoint(Track track, const std::string &checkpointId)
{
    withStore(track, [&](CheckpointStore &store) {
        store.deleteCheckpoint(checkpointId);
        return 0;
    });
}

NetworkState TrackingCoordinator::rollback(Track track, const std::string &id) const
{
    return storeFor(track).rollback(id);
}

std::vector<Commit> TrackingCoordinator::history(Track track,
                                                 const std::optional<std::string> &since) const
{
    return storeFor(track).history(since);
}

std::vector<FieldChange> TrackingCoordinator::diff(Track track, const std::string &fromId,
                                                   const std::string &toId) const
{
    const CheckpointStore &store = storeFor(track);
    return diffStates(store.rollback(fromId), store.rollback(toId));
}

std::vector<FieldChange> TrackingCoordinator::diffWithLive(Track track, const std::string &id)
{
    const NetworkState stored = storeFor(track).rollback(id);
    return diffStates(stored, captureLive());
}

std::vector<FieldChange> TrackingCoordinator::revertPlan(Track track, const std::string &id)
{
    const NetworkState stored = storeFor(track).rollback(id);
    return diffStates(captureLive(), stored);
}

int TrackingCoordinator::collectGarbage(Track track)
{
    return withStore(track, [](CheckpointStore &store) {
        return store.collectGarbage();
    });
}

bool TrackingCoordinator::hasHistory(Track track) const
{
    const TrackSlot &slot = m_tracks.at(track);
    if (!slot.store || slot.degraded) {
        return false;
    }
    try {
        return slot.store->head().has_value();
    } catch (const StoreError &) {
        // The commit that follows reports and degrades.
        return false;
    }
}

bool TrackingCoordinator::isDegraded(Track track) const
{
    return m_tracks.at(track).degraded;
}

TrackingPhase TrackingCoordinator::phase(Track track) const
{
    if (m_gate.isSuspended()) {
        return TrackingPhase::Suspended;
    }
    if (m_tracks.at(track).capturing) {
        return TrackingPhase::Capturing;
    }
    if (m_configDebouncer.hasPendingFor(track) || m_networkDebouncer.hasPendingFor(track)) {
        return TrackingPhase::Debouncing;
    }
    return TrackingPhase::Idle;
}

TrackStatus TrackingCoordinator::status(Track track) const
{
    const TrackSlot &slot = m_tracks.at(track);
    TrackStatus status;
    status.track = track;
    status.phase = phase(track);
    status.degraded = slot.degraded;
    status.degradedReason = slot.degradedReason;
    if (!slot.store || slot.degraded) {
        return status;
    }

    try {
        status.head = slot.store->head();
        if (const auto current = slot.store->currentCheckpoint()) {
            status.currentCheckpoint = current->id;
        }
    } catch (const StoreError &ex) {
        status.degradedReason = ex.what();
    }
    return status;
}

} // namespace nettrack
