#pragma once

#include <map>
#include <utility>
#include <optional>
#include <string>
#include <vector>

#include <QObject>
#include <QString>

#include "common/config.hpp"
#include "common/metatypes.hpp"
#include "common/models.hpp"
#include "tracking/checkpoint_store.hpp"
#include "tracking/debouncer.hpp"
#include "tracking/state_classifier.hpp"
#include "tracking/state_query.hpp"
#include "tracking/suspension_gate.hpp"

namespace nettrack {

/**
 * TrackingCoordinator wires the gate, the two debouncers, the classifier and
 * the per-track stores together:
 * - notify() drops events while suspended, otherwise classifies them and
 *   buffers them in the config or network debouncer
 * - a settle captures the live state (with bounded retries) and commits it
 *   to each affected track with parent = that track's head
 * - queries are answered from the stores and the diff engine
 *
 * Stores are borrowed. A null store, or one that failed with
 * StoreIOFailure, leaves that track degraded while the other keeps going.
 */
class TrackingCoordinator : public QObject
{
    Q_OBJECT
public:
    TrackingCoordinator(const TrackingConfig &config,
                        StateQuery &stateQuery,
                        CheckpointStore *volatileStore,
                        CheckpointStore *nonVolatileStore,
                        QObject *parent = nullptr);
    ~TrackingCoordinator() override;

    SuspensionToken suspend(const QString &label = QString());

    // Settle both debouncers immediately.
    void flushNow();

    // Capture the full live state into every healthy track and make a
    // checkpoint with this label the current baseline. Returns false if the
    // live state could not be read.
    bool captureBaseline(const std::string &label);

    std::vector<Checkpoint> listCheckpoints(Track track) const;
    std::string openCheckpoint(Track track, const std::string &label);
    void commitCheckpoint(Track track, const std::string &checkpointId);
    void deleteCheckpoint(Track track, const std::string &checkpointId);
    NetworkState rollback(Track track, const std::string &id) const;
    std::vector<Commit> history(Track track,
                                const std::optional<std::string> &since = std::nullopt) const;

    std::vector<FieldChange> diff(Track track, const std::string &fromId,
                                  const std::string &toId) const;
    // Stored state at id vs. the live state.
    std::vector<FieldChange> diffWithLive(Track track, const std::string &id);
    // Changes that take the live state back to id.
    std::vector<FieldChange> revertPlan(Track track, const std::string &id);

    int collectGarbage(Track track);

    TrackStatus status(Track track) const;
    TrackingPhase phase(Track track) const;
    bool isDegraded(Track track) const;

    SuspensionGate &gate()
    {
        return m_gate;
    }

    const StateClassifier &classifier() const
    {
        return m_classifier;
    }

public slots:
    void notify(const nettrack::ChangeEvent &event);

signals:
    void committed(const QString &track, const QString &commitId);
    void trackingFailed(const QString &kind, const QString &message);
    void degradedChanged(const QString &track, bool degraded, const QString &reason);

private slots:
    void onSettled(const nettrack::SettleRequest &request);
    void onSuspended();
    void onResumed();
    void onSuspensionLeaked(quint64 tokenId, const QString &label);

private:
    struct TrackSlot {
        CheckpointStore *store = nullptr;
        bool degraded = false;
        std::string degradedReason;
        bool capturing = false;
    };

    struct PendingCapture {
        SettleRequest request;
        ChangeScope scope;
        int attempt = 0;
        quint64 generation = 0;
        QString correlationId;
    };

    void attemptCapture(PendingCapture pending);
    void commitCaptured(Track track, const NetworkState &captured, const ChangeScope &scope);
    void finishCapture(const SettleRequest &request);
    void markDegraded(Track track, const std::string &reason);
    bool hasHistory(Track track) const;
    NetworkState captureLive();

    CheckpointStore &storeFor(Track track) const;

    // Run a store operation; a StoreIOFailure degrades the track and is rethrown.
    template<typename Fn>
    auto withStore(Track track, Fn &&fn) -> decltype(fn(std::declval<CheckpointStore &>()));

    TrackingConfig m_config;
    StateQuery &m_stateQuery;
    SuspensionGate m_gate;
    StateClassifier m_classifier;
    Debouncer m_configDebouncer;
    Debouncer m_networkDebouncer;
    std::map<Track, TrackSlot> m_tracks;
    // Bumped on every suspension; captures from an older generation are dropped.
    quint64 m_generation = 0;
};

} // namespace nettrack
