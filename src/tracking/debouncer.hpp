#pragma once

#include <chrono>
#include <map>

#include <QMetaType>
#include <QObject>
#include <QString>
#include <QTimer>

#include "common/models.hpp"

namespace nettrack {

// Coalesced result of one burst: the entities to refresh, per track.
struct SettleRequest {
    QString origin;
    std::map<Track, ChangeScope> scopes;
    int eventCount = 0;
};

/**
 * Debouncer holds change notifications until a quiet period elapses with no
 * further events, then emits exactly one settled() per burst.
 */
class Debouncer : public QObject
{
    Q_OBJECT
public:
    Debouncer(const QString &name, std::chrono::milliseconds quietPeriod,
              QObject *parent = nullptr);

    void notify(const ChangeEvent &event, Track track);

    // Drop everything buffered and stop the timer.
    void discardPending();

    // Start the quiet period over if anything is buffered.
    void restart();

    // Settle immediately if anything is buffered.
    void flushNow();

    bool isPending() const
    {
        return !m_pending.empty();
    }

    bool hasPendingFor(Track track) const
    {
        return m_pending.count(track) > 0;
    }

    const QString &name() const
    {
        return m_name;
    }

    std::chrono::milliseconds quietPeriod() const
    {
        return m_quietPeriod;
    }

    static ChangeScope scopeForEvent(const ChangeEvent &event);

signals:
    void settled(const nettrack::SettleRequest &request);

private:
    void settle();

    QString m_name;
    std::chrono::milliseconds m_quietPeriod;
    QTimer m_timer;
    std::map<Track, ChangeScope> m_pending;
    int m_eventCount = 0;
};

} // namespace nettrack

Q_DECLARE_METATYPE(nettrack::SettleRequest)
