#include "tracking/debouncer.hpp"

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace nettrack {

Debouncer::Debouncer(const QString &name, std::chrono::milliseconds quietPeriod,
                     QObject *parent)
    : QObject(parent)
    , m_name(name)
    , m_quietPeriod(quietPeriod)
{
    m_timer.setSingleShot(true);
    m_timer.setInterval(m_quietPeriod);
    connect(&m_timer, &QTimer::timeout, this, &Debouncer::settle);
}

ChangeScope Debouncer::scopeForEvent(const ChangeEvent &event)
{
    ChangeScope scope;
    if (event.source == ChangeSource::ConfigDirectory) {
        // A configuration file may touch anything.
        scope.full = true;
    } else if (event.interfaceName.empty()) {
        scope.global = true;
    } else {
        scope.interfaces.insert(event.interfaceName);
    }
    return scope;
}

void Debouncer::notify(const ChangeEvent &event, Track track)
{
    m_pending[track].merge(scopeForEvent(event));
    ++m_eventCount;
    // Every event restarts the quiet period.
    m_timer.start();

    NTLOG_DEBUG(QStringLiteral("Debouncer"),
                QStringLiteral("notify"),
                QStringLiteral("event_buffered"),
                QString::fromStdString(toSourceString(event.source)),
                m_name,
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"track", toTrackString(track)},
                               {"interface", event.interfaceName},
                               {"buffered", m_eventCount}}));
}

void Debouncer::discardPending()
{
    if (m_pending.empty()) {
        return;
    }
    NTLOG_DEBUG(QStringLiteral("Debouncer"),
                QStringLiteral("discardPending"),
                QStringLiteral("burst_discarded"),
                QStringLiteral("suspension_started"),
                m_name,
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"events", m_eventCount}}));
    m_timer.stop();
    m_pending.clear();
    m_eventCount = 0;
}

void Debouncer::restart()
{
    if (!m_pending.empty()) {
        m_timer.start();
    }
}

void Debouncer::flushNow()
{
    if (m_pending.empty()) {
        return;
    }
    m_timer.stop();
    settle();
}

void Debouncer::settle()
{
    if (m_pending.empty()) {
        return;
    }

    SettleRequest request;
    request.origin = m_name;
    request.scopes.swap(m_pending);
    request.eventCount = m_eventCount;
    m_eventCount = 0;

    NTLOG_DEBUG(QStringLiteral("Debouncer"),
                QStringLiteral("settle"),
                QStringLiteral("burst_settled"),
                QStringLiteral("quiet_period_elapsed"),
                m_name,
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"events", request.eventCount},
                               {"tracks", request.scopes.size()}}));

    emit settled(request);
}

} // namespace nettrack
