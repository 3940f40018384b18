#include "tracking/suspension_gate.hpp"

#include <algorithm>
#include <utility>
#include <vector>

#include "common/logging.hpp"

namespace nettrack {

namespace {

// Scan often enough that a leak is noticed within a quarter of the ceiling.
std::chrono::milliseconds leakScanInterval(std::chrono::milliseconds ceiling)
{
    return std::clamp(ceiling / 4, std::chrono::milliseconds(10),
                      std::chrono::milliseconds(5000));
}

} // namespace

SuspensionToken::SuspensionToken(SuspensionGate *gate, quint64 id)
    : m_gate(gate)
    , m_id(id)
{
}

SuspensionToken::~SuspensionToken()
{
    release();
}

SuspensionToken::SuspensionToken(SuspensionToken &&other) noexcept
    : m_gate(std::move(other.m_gate))
    , m_id(std::exchange(other.m_id, 0))
{
    other.m_gate.clear();
}

SuspensionToken &SuspensionToken::operator=(SuspensionToken &&other) noexcept
{
    if (this != &other) {
        release();
        m_gate = std::move(other.m_gate);
        m_id = std::exchange(other.m_id, 0);
        other.m_gate.clear();
    }
    return *this;
}

bool SuspensionToken::isActive() const
{
    return m_gate && m_id != 0 && m_gate->isLive(m_id);
}

void SuspensionToken::release()
{
    if (m_gate && m_id != 0) {
        m_gate->release(m_id);
    }
    m_gate.clear();
    m_id = 0;
}

SuspensionGate::SuspensionGate(std::chrono::milliseconds leakCeiling, QObject *parent)
    : QObject(parent)
    , m_leakCeiling(leakCeiling)
{
    if (m_leakCeiling.count() > 0) {
        m_leakTimer.setInterval(leakScanInterval(m_leakCeiling));
        connect(&m_leakTimer, &QTimer::timeout, this, [this]() {
            releaseLeakedTokens();
        });
    }
}

SuspensionGate::~SuspensionGate() = default;

SuspensionToken SuspensionGate::suspend(const QString &label)
{
    quint64 id = 0;
    int count = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        id = m_nextId++;
        m_live.emplace(id, Holder{label, std::chrono::steady_clock::now()});
        count = ++m_count;
    }

    NTLOG_DEBUG(QStringLiteral("SuspensionGate"),
                QStringLiteral("suspend"),
                QStringLiteral("suspension_acquired"),
                QStringLiteral("apply_in_progress"),
                QStringLiteral("refcount"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"token", id},
                               {"label", label.toStdString()},
                               {"active", count}}));

    if (count == 1) {
        if (m_leakCeiling.count() > 0 && !m_leakTimer.isActive()) {
            m_leakTimer.start();
        }
        emit suspended();
    }
    return SuspensionToken(this, id);
}

bool SuspensionGate::isLive(quint64 tokenId) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_live.count(tokenId) > 0;
}

bool SuspensionGate::release(quint64 tokenId)
{
    int count = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_live.find(tokenId);
        if (it == m_live.end()) {
            return false;
        }
        m_live.erase(it);
        count = --m_count;
    }

    NTLOG_DEBUG(QStringLiteral("SuspensionGate"),
                QStringLiteral("release"),
                QStringLiteral("suspension_released"),
                QStringLiteral("apply_finished"),
                QStringLiteral("refcount"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"token", tokenId}, {"active", count}}));

    if (count == 0) {
        m_leakTimer.stop();
        emit resumed();
    }
    return true;
}

int SuspensionGate::releaseLeakedTokens()
{
    if (m_leakCeiling.count() <= 0) {
        return 0;
    }

    std::vector<std::pair<quint64, QString>> leaked;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto now = std::chrono::steady_clock::now();
        for (const auto &[id, holder] : m_live) {
            if (now - holder.acquiredAt >= m_leakCeiling) {
                leaked.emplace_back(id, holder.label);
            }
        }
    }

    int released = 0;
    for (const auto &[id, label] : leaked) {
        NTLOG_WARN(QStringLiteral("SuspensionGate"),
                   QStringLiteral("releaseLeakedTokens"),
                   QStringLiteral("suspension_leak"),
                   QStringLiteral("ceiling_exceeded"),
                   QStringLiteral("force_release"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"token", id},
                                  {"label", label.toStdString()},
                                  {"ceilingMs", m_leakCeiling.count()}}));
        emit suspensionLeaked(id, label);
        if (release(id)) {
            ++released;
        }
    }
    return released;
}

} // namespace nettrack
