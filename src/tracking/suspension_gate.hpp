#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>

#include <QObject>
#include <QPointer>
#include <QString>
#include <QTimer>

namespace nettrack {

class SuspensionGate;

// Scoped suspension. Tracking stays suspended while any token is live.
// Release is idempotent and also happens on destruction.
class SuspensionToken
{
public:
    SuspensionToken() = default;
    SuspensionToken(SuspensionGate *gate, quint64 id);
    ~SuspensionToken();

    SuspensionToken(SuspensionToken &&other) noexcept;
    SuspensionToken &operator=(SuspensionToken &&other) noexcept;

    SuspensionToken(const SuspensionToken &) = delete;
    SuspensionToken &operator=(const SuspensionToken &) = delete;

    quint64 id() const
    {
        return m_id;
    }

    bool isActive() const;
    void release();

private:
    QPointer<SuspensionGate> m_gate;
    quint64 m_id = 0;
};

/**
 * SuspensionGate is a reference-counted flag set that blocks tracking while
 * an external apply is running. Tokens held longer than the leak ceiling are
 * force-released so tracking can never stall permanently.
 */
class SuspensionGate : public QObject
{
    Q_OBJECT
public:
    explicit SuspensionGate(std::chrono::milliseconds leakCeiling,
                            QObject *parent = nullptr);
    ~SuspensionGate() override;

    SuspensionToken suspend(const QString &label = QString());

    bool isSuspended() const
    {
        return m_count.load() > 0;
    }

    int activeCount() const
    {
        return m_count.load();
    }

    bool isLive(quint64 tokenId) const;

    // Returns false if the token was already released.
    bool release(quint64 tokenId);

    // Force-release tokens older than the ceiling. Returns how many were released.
    int releaseLeakedTokens();

    std::chrono::milliseconds leakCeiling() const
    {
        return m_leakCeiling;
    }

signals:
    void suspended();
    void resumed();
    void suspensionLeaked(quint64 tokenId, const QString &label);

private:
    struct Holder {
        QString label;
        std::chrono::steady_clock::time_point acquiredAt;
    };

    mutable std::mutex m_mutex;
    std::map<quint64, Holder> m_live;
    std::atomic<int> m_count{0};
    quint64 m_nextId = 1;
    std::chrono::milliseconds m_leakCeiling;
    QTimer m_leakTimer;
};

} // namespace nettrack
