#include "core/fs/batch_lock_manager.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <chrono>

namespace ss {

BatchLockManager::BatchLockManager(BatchLockConfig config)
    : m_config(std::move(config))
    , m_clock(clockOrDefault(m_config.clock))
{
    m_config.pollIntervalMs = std::max(1, m_config.pollIntervalMs);
    m_config.staleLockMs = std::max<int64_t>(1, m_config.staleLockMs);
}

// ── Acquire ─────────────────────────────────────────────────

void BatchLockManager::reclaimIfStaleLocked(int64_t now)
{
    if (m_state != State::Held) {
        return;
    }
    const int64_t heldMs = now - m_acquiredAt;
    if (heldMs < m_config.staleLockMs) {
        return;
    }
    LOG_WARN(ssFs, "Reclaiming stale batch lock held by %s for %lld ms",
             qUtf8Printable(m_holderId), static_cast<long long>(heldMs));
    m_state = State::Free;
    m_holderId.clear();
    m_acquiredAt = 0;
    ++m_stats.staleReclaims;
}

BatchLockManager::AcquireResult BatchLockManager::tryAcquireLocked(const QString& holderId)
{
    reclaimIfStaleLocked(m_clock());

    if (m_state == State::Held) {
        return m_holderId == holderId ? AcquireResult::AlreadyHeld : AcquireResult::Unavailable;
    }

    m_state = State::Held;
    m_holderId = holderId;
    m_acquiredAt = m_clock();
    ++m_stats.acquisitions;
    LOG_DEBUG(ssFs, "Batch lock acquired by %s", qUtf8Printable(holderId));
    return AcquireResult::Acquired;
}

bool BatchLockManager::tryAcquire(const QString& holderId)
{
    if (holderId.isEmpty()) {
        LOG_WARN(ssFs, "Batch lock requested with an empty holder id");
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    return tryAcquireLocked(holderId) != AcquireResult::Unavailable;
}

bool BatchLockManager::acquire(const QString& holderId, int timeoutMs)
{
    return acquireFor(holderId, timeoutMs) != AcquireResult::Unavailable;
}

BatchLockManager::AcquireResult BatchLockManager::acquireFor(const QString& holderId,
                                                             int timeoutMs)
{
    if (holderId.isEmpty()) {
        LOG_WARN(ssFs, "Batch lock requested with an empty holder id");
        return AcquireResult::Unavailable;
    }

    const auto deadline = std::chrono::steady_clock::now()
                          + std::chrono::milliseconds(std::max(0, timeoutMs));
    std::unique_lock<std::mutex> lock(m_mutex);
    AcquireResult result = tryAcquireLocked(holderId);
    while (result == AcquireResult::Unavailable) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            ++m_stats.timeouts;
            LOG_WARN(ssFs, "Batch lock timeout for %s after %d ms (held by %s)",
                     qUtf8Printable(holderId), timeoutMs, qUtf8Printable(m_holderId));
            return result;
        }
        const auto poll = std::min<std::chrono::steady_clock::duration>(
            std::chrono::milliseconds(m_config.pollIntervalMs), deadline - now);
        m_releasedCv.wait_for(lock, poll);
        result = tryAcquireLocked(holderId);
    }
    return result;
}

void BatchLockManager::acquireUnbounded(const QString& holderId)
{
    if (holderId.isEmpty()) {
        LOG_WARN(ssFs, "Batch lock requested with an empty holder id");
        return;
    }

    std::unique_lock<std::mutex> lock(m_mutex);
    while (tryAcquireLocked(holderId) == AcquireResult::Unavailable) {
        m_releasedCv.wait_for(lock, std::chrono::milliseconds(m_config.pollIntervalMs));
    }
}

// ── Release ─────────────────────────────────────────────────

bool BatchLockManager::release(const QString& holderId)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state != State::Held || m_holderId != holderId) {
            ++m_stats.rejectedReleases;
            LOG_WARN(ssFs, "Batch lock release by %s ignored (holder: %s)",
                     qUtf8Printable(holderId),
                     m_holderId.isEmpty() ? "none" : qUtf8Printable(m_holderId));
            return false;
        }
        m_state = State::Free;
        m_holderId.clear();
        m_acquiredAt = 0;
        ++m_stats.releases;
        LOG_DEBUG(ssFs, "Batch lock released by %s", qUtf8Printable(holderId));
    }
    m_releasedCv.notify_all();
    return true;
}

// ── Inspection ──────────────────────────────────────────────

BatchLockManager::State BatchLockManager::state() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

QString BatchLockManager::currentHolder() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_holderId;
}

int64_t BatchLockManager::heldForMs() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state == State::Held ? m_clock() - m_acquiredAt : 0;
}

BatchLockStats BatchLockManager::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

QJsonObject BatchLockManager::statsJson() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    QJsonObject json;
    json[QStringLiteral("held")] = m_state == State::Held;
    json[QStringLiteral("holder")] = m_holderId;
    json[QStringLiteral("acquisitions")] = static_cast<qint64>(m_stats.acquisitions);
    json[QStringLiteral("releases")] = static_cast<qint64>(m_stats.releases);
    json[QStringLiteral("timeouts")] = static_cast<qint64>(m_stats.timeouts);
    json[QStringLiteral("staleReclaims")] = static_cast<qint64>(m_stats.staleReclaims);
    json[QStringLiteral("rejectedReleases")] = static_cast<qint64>(m_stats.rejectedReleases);
    return json;
}

// ── BatchLockGuard ──────────────────────────────────────────

BatchLockGuard::BatchLockGuard(BatchLockManager& manager, const QString& holderId, int timeoutMs)
    : m_manager(manager)
    , m_holderId(holderId)
    , m_result(manager.acquireFor(holderId, timeoutMs))
{
}

BatchLockGuard::~BatchLockGuard()
{
    if (owns() && !m_manager.release(m_holderId)) {
        LOG_WARN(ssFs, "Batch lock for %s was reclaimed before the guard released it",
                 qUtf8Printable(m_holderId));
    }
}

} // namespace ss
