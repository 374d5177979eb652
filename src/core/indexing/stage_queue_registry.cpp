#include "core/indexing/stage_queue_registry.h"
#include "core/indexing/stage_queue.h"
#include "core/shared/logging.h"

#include <QThread>

#include <chrono>

namespace ss {

namespace {

constexpr int kCapacityPollMs = 100;

QJsonObject statsToJson(const StageQueueStats& s)
{
    QJsonObject json;
    json[QStringLiteral("size")] = static_cast<qint64>(s.size);
    json[QStringLiteral("active")] = static_cast<qint64>(s.active);
    json[QStringLiteral("failed")] = static_cast<qint64>(s.failed);
    json[QStringLiteral("processed")] = static_cast<qint64>(s.processed);
    json[QStringLiteral("retried")] = static_cast<qint64>(s.retried);
    json[QStringLiteral("deadLettered")] = static_cast<qint64>(s.deadLettered);
    json[QStringLiteral("dropped")] = static_cast<qint64>(s.dropped);
    json[QStringLiteral("paused")] = s.paused;
    json[QStringLiteral("running")] = s.running;
    json[QStringLiteral("capacityPercent")] = s.capacityPercent;
    return json;
}

} // namespace

void StageQueueRegistry::registerQueue(StageQueue* queue)
{
    if (queue == nullptr) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_queues[queue->stage()] = queue;
}

void StageQueueRegistry::unregisterQueue(const QString& stage)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_queues.erase(stage);
}

StageQueue* StageQueueRegistry::queue(const QString& stage) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_queues.find(stage);
    return it == m_queues.end() ? nullptr : it->second;
}

QStringList StageQueueRegistry::stages() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    QStringList names;
    for (const auto& entry : m_queues) {
        names.append(entry.first);
    }
    return names;
}

std::vector<StageQueue*> StageQueueRegistry::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<StageQueue*> queues;
    queues.reserve(m_queues.size());
    for (const auto& entry : m_queues) {
        queues.push_back(entry.second);
    }
    return queues;
}

// ── Path maintenance ────────────────────────────────────────

int StageQueueRegistry::updateByFilePath(const QString& oldPath, const QString& newPath,
                                         const PayloadRewriter& rewrite)
{
    int total = 0;
    for (StageQueue* queue : snapshot()) {
        total += queue->updateByFilePath(oldPath, newPath, rewrite);
    }
    return total;
}

int StageQueueRegistry::updateByFilePaths(const std::vector<std::pair<QString, QString>>& pathChanges)
{
    int total = 0;
    for (const auto& change : pathChanges) {
        total += updateByFilePath(change.first, change.second);
    }
    return total;
}

int StageQueueRegistry::removeByFilePath(const QString& filePath)
{
    int total = 0;
    for (StageQueue* queue : snapshot()) {
        total += queue->removeByFilePath(filePath);
    }
    return total;
}

int StageQueueRegistry::removeByFilePaths(const QStringList& filePaths)
{
    int total = 0;
    for (const QString& path : filePaths) {
        total += removeByFilePath(path);
    }
    return total;
}

// ── Stats / persistence ─────────────────────────────────────

QJsonObject StageQueueRegistry::stats() const
{
    QJsonObject json;
    for (StageQueue* queue : snapshot()) {
        json[queue->stage()] = statsToJson(queue->stats());
    }
    return json;
}

bool StageQueueRegistry::persistAll()
{
    bool ok = true;
    for (StageQueue* queue : snapshot()) {
        if (!queue->persist()) {
            ok = false;
        }
    }
    return ok;
}

// ── Backpressure ────────────────────────────────────────────

CapacityWaitResult StageQueueRegistry::waitForCapacity(const QString& stage,
                                                       double highWatermarkPercent,
                                                       int timeoutMs)
{
    CapacityWaitResult result;
    StageQueue* target = queue(stage);
    if (target == nullptr) {
        return result;
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    result.capacityPercent = target->stats().capacityPercent;
    while (result.capacityPercent >= highWatermarkPercent) {
        if (!result.waited) {
            LOG_INFO(ssQueue, "Stage '%s' at %.1f%% capacity, waiting for room",
                     qUtf8Printable(stage), result.capacityPercent);
        }
        result.waited = true;
        if (std::chrono::steady_clock::now() >= deadline) {
            LOG_WARN(ssQueue, "Stage '%s' still at %.1f%% capacity after %d ms",
                     qUtf8Printable(stage), result.capacityPercent, timeoutMs);
            break;
        }
        QThread::msleep(kCapacityPollMs);
        result.capacityPercent = target->stats().capacityPercent;
    }
    return result;
}

} // namespace ss
