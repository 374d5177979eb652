#include "core/indexing/pipeline_telemetry.h"

#include <algorithm>

namespace ss {

void PipelineTelemetry::recordFileIndexed(int chunks, int truncated)
{
    m_filesIndexed.fetch_add(1);
    m_chunksPrepared.fetch_add(static_cast<uint64_t>(std::max(0, chunks)));
    m_chunksTruncated.fetch_add(static_cast<uint64_t>(std::max(0, truncated)));
}

void PipelineTelemetry::recordCacheLookup(bool hit)
{
    if (hit) {
        m_cacheHits.fetch_add(1);
    } else {
        m_cacheMisses.fetch_add(1);
    }
}

void PipelineTelemetry::recordEmbeddingEnqueued()
{
    m_embeddingsEnqueued.fetch_add(1);
}

void PipelineTelemetry::recordEmbeddingStored(int64_t latencyMs)
{
    m_embeddingsStored.fetch_add(1);
    const uint64_t latency = static_cast<uint64_t>(std::max<int64_t>(0, latencyMs));
    m_embedLatencyTotalMs.fetch_add(latency);

    uint64_t currentMax = m_embedLatencyMaxMs.load();
    while (latency > currentMax && !m_embedLatencyMaxMs.compare_exchange_weak(currentMax, latency)) {
    }
}

void PipelineTelemetry::recordValidationFailure()
{
    m_validationFailures.fetch_add(1);
}

void PipelineTelemetry::recordBackendError()
{
    m_backendErrors.fetch_add(1);
}

void PipelineTelemetry::recordCircuitRejection()
{
    m_circuitRejections.fetch_add(1);
}

void PipelineTelemetry::recordStoreFailure()
{
    m_storeFailures.fetch_add(1);
}

void PipelineTelemetry::recordDeadLetter()
{
    m_deadLettered.fetch_add(1);
}

void PipelineTelemetry::recordCategorization(bool ok)
{
    if (ok) {
        m_categorizations.fetch_add(1);
    } else {
        m_categorizationFailures.fetch_add(1);
    }
}

void PipelineTelemetry::recordMoveBatch(int moved, int failed, bool lockTimedOut)
{
    m_filesMoved.fetch_add(static_cast<uint64_t>(std::max(0, moved)));
    m_moveFailures.fetch_add(static_cast<uint64_t>(std::max(0, failed)));
    if (lockTimedOut) {
        m_lockTimeouts.fetch_add(1);
    }
}

void PipelineTelemetry::recordWatcherEvent(bool suppressed)
{
    m_watcherEventsSeen.fetch_add(1);
    if (suppressed) {
        m_watcherEventsSuppressed.fetch_add(1);
    }
}

QJsonObject PipelineTelemetry::snapshot() const
{
    QJsonObject out;
    const qint64 hits = static_cast<qint64>(m_cacheHits.load());
    const qint64 misses = static_cast<qint64>(m_cacheMisses.load());
    const qint64 lookups = hits + misses;
    const qint64 stored = static_cast<qint64>(m_embeddingsStored.load());

    out[QStringLiteral("filesIndexed")] = static_cast<qint64>(m_filesIndexed.load());
    out[QStringLiteral("chunksPrepared")] = static_cast<qint64>(m_chunksPrepared.load());
    out[QStringLiteral("chunksTruncated")] = static_cast<qint64>(m_chunksTruncated.load());
    out[QStringLiteral("cacheHits")] = hits;
    out[QStringLiteral("cacheMisses")] = misses;
    out[QStringLiteral("cacheHitRate")] =
        lookups > 0 ? static_cast<double>(hits) / static_cast<double>(lookups) : 0.0;

    out[QStringLiteral("embeddingsEnqueued")] = static_cast<qint64>(m_embeddingsEnqueued.load());
    out[QStringLiteral("embeddingsStored")] = stored;
    out[QStringLiteral("validationFailures")] = static_cast<qint64>(m_validationFailures.load());
    out[QStringLiteral("backendErrors")] = static_cast<qint64>(m_backendErrors.load());
    out[QStringLiteral("circuitRejections")] = static_cast<qint64>(m_circuitRejections.load());
    out[QStringLiteral("storeFailures")] = static_cast<qint64>(m_storeFailures.load());
    out[QStringLiteral("deadLettered")] = static_cast<qint64>(m_deadLettered.load());
    out[QStringLiteral("embedLatencyAvgMs")] =
        stored > 0 ? static_cast<double>(m_embedLatencyTotalMs.load()) / static_cast<double>(stored)
                   : 0.0;
    out[QStringLiteral("embedLatencyMaxMs")] = static_cast<qint64>(m_embedLatencyMaxMs.load());

    out[QStringLiteral("categorizations")] = static_cast<qint64>(m_categorizations.load());
    out[QStringLiteral("categorizationFailures")] =
        static_cast<qint64>(m_categorizationFailures.load());
    out[QStringLiteral("filesMoved")] = static_cast<qint64>(m_filesMoved.load());
    out[QStringLiteral("moveFailures")] = static_cast<qint64>(m_moveFailures.load());
    out[QStringLiteral("lockTimeouts")] = static_cast<qint64>(m_lockTimeouts.load());
    out[QStringLiteral("watcherEventsSeen")] = static_cast<qint64>(m_watcherEventsSeen.load());
    out[QStringLiteral("watcherEventsSuppressed")] =
        static_cast<qint64>(m_watcherEventsSuppressed.load());
    return out;
}

void PipelineTelemetry::reset()
{
    m_filesIndexed.store(0);
    m_chunksPrepared.store(0);
    m_chunksTruncated.store(0);
    m_cacheHits.store(0);
    m_cacheMisses.store(0);
    m_embeddingsEnqueued.store(0);
    m_embeddingsStored.store(0);
    m_validationFailures.store(0);
    m_backendErrors.store(0);
    m_circuitRejections.store(0);
    m_storeFailures.store(0);
    m_deadLettered.store(0);
    m_categorizations.store(0);
    m_categorizationFailures.store(0);
    m_filesMoved.store(0);
    m_moveFailures.store(0);
    m_lockTimeouts.store(0);
    m_watcherEventsSeen.store(0);
    m_watcherEventsSuppressed.store(0);
    m_embedLatencyTotalMs.store(0);
    m_embedLatencyMaxMs.store(0);
}

} // namespace ss
