#pragma once

#include <QJsonObject>

#include <atomic>
#include <cstdint>

namespace ss {

// Lock-free counters for the embedding pipeline. snapshot() is a read-only
// projection and never touches pipeline state.
class PipelineTelemetry {
public:
    void recordFileIndexed(int chunks, int truncated);
    void recordCacheLookup(bool hit);
    void recordEmbeddingEnqueued();
    void recordEmbeddingStored(int64_t latencyMs);
    void recordValidationFailure();
    void recordBackendError();
    void recordCircuitRejection();
    void recordStoreFailure();
    void recordDeadLetter();
    void recordCategorization(bool ok);
    void recordMoveBatch(int moved, int failed, bool lockTimedOut);
    void recordWatcherEvent(bool suppressed);

    QJsonObject snapshot() const;
    void reset();

private:
    std::atomic<uint64_t> m_filesIndexed{0};
    std::atomic<uint64_t> m_chunksPrepared{0};
    std::atomic<uint64_t> m_chunksTruncated{0};
    std::atomic<uint64_t> m_cacheHits{0};
    std::atomic<uint64_t> m_cacheMisses{0};
    std::atomic<uint64_t> m_embeddingsEnqueued{0};
    std::atomic<uint64_t> m_embeddingsStored{0};
    std::atomic<uint64_t> m_validationFailures{0};
    std::atomic<uint64_t> m_backendErrors{0};
    std::atomic<uint64_t> m_circuitRejections{0};
    std::atomic<uint64_t> m_storeFailures{0};
    std::atomic<uint64_t> m_deadLettered{0};
    std::atomic<uint64_t> m_categorizations{0};
    std::atomic<uint64_t> m_categorizationFailures{0};
    std::atomic<uint64_t> m_filesMoved{0};
    std::atomic<uint64_t> m_moveFailures{0};
    std::atomic<uint64_t> m_lockTimeouts{0};
    std::atomic<uint64_t> m_watcherEventsSeen{0};
    std::atomic<uint64_t> m_watcherEventsSuppressed{0};
    std::atomic<uint64_t> m_embedLatencyTotalMs{0};
    std::atomic<uint64_t> m_embedLatencyMaxMs{0};
};

} // namespace ss
