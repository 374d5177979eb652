#pragma once

#include "core/embedding/embedding_backend.h"
#include "core/indexing/chunker.h"
#include "core/indexing/pipeline_telemetry.h"
#include "core/indexing/stage_queue.h"
#include "core/indexing/stage_queue_registry.h"
#include "core/shared/settings.h"

#include <QJsonObject>
#include <QObject>
#include <QString>
#include <QStringList>

#include <vector>

namespace ss {

class BatchLockManager;
class EmbeddingCache;
class FileOperationTracker;
class VectorStore;
struct VectorMatch;

// Collaborators wired into the pipeline. None are owned; all must outlive
// the pipeline. generationBackend and organizeQueue are optional.
struct EmbeddingPipelineDeps {
    EmbeddingBackend* embeddingBackend = nullptr;
    TextGenerationBackend* generationBackend = nullptr;
    VectorStore* vectorStore = nullptr;
    EmbeddingCache* cache = nullptr;
    StageQueue* embeddingQueue = nullptr;
    StageQueue* organizeQueue = nullptr;
    BatchLockManager* lockManager = nullptr;
    FileOperationTracker* tracker = nullptr;
};

struct IndexReport {
    int chunks = 0;
    int cacheHits = 0;           // stored straight from the cache
    int enqueued = 0;            // embedding jobs created
    int truncated = 0;           // chunks capped to the token budget
    int rejected = 0;            // embedding queue refused the job
    int storeFailures = 0;
    QStringList chunkIds;
};

struct FileMove {
    QString source;
    QString destination;
};

struct FailedMove {
    FileMove move;
    QString error;
};

struct BatchMoveResult {
    bool lockTimedOut = false;   // nothing was touched
    std::vector<FileMove> moved;
    std::vector<FailedMove> failed;
    int jobsUpdated = 0;         // pending queue jobs rewritten to new paths
};

// EmbeddingPipeline: ingest -> embed -> index orchestration.
//
// indexFile() chunks and caps text, serves cache hits straight into the
// vector store and enqueues the rest on the embedding stage. Embedding jobs
// are validated before anything is cached or stored: invalid vectors are
// dead-lettered, backend failures are retried. moveFiles() runs a whole
// batch under the batch lock and records every touched path so the watcher
// can ignore the resulting events.
//
// Signals are emitted from stage queue worker threads.
class EmbeddingPipeline : public QObject {
    Q_OBJECT

public:
    static constexpr const char* kEmbeddingStage = "embedding";
    static constexpr const char* kOrganizeStage = "organize";

    EmbeddingPipeline(const PipelineSettings& settings,
                      const EmbeddingPipelineDeps& deps,
                      QObject* parent = nullptr);
    ~EmbeddingPipeline() override;

    EmbeddingPipeline(const EmbeddingPipeline&) = delete;
    EmbeddingPipeline& operator=(const EmbeddingPipeline&) = delete;
    EmbeddingPipeline(EmbeddingPipeline&&) = delete;
    EmbeddingPipeline& operator=(EmbeddingPipeline&&) = delete;

    // Checks the stored embedding identity, installs stage handlers and
    // restores persisted jobs. Returns false when a required collaborator
    // is missing.
    bool initialize();

    bool start();
    void stop();
    bool isRunning() const;

    IndexReport indexFile(const QString& filePath, const QString& text);

    // Returns the organize job id, or an empty string when categorization is
    // unavailable or the queue refused the job.
    QString requestCategorization(const QString& filePath, const QString& prompt);

    BatchMoveResult moveFiles(const std::vector<FileMove>& moves,
                              const QString& holderId,
                              int lockTimeoutMs);
    BatchMoveResult moveFiles(const std::vector<FileMove>& moves, const QString& holderId);

    // False when the path was just touched by anyone other than watcherSource.
    bool shouldProcessWatcherEvent(const QString& path, const QString& watcherSource);

    std::vector<VectorMatch> search(const QString& query, int k);

    QJsonObject metrics() const;

    StageQueueRegistry& queues() { return m_queues; }
    const QString& embeddingModel() const { return m_model; }
    int expectedDimensions() const { return m_dimensions; }
    bool embeddingIdentityReset() const { return m_identityReset; }

signals:
    void chunkIndexed(const QString& filePath, int chunkIndex, const QString& chunkId);
    void jobDeadLettered(const QString& stage, const QString& jobId,
                         const QString& filePath, const QString& error);
    void categorizationReady(const QString& filePath, const QString& category);
    void error(const QString& message);

private:
    JobOutcome handleEmbeddingJob(const QueueJob& job);
    JobOutcome handleOrganizeJob(const QueueJob& job);
    void onJobDeadLettered(const QueueJob& job);
    bool storeChunk(const QJsonObject& payload, const std::vector<float>& vector);

    PipelineSettings m_settings;
    EmbeddingPipelineDeps m_deps;
    QString m_model;
    int m_dimensions = 0;
    QString m_dataDir;
    Chunker m_chunker;

    StageQueueRegistry m_queues;
    PipelineTelemetry m_telemetry;
    BackendCircuitBreaker m_embedBreaker;
    BackendCircuitBreaker m_generateBreaker;

    bool m_initialized = false;
    bool m_identityReset = false;
};

} // namespace ss
