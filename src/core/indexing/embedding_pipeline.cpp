#include "core/indexing/embedding_pipeline.h"

#include "core/embedding/embedding_cache.h"
#include "core/embedding/embedding_index_metadata.h"
#include "core/embedding/embedding_input.h"
#include "core/embedding/vector_math.h"
#include "core/fs/batch_lock_manager.h"
#include "core/fs/file_operation_tracker.h"
#include "core/indexing/pipeline_config.h"
#include "core/shared/chunk.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"
#include "core/vector/vector_store.h"

#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>

namespace ss {

namespace {

QJsonObject vectorMetadata(const QJsonObject& payload)
{
    QJsonObject metadata;
    metadata[QStringLiteral("filePath")] = payload.value(QStringLiteral("filePath"));
    metadata[QStringLiteral("chunkIndex")] = payload.value(QStringLiteral("chunkIndex"));
    metadata[QStringLiteral("charStart")] = payload.value(QStringLiteral("charStart"));
    metadata[QStringLiteral("charEnd")] = payload.value(QStringLiteral("charEnd"));
    metadata[QStringLiteral("model")] = payload.value(QStringLiteral("model"));
    return metadata;
}

QJsonObject cacheStatsToJson(const EmbeddingCache::Stats& s)
{
    QJsonObject json;
    json[QStringLiteral("hits")] = static_cast<qint64>(s.hits);
    json[QStringLiteral("misses")] = static_cast<qint64>(s.misses);
    json[QStringLiteral("evictions")] = static_cast<qint64>(s.evictions);
    json[QStringLiteral("expirations")] = static_cast<qint64>(s.expirations);
    json[QStringLiteral("size")] = s.size;
    json[QStringLiteral("maxSize")] = s.maxSize;
    json[QStringLiteral("hitRate")] = s.hitRate;
    return json;
}

} // namespace

EmbeddingPipeline::EmbeddingPipeline(const PipelineSettings& settings,
                                     const EmbeddingPipelineDeps& deps,
                                     QObject* parent)
    : QObject(parent)
    , m_settings(settings)
    , m_deps(deps)
    , m_model(settings.embeddingModel)
    , m_dimensions(settings.expectedDimensions > 0
                       ? settings.expectedDimensions
                       : resolveEmbeddingDimension(settings.embeddingModel))
    , m_dataDir(SettingsManager::resolveDataDir(settings))
    , m_chunker(chunkerConfigFrom(settings))
{
}

EmbeddingPipeline::~EmbeddingPipeline()
{
    stop();
}

// ── Lifecycle ───────────────────────────────────────────────

bool EmbeddingPipeline::initialize()
{
    if (m_initialized) {
        return true;
    }
    if (m_deps.embeddingBackend == nullptr || m_deps.vectorStore == nullptr
        || m_deps.cache == nullptr || m_deps.embeddingQueue == nullptr
        || m_deps.lockManager == nullptr || m_deps.tracker == nullptr) {
        LOG_ERROR(ssPipeline, "EmbeddingPipeline initialize failed: missing dependency");
        emit error(QStringLiteral("EmbeddingPipeline initialize failed: missing dependency"));
        return false;
    }

    const QString metadataPath = embeddingIndexMetadataPath(m_dataDir);
    const std::optional<EmbeddingIndexMetadata> stored = readEmbeddingIndexMetadata(metadataPath);
    if (embeddingIdentityChanged(stored, m_model, m_dimensions)) {
        if (stored) {
            LOG_WARN(ssPipeline, "Embedding identity changed (%s/%d -> %s/%d), clearing cache",
                     qUtf8Printable(stored->model), stored->dimensions,
                     qUtf8Printable(m_model), m_dimensions);
        } else {
            LOG_INFO(ssPipeline, "No embedding index metadata, stamping %s/%d",
                     qUtf8Printable(m_model), m_dimensions);
        }
        m_deps.cache->clear();
        m_identityReset = stored.has_value();
        if (!writeEmbeddingIndexMetadata(metadataPath, m_model, m_dimensions)) {
            LOG_ERROR(ssPipeline, "Failed to write embedding index metadata: %s",
                      qUtf8Printable(metadataPath));
            emit error(QStringLiteral("Failed to write embedding index metadata"));
        }
    }

    m_deps.embeddingQueue->setHandler([this](const QueueJob& job) {
        return handleEmbeddingJob(job);
    });
    m_deps.embeddingQueue->setDeadLetterCallback([this](const QueueJob& job) {
        onJobDeadLettered(job);
    });
    m_deps.embeddingQueue->initialize();
    m_queues.registerQueue(m_deps.embeddingQueue);

    if (m_deps.organizeQueue != nullptr) {
        m_deps.organizeQueue->setHandler([this](const QueueJob& job) {
            return handleOrganizeJob(job);
        });
        m_deps.organizeQueue->setDeadLetterCallback([this](const QueueJob& job) {
            onJobDeadLettered(job);
        });
        m_deps.organizeQueue->initialize();
        m_queues.registerQueue(m_deps.organizeQueue);
    }

    m_initialized = true;
    LOG_INFO(ssPipeline, "EmbeddingPipeline ready (model=%s, dims=%d, dataDir=%s)",
             qUtf8Printable(m_model), m_dimensions, qUtf8Printable(m_dataDir));
    return true;
}

bool EmbeddingPipeline::start()
{
    if (!initialize()) {
        return false;
    }
    if (isRunning()) {
        return true;
    }

    bool ok = m_deps.embeddingQueue->start();
    if (m_deps.organizeQueue != nullptr && !m_deps.organizeQueue->start()) {
        ok = false;
    }
    if (!ok) {
        emit error(QStringLiteral("EmbeddingPipeline failed to start stage queues"));
    }
    return ok;
}

void EmbeddingPipeline::stop()
{
    if (!m_initialized) {
        return;
    }
    m_deps.embeddingQueue->stop();
    if (m_deps.organizeQueue != nullptr) {
        m_deps.organizeQueue->stop();
    }
}

bool EmbeddingPipeline::isRunning() const
{
    return m_initialized && m_deps.embeddingQueue->isRunning();
}

// ── Ingest ──────────────────────────────────────────────────

IndexReport EmbeddingPipeline::indexFile(const QString& filePath, const QString& text)
{
    IndexReport report;
    if (!m_initialized) {
        LOG_WARN(ssPipeline, "indexFile before initialize: %s", qUtf8Printable(filePath));
        return report;
    }
    if (filePath.isEmpty()) {
        LOG_WARN(ssPipeline, "indexFile called with an empty path");
        return report;
    }

    embedding_input::CapOptions capOptions;
    capOptions.maxTokens = m_settings.embeddingContextTokens;
    capOptions.charsPerToken = m_settings.charsPerToken;

    const std::vector<TextChunk> chunks = m_chunker.chunkText(text);
    report.chunks = static_cast<int>(chunks.size());

    for (const TextChunk& chunk : chunks) {
        const embedding_input::CappedInput capped =
            embedding_input::capEmbeddingInput(chunk.text, capOptions);
        if (capped.wasTruncated) {
            ++report.truncated;
        }

        const QString chunkId = computeChunkId(filePath, chunk.index);
        report.chunkIds.append(chunkId);

        QJsonObject payload;
        payload[QStringLiteral("filePath")] = filePath;
        payload[QStringLiteral("chunkId")] = chunkId;
        payload[QStringLiteral("chunkIndex")] = chunk.index;
        payload[QStringLiteral("charStart")] = chunk.charStart;
        payload[QStringLiteral("charEnd")] = chunk.charEnd;
        payload[QStringLiteral("text")] = capped.text;
        payload[QStringLiteral("model")] = m_model;

        const std::optional<CachedEmbedding> cached = m_deps.cache->get(capped.text, m_model);
        m_telemetry.recordCacheLookup(cached.has_value());
        if (cached && validateEmbeddingDimensions(cached->vector, m_dimensions)) {
            if (storeChunk(payload, cached->vector)) {
                ++report.cacheHits;
            } else {
                ++report.storeFailures;
            }
            continue;
        }

        const QString jobId = m_deps.embeddingQueue->enqueue(payload);
        if (jobId.isEmpty()) {
            ++report.rejected;
            continue;
        }
        ++report.enqueued;
        m_telemetry.recordEmbeddingEnqueued();
    }

    m_telemetry.recordFileIndexed(report.chunks, report.truncated);
    LOG_DEBUG(ssPipeline, "Indexed %s: %d chunks, %d cached, %d enqueued, %d truncated",
              qUtf8Printable(filePath), report.chunks, report.cacheHits, report.enqueued,
              report.truncated);
    return report;
}

bool EmbeddingPipeline::storeChunk(const QJsonObject& payload, const std::vector<float>& vector)
{
    const QString chunkId = payload.value(QStringLiteral("chunkId")).toString();
    if (!m_deps.vectorStore->put(chunkId, vector, vectorMetadata(payload))) {
        m_telemetry.recordStoreFailure();
        LOG_WARN(ssPipeline, "Vector store rejected chunk %s", qUtf8Printable(chunkId));
        return false;
    }
    emit chunkIndexed(payload.value(QStringLiteral("filePath")).toString(),
                      payload.value(QStringLiteral("chunkIndex")).toInt(), chunkId);
    return true;
}

// ── Stage handlers ──────────────────────────────────────────

JobOutcome EmbeddingPipeline::handleEmbeddingJob(const QueueJob& job)
{
    const QString text = job.payload.value(QStringLiteral("text")).toString();
    if (text.trimmed().isEmpty()) {
        m_telemetry.recordValidationFailure();
        return JobOutcome::fail(QStringLiteral("empty_text"));
    }

    // A retry after a store failure may already have the vector cached.
    const std::optional<CachedEmbedding> cached = m_deps.cache->get(text, m_model);
    if (cached && validateEmbeddingDimensions(cached->vector, m_dimensions)) {
        return storeChunk(job.payload, cached->vector)
                   ? JobOutcome::success()
                   : JobOutcome::retry(QStringLiteral("vector store write failed"));
    }

    if (m_embedBreaker.isOpen()) {
        m_telemetry.recordCircuitRejection();
        return JobOutcome::retry(QStringLiteral("embedding backend circuit open"));
    }

    QElapsedTimer timer;
    timer.start();
    const EmbeddingResponse response = m_deps.embeddingBackend->embed(text, m_model);
    if (!response.ok()) {
        m_embedBreaker.recordFailure();
        m_telemetry.recordBackendError();
        LOG_WARN(ssEmbed, "Embedding failed for %s: %s",
                 qUtf8Printable(job.filePath()), qUtf8Printable(response.error));
        return JobOutcome::retry(response.error);
    }
    m_embedBreaker.recordSuccess();

    const VectorValidation validation = validateEmbeddingVector(response.vector);
    if (!validation.valid) {
        m_telemetry.recordValidationFailure();
        LOG_WARN(ssEmbed, "Rejected embedding for %s: %s (index %d)",
                 qUtf8Printable(job.filePath()), qUtf8Printable(validation.reason),
                 validation.badIndex);
        return JobOutcome::fail(validation.reason);
    }
    if (!validateEmbeddingDimensions(response.vector, m_dimensions)) {
        m_telemetry.recordValidationFailure();
        const QString reason = QStringLiteral("dimension_mismatch: got %1, expected %2")
                                   .arg(response.vector.size())
                                   .arg(m_dimensions);
        LOG_WARN(ssEmbed, "Rejected embedding for %s: %s",
                 qUtf8Printable(job.filePath()), qUtf8Printable(reason));
        return JobOutcome::fail(reason);
    }

    m_deps.cache->set(text, m_model, response.vector);
    if (!storeChunk(job.payload, response.vector)) {
        return JobOutcome::retry(QStringLiteral("vector store write failed"));
    }
    m_telemetry.recordEmbeddingStored(timer.elapsed());
    return JobOutcome::success();
}

JobOutcome EmbeddingPipeline::handleOrganizeJob(const QueueJob& job)
{
    if (m_deps.generationBackend == nullptr) {
        return JobOutcome::fail(QStringLiteral("no text generation backend"));
    }
    const QString prompt = job.payload.value(QStringLiteral("prompt")).toString();
    if (prompt.trimmed().isEmpty()) {
        return JobOutcome::fail(QStringLiteral("empty_prompt"));
    }
    if (m_generateBreaker.isOpen()) {
        m_telemetry.recordCircuitRejection();
        return JobOutcome::retry(QStringLiteral("generation backend circuit open"));
    }

    const GenerationResponse response =
        m_deps.generationBackend->generate(prompt, m_settings.generationModel);
    if (!response.ok()) {
        m_generateBreaker.recordFailure();
        m_telemetry.recordCategorization(false);
        LOG_WARN(ssPipeline, "Categorization failed for %s: %s",
                 qUtf8Printable(job.filePath()), qUtf8Printable(response.error));
        return JobOutcome::retry(response.error);
    }
    m_generateBreaker.recordSuccess();

    const QString category = response.text.trimmed();
    if (category.isEmpty()) {
        m_telemetry.recordCategorization(false);
        return JobOutcome::fail(QStringLiteral("empty_completion"));
    }

    m_telemetry.recordCategorization(true);
    emit categorizationReady(job.filePath(), category);
    return JobOutcome::success();
}

void EmbeddingPipeline::onJobDeadLettered(const QueueJob& job)
{
    m_telemetry.recordDeadLetter();
    emit jobDeadLettered(job.stage, job.id, job.filePath(), job.lastError);
}

QString EmbeddingPipeline::requestCategorization(const QString& filePath, const QString& prompt)
{
    if (m_deps.organizeQueue == nullptr || m_deps.generationBackend == nullptr) {
        LOG_WARN(ssPipeline, "Categorization unavailable for %s", qUtf8Printable(filePath));
        return {};
    }

    QJsonObject payload;
    payload[QStringLiteral("filePath")] = filePath;
    payload[QStringLiteral("prompt")] = prompt;
    payload[QStringLiteral("model")] = m_settings.generationModel;
    return m_deps.organizeQueue->enqueue(payload);
}

// ── Batch moves ─────────────────────────────────────────────

BatchMoveResult EmbeddingPipeline::moveFiles(const std::vector<FileMove>& moves,
                                             const QString& holderId)
{
    return moveFiles(moves, holderId, m_settings.lockTimeoutMs);
}

BatchMoveResult EmbeddingPipeline::moveFiles(const std::vector<FileMove>& moves,
                                             const QString& holderId,
                                             int lockTimeoutMs)
{
    BatchMoveResult result;
    if (m_deps.lockManager == nullptr || m_deps.tracker == nullptr) {
        for (const FileMove& move : moves) {
            result.failed.push_back({move, QStringLiteral("pipeline not initialized")});
        }
        return result;
    }

    BatchLockGuard guard(*m_deps.lockManager, holderId, lockTimeoutMs);
    if (!guard.holds()) {
        result.lockTimedOut = true;
        m_telemetry.recordMoveBatch(0, 0, true);
        return result;
    }

    for (const FileMove& move : moves) {
        if (move.source.isEmpty() || move.destination.isEmpty()) {
            result.failed.push_back({move, QStringLiteral("empty path")});
            continue;
        }
        if (!QFileInfo::exists(move.source)) {
            result.failed.push_back({move, QStringLiteral("source missing")});
            continue;
        }
        if (QFileInfo::exists(move.destination)) {
            result.failed.push_back({move, QStringLiteral("destination exists")});
            continue;
        }
        const QString destDir = QFileInfo(move.destination).absolutePath();
        if (!QDir().mkpath(destDir)) {
            result.failed.push_back({move, QStringLiteral("cannot create destination directory")});
            continue;
        }

        // Recorded first so the watcher's echo of this rename is suppressed.
        m_deps.tracker->recordOperation(move.source, FileOperationType::Move, holderId);
        m_deps.tracker->recordOperation(move.destination, FileOperationType::Move, holderId);

        if (!QFile::rename(move.source, move.destination)) {
            LOG_WARN(ssFs, "Move failed: %s -> %s",
                     qUtf8Printable(move.source), qUtf8Printable(move.destination));
            result.failed.push_back({move, QStringLiteral("rename failed")});
            continue;
        }

        // Chunk ids are derived from the path, so pending chunks follow the file.
        const QString destination = move.destination;
        result.jobsUpdated += m_queues.updateByFilePath(
            move.source, destination, [&destination](QJsonObject& payload) {
                if (payload.contains(QStringLiteral("chunkIndex"))) {
                    payload[QStringLiteral("chunkId")] = computeChunkId(
                        destination, payload.value(QStringLiteral("chunkIndex")).toInt());
                }
            });
        result.moved.push_back(move);
    }

    m_telemetry.recordMoveBatch(static_cast<int>(result.moved.size()),
                                static_cast<int>(result.failed.size()), false);
    LOG_INFO(ssPipeline, "Batch move by %s: %d moved, %d failed, %d jobs rewritten",
             qUtf8Printable(holderId), static_cast<int>(result.moved.size()),
             static_cast<int>(result.failed.size()), result.jobsUpdated);
    return result;
}

bool EmbeddingPipeline::shouldProcessWatcherEvent(const QString& path, const QString& watcherSource)
{
    if (m_deps.tracker == nullptr) {
        return true;
    }
    const bool suppressed = m_deps.tracker->wasRecentlyOperated(path, watcherSource);
    m_telemetry.recordWatcherEvent(suppressed);
    if (suppressed) {
        LOG_DEBUG(ssFs, "Ignoring watcher event for recently moved %s", qUtf8Printable(path));
    }
    return !suppressed;
}

// ── Query ───────────────────────────────────────────────────

std::vector<VectorMatch> EmbeddingPipeline::search(const QString& query, int k)
{
    if (!m_initialized || query.trimmed().isEmpty() || k <= 0) {
        return {};
    }

    embedding_input::CapOptions capOptions;
    capOptions.maxTokens = m_settings.embeddingContextTokens;
    capOptions.charsPerToken = m_settings.charsPerToken;
    const QString text = embedding_input::capEmbeddingInput(query.trimmed(), capOptions).text;

    std::vector<float> queryVector;
    const std::optional<CachedEmbedding> cached = m_deps.cache->get(text, m_model);
    m_telemetry.recordCacheLookup(cached.has_value());
    if (cached) {
        queryVector = cached->vector;
    } else {
        if (m_embedBreaker.isOpen()) {
            m_telemetry.recordCircuitRejection();
            LOG_WARN(ssEmbed, "Search skipped, embedding backend circuit open");
            return {};
        }
        EmbeddingResponse response = m_deps.embeddingBackend->embed(text, m_model);
        if (!response.ok()) {
            m_embedBreaker.recordFailure();
            m_telemetry.recordBackendError();
            LOG_WARN(ssEmbed, "Query embedding failed: %s", qUtf8Printable(response.error));
            return {};
        }
        m_embedBreaker.recordSuccess();
        if (!validateEmbeddingVector(response.vector).valid
            || !validateEmbeddingDimensions(response.vector, m_dimensions)) {
            m_telemetry.recordValidationFailure();
            LOG_WARN(ssEmbed, "Query embedding rejected by validation");
            return {};
        }
        m_deps.cache->set(text, m_model, response.vector);
        queryVector = std::move(response.vector);
    }

    return m_deps.vectorStore->search(queryVector, k);
}

// ── Metrics ─────────────────────────────────────────────────

QJsonObject EmbeddingPipeline::metrics() const
{
    QJsonObject out = m_telemetry.snapshot();
    out[QStringLiteral("model")] = m_model;
    out[QStringLiteral("dimensions")] = m_dimensions;
    out[QStringLiteral("queues")] = m_queues.stats();
    out[QStringLiteral("embedCircuitOpen")] = m_embedBreaker.isOpen();

    if (m_deps.cache != nullptr) {
        out[QStringLiteral("cache")] = cacheStatsToJson(m_deps.cache->stats());
    }
    if (m_deps.lockManager != nullptr) {
        out[QStringLiteral("batchLock")] = m_deps.lockManager->statsJson();
    }
    if (m_deps.tracker != nullptr) {
        out[QStringLiteral("trackedOperations")] = static_cast<qint64>(m_deps.tracker->size());
    }
    if (m_deps.vectorStore != nullptr) {
        const VectorStoreStats storeStats = m_deps.vectorStore->stats();
        QJsonObject store;
        store[QStringLiteral("count")] = static_cast<qint64>(storeStats.count);
        store[QStringLiteral("dimensions")] = storeStats.dimensions;
        out[QStringLiteral("vectorStore")] = store;
    }
    return out;
}

} // namespace ss
