#include "core/indexing/pipeline_config.h"
#include "core/shared/settings_manager.h"

#include <QDir>

namespace ss {

StageQueueConfig stageQueueConfigFrom(const PipelineSettings& settings, const QString& stage)
{
    StageQueueConfig config;
    config.stage = stage;
    config.persistDir = SettingsManager::resolveDataDir(settings);
    config.backend = settings.queueBackend;
    config.concurrency = settings.queueConcurrency;
    config.maxRetries = settings.queueMaxRetries;
    config.retryBaseDelayMs = settings.retryBaseDelayMs;
    config.retryMaxDelayMs = settings.retryMaxDelayMs;
    config.maxQueueSize = settings.queueMaxSize;
    config.persistBatchSize = settings.persistBatchSize;
    return config;
}

EmbeddingCacheConfig embeddingCacheConfigFrom(const PipelineSettings& settings)
{
    EmbeddingCacheConfig config;
    config.maxSize = settings.cacheMaxSize;
    config.ttlMs = settings.cacheTtlMs;
    config.cleanupIntervalMs = settings.cacheCleanupIntervalMs;
    return config;
}

BatchLockConfig batchLockConfigFrom(const PipelineSettings& settings)
{
    BatchLockConfig config;
    config.pollIntervalMs = settings.lockPollIntervalMs;
    config.staleLockMs = settings.staleLockMs;
    return config;
}

FileOperationTrackerConfig trackerConfigFrom(const PipelineSettings& settings)
{
    FileOperationTrackerConfig config;
    config.cooldownMs = settings.trackerCooldownMs;
    config.persistencePath = trackerFilePath(settings);
    config.caseInsensitivePaths = settings.caseInsensitivePaths;
    config.maxRecords = settings.trackerMaxRecords;
    return config;
}

ChunkerConfig chunkerConfigFrom(const PipelineSettings& settings)
{
    ChunkerConfig config;
    config.chunkSize = settings.chunkSize;
    config.overlap = settings.chunkOverlap;
    config.maxChunks = settings.maxChunks;
    return config;
}

QString trackerFilePath(const PipelineSettings& settings)
{
    return QDir(SettingsManager::resolveDataDir(settings)).filePath(QStringLiteral("file-operations.json"));
}

} // namespace ss
