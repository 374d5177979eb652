#pragma once

#include "core/shared/types.h"

#include <QString>
#include <cstdint>

namespace ss {

struct PipelineSettings {
    // Storage root for queue files, tracker state and index metadata.
    // Empty means SettingsManager::defaultDataDir().
    QString dataDir;

    // Models
    QString embeddingModel = QStringLiteral("nomic-embed-text-v1.5-Q8_0.gguf");
    QString generationModel = QStringLiteral("qwen2.5-3b-instruct-q4_k_m.gguf");
    int expectedDimensions = 0;              // 0 = resolve from embeddingModel

    // Token budget
    int embeddingContextTokens = 1000;
    double charsPerToken = 3.5;

    // Chunking
    int chunkSize = 1000;
    int chunkOverlap = 200;
    int maxChunks = 50;

    // Embedding cache
    int cacheMaxSize = 500;
    int64_t cacheTtlMs = 30 * 60 * 1000;
    int cacheCleanupIntervalMs = 60 * 1000;

    // Stage queues
    int queueConcurrency = 2;
    int queueMaxRetries = 3;
    int retryBaseDelayMs = 1000;
    int retryMaxDelayMs = 30000;
    int queueMaxSize = 10000;
    int persistBatchSize = 10;
    QueueBackend queueBackend = QueueBackend::JsonFiles;

    // Batch lock
    int lockPollIntervalMs = 100;
    int lockTimeoutMs = 15000;
    int64_t staleLockMs = 5 * 60 * 1000;

    // File operation tracker
    int64_t trackerCooldownMs = 5000;
    bool caseInsensitivePaths = true;
    int trackerMaxRecords = 10000;
};

} // namespace ss
