#include "tools/queuectl/queue_control.h"
#include "core/indexing/pipeline_config.h"
#include "core/shared/logging.h"

#include <QJsonArray>

namespace ss {

namespace {

QJsonObject statsJson(const StageQueueStats& s)
{
    QJsonObject json;
    json[QStringLiteral("stage")] = s.stage;
    json[QStringLiteral("pending")] = static_cast<qint64>(s.size);
    json[QStringLiteral("deadLetters")] = static_cast<qint64>(s.failed);
    json[QStringLiteral("capacityPercent")] = s.capacityPercent;
    return json;
}

} // namespace

StageQueueConfig queueControlConfig(const PipelineSettings& settings,
                                    const QueueControlRequest& request)
{
    StageQueueConfig config = stageQueueConfigFrom(settings, request.stage);
    if (!request.dataDir.isEmpty()) {
        config.persistDir = request.dataDir;
    }
    if (request.backend) {
        config.backend = *request.backend;
    }
    return config;
}

QueueControlResult runQueueControl(StageQueue& queue, const QueueControlRequest& request)
{
    queue.initialize();

    QueueControlResult result;
    result.report = statsJson(queue.stats());

    if (!request.retryJobId.isEmpty()) {
        const bool requeued = queue.retryDeadLetter(request.retryJobId);
        result.report[QStringLiteral("retried")] = requeued;
        if (!requeued) {
            result.error = QStringLiteral("No dead-lettered job with id %1").arg(request.retryJobId);
            result.exitCode = 1;
        }
    }

    if (request.clearDead) {
        result.report[QStringLiteral("cleared")] = queue.clearDeadLetters();
    }

    if (request.listDead) {
        QJsonArray dead;
        for (const QueueJob& job : queue.deadLetters()) {
            dead.append(queueJobToJson(job));
        }
        result.report[QStringLiteral("deadLetterJobs")] = dead;
    }

    if (!request.retryJobId.isEmpty() || request.clearDead) {
        const StageQueueStats after = queue.stats();
        result.report[QStringLiteral("pending")] = static_cast<qint64>(after.size);
        result.report[QStringLiteral("deadLetters")] = static_cast<qint64>(after.failed);
        LOG_INFO(ssQueue, "queuectl on '%s': %d pending, %d dead letters",
                 qUtf8Printable(request.stage), static_cast<int>(after.size),
                 static_cast<int>(after.failed));
    }
    return result;
}

} // namespace ss
