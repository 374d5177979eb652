#include "core/indexing/queue_job.h"

#include <QUuid>

#include <algorithm>

namespace ss {

QString QueueJob::filePath() const
{
    return payload.value(QStringLiteral("filePath")).toString();
}

QJsonObject queueJobToJson(const QueueJob& job)
{
    QJsonObject json;
    json.insert(QStringLiteral("id"), job.id);
    json.insert(QStringLiteral("stage"), job.stage);
    json.insert(QStringLiteral("payload"), job.payload);
    json.insert(QStringLiteral("attempts"), job.attempts);
    json.insert(QStringLiteral("status"), jobStatusToString(job.status));
    json.insert(QStringLiteral("enqueuedAt"), static_cast<qint64>(job.enqueuedAt));
    json.insert(QStringLiteral("notBefore"), static_cast<qint64>(job.notBefore));
    if (job.failedAt > 0) {
        json.insert(QStringLiteral("failedAt"), static_cast<qint64>(job.failedAt));
    }
    if (!job.lastError.isEmpty()) {
        json.insert(QStringLiteral("lastError"), job.lastError);
    }
    return json;
}

std::optional<QueueJob> queueJobFromJson(const QJsonObject& json)
{
    QueueJob job;
    job.id = json.value(QStringLiteral("id")).toString();
    if (job.id.isEmpty()) {
        return std::nullopt;
    }
    job.stage = json.value(QStringLiteral("stage")).toString();
    job.payload = json.value(QStringLiteral("payload")).toObject();
    job.attempts = std::max(0, json.value(QStringLiteral("attempts")).toInt(0));
    job.status = jobStatusFromString(json.value(QStringLiteral("status")).toString());
    job.enqueuedAt = json.value(QStringLiteral("enqueuedAt")).toVariant().toLongLong();
    job.notBefore = json.value(QStringLiteral("notBefore")).toVariant().toLongLong();
    job.failedAt = json.value(QStringLiteral("failedAt")).toVariant().toLongLong();
    job.lastError = json.value(QStringLiteral("lastError")).toString();
    return job;
}

QString generateJobId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

} // namespace ss
