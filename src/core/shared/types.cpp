#include "core/shared/types.h"

namespace ss {

QString fileOperationTypeToString(FileOperationType type)
{
    switch (type) {
    case FileOperationType::Move:    return QStringLiteral("move");
    case FileOperationType::Rename:  return QStringLiteral("rename");
    case FileOperationType::Copy:    return QStringLiteral("copy");
    case FileOperationType::Delete:  return QStringLiteral("delete");
    case FileOperationType::Create:  return QStringLiteral("create");
    case FileOperationType::Unknown: return QStringLiteral("unknown");
    }
    return QStringLiteral("unknown");
}

FileOperationType fileOperationTypeFromString(const QString& str)
{
    if (str == QLatin1String("move"))   return FileOperationType::Move;
    if (str == QLatin1String("rename")) return FileOperationType::Rename;
    if (str == QLatin1String("copy"))   return FileOperationType::Copy;
    if (str == QLatin1String("delete")) return FileOperationType::Delete;
    if (str == QLatin1String("create")) return FileOperationType::Create;
    return FileOperationType::Unknown;
}

QString jobStatusToString(JobStatus status)
{
    switch (status) {
    case JobStatus::Pending: return QStringLiteral("pending");
    case JobStatus::Active:  return QStringLiteral("active");
    case JobStatus::Failed:  return QStringLiteral("failed");
    }
    return QStringLiteral("pending");
}

JobStatus jobStatusFromString(const QString& str)
{
    if (str == QLatin1String("active")) return JobStatus::Active;
    if (str == QLatin1String("failed")) return JobStatus::Failed;
    return JobStatus::Pending;
}

QString queueBackendToString(QueueBackend backend)
{
    switch (backend) {
    case QueueBackend::JsonFiles: return QStringLiteral("json");
    case QueueBackend::Sqlite:    return QStringLiteral("sqlite");
    }
    return QStringLiteral("json");
}

QueueBackend queueBackendFromString(const QString& str)
{
    if (str.trimmed().toLower() == QLatin1String("sqlite")) return QueueBackend::Sqlite;
    return QueueBackend::JsonFiles;
}

} // namespace ss
