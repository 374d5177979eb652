#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(ssCore)
Q_DECLARE_LOGGING_CATEGORY(ssEmbed)
Q_DECLARE_LOGGING_CATEGORY(ssQueue)
Q_DECLARE_LOGGING_CATEGORY(ssFs)
Q_DECLARE_LOGGING_CATEGORY(ssPipeline)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
