#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(mcCore)
Q_DECLARE_LOGGING_CATEGORY(mcIndex)
Q_DECLARE_LOGGING_CATEGORY(mcEmbedding)
Q_DECLARE_LOGGING_CATEGORY(mcRanking)
Q_DECLARE_LOGGING_CATEGORY(mcMaintenance)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
