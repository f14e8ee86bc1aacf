#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(nrCore)
Q_DECLARE_LOGGING_CATEGORY(nrDedup)
Q_DECLARE_LOGGING_CATEGORY(nrIntegrity)
Q_DECLARE_LOGGING_CATEGORY(nrScoring)
Q_DECLARE_LOGGING_CATEGORY(nrRanking)
Q_DECLARE_LOGGING_CATEGORY(nrRegistry)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
