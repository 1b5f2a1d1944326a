#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(rcCore)
Q_DECLARE_LOGGING_CATEGORY(rcWorkflow)
Q_DECLARE_LOGGING_CATEGORY(rcRoute)
Q_DECLARE_LOGGING_CATEGORY(rcEvidence)
Q_DECLARE_LOGGING_CATEGORY(rcStore)
Q_DECLARE_LOGGING_CATEGORY(rcGeneration)
Q_DECLARE_LOGGING_CATEGORY(rcPlanner)
Q_DECLARE_LOGGING_CATEGORY(rcSynthesis)
Q_DECLARE_LOGGING_CATEGORY(rcBatch)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
