#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(tpCore)
Q_DECLARE_LOGGING_CATEGORY(tpLearning)
Q_DECLARE_LOGGING_CATEGORY(tpFeedback)
Q_DECLARE_LOGGING_CATEGORY(tpStore)
Q_DECLARE_LOGGING_CATEGORY(tpIpc)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
