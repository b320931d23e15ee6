#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(crlCore)
Q_DECLARE_LOGGING_CATEGORY(crlLearning)
Q_DECLARE_LOGGING_CATEGORY(crlStore)
Q_DECLARE_LOGGING_CATEGORY(crlEvents)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
