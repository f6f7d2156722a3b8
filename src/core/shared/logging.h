#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(cwCore)
Q_DECLARE_LOGGING_CATEGORY(cwIngest)
Q_DECLARE_LOGGING_CATEGORY(cwFs)
Q_DECLARE_LOGGING_CATEGORY(cwIndex)
Q_DECLARE_LOGGING_CATEGORY(cwSearch)
Q_DECLARE_LOGGING_CATEGORY(cwIpc)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
