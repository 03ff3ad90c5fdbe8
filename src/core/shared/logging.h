#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(cdirCore)
Q_DECLARE_LOGGING_CATEGORY(cdirStore)
Q_DECLARE_LOGGING_CATEGORY(cdirSearch)
Q_DECLARE_LOGGING_CATEGORY(cdirRanking)
Q_DECLARE_LOGGING_CATEGORY(cdirCache)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
