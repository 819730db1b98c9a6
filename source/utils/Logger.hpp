#ifndef TASKLINE_UTILS_LOGGER_HPP
#define TASKLINE_UTILS_LOGGER_HPP

#include <QtCore/QLoggingCategory>
#include <QtCore/QString>

Q_DECLARE_LOGGING_CATEGORY(appCore)
Q_DECLARE_LOGGING_CATEGORY(appSql)
Q_DECLARE_LOGGING_CATEGORY(appFile)
Q_DECLARE_LOGGING_CATEGORY(appUi)

// Routes Qt messages to filePath. Critical messages always reach stderr;
// everything else only with echoToStderr or when the file cannot be opened.
void initLogging(const QString &filePath, bool echoToStderr = false);

// Closes the log file opened by initLogging and restores the default handler.
void shutdownLogging();

#endif // TASKLINE_UTILS_LOGGER_HPP
