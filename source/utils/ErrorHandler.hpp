#ifndef TASKLINE_UTILS_ERRORHANDLER_HPP
#define TASKLINE_UTILS_ERRORHANDLER_HPP

#include <QString>
#include <QTextStream>
#include <stdexcept>
#include <utility>

#include "Logger.hpp"

// ─────────────────────────────────────────────────────────────────────────────
// Error taxonomy
// ─────────────────────────────────────────────────────────────────────────────

class TaskError : public std::runtime_error {
public:
    explicit TaskError(const QString &message)
        : std::runtime_error(message.toStdString()) {}

    QString message() const { return QString::fromStdString(what()); }
};

// Caller-supplied input violates a service constraint. Never reaches storage.
class ValidationError : public TaskError {
public:
    explicit ValidationError(const QString &message) : TaskError(message) {}
};

class NotFoundError : public TaskError {
public:
    explicit NotFoundError(qint64 taskId)
        : TaskError(QStringLiteral("Task with ID %1 not found").arg(taskId)),
          m_taskId(taskId) {}

    qint64 taskId() const { return m_taskId; }

private:
    qint64 m_taskId;
};

// Storage could not complete an I/O or query operation.
class PersistenceError : public TaskError {
public:
    PersistenceError(const QString &message, const QString &cause = QString())
        : TaskError(cause.isEmpty() ? message
                                    : QStringLiteral("%1: %2").arg(message, cause)),
          m_cause(cause) {}

    QString cause() const { return m_cause; }

private:
    QString m_cause;
};

// ─────────────────────────────────────────────────────────────────────────────
// Presentation guard: renders every error kind, never lets one escape
// ─────────────────────────────────────────────────────────────────────────────

template <typename Fn>
bool runSafe(const char *actionName, QTextStream &out, Fn &&fn) {
    try {
        std::forward<Fn>(fn)();
        qInfo(appUi) << "[DONE]" << actionName;
        return true;
    } catch (const ValidationError &e) {
        qWarning(appUi) << "[INVALID]" << actionName << "| what=" << e.what();
        out << "Error: " << e.message() << Qt::endl;
    } catch (const NotFoundError &e) {
        qWarning(appUi) << "[NOT FOUND]" << actionName << "| id=" << e.taskId();
        out << "Error: " << e.message() << Qt::endl;
    } catch (const PersistenceError &e) {
        qCritical(appUi) << "[STORAGE]" << actionName << "| what=" << e.what();
        out << "Storage error: " << e.message() << Qt::endl;
    } catch (const std::exception &e) {
        qCritical(appUi) << "[EXC]" << actionName << "| what=" << e.what();
        out << "An unexpected error occurred. Please try again." << Qt::endl;
    }
    return false;
}

#endif // TASKLINE_UTILS_ERRORHANDLER_HPP
