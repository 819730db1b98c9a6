#ifndef TASKLINE_SERVICE_ITASKSERVICE_HPP
#define TASKLINE_SERVICE_ITASKSERVICE_HPP

#include <QString>
#include <QVariant>
#include <optional>
#include <vector>

#include "Task.hpp"
#include "TaskStatistics.hpp"

// Validating entry point for presentation layers. Task ids arrive untyped
// (as typed by a user, parsed from a request) and are coerced here.
class ITaskService {
public:
    virtual ~ITaskService() = default;

    virtual Task addTask(const QString &title, const QString &description) = 0;
    virtual std::vector<Task> listTasks() const = 0;
    virtual Task findTask(const QVariant &taskId) const = 0;

    virtual Task updateTask(const QVariant &taskId, const QString &title,
                            const QString &description) = 0;
    virtual Task markComplete(const QVariant &taskId) = 0;
    virtual Task deleteTask(const QVariant &taskId) = 0;

    virtual std::vector<Task> searchTasks(
        const QString &keyword,
        std::optional<TaskStatus> statusFilter = std::nullopt) const = 0;

    virtual TaskStatistics getStatistics() const = 0;
};

#endif // TASKLINE_SERVICE_ITASKSERVICE_HPP
