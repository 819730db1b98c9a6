#ifndef TASKLINE_SERVICE_TASKSERVICEIMPL_HPP
#define TASKLINE_SERVICE_TASKSERVICEIMPL_HPP

#include <memory>
#include <optional>
#include <vector>

#include "ITaskService.hpp"
#include "TaskRepository.hpp"

class TaskServiceImpl : public ITaskService {
public:
    static constexpr int kMaxTitleLength = 50;

    explicit TaskServiceImpl(std::shared_ptr<TaskRepository> repository);

    Task addTask(const QString &title, const QString &description) override;
    std::vector<Task> listTasks() const override;
    Task findTask(const QVariant &taskId) const override;

    Task updateTask(const QVariant &taskId, const QString &title,
                    const QString &description) override;
    Task markComplete(const QVariant &taskId) override;
    Task deleteTask(const QVariant &taskId) override;

    std::vector<Task> searchTasks(
        const QString &keyword,
        std::optional<TaskStatus> statusFilter = std::nullopt) const override;

    TaskStatistics getStatistics() const override;

    // Throws ValidationError unless value is a positive integer, either as a
    // number or as text.
    static qint64 coerceTaskId(const QVariant &value);

private:
    std::shared_ptr<TaskRepository> m_repository;
};

#endif // TASKLINE_SERVICE_TASKSERVICEIMPL_HPP
