#ifndef TASKLINE_REPOSITORY_TASKREPOSITORY_HPP
#define TASKLINE_REPOSITORY_TASKREPOSITORY_HPP

#include <memory>
#include <optional>
#include <vector>

#include "IStorage.hpp"

// Uniform facade over exactly one storage backend. Adds no business rules;
// any failure that is not already a TaskError leaves here as PersistenceError.
class TaskRepository {
public:
    explicit TaskRepository(std::unique_ptr<IStorage> storage);

    Task addTask(const QString &title, const QString &description);

    std::vector<Task> getAllTasks() const;
    std::optional<Task> getTaskById(qint64 id) const;

    bool updateTask(const Task &task);
    std::optional<Task> deleteTask(qint64 id);

    std::vector<Task> searchTasks(
        const QString &keyword,
        std::optional<TaskStatus> statusFilter = std::nullopt) const;

    TaskStatistics getStatistics() const;

private:
    template <typename Fn>
    auto guarded(const char *operation, Fn &&fn) const -> decltype(fn());

    std::unique_ptr<IStorage> m_storage;
};

#endif // TASKLINE_REPOSITORY_TASKREPOSITORY_HPP
