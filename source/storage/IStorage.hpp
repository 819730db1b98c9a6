#ifndef TASKLINE_STORAGE_ISTORAGE_HPP
#define TASKLINE_STORAGE_ISTORAGE_HPP

#include <optional>
#include <vector>

#include "Task.hpp"
#include "TaskStatistics.hpp"

// Persistence backend for task records. Implementations report every
// I/O or query failure as PersistenceError.
class IStorage {
public:
    virtual ~IStorage() = default;

    // Assigns the id and created date, stores the record as Pending.
    virtual Task addTask(const QString &title, const QString &description) = 0;

    virtual std::vector<Task> getAllTasks() const = 0;
    virtual std::optional<Task> getTaskById(qint64 id) const = 0;

    // Replaces title, description and status of the record with task.id.
    // Returns false if no such record exists.
    virtual bool updateTask(const Task &task) = 0;

    // Returns the removed record, or nullopt if no such record exists.
    virtual std::optional<Task> deleteTask(qint64 id) = 0;

    virtual std::vector<Task> searchTasks(
        const QString &keyword,
        std::optional<TaskStatus> statusFilter = std::nullopt) const = 0;

    virtual TaskStatistics getStatistics() const = 0;
};

#endif // TASKLINE_STORAGE_ISTORAGE_HPP
