#ifndef TASKLINE_STORAGE_JSONFILESTORAGE_HPP
#define TASKLINE_STORAGE_JSONFILESTORAGE_HPP

#include <QString>

#include "IStorage.hpp"

// Keeps all tasks in memory and rewrites the whole JSON document after every
// mutation. A missing or malformed file yields an empty store.
class JsonFileStorage : public IStorage {
public:
    explicit JsonFileStorage(const QString &filePath);

    Task addTask(const QString &title, const QString &description) override;

    std::vector<Task> getAllTasks() const override;
    std::optional<Task> getTaskById(qint64 id) const override;

    bool updateTask(const Task &task) override;
    std::optional<Task> deleteTask(qint64 id) override;

    std::vector<Task> searchTasks(
        const QString &keyword,
        std::optional<TaskStatus> statusFilter = std::nullopt) const override;

    TaskStatistics getStatistics() const override;

private:
    void loadTasks();
    void saveTasks() const;
    qint64 nextId() const;

    QString m_filePath;
    std::vector<Task> m_tasks;
};

#endif // TASKLINE_STORAGE_JSONFILESTORAGE_HPP
