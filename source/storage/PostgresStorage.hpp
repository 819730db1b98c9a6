#ifndef TASKLINE_STORAGE_POSTGRESSTORAGE_HPP
#define TASKLINE_STORAGE_POSTGRESSTORAGE_HPP

#include "AppConfig.hpp"
#include "IStorage.hpp"

// Stores tasks in a PostgreSQL table. Every call opens its own connection
// through ConnectionScope; nothing is held between calls.
class PostgresStorage : public IStorage {
public:
    explicit PostgresStorage(const DatabaseConfig &config,
                             const QString &driver = QStringLiteral("QPSQL"));

    // Creates the tasks table and the full-text index if missing.
    void ensureSchema();

    Task addTask(const QString &title, const QString &description) override;

    // Newest first.
    std::vector<Task> getAllTasks() const override;
    std::optional<Task> getTaskById(qint64 id) const override;

    bool updateTask(const Task &task) override;
    std::optional<Task> deleteTask(qint64 id) override;

    std::vector<Task> searchTasks(
        const QString &keyword,
        std::optional<TaskStatus> statusFilter = std::nullopt) const override;

    TaskStatistics getStatistics() const override;

private:
    DatabaseConfig m_config;
    QString m_driver;
};

#endif // TASKLINE_STORAGE_POSTGRESSTORAGE_HPP
