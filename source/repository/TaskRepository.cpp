#include "TaskRepository.hpp"

#include <stdexcept>

#include "ErrorHandler.hpp"
#include "Logger.hpp"

TaskRepository::TaskRepository(std::unique_ptr<IStorage> storage)
    : m_storage(std::move(storage)) {
    if (!m_storage) {
        throw std::invalid_argument("TaskRepository requires a storage backend");
    }
}

template <typename Fn>
auto TaskRepository::guarded(const char *operation, Fn &&fn) const -> decltype(fn()) {
    try {
        return fn();
    } catch (const TaskError &) {
        throw;
    } catch (const std::exception &e) {
        qCritical(appCore) << "[Repository]" << operation << "failed:" << e.what();
        throw PersistenceError(QStringLiteral("Storage operation '%1' failed")
                                   .arg(QLatin1String(operation)),
                               QString::fromUtf8(e.what()));
    }
}

Task TaskRepository::addTask(const QString &title, const QString &description) {
    return guarded("addTask", [&] { return m_storage->addTask(title, description); });
}

std::vector<Task> TaskRepository::getAllTasks() const {
    return guarded("getAllTasks", [&] { return m_storage->getAllTasks(); });
}

std::optional<Task> TaskRepository::getTaskById(qint64 id) const {
    return guarded("getTaskById", [&] { return m_storage->getTaskById(id); });
}

bool TaskRepository::updateTask(const Task &task) {
    return guarded("updateTask", [&] { return m_storage->updateTask(task); });
}

std::optional<Task> TaskRepository::deleteTask(qint64 id) {
    return guarded("deleteTask", [&] { return m_storage->deleteTask(id); });
}

std::vector<Task> TaskRepository::searchTasks(
    const QString &keyword, std::optional<TaskStatus> statusFilter) const {
    return guarded("searchTasks",
                   [&] { return m_storage->searchTasks(keyword, statusFilter); });
}

TaskStatistics TaskRepository::getStatistics() const {
    return guarded("getStatistics", [&] { return m_storage->getStatistics(); });
}
