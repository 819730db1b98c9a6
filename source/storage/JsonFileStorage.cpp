#include "JsonFileStorage.hpp"

#include <QDate>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSaveFile>
#include <QSet>
#include <algorithm>

#include "ErrorHandler.hpp"
#include "Logger.hpp"

// ─────────────────────────────────────────────────────────────────────────────
// helpers
// ─────────────────────────────────────────────────────────────────────────────
namespace {

bool matchesKeyword(const Task &task, const QString &keyword) {
    return task.title.contains(keyword, Qt::CaseInsensitive) ||
           task.description.contains(keyword, Qt::CaseInsensitive);
}

} // END NAMESPACE

// ─────────────────────────────────────────────────────────────────────────────
// ctor
// ─────────────────────────────────────────────────────────────────────────────
JsonFileStorage::JsonFileStorage(const QString &filePath)
    : m_filePath(filePath) {
    loadTasks();
}

void JsonFileStorage::loadTasks() {
    m_tasks.clear();

    QFile file(m_filePath);
    if (!file.exists()) {
        qInfo(appFile) << "No existing task file found at" << m_filePath;
        return;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        qWarning(appFile) << "Error loading task data:" << file.errorString();
        return;
    }

    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isArray()) {
        qWarning(appFile) << "Error loading task data: malformed document"
                          << m_filePath << parseError.errorString();
        return;
    }

    std::vector<Task> loaded;
    const QJsonArray tasksArray = doc.array();
    loaded.reserve(static_cast<size_t>(tasksArray.size()));
    QSet<qint64> seenIds;

    for (const QJsonValue &value : tasksArray) {
        std::optional<Task> task;
        if (value.isObject()) {
            task = Task::fromJson(value.toObject());
        }
        if (!task) {
            qWarning(appFile) << "Error loading task data: invalid task entry in"
                              << m_filePath;
            return;
        }
        if (seenIds.contains(task->id)) {
            qWarning(appFile) << "Error loading task data: duplicate task ID"
                              << task->id << "in" << m_filePath;
            return;
        }
        seenIds.insert(task->id);
        loaded.push_back(*task);
    }

    m_tasks = std::move(loaded);
    qInfo(appFile) << "Loaded" << m_tasks.size() << "tasks from" << m_filePath;
}

void JsonFileStorage::saveTasks() const {
    QJsonArray tasksArray;
    for (const Task &task : m_tasks) {
        tasksArray.append(task.toJson());
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qCritical(appFile) << "Error saving task data:" << file.errorString();
        throw PersistenceError(QStringLiteral("Failed to save tasks"),
                               file.errorString());
    }

    const QByteArray payload = QJsonDocument(tasksArray).toJson(QJsonDocument::Indented);
    if (file.write(payload) != payload.size()) {
        qCritical(appFile) << "Error saving task data:" << file.errorString();
        file.cancelWriting();
        throw PersistenceError(QStringLiteral("Failed to save tasks"),
                               file.errorString());
    }

    if (!file.commit()) {
        qCritical(appFile) << "Error saving task data:" << file.errorString();
        throw PersistenceError(QStringLiteral("Failed to save tasks"),
                               file.errorString());
    }

    qInfo(appFile) << "Saved" << m_tasks.size() << "tasks to" << m_filePath;
}

qint64 JsonFileStorage::nextId() const {
    if (m_tasks.empty()) {
        return 1;
    }

    const auto maxIt = std::max_element(
        m_tasks.begin(), m_tasks.end(),
        [](const Task &lhs, const Task &rhs) { return lhs.id < rhs.id; });
    return maxIt->id + 1;
}

// ─────────────────────────────────────────────────────────────────────────────
// tasks
// ─────────────────────────────────────────────────────────────────────────────
Task JsonFileStorage::addTask(const QString &title, const QString &description) {
    Task task;
    task.id = nextId();
    task.title = title;
    task.description = description;
    task.status = TaskStatus::Pending;
    task.createdDate = truncateToSeconds(QDateTime::currentDateTime());

    m_tasks.push_back(task);
    saveTasks();

    qInfo(appFile) << "Added task ID" << task.id << ":" << task.title;
    return task;
}

std::vector<Task> JsonFileStorage::getAllTasks() const {
    return m_tasks;
}

std::optional<Task> JsonFileStorage::getTaskById(qint64 id) const {
    const auto it = std::find_if(m_tasks.begin(), m_tasks.end(),
                                 [id](const Task &task) { return task.id == id; });
    if (it == m_tasks.end()) {
        return std::nullopt;
    }
    return *it;
}

bool JsonFileStorage::updateTask(const Task &task) {
    const auto it = std::find_if(m_tasks.begin(), m_tasks.end(),
                                 [&task](const Task &existing) {
                                     return existing.id == task.id;
                                 });
    if (it == m_tasks.end()) {
        qInfo(appFile) << "No task to update for id=" << task.id;
        return false;
    }

    // id and created date never change after creation
    it->title = task.title;
    it->description = task.description;
    it->status = task.status;
    saveTasks();

    qInfo(appFile) << "Updated task ID" << task.id << ":" << task.title;
    return true;
}

std::optional<Task> JsonFileStorage::deleteTask(qint64 id) {
    const auto it = std::find_if(m_tasks.begin(), m_tasks.end(),
                                 [id](const Task &task) { return task.id == id; });
    if (it == m_tasks.end()) {
        qInfo(appFile) << "No task to delete for id=" << id;
        return std::nullopt;
    }

    Task removed = *it;
    m_tasks.erase(it);
    saveTasks();

    qInfo(appFile) << "Deleted task ID" << id << ":" << removed.title;
    return removed;
}

std::vector<Task> JsonFileStorage::searchTasks(
    const QString &keyword, std::optional<TaskStatus> statusFilter) const {
    std::vector<Task> out;
    for (const Task &task : m_tasks) {
        if (statusFilter && task.status != *statusFilter) {
            continue;
        }
        if (matchesKeyword(task, keyword)) {
            out.push_back(task);
        }
    }

    qInfo(appFile) << "Search" << keyword << "→" << out.size() << "tasks";
    return out;
}

TaskStatistics JsonFileStorage::getStatistics() const {
    TaskStatistics stats;
    const QDate today = QDate::currentDate();

    for (const Task &task : m_tasks) {
        ++stats.total;
        if (task.status == TaskStatus::Pending) {
            ++stats.pending;
        } else {
            ++stats.completed;
        }
        if (task.createdDate.date() == today) {
            ++stats.createdToday;
        }
    }

    return stats;
}
