#include "Logger.hpp"
#include "ErrorHandler.hpp"
#include "TaskServiceImpl.hpp"

#include <QMetaType>
#include <cmath>
#include <limits>

namespace {

struct ValidatedFields {
    QString title;
    QString description;
};

ValidatedFields validateFields(const QString &title, const QString &description) {
    ValidatedFields fields{title.trimmed(), description.trimmed()};

    if (fields.title.isEmpty()) {
        throw ValidationError(QStringLiteral("Task title cannot be empty"));
    }

    // raw input as typed, counted in code points rather than UTF-16 units
    if (title.toUcs4().size() > TaskServiceImpl::kMaxTitleLength) {
        throw ValidationError(QStringLiteral("Task title cannot exceed %1 characters")
                                  .arg(TaskServiceImpl::kMaxTitleLength));
    }

    if (fields.description.isEmpty()) {
        throw ValidationError(QStringLiteral("Task description cannot be empty"));
    }

    return fields;
}

} // END NAMESPACE

TaskServiceImpl::TaskServiceImpl(std::shared_ptr<TaskRepository> repository)
    : m_repository(std::move(repository)) {}

qint64 TaskServiceImpl::coerceTaskId(const QVariant &value) {
    bool ok = false;
    qint64 id = 0;

    switch (value.typeId()) {
    case QMetaType::Int:
    case QMetaType::UInt:
    case QMetaType::Long:
    case QMetaType::LongLong:
    case QMetaType::Short:
    case QMetaType::UShort:
        id = value.toLongLong(&ok);
        break;
    case QMetaType::ULong:
    case QMetaType::ULongLong: {
        const qulonglong raw = value.toULongLong(&ok);
        ok = ok && raw <= static_cast<qulonglong>(std::numeric_limits<qint64>::max());
        id = static_cast<qint64>(raw);
        break;
    }
    case QMetaType::Double:
    case QMetaType::Float: {
        const double raw = value.toDouble(&ok);
        ok = ok && std::isfinite(raw) && std::floor(raw) == raw &&
             std::fabs(raw) < 9.0e15;
        id = static_cast<qint64>(raw);
        break;
    }
    case QMetaType::QString:
    case QMetaType::QByteArray:
        id = value.toString().trimmed().toLongLong(&ok);
        break;
    default:
        break;
    }

    if (!ok) {
        throw ValidationError(QStringLiteral("Task ID must be a number"));
    }
    if (id <= 0) {
        throw ValidationError(QStringLiteral("Task ID must be a positive number"));
    }
    return id;
}

// ───────────────────────────────────────────────
// Tasks
// ───────────────────────────────────────────────

Task TaskServiceImpl::addTask(const QString &title, const QString &description) {
    const ValidatedFields fields = validateFields(title, description);

    Task task = m_repository->addTask(fields.title, fields.description);
    qInfo(appCore) << "[Service] Task added:" << task.title << "(id=" << task.id << ")";
    return task;
}

std::vector<Task> TaskServiceImpl::listTasks() const {
    auto tasks = m_repository->getAllTasks();
    qInfo(appCore) << "[Service] Retrieved" << tasks.size() << "tasks";
    return tasks;
}

Task TaskServiceImpl::findTask(const QVariant &taskId) const {
    const qint64 id = coerceTaskId(taskId);

    auto task = m_repository->getTaskById(id);
    if (!task) {
        qWarning(appCore) << "[Service] Task with id" << id << "not found";
        throw NotFoundError(id);
    }
    return *task;
}

Task TaskServiceImpl::updateTask(const QVariant &taskId, const QString &title,
                                 const QString &description) {
    const qint64 id = coerceTaskId(taskId);
    const ValidatedFields fields = validateFields(title, description);

    auto task = m_repository->getTaskById(id);
    if (!task) {
        throw NotFoundError(id);
    }

    task->title = fields.title;
    task->description = fields.description;
    if (!m_repository->updateTask(*task)) {
        throw NotFoundError(id);
    }

    qInfo(appCore) << "[Service] Task updated:" << task->title << "(id=" << id << ")";
    return *task;
}

Task TaskServiceImpl::markComplete(const QVariant &taskId) {
    const qint64 id = coerceTaskId(taskId);

    auto task = m_repository->getTaskById(id);
    if (!task) {
        qWarning(appCore) << "[Service] Cannot complete missing task id=" << id;
        throw NotFoundError(id);
    }

    // re-persisted even when already Completed
    task->status = TaskStatus::Completed;
    if (!m_repository->updateTask(*task)) {
        throw NotFoundError(id);
    }

    qInfo(appCore) << "[Service] Task marked completed (id=" << id << ")";
    return *task;
}

Task TaskServiceImpl::deleteTask(const QVariant &taskId) {
    const qint64 id = coerceTaskId(taskId);

    auto removed = m_repository->deleteTask(id);
    if (!removed) {
        qWarning(appCore) << "[Service] Cannot delete missing task id=" << id;
        throw NotFoundError(id);
    }

    qInfo(appCore) << "[Service] Task deleted (id=" << id << ")";
    return *removed;
}

std::vector<Task> TaskServiceImpl::searchTasks(
    const QString &keyword, std::optional<TaskStatus> statusFilter) const {
    const QString trimmed = keyword.trimmed();
    if (trimmed.isEmpty()) {
        return {};
    }

    auto tasks = m_repository->searchTasks(trimmed, statusFilter);
    qInfo(appCore) << "[Service] Search" << trimmed << "matched" << tasks.size();
    return tasks;
}

TaskStatistics TaskServiceImpl::getStatistics() const {
    return m_repository->getStatistics();
}
