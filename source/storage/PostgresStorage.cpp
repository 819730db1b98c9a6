#include "PostgresStorage.hpp"

#include <QVariant>
#include <QtSql/QSqlError>
#include <QtSql/QSqlQuery>
#include <QtSql/QSqlRecord>

#include "ConnectionScope.hpp"
#include "ErrorHandler.hpp"
#include "Logger.hpp"

// ─────────────────────────────────────────────────────────────────────────────
// helpers
// ─────────────────────────────────────────────────────────────────────────────
namespace {

const QLatin1String kTaskColumns("id, title, description, status, created_date");

// Rolled back by ConnectionScope when this throws.
void execOrThrow(QSqlQuery &query, const QString &what) {
    if (!query.exec()) {
        const QString cause = query.lastError().text();
        qCritical(appSql) << what << ":" << cause;
        throw PersistenceError(what, cause);
    }
}

void execOrThrow(QSqlQuery &query, const QString &sql, const QString &what) {
    if (!query.exec(sql)) {
        const QString cause = query.lastError().text();
        qCritical(appSql) << what << ":" << cause;
        throw PersistenceError(what, cause);
    }
}

QString likePattern(const QString &keyword) {
    QString escaped = keyword;
    escaped.replace(QLatin1Char('\\'), QLatin1String("\\\\"));
    escaped.replace(QLatin1Char('%'), QLatin1String("\\%"));
    escaped.replace(QLatin1Char('_'), QLatin1String("\\_"));
    return QLatin1Char('%') + escaped + QLatin1Char('%');
}

Task rowToTask(const QSqlRecord &record) {
    const QString statusText = record.value("status").toString();
    const auto status = statusFromString(statusText);
    if (!status) {
        throw PersistenceError(QStringLiteral("Unexpected task status in database"),
                               statusText);
    }

    Task task;
    task.id = record.value("id").toLongLong();
    task.title = record.value("title").toString();
    task.description = record.value("description").toString();
    task.status = *status;
    task.createdDate = truncateToSeconds(record.value("created_date").toDateTime());

    return task;
}

std::vector<Task> fetchAll(QSqlQuery &query) {
    std::vector<Task> out;
    while (query.next()) {
        out.push_back(rowToTask(query.record()));
    }
    return out;
}

} // END NAMESPACE

// ─────────────────────────────────────────────────────────────────────────────
// ctor
// ─────────────────────────────────────────────────────────────────────────────
PostgresStorage::PostgresStorage(const DatabaseConfig &config, const QString &driver)
    : m_config(config), m_driver(driver) {
    ensureSchema();
    qInfo(appSql) << "PostgresStorage ready, database:" << m_config.name
                  << "at" << m_config.host << ":" << m_config.port;
}

void PostgresStorage::ensureSchema() {
    qInfo(appSql) << "Ensuring DB schema...";

    ConnectionScope scope(m_driver, m_config);
    QSqlQuery query(scope.database());

    execOrThrow(query,
                "CREATE TABLE IF NOT EXISTS tasks ("
                "  id SERIAL PRIMARY KEY,"
                "  title VARCHAR(50) NOT NULL,"
                "  description TEXT NOT NULL,"
                "  status VARCHAR(20) NOT NULL DEFAULT 'Pending',"
                "  created_date TIMESTAMP(0) NOT NULL DEFAULT CURRENT_TIMESTAMP"
                ")",
                QStringLiteral("Failed to create tasks table"));

    // same expression as the search predicate, so the planner can use it
    execOrThrow(query,
                "CREATE INDEX IF NOT EXISTS idx_tasks_fulltext "
                "ON tasks USING GIN "
                "(to_tsvector('english', title || ' ' || description))",
                QStringLiteral("Failed to create full-text index"));

    scope.commit();
    qInfo(appSql) << "Schema OK";
}

// ─────────────────────────────────────────────────────────────────────────────
// tasks
// ─────────────────────────────────────────────────────────────────────────────
Task PostgresStorage::addTask(const QString &title, const QString &description) {
    qInfo(appSql) << "Insert task title=" << title;

    ConnectionScope scope(m_driver, m_config);
    QSqlQuery query(scope.database());
    query.prepare(QStringLiteral("INSERT INTO tasks(title, description) VALUES(?, ?) "
                                 "RETURNING %1").arg(kTaskColumns));
    query.addBindValue(title);
    query.addBindValue(description);

    execOrThrow(query, QStringLiteral("Failed to add task"));

    if (!query.next()) {
        throw PersistenceError(QStringLiteral("Failed to add task"),
                               QStringLiteral("INSERT returned no row"));
    }

    Task task = rowToTask(query.record());
    scope.commit();

    qInfo(appSql) << "Added task ID" << task.id << ":" << task.title;
    return task;
}

std::vector<Task> PostgresStorage::getAllTasks() const {
    qInfo(appSql) << "Query: getAllTasks()";

    ConnectionScope scope(m_driver, m_config);
    QSqlQuery query(scope.database());
    query.setForwardOnly(true);

    execOrThrow(query,
                QStringLiteral("SELECT %1 FROM tasks ORDER BY created_date DESC, id DESC")
                    .arg(kTaskColumns),
                QStringLiteral("Failed to retrieve tasks"));

    std::vector<Task> out = fetchAll(query);
    scope.commit();

    qInfo(appSql) << "→" << out.size() << "tasks fetched";
    return out;
}

std::optional<Task> PostgresStorage::getTaskById(qint64 id) const {
    qInfo(appSql) << "Query: getTaskById id=" << id;

    ConnectionScope scope(m_driver, m_config);
    QSqlQuery query(scope.database());
    query.prepare(QStringLiteral("SELECT %1 FROM tasks WHERE id = ?").arg(kTaskColumns));
    query.addBindValue(id);

    execOrThrow(query, QStringLiteral("Failed to find task"));

    std::optional<Task> task;
    if (query.next()) {
        task = rowToTask(query.record());
    } else {
        qInfo(appSql) << "Task not found id=" << id;
    }

    scope.commit();
    return task;
}

bool PostgresStorage::updateTask(const Task &task) {
    qInfo(appSql) << "Update task id=" << task.id;

    ConnectionScope scope(m_driver, m_config);
    QSqlQuery query(scope.database());
    query.prepare("UPDATE tasks SET title = ?, description = ?, status = ? "
                  "WHERE id = ?");
    query.addBindValue(task.title);
    query.addBindValue(task.description);
    query.addBindValue(statusToString(task.status));
    query.addBindValue(task.id);

    execOrThrow(query, QStringLiteral("Failed to update task"));

    if (query.numRowsAffected() == 0) {
        qInfo(appSql) << "No rows updated for id=" << task.id;
        return false;
    }

    scope.commit();
    qInfo(appSql) << "Updated task ID" << task.id << ":" << task.title;
    return true;
}

std::optional<Task> PostgresStorage::deleteTask(qint64 id) {
    qInfo(appSql) << "Delete task id=" << id;

    ConnectionScope scope(m_driver, m_config);

    QSqlQuery select(scope.database());
    select.prepare(
        QStringLiteral("SELECT %1 FROM tasks WHERE id = ? FOR UPDATE").arg(kTaskColumns));
    select.addBindValue(id);
    execOrThrow(select, QStringLiteral("Failed to delete task"));

    if (!select.next()) {
        qInfo(appSql) << "Not found id=" << id;
        return std::nullopt;
    }
    Task removed = rowToTask(select.record());
    select.finish();

    QSqlQuery del(scope.database());
    del.prepare("DELETE FROM tasks WHERE id = ?");
    del.addBindValue(id);
    execOrThrow(del, QStringLiteral("Failed to delete task"));

    if (del.numRowsAffected() == 0) {
        qInfo(appSql) << "Not found id=" << id;
        return std::nullopt;
    }

    scope.commit();
    qInfo(appSql) << "Deleted task ID" << id << ":" << removed.title;
    return removed;
}

std::vector<Task> PostgresStorage::searchTasks(
    const QString &keyword, std::optional<TaskStatus> statusFilter) const {
    qInfo(appSql) << "Query: searchTasks keyword=" << keyword;

    QString sql = QStringLiteral(
        "SELECT %1 FROM tasks "
        "WHERE (to_tsvector('english', title || ' ' || description) "
        "       @@ plainto_tsquery('english', ?) "
        "   OR title ILIKE ? "
        "   OR description ILIKE ?)").arg(kTaskColumns);
    if (statusFilter) {
        sql += QStringLiteral(" AND status = ?");
    }
    sql += QStringLiteral(" ORDER BY created_date DESC, id DESC");

    ConnectionScope scope(m_driver, m_config);
    QSqlQuery query(scope.database());
    query.setForwardOnly(true);
    query.prepare(sql);

    const QString pattern = likePattern(keyword);
    query.addBindValue(keyword);
    query.addBindValue(pattern);
    query.addBindValue(pattern);
    if (statusFilter) {
        query.addBindValue(statusToString(*statusFilter));
    }

    execOrThrow(query, QStringLiteral("Failed to search tasks"));

    std::vector<Task> out = fetchAll(query);
    scope.commit();

    qInfo(appSql) << "→" << out.size() << "tasks matched";
    return out;
}

TaskStatistics PostgresStorage::getStatistics() const {
    qInfo(appSql) << "Query: getStatistics()";

    ConnectionScope scope(m_driver, m_config);
    QSqlQuery query(scope.database());

    execOrThrow(query,
                "SELECT "
                "  COUNT(*) AS total_tasks, "
                "  COUNT(CASE WHEN status = 'Pending' THEN 1 END) AS pending_tasks, "
                "  COUNT(CASE WHEN status = 'Completed' THEN 1 END) AS completed_tasks, "
                "  COUNT(CASE WHEN created_date >= CURRENT_DATE THEN 1 END) AS tasks_today "
                "FROM tasks",
                QStringLiteral("Failed to get statistics"));

    TaskStatistics stats;
    if (query.next()) {
        stats.total = query.value("total_tasks").toLongLong();
        stats.pending = query.value("pending_tasks").toLongLong();
        stats.completed = query.value("completed_tasks").toLongLong();
        stats.createdToday = query.value("tasks_today").toLongLong();
    }

    scope.commit();
    return stats;
}
