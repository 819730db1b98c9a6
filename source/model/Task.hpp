#ifndef TASKLINE_MODEL_TASK_HPP
#define TASKLINE_MODEL_TASK_HPP

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <cmath>
#include <optional>

enum class TaskStatus {
    Pending,
    Completed
};

inline QString statusToString(TaskStatus status) {
    return status == TaskStatus::Completed ? QStringLiteral("Completed")
                                           : QStringLiteral("Pending");
}

inline std::optional<TaskStatus> statusFromString(const QString &text) {
    if (text == QLatin1String("Pending")) {
        return TaskStatus::Pending;
    }
    if (text == QLatin1String("Completed")) {
        return TaskStatus::Completed;
    }
    return std::nullopt;
}

// created_date is always kept at second resolution
inline QString taskDateFormat() { return QStringLiteral("yyyy-MM-dd HH:mm:ss"); }

inline QDateTime truncateToSeconds(const QDateTime &dateTime) {
    QDateTime truncated = dateTime;
    const QTime time = dateTime.time();
    truncated.setTime(QTime(time.hour(), time.minute(), time.second()));
    return truncated;
}

struct Task {
    qint64 id = 0;
    QString title;
    QString description;
    TaskStatus status = TaskStatus::Pending;
    QDateTime createdDate;

    QString createdDateString() const {
        return createdDate.toString(taskDateFormat());
    }

    QJsonObject toJson() const {
        return QJsonObject{{"id", id},
                           {"title", title},
                           {"description", description},
                           {"status", statusToString(status)},
                           {"created_date", createdDateString()}};
    }

    // Returns nullopt when a field is missing or has the wrong type, the id is
    // not a positive integer, or the date does not match yyyy-MM-dd HH:mm:ss.
    static std::optional<Task> fromJson(const QJsonObject &jsonObject) {
        const QJsonValue idValue = jsonObject.value("id");
        const QJsonValue titleValue = jsonObject.value("title");
        const QJsonValue descriptionValue = jsonObject.value("description");
        const QJsonValue statusValue = jsonObject.value("status");
        const QJsonValue dateValue = jsonObject.value("created_date");

        if (!idValue.isDouble() || !titleValue.isString() ||
            !descriptionValue.isString() || !statusValue.isString() ||
            !dateValue.isString()) {
            return std::nullopt;
        }

        const double rawId = idValue.toDouble();
        if (rawId < 1 || std::floor(rawId) != rawId || rawId >= 9.0e15) {
            return std::nullopt;
        }

        const auto status = statusFromString(statusValue.toString());
        if (!status) {
            return std::nullopt;
        }

        const QDateTime created =
            QDateTime::fromString(dateValue.toString(), taskDateFormat());
        if (!created.isValid()) {
            return std::nullopt;
        }

        Task task;
        task.id = idValue.toInteger();
        task.title = titleValue.toString();
        task.description = descriptionValue.toString();
        task.status = *status;
        task.createdDate = created;

        return task;
    }

    bool operator==(const Task &other) const {
        return id == other.id && title == other.title &&
               description == other.description && status == other.status &&
               createdDateString() == other.createdDateString();
    }

    bool operator!=(const Task &other) const { return !(*this == other); }
};

#endif // TASKLINE_MODEL_TASK_HPP
