#ifndef TASKLINE_TESTS_TESTSUPPORT_HPP
#define TASKLINE_TESTS_TESTSUPPORT_HPP

#include <catch2/catch.hpp>

#include <QJsonDocument>
#include <QString>
#include <algorithm>
#include <stdexcept>

#include "IStorage.hpp"

namespace Catch {
template <> struct StringMaker<QString> {
    static std::string convert(const QString &value) {
        return '"' + value.toStdString() + '"';
    }
};

template <> struct StringMaker<Task> {
    static std::string convert(const Task &task) {
        return QString::fromUtf8(QJsonDocument(task.toJson()).toJson(QJsonDocument::Compact))
            .toStdString();
    }
};
} // namespace Catch

// In-memory storage that counts calls and can be told to fail.
class FakeStorage : public IStorage {
public:
    mutable int addCalls = 0;
    mutable int readCalls = 0;
    mutable int updateCalls = 0;
    mutable int deleteCalls = 0;
    mutable int searchCalls = 0;
    mutable int statisticsCalls = 0;

    bool failWithRuntimeError = false;

    std::vector<Task> tasks;

    Task addTask(const QString &title, const QString &description) override {
        ++addCalls;
        maybeFail();
        Task task;
        task.id = tasks.empty() ? 1 : tasks.back().id + 1;
        task.title = title;
        task.description = description;
        task.createdDate = truncateToSeconds(QDateTime::currentDateTime());
        tasks.push_back(task);
        return task;
    }

    std::vector<Task> getAllTasks() const override {
        ++readCalls;
        maybeFail();
        return tasks;
    }

    std::optional<Task> getTaskById(qint64 id) const override {
        ++readCalls;
        maybeFail();
        for (const Task &task : tasks) {
            if (task.id == id) {
                return task;
            }
        }
        return std::nullopt;
    }

    bool updateTask(const Task &task) override {
        ++updateCalls;
        maybeFail();
        for (Task &existing : tasks) {
            if (existing.id == task.id) {
                existing.title = task.title;
                existing.description = task.description;
                existing.status = task.status;
                return true;
            }
        }
        return false;
    }

    std::optional<Task> deleteTask(qint64 id) override {
        ++deleteCalls;
        maybeFail();
        auto it = std::find_if(tasks.begin(), tasks.end(),
                               [id](const Task &task) { return task.id == id; });
        if (it == tasks.end()) {
            return std::nullopt;
        }
        Task removed = *it;
        tasks.erase(it);
        return removed;
    }

    std::vector<Task> searchTasks(const QString &keyword,
                                  std::optional<TaskStatus> statusFilter) const override {
        ++searchCalls;
        maybeFail();
        std::vector<Task> out;
        for (const Task &task : tasks) {
            if (statusFilter && task.status != *statusFilter) {
                continue;
            }
            if (task.title.contains(keyword, Qt::CaseInsensitive) ||
                task.description.contains(keyword, Qt::CaseInsensitive)) {
                out.push_back(task);
            }
        }
        return out;
    }

    TaskStatistics getStatistics() const override {
        ++statisticsCalls;
        maybeFail();
        TaskStatistics stats;
        for (const Task &task : tasks) {
            ++stats.total;
            ++(task.status == TaskStatus::Pending ? stats.pending : stats.completed);
            ++stats.createdToday;
        }
        return stats;
    }

private:
    void maybeFail() const {
        if (failWithRuntimeError) {
            throw std::runtime_error("disk on fire");
        }
    }
};

#endif // TASKLINE_TESTS_TESTSUPPORT_HPP
