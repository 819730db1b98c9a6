#include "TestSupport.hpp"

#include "Task.hpp"

namespace {

Task sampleTask(TaskStatus status) {
    Task task;
    task.id = 42;
    task.title = QStringLiteral("Write report");
    task.description = QStringLiteral("Quarterly report, ünïcödé included");
    task.status = status;
    task.createdDate = QDateTime(QDate(2024, 3, 9), QTime(7, 5, 3));
    return task;
}

} // namespace

TEST_CASE("Task serializes to the persisted key-value layout", "[model]") {
    const QJsonObject json = sampleTask(TaskStatus::Completed).toJson();

    CHECK(json.value("id").toInteger() == 42);
    CHECK(json.value("title").toString() == QStringLiteral("Write report"));
    CHECK(json.value("status").toString() == QStringLiteral("Completed"));
    CHECK(json.value("created_date").toString() == QStringLiteral("2024-03-09 07:05:03"));
}

TEST_CASE("Task survives a trip through its JSON form", "[model]") {
    const auto status = GENERATE(TaskStatus::Pending, TaskStatus::Completed);
    const Task original = sampleTask(status);

    const auto restored = Task::fromJson(original.toJson());

    REQUIRE(restored.has_value());
    CHECK(*restored == original);
    CHECK(restored->createdDateString() == original.createdDateString());
}

TEST_CASE("Task::fromJson rejects incomplete or malformed objects", "[model]") {
    QJsonObject json = sampleTask(TaskStatus::Pending).toJson();

    SECTION("missing title") {
        json.remove("title");
        CHECK_FALSE(Task::fromJson(json).has_value());
    }

    SECTION("id that is zero or negative") {
        json.insert("id", 0);
        CHECK_FALSE(Task::fromJson(json).has_value());
        json.insert("id", -5);
        CHECK_FALSE(Task::fromJson(json).has_value());
    }

    SECTION("id with a fractional part") {
        json.insert("id", 2.5);
        CHECK_FALSE(Task::fromJson(json).has_value());
    }

    SECTION("id stored as text") {
        json.insert("id", QStringLiteral("42"));
        CHECK_FALSE(Task::fromJson(json).has_value());
    }

    SECTION("unknown status") {
        json.insert("status", QStringLiteral("Archived"));
        CHECK_FALSE(Task::fromJson(json).has_value());
    }

    SECTION("date in another format") {
        json.insert("created_date", QStringLiteral("09/03/2024 07:05"));
        CHECK_FALSE(Task::fromJson(json).has_value());
    }
}

TEST_CASE("Status names map both ways", "[model]") {
    CHECK(statusToString(TaskStatus::Pending) == QStringLiteral("Pending"));
    CHECK(statusToString(TaskStatus::Completed) == QStringLiteral("Completed"));
    CHECK(statusFromString("Completed") == TaskStatus::Completed);
    CHECK_FALSE(statusFromString("completed").has_value());
}

TEST_CASE("truncateToSeconds drops milliseconds only", "[model]") {
    const QDateTime precise(QDate(2024, 1, 2), QTime(3, 4, 5, 678));
    const QDateTime truncated = truncateToSeconds(precise);

    CHECK(truncated.time() == QTime(3, 4, 5));
    CHECK(truncated.date() == precise.date());
}
