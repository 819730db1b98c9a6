#include "TestSupport.hpp"

#include <memory>

#include "ErrorHandler.hpp"
#include "TaskRepository.hpp"

namespace {

class ThrowingStorage : public FakeStorage {
public:
    std::optional<Task> getTaskById(qint64 id) const override {
        throw PersistenceError("Failed to find task", QStringLiteral("id %1 unreadable").arg(id));
    }
};

} // namespace

TEST_CASE("TaskRepository delegates every operation to its storage", "[repository]") {
    auto fake = std::make_unique<FakeStorage>();
    FakeStorage *storage = fake.get();
    TaskRepository repository(std::move(fake));

    const Task task = repository.addTask("Buy milk", "Get 2% milk");
    CHECK(storage->addCalls == 1);

    CHECK(repository.getAllTasks().size() == 1);
    CHECK(repository.getTaskById(task.id) == task);
    CHECK(storage->readCalls == 2);

    Task completed = task;
    completed.status = TaskStatus::Completed;
    CHECK(repository.updateTask(completed));
    CHECK(storage->updateCalls == 1);

    CHECK(repository.searchTasks("milk").size() == 1);
    CHECK(storage->searchCalls == 1);

    CHECK(repository.getStatistics().completed == 1);
    CHECK(storage->statisticsCalls == 1);

    CHECK(repository.deleteTask(task.id) == completed);
    CHECK(storage->deleteCalls == 1);
    CHECK(repository.getAllTasks().empty());
}

TEST_CASE("TaskRepository converts foreign failures to PersistenceError", "[repository]") {
    auto fake = std::make_unique<FakeStorage>();
    fake->failWithRuntimeError = true;
    TaskRepository repository(std::move(fake));

    CHECK_THROWS_AS(repository.addTask("a", "b"), PersistenceError);
    CHECK_THROWS_AS(repository.getAllTasks(), PersistenceError);
    CHECK_THROWS_AS(repository.getStatistics(), PersistenceError);

    try {
        repository.deleteTask(1);
        FAIL("deleteTask should have thrown");
    } catch (const PersistenceError &e) {
        CHECK(e.cause() == QStringLiteral("disk on fire"));
        CHECK(e.message().contains("deleteTask"));
    }
}

TEST_CASE("TaskRepository lets PersistenceError through unchanged", "[repository]") {
    TaskRepository repository(std::make_unique<ThrowingStorage>());

    try {
        repository.getTaskById(5);
        FAIL("getTaskById should have thrown");
    } catch (const PersistenceError &e) {
        CHECK(e.cause() == QStringLiteral("id 5 unreadable"));
        CHECK(e.message() == QStringLiteral("Failed to find task: id 5 unreadable"));
    }
}

TEST_CASE("TaskRepository requires a storage backend", "[repository]") {
    CHECK_THROWS_AS(TaskRepository(nullptr), std::invalid_argument);
}
