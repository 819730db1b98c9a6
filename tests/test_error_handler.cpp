#include "TestSupport.hpp"

#include <QTextStream>
#include <stdexcept>

#include "ErrorHandler.hpp"

TEST_CASE("runSafe returns true and prints nothing when the action succeeds", "[errors]") {
    QString rendered;
    QTextStream out(&rendered);
    bool ran = false;

    CHECK(runSafe("noop", out, [&ran] { ran = true; }));
    CHECK(ran);
    CHECK(rendered.isEmpty());
}

TEST_CASE("runSafe renders each error kind and keeps going", "[errors]") {
    QString rendered;
    QTextStream out(&rendered);

    SECTION("validation") {
        CHECK_FALSE(runSafe("add", out, [] {
            throw ValidationError(QStringLiteral("Task title cannot be empty"));
        }));
        CHECK(rendered == QStringLiteral("Error: Task title cannot be empty\n"));
    }

    SECTION("not found") {
        CHECK_FALSE(runSafe("delete", out, [] { throw NotFoundError(7); }));
        CHECK(rendered == QStringLiteral("Error: Task with ID 7 not found\n"));
    }

    SECTION("persistence keeps the cause") {
        CHECK_FALSE(runSafe("list", out, [] {
            throw PersistenceError(QStringLiteral("x"), QStringLiteral("cause"));
        }));
        CHECK(rendered == QStringLiteral("Storage error: x: cause\n"));
    }

    SECTION("anything else is reported generically") {
        CHECK_FALSE(runSafe("stats", out, [] { throw std::runtime_error("boom"); }));
        CHECK(rendered == QStringLiteral("An unexpected error occurred. Please try again.\n"));
        CHECK_FALSE(rendered.contains(QStringLiteral("boom")));
    }
}
