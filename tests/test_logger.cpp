#include "TestSupport.hpp"

#include <QFile>
#include <QTemporaryDir>

#include "Logger.hpp"

namespace {

QString readLog(const QString &path) {
    QFile file(path);
    REQUIRE(file.open(QIODevice::ReadOnly | QIODevice::Text));
    return QString::fromUtf8(file.readAll());
}

} // namespace

TEST_CASE("initLogging writes formatted lines to the log file", "[logging]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath("taskline.log");

    initLogging(path);
    qWarning(appFile) << "first marker";
    shutdownLogging();

    const QString log = readLog(path);
    CHECK(log.contains(QStringLiteral("[taskline.file]")));
    CHECK(log.contains(QStringLiteral("first marker")));
}

TEST_CASE("initLogging appends across runs and stops writing after shutdown", "[logging]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath("taskline.log");

    initLogging(path);
    qWarning(appCore) << "from the first run";
    shutdownLogging();

    initLogging(path);
    qWarning(appCore) << "from the second run";
    shutdownLogging();

    qWarning(appCore) << "after shutdown";

    const QString log = readLog(path);
    CHECK(log.contains(QStringLiteral("from the first run")));
    CHECK(log.contains(QStringLiteral("from the second run")));
    CHECK_FALSE(log.contains(QStringLiteral("after shutdown")));
}
