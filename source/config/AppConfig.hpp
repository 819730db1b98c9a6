#ifndef TASKLINE_CONFIG_APPCONFIG_HPP
#define TASKLINE_CONFIG_APPCONFIG_HPP

#include <QString>

enum class StorageBackend {
    File,
    Postgres
};

struct DatabaseConfig {
    QString host = QStringLiteral("localhost");
    int port = 5432;
    QString name = QStringLiteral("taskline");
    QString user;
    QString password;
};

struct AppConfig {
    StorageBackend backend = StorageBackend::File;
    QString tasksFile = QStringLiteral("tasks.json");
    QString logFile = QStringLiteral("taskline.log");
    DatabaseConfig database;

    // Reads the INI file at path, writing a default one first if it is
    // missing. DB_HOST, DB_PORT, DB_NAME, DB_USER and DB_PASSWORD override
    // the [Database] section.
    static AppConfig load(const QString &path);

    void save(const QString &path) const;
};

QString backendToString(StorageBackend backend);

#endif // TASKLINE_CONFIG_APPCONFIG_HPP
