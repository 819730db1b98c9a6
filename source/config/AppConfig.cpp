#include "AppConfig.hpp"

#include <QFileInfo>
#include <QSettings>
#include <QtGlobal>

#include "Logger.hpp"

namespace {

QString envOr(const char *name, const QString &fallback) {
    return qEnvironmentVariableIsSet(name) ? qEnvironmentVariable(name) : fallback;
}

StorageBackend backendFromString(const QString &text) {
    const QString normalized = text.trimmed().toLower();
    if (normalized == QLatin1String("postgres") || normalized == QLatin1String("postgresql")) {
        return StorageBackend::Postgres;
    }
    if (normalized != QLatin1String("file")) {
        qWarning(appCore) << "Unknown storage backend" << text << "- using file";
    }
    return StorageBackend::File;
}

} // END NAMESPACE

QString backendToString(StorageBackend backend) {
    return backend == StorageBackend::Postgres ? QStringLiteral("postgres")
                                               : QStringLiteral("file");
}

AppConfig AppConfig::load(const QString &path) {
    AppConfig config;

    if (!QFileInfo::exists(path)) {
        config.save(path);
        qInfo(appCore) << "Created default configuration file" << path;
    }

    QSettings settings(path, QSettings::IniFormat);

    settings.beginGroup("Storage");
    config.backend = backendFromString(
        settings.value("backend", backendToString(config.backend)).toString());
    config.tasksFile = settings.value("file_name", config.tasksFile).toString();
    settings.endGroup();

    settings.beginGroup("Logging");
    config.logFile = settings.value("file", config.logFile).toString();
    settings.endGroup();

    settings.beginGroup("Database");
    DatabaseConfig &db = config.database;
    db.host = settings.value("host", db.host).toString();
    db.port = settings.value("port", db.port).toInt();
    db.name = settings.value("name", db.name).toString();
    db.user = settings.value("user", db.user).toString();
    db.password = settings.value("password", db.password).toString();
    settings.endGroup();

    db.host = envOr("DB_HOST", db.host);
    db.name = envOr("DB_NAME", db.name);
    db.user = envOr("DB_USER", db.user);
    db.password = envOr("DB_PASSWORD", db.password);

    bool portOk = false;
    const int envPort = qEnvironmentVariableIntValue("DB_PORT", &portOk);
    if (portOk) {
        db.port = envPort;
    }

    return config;
}

void AppConfig::save(const QString &path) const {
    QSettings settings(path, QSettings::IniFormat);

    settings.beginGroup("Storage");
    settings.setValue("backend", backendToString(backend));
    settings.setValue("file_name", tasksFile);
    settings.endGroup();

    settings.beginGroup("Logging");
    settings.setValue("file", logFile);
    settings.endGroup();

    // password is never written back; set it by hand or via DB_PASSWORD
    settings.beginGroup("Database");
    settings.setValue("host", database.host);
    settings.setValue("port", database.port);
    settings.setValue("name", database.name);
    settings.setValue("user", database.user);
    settings.endGroup();

    settings.sync();
    if (settings.status() != QSettings::NoError) {
        qWarning(appCore) << "Failed to write configuration file" << path;
    }
}
