#include "StorageFactory.hpp"

#include "JsonFileStorage.hpp"
#include "Logger.hpp"
#include "PostgresStorage.hpp"

std::unique_ptr<IStorage> makeStorage(const AppConfig &config) {
    qInfo(appCore) << "Using" << backendToString(config.backend) << "storage";

    switch (config.backend) {
    case StorageBackend::Postgres:
        return std::make_unique<PostgresStorage>(config.database);
    case StorageBackend::File:
        break;
    }
    return std::make_unique<JsonFileStorage>(config.tasksFile);
}
