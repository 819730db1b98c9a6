#ifndef TASKLINE_STORAGE_STORAGEFACTORY_HPP
#define TASKLINE_STORAGE_STORAGEFACTORY_HPP

#include <memory>

#include "AppConfig.hpp"
#include "IStorage.hpp"

std::unique_ptr<IStorage> makeStorage(const AppConfig &config);

#endif // TASKLINE_STORAGE_STORAGEFACTORY_HPP
