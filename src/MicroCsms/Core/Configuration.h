// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_CONFIGURATION_H
#define MC_CONFIGURATION_H

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <MicroCsms/Core/ConfigurationKeyValue.h>
#include <MicroCsms/Core/FilesystemAdapter.h>
#include <MicroCsms/Core/Json.h>

#define MC_CONFIGURATION_FN "csms-config.jsn"

namespace MicroCsms {

/*
 * Typed server settings, persisted as JSON in the store folder. Components declare their settings with
 * a factory default when they are constructed. Values from the config file override the factory default.
 *
 * If no filesystem is given, the settings are volatile.
 */
class ConfigurationService {
private:
    std::shared_ptr<FilesystemAdapter> filesystem;
    std::string filename;

    std::vector<std::shared_ptr<Configuration>> configurations;

    struct Validator {
        std::string key;
        std::function<bool(const char*)> checkValue;
    };
    std::vector<Validator> validators;

    std::unique_ptr<JsonDoc> stored; //file content of the last load()

    std::recursive_mutex mutex;

    std::shared_ptr<Configuration> getConfigurationUnlocked(const char *key);
    bool applyStored(Configuration& config);
public:
    ConfigurationService(std::shared_ptr<FilesystemAdapter> filesystem, const char *filename = MC_CONFIGURATION_FN);

    template <class T>
    std::shared_ptr<Configuration> declareConfiguration(const char *key, T factoryDefault, bool readonly = false);

    std::shared_ptr<Configuration> getConfiguration(const char *key);

    void registerValidator(const char *key, std::function<bool(const char*)> validator);

    /*
     * Sets the config from its string representation after checking it with the registered validator.
     * Returns false if the key is unknown, read-only or the value is rejected
     */
    bool setConfiguration(const char *key, const char *value);

    bool load();
    bool save();
};

//default implementation for common validator
bool VALIDATE_UNSIGNED_INT(const char*);

} //namespace MicroCsms

#endif
