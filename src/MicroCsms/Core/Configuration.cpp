// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <string.h>
#include <stdlib.h>
#include <limits.h>

#include <MicroCsms/Core/Configuration.h>
#include <MicroCsms/Core/FilesystemUtils.h>
#include <MicroCsms/Debug.h>

namespace MicroCsms {

bool loadFactoryDefault(Configuration& config, int factoryDef) {
    config.setInt(factoryDef);
    return true;
}

bool loadFactoryDefault(Configuration& config, bool factoryDef) {
    config.setBool(factoryDef);
    return true;
}

bool loadFactoryDefault(Configuration& config, const char *factoryDef) {
    return config.setString(factoryDef);
}

bool VALIDATE_UNSIGNED_INT(const char *value) {
    if (!value || *value == '\0') {
        return false;
    }
    for(size_t i = 0; value[i] != '\0'; i++) {
        if (value[i] < '0' || value[i] > '9') {
            return false;
        }
    }
    return strlen(value) <= 9; //fits into int
}

} //namespace MicroCsms

using namespace MicroCsms;

ConfigurationService::ConfigurationService(std::shared_ptr<FilesystemAdapter> filesystem, const char *filename) :
        filesystem(filesystem), filename(filename) {

}

template <class T>
std::shared_ptr<Configuration> ConfigurationService::declareConfiguration(const char *key, T factoryDef, bool readonly) {
    std::lock_guard<std::recursive_mutex> lock(mutex);

    auto res = getConfigurationUnlocked(key);
    if (res) {
        if (res->getType() != convertType<T>()) {
            MC_DBG_ERR("conflicting declarations of %s", key);
            return nullptr;
        }
        if (readonly) {
            res->setReadOnly();
        }
        return res;
    }

    res = makeConfiguration(convertType<T>(), key);
    if (!res) {
        return nullptr;
    }

    if (!loadFactoryDefault(*res, factoryDef)) {
        MC_DBG_ERR("invalid default for %s", key);
        return nullptr;
    }

    applyStored(*res);

    if (readonly) {
        res->setReadOnly();
    }

    configurations.push_back(res);
    return res;
}

template std::shared_ptr<Configuration> ConfigurationService::declareConfiguration<int>(const char *key, int factoryDef, bool readonly);
template std::shared_ptr<Configuration> ConfigurationService::declareConfiguration<bool>(const char *key, bool factoryDef, bool readonly);
template std::shared_ptr<Configuration> ConfigurationService::declareConfiguration<const char*>(const char *key, const char *factoryDef, bool readonly);

std::shared_ptr<Configuration> ConfigurationService::getConfigurationUnlocked(const char *key) {
    for (auto& config : configurations) {
        if (!strcmp(config->getKey(), key)) {
            return config;
        }
    }
    return nullptr;
}

std::shared_ptr<Configuration> ConfigurationService::getConfiguration(const char *key) {
    std::lock_guard<std::recursive_mutex> lock(mutex);
    return getConfigurationUnlocked(key);
}

void ConfigurationService::registerValidator(const char *key, std::function<bool(const char*)> validator) {
    std::lock_guard<std::recursive_mutex> lock(mutex);
    for (auto& v : validators) {
        if (v.key == key) {
            v.checkValue = validator;
            return;
        }
    }
    validators.push_back(Validator{key, validator});
}

bool ConfigurationService::setConfiguration(const char *key, const char *value) {
    std::lock_guard<std::recursive_mutex> lock(mutex);

    auto config = getConfigurationUnlocked(key);
    if (!config) {
        MC_DBG_WARN("unknown config: %s", key);
        return false;
    }

    if (config->isReadOnly()) {
        MC_DBG_WARN("config %s is read-only", key);
        return false;
    }

    for (auto& v : validators) {
        if (v.key == key && v.checkValue && !v.checkValue(value)) {
            MC_DBG_WARN("rejected value for %s: %s", key, value);
            return false;
        }
    }

    switch (config->getType()) {
        case TConfig::Int: {
            char *end = nullptr;
            long num = strtol(value, &end, 10);
            if (!end || *end != '\0' || end == value || num > INT_MAX || num < INT_MIN) {
                MC_DBG_WARN("not an int: %s", value);
                return false;
            }
            config->setInt((int) num);
            return true;
        }
        case TConfig::Bool:
            if (!strcmp(value, "true")) {
                config->setBool(true);
            } else if (!strcmp(value, "false")) {
                config->setBool(false);
            } else {
                MC_DBG_WARN("not a bool: %s", value);
                return false;
            }
            return true;
        case TConfig::String:
            return config->setString(value);
    }

    return false;
}

bool ConfigurationService::applyStored(Configuration& config) {
    if (!stored) {
        return false;
    }

    JsonArray storedConfigs = (*stored)["configurations"];
    for (JsonObject storedConfig : storedConfigs) {
        const char *key = storedConfig["key"] | "";
        if (strcmp(key, config.getKey())) {
            continue;
        }

        TConfig type;
        if (!deserializeTConfig(storedConfig["type"] | "_Undefined", type) || type != config.getType()) {
            MC_DBG_ERR("corrupt config %s", key);
            return false;
        }

        switch (type) {
            case TConfig::Int:
                if (!storedConfig["value"].is<int>()) {
                    MC_DBG_ERR("corrupt config %s", key);
                    return false;
                }
                config.setInt(storedConfig["value"]);
                return true;
            case TConfig::Bool:
                if (!storedConfig["value"].is<bool>()) {
                    MC_DBG_ERR("corrupt config %s", key);
                    return false;
                }
                config.setBool(storedConfig["value"]);
                return true;
            case TConfig::String:
                return config.setString(storedConfig["value"] | "");
        }
    }

    return false;
}

bool ConfigurationService::load() {
    std::lock_guard<std::recursive_mutex> lock(mutex);

    if (!filesystem) {
        return true; //volatile configs
    }

    size_t fsize = 0;
    if (filesystem->stat(filename.c_str(), &fsize) != 0) {
        MC_DBG_DEBUG("config file %s doesn't exist yet", filename.c_str());
        return true;
    }

    auto doc = FilesystemUtils::loadJson(filesystem, filename.c_str());
    if (!doc) {
        MC_DBG_ERR("failed to load %s", filename.c_str());
        return false;
    }

    if (!(*doc)["configurations"].is<JsonArray>()) {
        MC_DBG_ERR("corrupt config file %s", filename.c_str());
        return false;
    }

    stored = std::move(doc);

    for (auto& config : configurations) {
        applyStored(*config);
    }

    MC_DBG_DEBUG("Initialization finished");
    return true;
}

bool ConfigurationService::save() {
    std::lock_guard<std::recursive_mutex> lock(mutex);

    if (!filesystem) {
        return true; //volatile configs
    }

    size_t jsonCapacity = JSON_OBJECT_SIZE(1) + JSON_ARRAY_SIZE(configurations.size());
    for (auto& config : configurations) {
        jsonCapacity += JSON_OBJECT_SIZE(3);
        if (config->getType() == TConfig::String) {
            jsonCapacity += strlen(config->getString()) + 1;
        }
    }

    auto doc = initJsonDoc(jsonCapacity);
    JsonArray configurationsArray = doc.createNestedArray("configurations");

    for (auto& config : configurations) {
        JsonObject stored = configurationsArray.createNestedObject();
        stored["type"] = serializeTConfig(config->getType());
        stored["key"] = (const char*) config->getKey();
        switch (config->getType()) {
            case TConfig::Int:
                stored["value"] = config->getInt();
                break;
            case TConfig::Bool:
                stored["value"] = config->getBool();
                break;
            case TConfig::String:
                stored["value"] = (char*) config->getString(); //cast to char* to force ArduinoJson to copy the string
                break;
        }
    }

    if (!FilesystemUtils::storeJson(filesystem, filename.c_str(), doc)) {
        MC_DBG_ERR("failed to save %s", filename.c_str());
        return false;
    }

    return true;
}
