// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <string.h>
#include <string>

#include <MicroCsms/Core/ConfigurationKeyValue.h>
#include <MicroCsms/Debug.h>

namespace MicroCsms {

template<> TConfig convertType<int>() {return TConfig::Int;}
template<> TConfig convertType<bool>() {return TConfig::Bool;}
template<> TConfig convertType<const char*>() {return TConfig::String;}

Configuration::~Configuration() {

}

void Configuration::setInt(int) {
    MC_DBG_ERR("type err");
}

void Configuration::setBool(bool) {
    MC_DBG_ERR("type err");
}

bool Configuration::setString(const char*) {
    MC_DBG_ERR("type err");
    return false;
}

int Configuration::getInt() {
    MC_DBG_ERR("type err");
    return 0;
}

bool Configuration::getBool() {
    MC_DBG_ERR("type err");
    return false;
}

const char *Configuration::getString() {
    MC_DBG_ERR("type err");
    return "";
}

revision_t Configuration::getValueRevision() {
    return value_revision;
}

void Configuration::setReadOnly() {
    readOnly = true;
}

bool Configuration::isReadOnly() {
    return readOnly;
}

class ConfigInt : public Configuration {
private:
    std::string key;
    int val = 0;
public:

    ~ConfigInt() = default;

    bool setKey(const char *key) override {
        this->key = key;
        return true;
    }

    const char *getKey() override {
        return key.c_str();
    }

    TConfig getType() override {
        return TConfig::Int;
    }

    void setInt(int val) override {
        this->val = val;
        value_revision++;
    }

    int getInt() override {
        return val;
    }
};

class ConfigBool : public Configuration {
private:
    std::string key;
    bool val = false;
public:

    ~ConfigBool() = default;

    bool setKey(const char *key) override {
        this->key = key;
        return true;
    }

    const char *getKey() override {
        return key.c_str();
    }

    TConfig getType() override {
        return TConfig::Bool;
    }

    void setBool(bool val) override {
        this->val = val;
        value_revision++;
    }

    bool getBool() override {
        return val;
    }
};

class ConfigString : public Configuration {
private:
    std::string key;
    std::string val;
public:

    ~ConfigString() = default;

    bool setKey(const char *key) override {
        this->key = key;
        return true;
    }

    const char *getKey() override {
        return key.c_str();
    }

    TConfig getType() override {
        return TConfig::String;
    }

    bool setString(const char *src) override {
        if (!src) {
            src = "";
        }

        if (strlen(src) >= MC_CONFIG_MAX_VALSTRSIZE) {
            MC_DBG_ERR("value exceeds max size");
            return false;
        }

        if (val == src) {
            //value didn't change
            return true;
        }

        val = src;
        value_revision++;
        return true;
    }

    const char *getString() override {
        return val.c_str();
    }
};

std::unique_ptr<Configuration> makeConfiguration(TConfig type, const char *key) {
    std::unique_ptr<Configuration> res;
    switch (type) {
        case TConfig::Int:
            res.reset(new ConfigInt());
            break;
        case TConfig::Bool:
            res.reset(new ConfigBool());
            break;
        case TConfig::String:
            res.reset(new ConfigString());
            break;
    }
    if (!res) {
        MC_DBG_ERR("OOM");
        return nullptr;
    }
    res->setKey(key);
    return res;
}

const char *serializeTConfig(TConfig type) {
    switch (type) {
        case TConfig::Int:
            return "int";
        case TConfig::Bool:
            return "bool";
        case TConfig::String:
            return "string";
    }
    return "_Undefined";
}

bool deserializeTConfig(const char *serialized, TConfig& out) {
    if (!strcmp(serialized, "int")) {
        out = TConfig::Int;
        return true;
    } else if (!strcmp(serialized, "bool")) {
        out = TConfig::Bool;
        return true;
    } else if (!strcmp(serialized, "string")) {
        out = TConfig::String;
        return true;
    } else {
        MC_DBG_WARN("config type error");
        return false;
    }
}

} //namespace MicroCsms
