// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_CONFIGURATIONKEYVALUE_H
#define MC_CONFIGURATIONKEYVALUE_H

#include <memory>
#include <stdint.h>

#define MC_CONFIG_MAX_VALSTRSIZE 128

namespace MicroCsms {

using revision_t = uint16_t;

enum class TConfig : uint8_t {
    Int,
    Bool,
    String
};

template<class T>
TConfig convertType();

class Configuration {
protected:
    revision_t value_revision = 0; //write access counter; used to check if this config has been changed
private:
    bool readOnly = false;
public:
    virtual ~Configuration();

    virtual bool setKey(const char *key) = 0;
    virtual const char *getKey() = 0;

    virtual void setInt(int);
    virtual void setBool(bool);
    virtual bool setString(const char*);

    virtual int getInt();
    virtual bool getBool();
    virtual const char *getString(); //always returns c-string (empty if undefined)

    virtual TConfig getType() = 0;

    revision_t getValueRevision();

    void setReadOnly();
    bool isReadOnly();
};

std::unique_ptr<Configuration> makeConfiguration(TConfig type, const char *key);

const char *serializeTConfig(TConfig type);
bool deserializeTConfig(const char *serialized, TConfig& out);

} //namespace MicroCsms

#endif
