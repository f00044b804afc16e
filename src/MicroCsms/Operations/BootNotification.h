// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_BOOTNOTIFICATION_H
#define MC_BOOTNOTIFICATION_H

#include <string>

#include <MicroCsms/Core/Operation.h>

namespace MicroCsms {

class Context;
class Model;

class BootNotification : public Operation {
private:
    Context& context;
    Model& model;
    std::string chargePointId;
    bool accepted = false;
    const char *errorCode = nullptr;
public:
    BootNotification(Context& context, Model& model, const char *chargePointId);

    const char* getOperationType() override;

    void processReq(JsonObject payload) override;

    std::unique_ptr<JsonDoc> createConf() override;

    const char *getErrorCode() override {return errorCode;}
};

} //namespace MicroCsms

#endif
