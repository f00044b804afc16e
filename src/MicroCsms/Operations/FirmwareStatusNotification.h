// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_FIRMWARESTATUSNOTIFICATION_H
#define MC_FIRMWARESTATUSNOTIFICATION_H

#include <string>

#include <MicroCsms/Core/Operation.h>

namespace MicroCsms {

class Model;

class FirmwareStatusNotification : public Operation {
private:
    Model& model;
    std::string chargePointId;
public:
    FirmwareStatusNotification(Model& model, const char *chargePointId);

    const char* getOperationType() override;

    void processReq(JsonObject payload) override;

    std::unique_ptr<JsonDoc> createConf() override;
};

} //namespace MicroCsms

#endif
