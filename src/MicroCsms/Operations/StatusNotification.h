// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_STATUSNOTIFICATION_H
#define MC_STATUSNOTIFICATION_H

#include <string>

#include <MicroCsms/Core/Operation.h>

namespace MicroCsms {

class Context;
class Model;

class StatusNotification : public Operation {
private:
    Context& context;
    Model& model;
    std::string chargePointId;
public:
    StatusNotification(Context& context, Model& model, const char *chargePointId);

    const char* getOperationType() override;

    void processReq(JsonObject payload) override;

    std::unique_ptr<JsonDoc> createConf() override;
};

} //namespace MicroCsms

#endif
