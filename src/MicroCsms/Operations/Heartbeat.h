// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_HEARTBEAT_H
#define MC_HEARTBEAT_H

#include <string>

#include <MicroCsms/Core/Operation.h>

namespace MicroCsms {

class Context;
class Model;

class Heartbeat : public Operation {
private:
    Context& context;
    Model& model;
    std::string chargePointId;
public:
    Heartbeat(Context& context, Model& model, const char *chargePointId);

    const char* getOperationType() override;

    void processReq(JsonObject payload) override;

    std::unique_ptr<JsonDoc> createConf() override;
};

} //namespace MicroCsms

#endif
