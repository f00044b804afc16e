// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_METERVALUES_H
#define MC_METERVALUES_H

#include <string>

#include <MicroCsms/Core/Operation.h>

namespace MicroCsms {

class Context;
class Model;
struct MeterValue;

class MeterValues : public Operation {
private:
    Context& context;
    Model& model;
    std::string chargePointId;

    bool parseMeterValue(JsonObject meterValueJson, MeterValue& out);
public:
    MeterValues(Context& context, Model& model, const char *chargePointId);

    const char* getOperationType() override;

    void processReq(JsonObject payload) override;

    std::unique_ptr<JsonDoc> createConf() override;
};

} //namespace MicroCsms

#endif
