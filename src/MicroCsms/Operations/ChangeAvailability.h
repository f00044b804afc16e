// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_CHANGEAVAILABILITY_H
#define MC_CHANGEAVAILABILITY_H

#include <MicroCsms/Core/Operation.h>
#include <MicroCsms/Model/RemoteControl/RemoteControlDefs.h>

namespace MicroCsms {

class ChangeAvailability : public Operation {
private:
    int connectorId;
    AvailabilityType type;
    RemoteStatus status = RemoteStatus::ERR_INTERNAL;
public:
    ChangeAvailability(int connectorId, AvailabilityType type); //connectorId 0 addresses the whole charge point

    const char* getOperationType() override;

    std::unique_ptr<JsonDoc> createReq() override;

    void processConf(JsonObject payload) override;

    RemoteStatus getStatus() {return status;}
};

} //namespace MicroCsms

#endif
