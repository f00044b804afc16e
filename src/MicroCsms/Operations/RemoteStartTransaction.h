// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_REMOTESTARTTRANSACTION_H
#define MC_REMOTESTARTTRANSACTION_H

#include <string>

#include <MicroCsms/Core/Operation.h>
#include <MicroCsms/Model/RemoteControl/RemoteControlDefs.h>

namespace MicroCsms {

class RemoteStartTransaction : public Operation {
private:
    int connectorId;
    std::string idTag;
    RemoteStatus status = RemoteStatus::ERR_INTERNAL;
public:
    RemoteStartTransaction(int connectorId, const char *idTag); //connectorId <= 0 lets the charge point choose

    const char* getOperationType() override;

    std::unique_ptr<JsonDoc> createReq() override;

    void processConf(JsonObject payload) override;

    RemoteStatus getStatus() {return status;}
};

} //namespace MicroCsms

#endif
