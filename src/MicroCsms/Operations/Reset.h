// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_RESET_H
#define MC_RESET_H

#include <MicroCsms/Core/Operation.h>
#include <MicroCsms/Model/RemoteControl/RemoteControlDefs.h>

namespace MicroCsms {

class Reset : public Operation {
private:
    ResetType type;
    RemoteStatus status = RemoteStatus::ERR_INTERNAL;
public:
    Reset(ResetType type);

    const char* getOperationType() override;

    std::unique_ptr<JsonDoc> createReq() override;

    void processConf(JsonObject payload) override;

    RemoteStatus getStatus() {return status;}
};

} //namespace MicroCsms

#endif
