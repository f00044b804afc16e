// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_REMOTESTOPTRANSACTION_H
#define MC_REMOTESTOPTRANSACTION_H

#include <MicroCsms/Core/Operation.h>
#include <MicroCsms/Model/RemoteControl/RemoteControlDefs.h>

namespace MicroCsms {

class RemoteStopTransaction : public Operation {
private:
    int transactionId;
    RemoteStatus status = RemoteStatus::ERR_INTERNAL;
public:
    RemoteStopTransaction(int transactionId);

    const char* getOperationType() override;

    std::unique_ptr<JsonDoc> createReq() override;

    void processConf(JsonObject payload) override;

    RemoteStatus getStatus() {return status;}
};

} //namespace MicroCsms

#endif
