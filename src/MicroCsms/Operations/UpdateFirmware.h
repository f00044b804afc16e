// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_UPDATEFIRMWARE_H
#define MC_UPDATEFIRMWARE_H

#include <string>

#include <MicroCsms/Core/Operation.h>
#include <MicroCsms/Core/Time.h>
#include <MicroCsms/Model/RemoteControl/RemoteControlDefs.h>

namespace MicroCsms {

class Clock;

class UpdateFirmware : public Operation {
private:
    const Clock& clock;
    std::string location;
    Timestamp retrieveDate;
    int retries;
    int retryInterval;
    RemoteStatus status = RemoteStatus::ERR_INTERNAL;
public:
    UpdateFirmware(const Clock& clock, const char *location, const Timestamp& retrieveDate, int retries, int retryInterval);

    const char* getOperationType() override;

    std::unique_ptr<JsonDoc> createReq() override;

    void processConf(JsonObject payload) override;

    RemoteStatus getStatus() {return status;}
};

} //namespace MicroCsms

#endif
