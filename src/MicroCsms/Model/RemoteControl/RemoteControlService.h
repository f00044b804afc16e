// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_REMOTECONTROLSERVICE_H
#define MC_REMOTECONTROLSERVICE_H

#include <MicroCsms/Model/RemoteControl/RemoteControlDefs.h>
#include <MicroCsms/Core/Time.h>

namespace MicroCsms {

class Context;

/*
 * Server-initiated commands. Each call blocks until the charge point confirms, the Call times out or
 * the charge point disconnects
 */
class RemoteControlService {
private:
    Context& context;
public:
    RemoteControlService(Context& context);

    RemoteCommandResult remoteStartTransaction(const char *chargePointId, int connectorId, const char *idTag);
    RemoteCommandResult remoteStopTransaction(const char *chargePointId, int transactionId);
    RemoteCommandResult changeAvailability(const char *chargePointId, int connectorId, AvailabilityType type);
    RemoteCommandResult reset(const char *chargePointId, ResetType type);
    RemoteCommandResult updateFirmware(const char *chargePointId, const char *location, const Timestamp& retrieveDate, int retries, int retryInterval);
};

} //namespace MicroCsms

#endif
