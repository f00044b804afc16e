// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <string.h>

#include <MicroCsms/Model/RemoteControl/RemoteControlService.h>
#include <MicroCsms/Core/Context.h>
#include <MicroCsms/Operations/RemoteStartTransaction.h>
#include <MicroCsms/Operations/RemoteStopTransaction.h>
#include <MicroCsms/Operations/ChangeAvailability.h>
#include <MicroCsms/Operations/Reset.h>
#include <MicroCsms/Operations/UpdateFirmware.h>
#include <MicroCsms/Model/Authorization/UserStore.h>
#include <MicroCsms/Debug.h>

using namespace MicroCsms;

namespace MicroCsms {
namespace RemoteControl {

template <class OperationT>
RemoteCommandResult execute(SessionManager& sessionManager, const char *chargePointId, OperationT& operation) {
    auto commandResult = sessionManager.sendCommand(chargePointId, operation);

    RemoteCommandResult res;
    res.error = commandResult.error;
    res.errorCode = commandResult.errorCode;
    res.status = operation.getStatus();

    if (res.error != CommandError::None) {
        MC_DBG_WARN("%s to %s: %s %s", operation.getOperationType(), chargePointId, serializeCommandError(res.error), res.errorCode.c_str());
    } else {
        MC_DBG_INFO("%s to %s: %s", operation.getOperationType(), chargePointId, serializeRemoteStatus(res.status));
    }
    return res;
}

} //namespace RemoteControl
} //namespace MicroCsms

RemoteControlService::RemoteControlService(Context& context) : context(context) {

}

RemoteCommandResult RemoteControlService::remoteStartTransaction(const char *chargePointId, int connectorId, const char *idTag) {
    if (!idTag || !*idTag || strlen(idTag) > MC_IDTAG_LEN_MAX) {
        MC_DBG_ERR("invalid idTag");
        RemoteCommandResult res;
        res.error = CommandError::CommandRejected;
        res.errorCode = "PropertyConstraintViolation";
        return res;
    }

    //TODO: check that the idTag has no active transaction on another charger before sending
    RemoteStartTransaction operation {connectorId, idTag};
    return RemoteControl::execute(context.getSessionManager(), chargePointId, operation);
}

RemoteCommandResult RemoteControlService::remoteStopTransaction(const char *chargePointId, int transactionId) {
    RemoteStopTransaction operation {transactionId};
    return RemoteControl::execute(context.getSessionManager(), chargePointId, operation);
}

RemoteCommandResult RemoteControlService::changeAvailability(const char *chargePointId, int connectorId, AvailabilityType type) {
    ChangeAvailability operation {connectorId, type};
    return RemoteControl::execute(context.getSessionManager(), chargePointId, operation);
}

RemoteCommandResult RemoteControlService::reset(const char *chargePointId, ResetType type) {
    Reset operation {type};
    return RemoteControl::execute(context.getSessionManager(), chargePointId, operation);
}

RemoteCommandResult RemoteControlService::updateFirmware(const char *chargePointId, const char *location, const Timestamp& retrieveDate, int retries, int retryInterval) {
    UpdateFirmware operation {context.getClock(), location, retrieveDate, retries, retryInterval};
    return RemoteControl::execute(context.getSessionManager(), chargePointId, operation);
}
