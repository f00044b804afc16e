// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroCsms/Operations/FirmwareStatusNotification.h>
#include <MicroCsms/Model/Model.h>
#include <MicroCsms/Model/FirmwareManagement/FirmwareService.h>
#include <MicroCsms/Debug.h>

using namespace MicroCsms;

FirmwareStatusNotification::FirmwareStatusNotification(Model& model, const char *chargePointId) : model(model), chargePointId(chargePointId) {

}

const char* FirmwareStatusNotification::getOperationType() {
    return "FirmwareStatusNotification";
}

void FirmwareStatusNotification::processReq(JsonObject payload) {

    const char *statusCstr = payload["status"] | "_Undefined";

    MC_DBG_INFO("FirmwareStatusNotification from %s: %s", chargePointId.c_str(), statusCstr);

    FirmwareStatus status;
    if (!deserializeFirmwareStatus(statusCstr, status)) {
        MC_DBG_WARN("invalid firmware status %s. Ignore", statusCstr);
        return;
    }

    if (auto firmwareService = model.getFirmwareService()) {
        firmwareService->notifyStatus(chargePointId.c_str(), status);
    }
}

std::unique_ptr<JsonDoc> FirmwareStatusNotification::createConf() {
    return createEmptyDocument();
}
