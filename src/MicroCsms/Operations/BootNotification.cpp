// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroCsms/Operations/BootNotification.h>
#include <MicroCsms/Core/Context.h>
#include <MicroCsms/Model/Model.h>
#include <MicroCsms/Model/ChargePoint/Charger.h>
#include <MicroCsms/Debug.h>

using namespace MicroCsms;

BootNotification::BootNotification(Context& context, Model& model, const char *chargePointId) : context(context), model(model), chargePointId(chargePointId) {

}

const char* BootNotification::getOperationType(){
    return "BootNotification";
}

void BootNotification::processReq(JsonObject payload) {

    if (!payload.containsKey("chargePointVendor") || !payload.containsKey("chargePointModel")) {
        errorCode = "FormationViolation";
        return;
    }

    const char *vendor = payload["chargePointVendor"] | "";
    const char *chargePointModel = payload["chargePointModel"] | "";

    MC_DBG_INFO("BootNotification from %s: vendor=%s, model=%s", chargePointId.c_str(), vendor, chargePointModel);

    auto chargerStore = model.getChargerStore();

    Charger charger;
    if (!chargerStore || !chargerStore->get(chargePointId.c_str(), charger)) {
        MC_DBG_ERR("charger %s not registered", chargePointId.c_str());
        accepted = false;
        return;
    }

    charger.vendor = vendor;
    charger.model = chargePointModel;
    if (payload.containsKey("chargePointSerialNumber")) {
        charger.serialNumber = payload["chargePointSerialNumber"] | "";
    }
    if (payload.containsKey("firmwareVersion")) {
        charger.firmwareVersion = payload["firmwareVersion"] | "";
    }
    charger.status = ChargePointStatus::Available;
    charger.lastHeartbeat = context.getClock().now();

    if (!chargerStore->update(charger)) {
        MC_DBG_ERR("could not update charger %s", chargePointId.c_str());
    }

    accepted = true;
}

std::unique_ptr<JsonDoc> BootNotification::createConf(){
    auto doc = makeJsonDoc(JSON_OBJECT_SIZE(3) + MC_JSONDATE_SIZE);
    JsonObject payload = doc->to<JsonObject>();

    char currentTime [MC_JSONDATE_SIZE] = {'\0'};
    context.getClock().toJsonString(context.getClock().now(), currentTime, sizeof(currentTime));
    payload["currentTime"] = currentTime;

    payload["interval"] = context.getHeartbeatInterval();
    payload["status"] = accepted ? "Accepted" : "Rejected";
    return doc;
}
