// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroCsms/Operations/Heartbeat.h>
#include <MicroCsms/Core/Context.h>
#include <MicroCsms/Model/Model.h>
#include <MicroCsms/Model/ChargePoint/Charger.h>
#include <MicroCsms/Debug.h>

using namespace MicroCsms;

Heartbeat::Heartbeat(Context& context, Model& model, const char *chargePointId) : context(context), model(model), chargePointId(chargePointId) {

}

const char* Heartbeat::getOperationType(){
    return "Heartbeat";
}

void Heartbeat::processReq(JsonObject payload) {

    MC_DBG_DEBUG("Heartbeat from %s", chargePointId.c_str());

    auto chargerStore = model.getChargerStore();

    Charger charger;
    if (!chargerStore || !chargerStore->get(chargePointId.c_str(), charger)) {
        MC_DBG_WARN("charger %s not found", chargePointId.c_str());
        return;
    }

    charger.lastHeartbeat = context.getClock().now();
    if (!chargerStore->update(charger)) {
        MC_DBG_ERR("could not update heartbeat of %s", chargePointId.c_str());
    }
}

std::unique_ptr<JsonDoc> Heartbeat::createConf(){
    auto doc = makeJsonDoc(JSON_OBJECT_SIZE(1) + MC_JSONDATE_SIZE);
    JsonObject payload = doc->to<JsonObject>();

    char currentTime [MC_JSONDATE_SIZE] = {'\0'};
    context.getClock().toJsonString(context.getClock().now(), currentTime, sizeof(currentTime));
    payload["currentTime"] = currentTime;
    return doc;
}
