// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroCsms/Operations/ChangeAvailability.h>
#include <MicroCsms/Debug.h>

using namespace MicroCsms;

ChangeAvailability::ChangeAvailability(int connectorId, AvailabilityType type) : connectorId(connectorId), type(type) {

}

const char* ChangeAvailability::getOperationType() {
    return "ChangeAvailability";
}

std::unique_ptr<JsonDoc> ChangeAvailability::createReq() {
    auto doc = makeJsonDoc(JSON_OBJECT_SIZE(2));
    JsonObject payload = doc->to<JsonObject>();
    payload["connectorId"] = connectorId;
    payload["type"] = serializeAvailabilityType(type);
    return doc;
}

void ChangeAvailability::processConf(JsonObject payload) {
    status = deserializeRemoteStatus(payload["status"] | "_Undefined");
    if (status == RemoteStatus::ERR_INTERNAL) {
        MC_DBG_WARN("invalid ChangeAvailability.conf");
    }
}
