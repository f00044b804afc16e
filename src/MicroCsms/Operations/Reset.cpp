// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroCsms/Operations/Reset.h>
#include <MicroCsms/Debug.h>

using namespace MicroCsms;

Reset::Reset(ResetType type) : type(type) {

}

const char* Reset::getOperationType() {
    return "Reset";
}

std::unique_ptr<JsonDoc> Reset::createReq() {
    auto doc = makeJsonDoc(JSON_OBJECT_SIZE(1));
    JsonObject payload = doc->to<JsonObject>();
    payload["type"] = serializeResetType(type);
    return doc;
}

void Reset::processConf(JsonObject payload) {
    status = deserializeRemoteStatus(payload["status"] | "_Undefined");
    if (status == RemoteStatus::ERR_INTERNAL) {
        MC_DBG_WARN("invalid Reset.conf");
    }
}
