// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroCsms/Operations/RemoteStartTransaction.h>
#include <MicroCsms/Debug.h>

using namespace MicroCsms;

RemoteStartTransaction::RemoteStartTransaction(int connectorId, const char *idTag) : connectorId(connectorId), idTag(idTag ? idTag : "") {

}

const char* RemoteStartTransaction::getOperationType() {
    return "RemoteStartTransaction";
}

std::unique_ptr<JsonDoc> RemoteStartTransaction::createReq() {
    auto doc = makeJsonDoc(JSON_OBJECT_SIZE(2));
    JsonObject payload = doc->to<JsonObject>();
    if (connectorId > 0) {
        payload["connectorId"] = connectorId;
    }
    payload["idTag"] = idTag.c_str();
    return doc;
}

void RemoteStartTransaction::processConf(JsonObject payload) {
    status = deserializeRemoteStatus(payload["status"] | "_Undefined");
    if (status == RemoteStatus::ERR_INTERNAL) {
        MC_DBG_WARN("invalid RemoteStartTransaction.conf");
    }
}
