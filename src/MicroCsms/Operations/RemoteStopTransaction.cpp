// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroCsms/Operations/RemoteStopTransaction.h>
#include <MicroCsms/Debug.h>

using namespace MicroCsms;

RemoteStopTransaction::RemoteStopTransaction(int transactionId) : transactionId(transactionId) {

}

const char* RemoteStopTransaction::getOperationType() {
    return "RemoteStopTransaction";
}

std::unique_ptr<JsonDoc> RemoteStopTransaction::createReq() {
    auto doc = makeJsonDoc(JSON_OBJECT_SIZE(1));
    JsonObject payload = doc->to<JsonObject>();
    payload["transactionId"] = transactionId;
    return doc;
}

void RemoteStopTransaction::processConf(JsonObject payload) {
    status = deserializeRemoteStatus(payload["status"] | "_Undefined");
    if (status == RemoteStatus::ERR_INTERNAL) {
        MC_DBG_WARN("invalid RemoteStopTransaction.conf");
    }
}
