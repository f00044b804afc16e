// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroCsms/Operations/StopTransaction.h>
#include <MicroCsms/Model/Model.h>
#include <MicroCsms/Debug.h>

using namespace MicroCsms;

StopTransaction::StopTransaction(Model& model, const char *chargePointId) : model(model), chargePointId(chargePointId) {

}

const char* StopTransaction::getOperationType() {
    return "StopTransaction";
}

void StopTransaction::processReq(JsonObject payload) {

    if (!payload.containsKey("transactionId") || !payload.containsKey("meterStop")) {
        errorCode = "FormationViolation";
        return;
    }

    if (!payload["meterStop"].is<int32_t>() || payload["meterStop"].as<int32_t>() < 0) {
        MC_DBG_WARN("meterStop out of range");
        errorCode = "PropertyConstraintViolation";
        return;
    }

    transactionId = payload["transactionId"] | -1;
    int32_t meterStop = payload["meterStop"] | (int32_t) 0;
    const char *reason = payload["reason"] | ""; //empty means default reason

    MC_DBG_INFO("StopTransaction from %s: transactionId=%i, meterStop=%i", chargePointId.c_str(), transactionId, meterStop);

    auto transactionService = model.getTransactionService();
    if (!transactionService) {
        errorCode = "InternalError";
        return;
    }

    status = transactionService->stopTransaction(transactionId, meterStop, reason, billingDue);
}

std::unique_ptr<JsonDoc> StopTransaction::createConf() {
    auto doc = makeJsonDoc(JSON_OBJECT_SIZE(1) + JSON_OBJECT_SIZE(1));
    JsonObject payload = doc->to<JsonObject>();
    JsonObject idTagInfo = payload.createNestedObject("idTagInfo");
    idTagInfo["status"] = serializeAuthorizationStatus(status);
    return doc;
}

void StopTransaction::onConfSent() {
    if (!billingDue) {
        return;
    }
    if (auto transactionService = model.getTransactionService()) {
        transactionService->billTransaction(transactionId);
    }
}
