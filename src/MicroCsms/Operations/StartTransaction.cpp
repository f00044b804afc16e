// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <string.h>

#include <MicroCsms/Operations/StartTransaction.h>
#include <MicroCsms/Core/Context.h>
#include <MicroCsms/Model/Model.h>
#include <MicroCsms/Model/Authorization/UserStore.h>
#include <MicroCsms/Debug.h>

using namespace MicroCsms;

StartTransaction::StartTransaction(Context& context, Model& model, const char *chargePointId) : context(context), model(model), chargePointId(chargePointId) {

}

const char* StartTransaction::getOperationType() {
    return "StartTransaction";
}

void StartTransaction::processReq(JsonObject payload) {

    if (!payload.containsKey("connectorId") || !payload.containsKey("idTag") || !payload.containsKey("meterStart")) {
        errorCode = "FormationViolation";
        return;
    }

    if (!payload["meterStart"].is<int32_t>() || payload["meterStart"].as<int32_t>() < 0) {
        MC_DBG_WARN("meterStart out of range");
        errorCode = "PropertyConstraintViolation";
        return;
    }

    int connectorId = payload["connectorId"] | -1;
    const char *idTag = payload["idTag"] | "";
    int32_t meterStart = payload["meterStart"] | (int32_t) 0;

    MC_DBG_INFO("StartTransaction from %s: connectorId=%i, idTag=%s, meterStart=%i", chargePointId.c_str(), connectorId, idTag, meterStart);

    if (strnlen(idTag, MC_IDTAG_LEN_MAX + 1) > MC_IDTAG_LEN_MAX) {
        MC_DBG_WARN("idTag too long");
        return; //Invalid
    }

    Timestamp timestamp;
    if (!context.getClock().parseString(payload["timestamp"] | "", timestamp)) {
        MC_DBG_DEBUG("no valid timestamp, take server time");
    }

    auto transactionService = model.getTransactionService();
    if (!transactionService) {
        errorCode = "InternalError";
        return;
    }

    result = transactionService->startTransaction(chargePointId.c_str(), connectorId, idTag, meterStart, timestamp);
}

std::unique_ptr<JsonDoc> StartTransaction::createConf() {
    auto doc = makeJsonDoc(JSON_OBJECT_SIZE(2) + JSON_OBJECT_SIZE(1));
    JsonObject payload = doc->to<JsonObject>();
    payload["transactionId"] = result.transactionId;
    JsonObject idTagInfo = payload.createNestedObject("idTagInfo");
    idTagInfo["status"] = serializeAuthorizationStatus(result.status);
    return doc;
}
