// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroCsms/Operations/StatusNotification.h>
#include <MicroCsms/Core/Context.h>
#include <MicroCsms/Model/Model.h>
#include <MicroCsms/Model/ChargePoint/Charger.h>
#include <MicroCsms/Model/Transactions/TransactionService.h>
#include <MicroCsms/Debug.h>

using namespace MicroCsms;

StatusNotification::StatusNotification(Context& context, Model& model, const char *chargePointId) : context(context), model(model), chargePointId(chargePointId) {

}

const char* StatusNotification::getOperationType(){
    return "StatusNotification";
}

void StatusNotification::processReq(JsonObject payload) {

    int connectorId = payload["connectorId"] | -1;
    const char *statusCstr = payload["status"] | "_Undefined";
    const char *errorCode = payload["errorCode"] | "NoError";

    MC_DBG_INFO("StatusNotification from %s: connectorId=%i, status=%s, errorCode=%s", chargePointId.c_str(), connectorId, statusCstr, errorCode);

    //the charge point gets its confirmation in any case, otherwise it would repeat the notification

    ChargePointStatus status;
    if (!deserializeChargePointStatus(statusCstr, status)) {
        MC_DBG_WARN("invalid status %s. Ignore", statusCstr);
        return;
    }

    auto chargerStore = model.getChargerStore();

    Charger charger;
    if (!chargerStore || !chargerStore->get(chargePointId.c_str(), charger)) {
        MC_DBG_WARN("charger %s not found", chargePointId.c_str());
        return;
    }

    charger.status = status;
    charger.lastHeartbeat = context.getClock().now();
    if (!chargerStore->update(charger)) {
        MC_DBG_ERR("could not update status of %s", chargePointId.c_str());
    }

    if (!isChargingStatus(status)) {
        auto transactionService = model.getTransactionService();
        if (transactionService) {
            auto n = transactionService->failOngoingTransactions(charger.id, status);
            if (n > 0) {
                MC_DBG_INFO("failed %u ongoing transactions of %s", n, chargePointId.c_str());
            }
        }
    }
}

std::unique_ptr<JsonDoc> StatusNotification::createConf(){
    return createEmptyDocument();
}
