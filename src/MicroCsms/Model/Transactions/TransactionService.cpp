// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <stdint.h>

#include <MicroCsms/Model/Transactions/TransactionService.h>
#include <MicroCsms/Model/Transactions/TransactionStore.h>
#include <MicroCsms/Model/Authorization/UserStore.h>
#include <MicroCsms/Core/Time.h>
#include <MicroCsms/Debug.h>

#define MC_STOPREASON_DEFAULT "Remote"

namespace MicroCsms {
const char *serializeAuthorizationStatus(AuthorizationStatus status) {
    switch (status) {
        case AuthorizationStatus::Accepted:
            return "Accepted";
        case AuthorizationStatus::Blocked:
            return "Blocked";
        case AuthorizationStatus::Expired:
            return "Expired";
        case AuthorizationStatus::Invalid:
            return "Invalid";
        case AuthorizationStatus::ConcurrentTx:
            return "ConcurrentTx";
    }
    return "Invalid";
}
} //namespace MicroCsms

using namespace MicroCsms;

namespace MicroCsms {
namespace TransactionUtils {

//energy between two meter readings in Wh. Returns false if the difference exceeds the int32 range
bool calculateEnergy(int32_t meterStartWh, int32_t meterStopWh, int32_t& energyWh) {
    int64_t energy = (int64_t) meterStopWh - (int64_t) meterStartWh;
    if (energy < INT32_MIN || energy > INT32_MAX) {
        return false;
    }
    energyWh = (int32_t) energy;
    return true;
}

} //namespace TransactionUtils
} //namespace MicroCsms

TransactionService::TransactionService(Clock& clock, ChargerStore& chargerStore, UserStore& userStore, TransactionStore& transactionStore, BillingService& billingService) :
        clock(clock), chargerStore(chargerStore), userStore(userStore), transactionStore(transactionStore), billingService(billingService) {

}

StartTxResult TransactionService::startTransaction(const char *chargePointId, int connectorId, const char *idTag, int32_t meterStartWh, const Timestamp& timestamp) {

    StartTxResult res;

    Charger charger;
    if (!chargerStore.get(chargePointId, charger)) {
        MC_DBG_ERR("charger %s not found", chargePointId);
        return res;
    }

    User user;
    if (!idTag || !userStore.getByIdTag(idTag, user)) {
        MC_DBG_WARN("unknown idTag %s", idTag ? idTag : "(null)");
        return res;
    }

    if (!user.active) {
        MC_DBG_WARN("user %i is deactivated", user.id);
        res.status = AuthorizationStatus::Blocked;
        return res;
    }

    Transaction tx;
    tx.userId = user.id;
    tx.chargerId = charger.id;
    tx.connectorId = connectorId;
    tx.idTag = idTag;
    tx.startMeterWh = meterStartWh;
    tx.startTime = timestamp.isDefined() ? timestamp : clock.now();
    tx.updatedAt = clock.now();
    tx.status = TransactionStatus::Running;

    switch (transactionStore.create(tx)) {
        case TxCreateResult::Created:
            break;
        case TxCreateResult::ConcurrentTx:
            res.status = AuthorizationStatus::ConcurrentTx;
            return res;
        case TxCreateResult::StoreFailure:
            MC_DBG_ERR("could not create transaction for %s", chargePointId);
            return res;
    }

    MC_DBG_INFO("created transaction %i for charger %s", tx.id, chargePointId);

    res.status = AuthorizationStatus::Accepted;
    res.transactionId = tx.id;
    return res;
}

AuthorizationStatus TransactionService::stopTransaction(int transactionId, int32_t meterStopWh, const char *reason, bool& billingDue) {

    billingDue = false;

    Transaction tx;
    if (!transactionStore.get(transactionId, tx)) {
        MC_DBG_ERR("transaction %i not found", transactionId);
        return AuthorizationStatus::Invalid;
    }

    if (!isOngoingStatus(tx.status)) {
        MC_DBG_INFO("transaction %i already %s", transactionId, serializeTransactionStatus(tx.status));
        return AuthorizationStatus::Accepted;
    }

    tx.endMeterWh = meterStopWh;
    tx.endMeterDefined = true;
    tx.energyDefined = TransactionUtils::calculateEnergy(tx.startMeterWh, meterStopWh, tx.energyConsumedWh);
    if (!tx.energyDefined) {
        MC_DBG_ERR("transaction %i: meter readings %i .. %i out of range", transactionId, tx.startMeterWh, meterStopWh);
    }
    tx.endTime = clock.now();
    tx.updatedAt = tx.endTime;
    tx.stopReason = reason && *reason ? reason : MC_STOPREASON_DEFAULT;
    tx.status = TransactionStatus::Completed;

    if (!transactionStore.update(tx)) {
        MC_DBG_ERR("could not stop transaction %i", transactionId);
        return AuthorizationStatus::Invalid;
    }

    MC_DBG_INFO("stopped transaction %i: %i Wh consumed", transactionId, tx.energyConsumedWh);
    billingDue = true;
    return AuthorizationStatus::Accepted;
}

BillingResult TransactionService::billTransaction(int transactionId) {
    auto res = billingService.processTransactionBilling(transactionId);
    if (res.isSuccess()) {
        MC_DBG_INFO("billing of transaction %i: %s", transactionId, serializeBillingStatus(res.status));
    } else {
        MC_DBG_WARN("billing of transaction %i failed: %s", transactionId, serializeBillingStatus(res.status));
    }
    return res;
}

bool TransactionService::addMeterValue(const MeterValue& meterValue) {
    Transaction tx;
    if (!transactionStore.get(meterValue.transactionId, tx)) {
        MC_DBG_WARN("transaction %i not found, discard meter value", meterValue.transactionId);
        return false;
    }
    return transactionStore.addMeterValue(meterValue);
}

unsigned int TransactionService::failOngoingTransactions(int chargerId, ChargePointStatus status) {

    unsigned int count = 0;

    auto transactions = transactionStore.findByCharger(chargerId);
    for (auto& tx : transactions) {
        if (!isOngoingStatus(tx.status)) {
            continue;
        }

        if (!tx.endMeterDefined) {
            auto meterValues = transactionStore.getMeterValues(tx.id);
            if (!meterValues.empty()) {
                tx.endMeterWh = meterValues.back().energyWh;
                tx.endMeterDefined = true;
                tx.energyDefined = TransactionUtils::calculateEnergy(tx.startMeterWh, tx.endMeterWh, tx.energyConsumedWh);
            } else {
                MC_DBG_WARN("no meter values for transaction %i, cannot calculate energy", tx.id);
            }
        }

        tx.stopReason = "STATUS_CHANGE_TO_";
        tx.stopReason += serializeChargePointStatus(status);
        tx.status = TransactionStatus::Failed;
        tx.endTime = clock.now();
        tx.updatedAt = tx.endTime;

        if (!transactionStore.update(tx)) {
            MC_DBG_ERR("could not fail transaction %i", tx.id);
            continue;
        }
        count++;

        MC_DBG_INFO("transaction %i failed due to status change to %s", tx.id, serializeChargePointStatus(status));

        if (tx.energyDefined && tx.energyConsumedWh > 0) {
            billTransaction(tx.id);
        } else {
            MC_DBG_WARN("cannot bill failed transaction %i, no energy consumed", tx.id);
        }
    }

    return count;
}

bool TransactionService::findActive(int chargerId, Transaction& out) {
    auto transactions = transactionStore.findByCharger(chargerId);
    for (auto& tx : transactions) {
        if (isActiveStatus(tx.status)) {
            out = tx;
            return true;
        }
    }
    return false;
}
