// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <stdio.h>

#include <MicroCsms/Model/Billing/BillingService.h>
#include <MicroCsms/Model/Billing/BillingUtils.h>
#include <MicroCsms/Model/Billing/TariffStore.h>
#include <MicroCsms/Model/Billing/WalletStore.h>
#include <MicroCsms/Model/Transactions/TransactionStore.h>
#include <MicroCsms/Core/Configuration.h>
#include <MicroCsms/Core/Json.h>
#include <MicroCsms/Core/Time.h>
#include <MicroCsms/Debug.h>

#define MC_WALLETLOCK_TIMEOUT_DEFAULT 5000 //in ms

namespace MicroCsms {
const char *serializeBillingStatus(BillingStatus status) {
    switch (status) {
        case BillingStatus::Billed:
            return "Billed";
        case BillingStatus::NothingToBill:
            return "NothingToBill";
        case BillingStatus::AlreadyBilled:
            return "AlreadyBilled";
        case BillingStatus::NoTariffConfigured:
            return "NoTariffConfigured";
        case BillingStatus::WalletNotFound:
            return "WalletNotFound";
        case BillingStatus::LockFailure:
            return "LockFailure";
        case BillingStatus::StoreFailure:
            return "StoreFailure";
        case BillingStatus::TransactionNotFound:
            return "TransactionNotFound";
        case BillingStatus::IllegalState:
            return "IllegalState";
    }
    return "_Undefined";
}
} //namespace MicroCsms

using namespace MicroCsms;

BillingService::BillingService(Clock& clock, ConfigurationService& configuration, TransactionStore& transactionStore, TariffStore& tariffStore, WalletStore& walletStore) :
        clock(clock), transactionStore(transactionStore), tariffStore(tariffStore), walletStore(walletStore) {

    walletLockTimeoutInt = configuration.declareConfiguration<int>("WalletLockTimeout", MC_WALLETLOCK_TIMEOUT_DEFAULT);
    configuration.registerValidator("WalletLockTimeout", VALIDATE_UNSIGNED_INT);
}

void BillingService::markBillingFailed(int transactionId, BillingStatus reason) {
    Transaction tx;
    if (!transactionStore.get(transactionId, tx)) {
        MC_DBG_ERR("transaction %i vanished", transactionId);
        return;
    }
    if (tx.status != TransactionStatus::BillingFailed || !tx.billingFailedAt.isDefined()) {
        tx.billingFailedAt = clock.now();
    }
    tx.status = TransactionStatus::BillingFailed;
    tx.updatedAt = clock.now();
    if (!transactionStore.update(tx)) {
        MC_DBG_ERR("could not mark transaction %i as BILLING_FAILED", transactionId);
        return;
    }
    MC_DBG_WARN("billing of transaction %i failed: %s", transactionId, serializeBillingStatus(reason));
}

BillingResult BillingService::bill(Transaction& tx) {

    BillingResult res;

    if (!tx.energyDefined || tx.energyConsumedWh <= 0) {
        MC_DBG_INFO("transaction %i: no energy consumed", tx.id);
        res.status = BillingStatus::NothingToBill;
        return res;
    }

    bool billed = false;
    if (!walletStore.hasChargeDeduction(tx.id, billed)) {
        res.status = BillingStatus::StoreFailure;
        return res;
    }
    if (billed) {
        MC_DBG_INFO("transaction %i already billed", tx.id);
        res.status = BillingStatus::AlreadyBilled;
        return res;
    }

    Tariff tariff;
    if (!tariffStore.getChargerTariff(tx.chargerId, tariff) && !tariffStore.getGlobalTariff(tariff)) {
        MC_DBG_ERR("no tariff configuration found for charger %i", tx.chargerId);
        res.status = BillingStatus::NoTariffConfigured;
        return res;
    }

    int64_t amount = BillingUtils::calculateAmount(tx.energyConsumedWh, tariff.rateE4);
    if (amount <= 0) {
        MC_DBG_INFO("transaction %i: amount is 0", tx.id);
        res.status = BillingStatus::NothingToBill;
        return res;
    }

    Wallet wallet;
    if (!walletStore.getByUser(tx.userId, wallet)) {
        MC_DBG_ERR("no wallet found for user %i", tx.userId);
        res.status = BillingStatus::WalletNotFound;
        return res;
    }

    int lockTimeout = walletLockTimeoutInt ? walletLockTimeoutInt->getInt() : MC_WALLETLOCK_TIMEOUT_DEFAULT;
    if (lockTimeout < 0) {
        lockTimeout = 0;
    }

    WalletLock walletLock {walletStore, wallet.id, (unsigned long) lockTimeout};
    if (!walletLock.isLocked()) {
        res.status = BillingStatus::LockFailure;
        return res;
    }

    //another thread may have billed the transaction while waiting for the lock
    if (!walletStore.hasChargeDeduction(tx.id, billed)) {
        res.status = BillingStatus::StoreFailure;
        return res;
    }
    if (billed) {
        MC_DBG_INFO("transaction %i already billed", tx.id);
        res.status = BillingStatus::AlreadyBilled;
        return res;
    }

    if (!walletStore.get(wallet.id, wallet)) {
        res.status = BillingStatus::StoreFailure;
        return res;
    }

    int64_t previousBalance = wallet.balanceDefined ? wallet.balance : 0;
    int64_t newBalance = previousBalance - amount; //may become negative

    char energyStr [24], rateStr [24], amountStr [24], previousBalanceStr [24], newBalanceStr [24];
    BillingUtils::printDecimal(energyStr, sizeof(energyStr), tx.energyConsumedWh, 3);
    BillingUtils::printDecimal(rateStr, sizeof(rateStr), tariff.rateE4, 4);
    BillingUtils::printDecimal(amountStr, sizeof(amountStr), amount, 2);
    BillingUtils::printDecimal(previousBalanceStr, sizeof(previousBalanceStr), previousBalance, 2);
    BillingUtils::printDecimal(newBalanceStr, sizeof(newBalanceStr), newBalance, 2);

    WalletTransaction booking;
    booking.walletId = wallet.id;
    booking.amount = -amount;
    booking.type = WalletTxType::ChargeDeduct;
    booking.chargingTransactionId = tx.id;
    booking.createdAt = clock.now();

    char description [96];
    snprintf(description, sizeof(description), "Charging session - %s kWh @ %s/kWh", energyStr, rateStr);
    booking.description = description;

    auto metadata = initJsonDoc(JSON_OBJECT_SIZE(5));
    metadata["energy_consumed_kwh"] = (const char*) energyStr;
    metadata["rate_per_kwh"] = (const char*) rateStr;
    metadata["calculated_amount"] = (const char*) amountStr;
    metadata["previous_balance"] = (const char*) previousBalanceStr;
    metadata["new_balance"] = (const char*) newBalanceStr;
    serializeJson(metadata, booking.metadata);

    wallet.balance = newBalance;
    wallet.balanceDefined = true;

    if (!walletStore.commitBooking(wallet, booking)) {
        res.status = BillingStatus::StoreFailure;
        return res;
    }

    MC_DBG_INFO("billed transaction %i: %s (balance %s -> %s)", tx.id, amountStr, previousBalanceStr, newBalanceStr);

    res.status = BillingStatus::Billed;
    res.amount = amount;
    return res;
}

BillingResult BillingService::processTransactionBilling(int transactionId) {

    Transaction tx;
    if (!transactionStore.get(transactionId, tx)) {
        MC_DBG_ERR("transaction %i not found", transactionId);
        BillingResult res;
        res.status = BillingStatus::TransactionNotFound;
        return res;
    }

    auto res = bill(tx);

    if (!res.isSuccess()) {
        markBillingFailed(transactionId, res.status);
    }

    return res;
}

BillingResult BillingService::retryFailedBilling(int transactionId) {

    Transaction tx;
    if (!transactionStore.get(transactionId, tx)) {
        MC_DBG_ERR("transaction %i not found", transactionId);
        BillingResult res;
        res.status = BillingStatus::TransactionNotFound;
        return res;
    }

    if (tx.status != TransactionStatus::BillingFailed) {
        MC_DBG_WARN("transaction %i is %s, not BILLING_FAILED", transactionId, serializeTransactionStatus(tx.status));
        BillingResult res;
        res.status = BillingStatus::IllegalState;
        return res;
    }

    auto res = bill(tx);

    if (!res.isSuccess()) {
        markBillingFailed(transactionId, res.status);
        return res;
    }

    if (!transactionStore.get(transactionId, tx)) {
        res.status = BillingStatus::StoreFailure;
        return res;
    }
    tx.status = TransactionStatus::Completed;
    tx.updatedAt = clock.now();
    if (!transactionStore.update(tx)) {
        MC_DBG_ERR("billed transaction %i, but could not complete it", transactionId);
        res.status = BillingStatus::StoreFailure;
        return res;
    }

    MC_DBG_INFO("retry of transaction %i succeeded", transactionId);
    return res;
}
