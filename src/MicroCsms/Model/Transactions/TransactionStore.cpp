// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroCsms/Model/Transactions/TransactionStore.h>
#include <MicroCsms/Debug.h>

using namespace MicroCsms;

TxCreateResult VolatileTransactionStore::create(Transaction& tx) {
    std::lock_guard<std::mutex> lock(mutex);

    if (isActiveStatus(tx.status)) {
        for (auto& entry : transactions) {
            if (entry.second.chargerId == tx.chargerId && isActiveStatus(entry.second.status)) {
                MC_DBG_WARN("charger %i already has active transaction %i", tx.chargerId, entry.first);
                return TxCreateResult::ConcurrentTx;
            }
        }
    }

    tx.id = nextId++;
    transactions[tx.id] = tx;
    return TxCreateResult::Created;
}

bool VolatileTransactionStore::get(int transactionId, Transaction& out) {
    std::lock_guard<std::mutex> lock(mutex);
    auto entry = transactions.find(transactionId);
    if (entry == transactions.end()) {
        return false;
    }
    out = entry->second;
    return true;
}

bool VolatileTransactionStore::update(const Transaction& tx) {
    std::lock_guard<std::mutex> lock(mutex);
    auto entry = transactions.find(tx.id);
    if (entry == transactions.end()) {
        MC_DBG_ERR("transaction %i not found", tx.id);
        return false;
    }
    entry->second = tx;
    return true;
}

std::vector<Transaction> VolatileTransactionStore::findByCharger(int chargerId) {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<Transaction> res;
    for (auto& entry : transactions) {
        if (entry.second.chargerId == chargerId) {
            res.push_back(entry.second);
        }
    }
    return res;
}

std::vector<Transaction> VolatileTransactionStore::findByStatus(TransactionStatus status) {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<Transaction> res;
    for (auto& entry : transactions) {
        if (entry.second.status == status) {
            res.push_back(entry.second);
        }
    }
    return res;
}

bool VolatileTransactionStore::addMeterValue(const MeterValue& meterValue) {
    std::lock_guard<std::mutex> lock(mutex);
    if (transactions.find(meterValue.transactionId) == transactions.end()) {
        MC_DBG_ERR("transaction %i not found", meterValue.transactionId);
        return false;
    }
    meterValues[meterValue.transactionId].push_back(meterValue);
    return true;
}

std::vector<MeterValue> VolatileTransactionStore::getMeterValues(int transactionId) {
    std::lock_guard<std::mutex> lock(mutex);
    auto entry = meterValues.find(transactionId);
    if (entry == meterValues.end()) {
        return std::vector<MeterValue>();
    }
    return entry->second;
}
