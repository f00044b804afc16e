// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_TRANSACTIONSTORE_H
#define MC_TRANSACTIONSTORE_H

#include <map>
#include <mutex>
#include <vector>

#include <MicroCsms/Model/Transactions/Transaction.h>

namespace MicroCsms {

enum class TxCreateResult : uint8_t {
    Created,
    ConcurrentTx, //the charger already has an active transaction
    StoreFailure
};

class TransactionStore {
public:
    virtual ~TransactionStore() = default;

    /*
     * Inserts `tx` and assigns its id. Atomically checks that the charger has no other active transaction
     */
    virtual TxCreateResult create(Transaction& tx) = 0;

    virtual bool get(int transactionId, Transaction& out) = 0;
    virtual bool update(const Transaction& tx) = 0;

    virtual std::vector<Transaction> findByCharger(int chargerId) = 0;
    virtual std::vector<Transaction> findByStatus(TransactionStatus status) = 0;

    virtual bool addMeterValue(const MeterValue& meterValue) = 0;
    virtual std::vector<MeterValue> getMeterValues(int transactionId) = 0;
};

class VolatileTransactionStore : public TransactionStore {
private:
    std::map<int, Transaction> transactions;
    std::map<int, std::vector<MeterValue>> meterValues;
    int nextId = 1;
    std::mutex mutex;
public:
    TxCreateResult create(Transaction& tx) override;

    bool get(int transactionId, Transaction& out) override;
    bool update(const Transaction& tx) override;

    std::vector<Transaction> findByCharger(int chargerId) override;
    std::vector<Transaction> findByStatus(TransactionStatus status) override;

    bool addMeterValue(const MeterValue& meterValue) override;
    std::vector<MeterValue> getMeterValues(int transactionId) override;
};

} //namespace MicroCsms

#endif
