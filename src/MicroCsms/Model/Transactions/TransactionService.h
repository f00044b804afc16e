// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_TRANSACTIONSERVICE_H
#define MC_TRANSACTIONSERVICE_H

#include <MicroCsms/Model/Transactions/Transaction.h>
#include <MicroCsms/Model/ChargePoint/Charger.h>
#include <MicroCsms/Model/Billing/BillingService.h>

namespace MicroCsms {

class Clock;
class ChargerStore;
class UserStore;
class TransactionStore;

//idTagInfo.status of the StartTransaction / StopTransaction reply
enum class AuthorizationStatus : uint8_t {
    Accepted,
    Blocked,
    Expired,
    Invalid,
    ConcurrentTx
};

const char *serializeAuthorizationStatus(AuthorizationStatus status);

struct StartTxResult {
    AuthorizationStatus status = AuthorizationStatus::Invalid;
    int transactionId = 0; //0 if not accepted
};

/*
 * Lifecycle of charging transactions as reported by the chargers. Billing is delegated to the
 * BillingService
 */
class TransactionService {
private:
    Clock& clock;
    ChargerStore& chargerStore;
    UserStore& userStore;
    TransactionStore& transactionStore;
    BillingService& billingService;
public:
    TransactionService(Clock& clock, ChargerStore& chargerStore, UserStore& userStore, TransactionStore& transactionStore, BillingService& billingService);

    /*
     * Resolves the idTag and creates a RUNNING transaction. Rejects the start if the charger already
     * has an active transaction
     */
    StartTxResult startTransaction(const char *chargePointId, int connectorId, const char *idTag, int32_t meterStartWh, const Timestamp& timestamp);

    /*
     * Records the end values and completes the transaction. Stopping an already stopped transaction is
     * accepted without changing it. Returns Invalid if the transaction is unknown. `billingDue` is set if
     * this call stopped the transaction
     */
    AuthorizationStatus stopTransaction(int transactionId, int32_t meterStopWh, const char *reason, bool& billingDue);

    BillingResult billTransaction(int transactionId);

    /*
     * Stores the meter value if its transaction exists
     */
    bool addMeterValue(const MeterValue& meterValue);

    /*
     * Fails the ongoing transactions of the charger after it reported a non-charging status. The end
     * meter is taken from the latest meter value. Failed transactions with consumed energy are billed.
     * Returns the number of failed transactions
     */
    unsigned int failOngoingTransactions(int chargerId, ChargePointStatus status);

    bool findActive(int chargerId, Transaction& out);
};

} //namespace MicroCsms

#endif
