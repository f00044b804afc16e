// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_BILLINGSERVICE_H
#define MC_BILLINGSERVICE_H

#include <memory>
#include <stdint.h>

namespace MicroCsms {

class Clock;
class ConfigurationService;
class Configuration;
class TransactionStore;
class TariffStore;
class WalletStore;
struct Transaction;

enum class BillingStatus : uint8_t {
    Billed,
    NothingToBill,      //no energy consumed or zero amount
    AlreadyBilled,      //the wallet has already been charged for the transaction
    NoTariffConfigured,
    WalletNotFound,
    LockFailure,
    StoreFailure,
    TransactionNotFound,
    IllegalState        //retry of a transaction which is not in BILLING_FAILED
};

const char *serializeBillingStatus(BillingStatus status);

struct BillingResult {
    BillingStatus status = BillingStatus::StoreFailure;
    int64_t amount = 0; //minor units which have been deducted

    bool isSuccess() const {
        return status == BillingStatus::Billed ||
               status == BillingStatus::NothingToBill ||
               status == BillingStatus::AlreadyBilled;
    }
};

/*
 * Charges the wallet of the user for the energy of a stopped transaction. Billing is idempotent: each
 * transaction results in at most one CHARGE_DEDUCT booking. If billing fails, the transaction goes to
 * BILLING_FAILED and the retry sweep picks it up later.
 */
class BillingService {
private:
    Clock& clock;
    TransactionStore& transactionStore;
    TariffStore& tariffStore;
    WalletStore& walletStore;

    std::shared_ptr<Configuration> walletLockTimeoutInt;

    BillingResult bill(Transaction& tx);
    void markBillingFailed(int transactionId, BillingStatus reason);
public:
    BillingService(Clock& clock, ConfigurationService& configuration, TransactionStore& transactionStore, TariffStore& tariffStore, WalletStore& walletStore);

    BillingResult processTransactionBilling(int transactionId);

    /*
     * Re-runs billing for a transaction in BILLING_FAILED. On success, the transaction becomes COMPLETED
     */
    BillingResult retryFailedBilling(int transactionId);
};

} //namespace MicroCsms

#endif
