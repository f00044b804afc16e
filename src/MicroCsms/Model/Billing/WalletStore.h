// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_WALLETSTORE_H
#define MC_WALLETSTORE_H

#include <condition_variable>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include <stdint.h>

#include <MicroCsms/Core/Time.h>

namespace MicroCsms {

struct Wallet {
    int id = 0;
    int userId = 0;
    int64_t balance = 0; //minor units
    bool balanceDefined = false; //a wallet without balance counts as 0
};

enum class WalletTxType : uint8_t {
    TopUp,
    ChargeDeduct
};

const char *serializeWalletTxType(WalletTxType type);

struct WalletTransaction {
    int id = 0;
    int walletId = 0;
    int64_t amount = 0; //minor units, negative for deductions
    WalletTxType type = WalletTxType::TopUp;
    int chargingTransactionId = 0; //0 if not related to a charging transaction
    std::string description;
    std::string metadata; //serialized JSON object
    Timestamp createdAt;
};

/*
 * Wallets and their booking records. The read-modify-write of a balance happens under the wallet lock,
 * which serializes all bookings of the same wallet across threads.
 */
class WalletStore {
public:
    virtual ~WalletStore() = default;

    virtual bool getByUser(int userId, Wallet& out) = 0;

    /*
     * Acquires the row lock of the wallet. Waits at most `timeoutMs`. Returns false if the lock could
     * not be acquired
     */
    virtual bool lock(int walletId, unsigned long timeoutMs) = 0;
    virtual void unlock(int walletId) = 0;

    /*
     * Reads the wallet. Only valid while holding the lock
     */
    virtual bool get(int walletId, Wallet& out) = 0;

    /*
     * Checks if a deduction for the charging transaction exists. Returns false on store failure and
     * writes the result into `exists` otherwise
     */
    virtual bool hasChargeDeduction(int chargingTransactionId, bool& exists) = 0;

    /*
     * Writes the new balance and inserts the booking in one commit. Either both or nothing is applied
     */
    virtual bool commitBooking(const Wallet& updated, const WalletTransaction& booking) = 0;

    virtual std::vector<WalletTransaction> getBookings(int walletId) = 0;
};

/*
 * RAII holder of the wallet row lock
 */
class WalletLock {
private:
    WalletStore& store;
    int walletId;
    bool locked = false;
public:
    WalletLock(WalletStore& store, int walletId, unsigned long timeoutMs);
    ~WalletLock();

    bool isLocked() const {return locked;}
};

class VolatileWalletStore : public WalletStore {
private:
    std::map<int, Wallet> wallets;
    std::vector<WalletTransaction> bookings;
    int nextWalletId = 1;
    int nextBookingId = 1;

    std::mutex mutex;
    std::condition_variable lockCv;
    std::set<int> lockedWallets;

    bool failCommits = false;
public:
    /*
     * Creates the wallet of the user. `balanceDefined = false` models a wallet which was never topped up
     */
    int add(int userId, int64_t balance, bool balanceDefined = true);

    void setFailCommits(bool failCommits); //simulate an unavailable store

    bool getByUser(int userId, Wallet& out) override;
    bool lock(int walletId, unsigned long timeoutMs) override;
    void unlock(int walletId) override;
    bool get(int walletId, Wallet& out) override;
    bool hasChargeDeduction(int chargingTransactionId, bool& exists) override;
    bool commitBooking(const Wallet& updated, const WalletTransaction& booking) override;
    std::vector<WalletTransaction> getBookings(int walletId) override;
};

} //namespace MicroCsms

#endif
