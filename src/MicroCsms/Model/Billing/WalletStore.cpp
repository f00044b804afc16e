// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <chrono>

#include <MicroCsms/Model/Billing/WalletStore.h>
#include <MicroCsms/Debug.h>

namespace MicroCsms {
const char *serializeWalletTxType(WalletTxType type) {
    switch (type) {
        case WalletTxType::TopUp:
            return "TOP_UP";
        case WalletTxType::ChargeDeduct:
            return "CHARGE_DEDUCT";
    }
    return "_Undefined";
}
} //namespace MicroCsms

using namespace MicroCsms;

WalletLock::WalletLock(WalletStore& store, int walletId, unsigned long timeoutMs) : store(store), walletId(walletId) {
    locked = store.lock(walletId, timeoutMs);
}

WalletLock::~WalletLock() {
    if (locked) {
        store.unlock(walletId);
    }
}

int VolatileWalletStore::add(int userId, int64_t balance, bool balanceDefined) {
    std::lock_guard<std::mutex> lock(mutex);
    for (auto& entry : wallets) {
        if (entry.second.userId == userId) {
            MC_DBG_ERR("user %i already has a wallet", userId);
            return 0;
        }
    }
    Wallet wallet;
    wallet.id = nextWalletId++;
    wallet.userId = userId;
    wallet.balance = balance;
    wallet.balanceDefined = balanceDefined;
    wallets[wallet.id] = wallet;
    return wallet.id;
}

void VolatileWalletStore::setFailCommits(bool failCommits) {
    std::lock_guard<std::mutex> lock(mutex);
    this->failCommits = failCommits;
}

bool VolatileWalletStore::getByUser(int userId, Wallet& out) {
    std::lock_guard<std::mutex> lock(mutex);
    for (auto& entry : wallets) {
        if (entry.second.userId == userId) {
            out = entry.second;
            return true;
        }
    }
    return false;
}

bool VolatileWalletStore::lock(int walletId, unsigned long timeoutMs) {
    std::unique_lock<std::mutex> lock(mutex);
    if (wallets.find(walletId) == wallets.end()) {
        return false;
    }
    bool acquired = lockCv.wait_for(lock, std::chrono::milliseconds(timeoutMs), [this, walletId] () {
        return lockedWallets.find(walletId) == lockedWallets.end();
    });
    if (!acquired) {
        MC_DBG_WARN("wallet %i lock timeout", walletId);
        return false;
    }
    lockedWallets.insert(walletId);
    return true;
}

void VolatileWalletStore::unlock(int walletId) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        lockedWallets.erase(walletId);
    }
    lockCv.notify_all();
}

bool VolatileWalletStore::get(int walletId, Wallet& out) {
    std::lock_guard<std::mutex> lock(mutex);
    auto entry = wallets.find(walletId);
    if (entry == wallets.end()) {
        return false;
    }
    out = entry->second;
    return true;
}

bool VolatileWalletStore::hasChargeDeduction(int chargingTransactionId, bool& exists) {
    std::lock_guard<std::mutex> lock(mutex);
    exists = false;
    for (auto& booking : bookings) {
        if (booking.type == WalletTxType::ChargeDeduct && booking.chargingTransactionId == chargingTransactionId) {
            exists = true;
            break;
        }
    }
    return true;
}

bool VolatileWalletStore::commitBooking(const Wallet& updated, const WalletTransaction& booking) {
    std::lock_guard<std::mutex> lock(mutex);
    if (failCommits) {
        MC_DBG_ERR("wallet store unavailable");
        return false;
    }
    auto entry = wallets.find(updated.id);
    if (entry == wallets.end() || booking.walletId != updated.id) {
        MC_DBG_ERR("wallet %i not found", updated.id);
        return false;
    }
    entry->second = updated;
    bookings.push_back(booking);
    bookings.back().id = nextBookingId++;
    return true;
}

std::vector<WalletTransaction> VolatileWalletStore::getBookings(int walletId) {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<WalletTransaction> res;
    for (auto& booking : bookings) {
        if (booking.walletId == walletId) {
            res.push_back(booking);
        }
    }
    return res;
}
