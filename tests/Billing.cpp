// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <thread>
#include <string.h>

#include <MicroCsms.h>
#include <MicroCsms/Core/Context.h>
#include <MicroCsms/Model/ChargePoint/Charger.h>
#include <MicroCsms/Model/Authorization/UserStore.h>
#include <MicroCsms/Model/Transactions/TransactionService.h>
#include <MicroCsms/Model/Transactions/TransactionStore.h>
#include <MicroCsms/Model/Billing/BillingUtils.h>
#include <MicroCsms/Model/Billing/BillingService.h>
#include <MicroCsms/Model/Billing/BillingRetrySweep.h>
#include <MicroCsms/Model/Billing/TariffStore.h>
#include <MicroCsms/Model/Billing/WalletStore.h>
#include <MicroCsms/Debug.h>
#include <catch2/catch.hpp>
#include "./helpers/testHelper.h"

using namespace MicroCsms;

TEST_CASE( "Billing utils" ) {
    printf("\nRun %s\n",  "Billing utils");

    SECTION("Amount") {
        REQUIRE( BillingUtils::calculateAmount(10005, 3500) == 350 ); //10.005 kWh x 0.35 = 3.50175
        REQUIRE( BillingUtils::calculateAmount(1000, 3500) == 350 );
        REQUIRE( BillingUtils::calculateAmount(15, 3500) == 1 ); //0.00525 rounds half-up
        REQUIRE( BillingUtils::calculateAmount(14, 3500) == 0 );
        REQUIRE( BillingUtils::calculateAmount(0, 3500) == 0 );
        REQUIRE( BillingUtils::calculateAmount(-500, 3500) == 0 );
        REQUIRE( BillingUtils::calculateAmount(2000000000, 10000) == 200000000 ); //no overflow
    }

    SECTION("Parse decimal") {
        int64_t v;
        REQUIRE( BillingUtils::parseDecimal("0.35", 4, v) );
        REQUIRE( v == 3500 );
        REQUIRE( BillingUtils::parseDecimal("12.5", 2, v) );
        REQUIRE( v == 1250 );
        REQUIRE( BillingUtils::parseDecimal("7", 2, v) );
        REQUIRE( v == 700 );
        REQUIRE( BillingUtils::parseDecimal("1.230", 2, v) );
        REQUIRE( v == 123 );

        REQUIRE( !BillingUtils::parseDecimal("1.234", 2, v) );
        REQUIRE( !BillingUtils::parseDecimal("-1.00", 2, v) );
        REQUIRE( !BillingUtils::parseDecimal("", 2, v) );
        REQUIRE( !BillingUtils::parseDecimal(".5", 2, v) );
        REQUIRE( !BillingUtils::parseDecimal("1.5 EUR", 2, v) );
    }

    SECTION("Print decimal") {
        char buf [24];
        REQUIRE( BillingUtils::printDecimal(buf, sizeof(buf), -350, 2) );
        REQUIRE( !strcmp(buf, "-3.50") );
        REQUIRE( BillingUtils::printDecimal(buf, sizeof(buf), 10005, 3) );
        REQUIRE( !strcmp(buf, "10.005") );
        REQUIRE( BillingUtils::printDecimal(buf, sizeof(buf), 5, 2) );
        REQUIRE( !strcmp(buf, "0.05") );
        REQUIRE( !BillingUtils::printDecimal(buf, 4, 123456, 2) );
    }
}

TEST_CASE( "Transaction billing" ) {
    printf("\nRun %s\n",  "Transaction billing");

    TestSystem sys;
    int chargerId = sys.chargers->add("CP001");
    int userId = sys.users->add("TAG0001");
    sys.wallets->add(userId, 10000); //100.00

    auto& clock = sys.csms.getContext().getClock();
    auto& txService = *sys.csms.getModel().getTransactionService();
    auto& txStore = *sys.csms.getModel().getTransactionStore();
    auto& billingService = *sys.csms.getModel().getBillingService();

    auto runTransaction = [&] (int32_t meterStart, int32_t meterStop) -> int {
        auto start = txService.startTransaction("CP001", 1, "TAG0001", meterStart, clock.now());
        REQUIRE( start.status == AuthorizationStatus::Accepted );
        bool billingDue = false;
        REQUIRE( txService.stopTransaction(start.transactionId, meterStop, "Local", billingDue) == AuthorizationStatus::Accepted );
        REQUIRE( billingDue );
        return start.transactionId;
    };

    auto getBalance = [&] () -> int64_t {
        Wallet wallet;
        REQUIRE( sys.wallets->getByUser(userId, wallet) );
        return wallet.balance;
    };

    auto getStatus = [&] (int txId) -> TransactionStatus {
        Transaction tx;
        REQUIRE( txStore.get(txId, tx) );
        return tx.status;
    };

    SECTION("Deduction from the wallet") {
        sys.tariffs->setGlobalTariff(3500);

        int txId = runTransaction(1000, 11005);
        auto res = txService.billTransaction(txId);

        REQUIRE( res.status == BillingStatus::Billed );
        REQUIRE( res.amount == 350 );
        REQUIRE( getBalance() == 9650 );
        REQUIRE( getStatus(txId) == TransactionStatus::Completed );

        Wallet wallet;
        REQUIRE( sys.wallets->getByUser(userId, wallet) );
        auto bookings = sys.wallets->getBookings(wallet.id);
        REQUIRE( bookings.size() == 1 );
        REQUIRE( bookings[0].amount == -350 );
        REQUIRE( bookings[0].type == WalletTxType::ChargeDeduct );
        REQUIRE( bookings[0].chargingTransactionId == txId );
        REQUIRE( bookings[0].description == "Charging session - 10.005 kWh @ 0.3500/kWh" );

        auto metadata = initJsonDoc(JSON_OBJECT_SIZE(5) + 128);
        REQUIRE( !deserializeJson(metadata, bookings[0].metadata) );
        REQUIRE( !strcmp(metadata["energy_consumed_kwh"] | "", "10.005") );
        REQUIRE( !strcmp(metadata["calculated_amount"] | "", "3.50") );
        REQUIRE( !strcmp(metadata["previous_balance"] | "", "100.00") );
        REQUIRE( !strcmp(metadata["new_balance"] | "", "96.50") );
    }

    SECTION("Billing is idempotent") {
        sys.tariffs->setGlobalTariff(3500);

        int txId = runTransaction(1000, 11005);
        REQUIRE( txService.billTransaction(txId).status == BillingStatus::Billed );
        REQUIRE( txService.billTransaction(txId).status == BillingStatus::AlreadyBilled );
        REQUIRE( getBalance() == 9650 );

        //stopping again doesn't trigger billing
        bool billingDue = true;
        REQUIRE( txService.stopTransaction(txId, 20000, "Local", billingDue) == AuthorizationStatus::Accepted );
        REQUIRE( !billingDue );
    }

    SECTION("Concurrent billing of the same transaction") {
        sys.tariffs->setGlobalTariff(3500);

        int txId = runTransaction(1000, 11005);

        BillingResult res1, res2;
        std::thread t1 ([&] () {res1 = billingService.processTransactionBilling(txId);});
        std::thread t2 ([&] () {res2 = billingService.processTransactionBilling(txId);});
        t1.join();
        t2.join();

        REQUIRE( res1.isSuccess() );
        REQUIRE( res2.isSuccess() );
        REQUIRE( (res1.status == BillingStatus::Billed) != (res2.status == BillingStatus::Billed) );
        REQUIRE( getBalance() == 9650 );
    }

    SECTION("Charger tariff takes precedence") {
        sys.tariffs->setGlobalTariff(3500);
        sys.tariffs->setChargerTariff(chargerId, 2900);

        int txId = runTransaction(0, 10005);
        auto res = txService.billTransaction(txId);
        REQUIRE( res.status == BillingStatus::Billed );
        REQUIRE( res.amount == 290 ); //2.90145
    }

    SECTION("No energy consumed") {
        sys.tariffs->setGlobalTariff(3500);

        int txId = runTransaction(5000, 5000);
        REQUIRE( txService.billTransaction(txId).status == BillingStatus::NothingToBill );
        REQUIRE( getStatus(txId) == TransactionStatus::Completed );
        REQUIRE( getBalance() == 10000 );
    }

    SECTION("Wallet without balance") {
        sys.tariffs->setGlobalTariff(3500);
        int userId2 = sys.users->add("TAG0002");
        sys.wallets->add(userId2, 0, false);

        auto start = txService.startTransaction("CP001", 1, "TAG0002", 0, clock.now());
        bool billingDue;
        txService.stopTransaction(start.transactionId, 1000, "", billingDue);

        REQUIRE( txService.billTransaction(start.transactionId).status == BillingStatus::Billed );

        Wallet wallet;
        REQUIRE( sys.wallets->getByUser(userId2, wallet) );
        REQUIRE( wallet.balanceDefined );
        REQUIRE( wallet.balance == -350 );

        Transaction tx;
        REQUIRE( txStore.get(start.transactionId, tx) );
        REQUIRE( tx.stopReason == "Remote" );
    }

    SECTION("Meter readings beyond the int32 range") {
        sys.tariffs->setGlobalTariff(3500);

        auto start = txService.startTransaction("CP001", 1, "TAG0001", -2000000000, clock.now());
        REQUIRE( start.status == AuthorizationStatus::Accepted );
        bool billingDue = false;
        REQUIRE( txService.stopTransaction(start.transactionId, 2000000000, "Local", billingDue) == AuthorizationStatus::Accepted );

        Transaction tx;
        REQUIRE( txStore.get(start.transactionId, tx) );
        REQUIRE( !tx.energyDefined );

        REQUIRE( txService.billTransaction(start.transactionId).status == BillingStatus::NothingToBill );
        REQUIRE( getBalance() == 10000 );
    }

    SECTION("No wallet") {
        sys.tariffs->setGlobalTariff(3500);
        sys.users->add("TAG0003");

        auto start = txService.startTransaction("CP001", 1, "TAG0003", 0, clock.now());
        bool billingDue;
        txService.stopTransaction(start.transactionId, 1000, "Local", billingDue);

        REQUIRE( txService.billTransaction(start.transactionId).status == BillingStatus::WalletNotFound );
        REQUIRE( getStatus(start.transactionId) == TransactionStatus::BillingFailed );
    }

    SECTION("No tariff, then retry") {
        int txId = runTransaction(1000, 11005);

        REQUIRE( txService.billTransaction(txId).status == BillingStatus::NoTariffConfigured );
        REQUIRE( getStatus(txId) == TransactionStatus::BillingFailed );
        REQUIRE( getBalance() == 10000 );

        sys.tariffs->setGlobalTariff(3500);

        auto res = sys.csms.retryFailedBilling(txId);
        REQUIRE( res.status == BillingStatus::Billed );
        REQUIRE( getStatus(txId) == TransactionStatus::Completed );
        REQUIRE( getBalance() == 9650 );

        //only BILLING_FAILED transactions can be retried
        REQUIRE( sys.csms.retryFailedBilling(txId).status == BillingStatus::IllegalState );
        REQUIRE( sys.csms.retryFailedBilling(9999).status == BillingStatus::TransactionNotFound );
    }

    SECTION("Store failure leaves the wallet unchanged") {
        sys.tariffs->setGlobalTariff(3500);
        sys.wallets->setFailCommits(true);

        int txId = runTransaction(1000, 11005);
        REQUIRE( txService.billTransaction(txId).status == BillingStatus::StoreFailure );
        REQUIRE( getStatus(txId) == TransactionStatus::BillingFailed );
        REQUIRE( getBalance() == 10000 );

        Wallet wallet;
        REQUIRE( sys.wallets->getByUser(userId, wallet) );
        REQUIRE( sys.wallets->getBookings(wallet.id).empty() );

        sys.wallets->setFailCommits(false);
        REQUIRE( sys.csms.retryFailedBilling(txId).status == BillingStatus::Billed );
        REQUIRE( getBalance() == 9650 );
    }
}

TEST_CASE( "Billing retry sweep" ) {
    printf("\nRun %s\n",  "Billing retry sweep");

    TestSystem sys;
    sys.chargers->add("CP001");
    int userId = sys.users->add("TAG0001");
    sys.wallets->add(userId, 10000);

    auto& clock = sys.csms.getContext().getClock();
    auto& txService = *sys.csms.getModel().getTransactionService();
    auto& txStore = *sys.csms.getModel().getTransactionStore();
    auto& sweep = *sys.csms.getModel().getBillingRetrySweep();

    auto runFailingTransaction = [&] () -> int {
        auto start = txService.startTransaction("CP001", 1, "TAG0001", 0, clock.now());
        REQUIRE( start.status == AuthorizationStatus::Accepted );
        bool billingDue;
        txService.stopTransaction(start.transactionId, 1000, "Local", billingDue);
        REQUIRE( txService.billTransaction(start.transactionId).status == BillingStatus::NoTariffConfigured );
        return start.transactionId;
    };

    auto getStatus = [&] (int txId) -> TransactionStatus {
        Transaction tx;
        REQUIRE( txStore.get(txId, tx) );
        return tx.status;
    };

    //failed two days ago, outside of the retry window
    int oldTx = runFailingTransaction();

    mtime += 2 * 24 * 3600;

    int recentTx = runFailingTransaction();

    SECTION("Nothing to retry while the cause persists") {
        auto stats = sweep.runOnce();
        REQUIRE( stats.successful == 0 );
        REQUIRE( stats.failed == 1 );
        REQUIRE( getStatus(recentTx) == TransactionStatus::BillingFailed );
    }

    SECTION("Retry within the window") {
        sys.tariffs->setGlobalTariff(3500);

        auto stats = sweep.runOnce();
        REQUIRE( stats.successful == 1 );
        REQUIRE( stats.failed == 0 );

        REQUIRE( getStatus(recentTx) == TransactionStatus::Completed );
        REQUIRE( getStatus(oldTx) == TransactionStatus::BillingFailed );

        //the old one can still be resolved manually
        REQUIRE( sys.csms.retryFailedBilling(oldTx).status == BillingStatus::Billed );
    }

    SECTION("Retries end with the window") {
        //recentTx keeps failing. Every sweep within 24 h of the first failure retries it
        unsigned int retries = 0;
        for (int32_t elapsed = 0; elapsed <= 24 * 3600; elapsed += 1800) {
            retries += sweep.runOnce().failed;
            mtime += 1800;
        }
        REQUIRE( retries == 49 );

        auto stats = sweep.runOnce();
        REQUIRE( stats.successful == 0 );
        REQUIRE( stats.failed == 0 );
        REQUIRE( getStatus(recentTx) == TransactionStatus::BillingFailed );

        REQUIRE( sweep.archiveOnce() == 0 );

        mtime += 6 * 24 * 3600; //recentTx failed more than 7 days ago
        REQUIRE( sweep.runOnce().failed == 0 );
        REQUIRE( sweep.archiveOnce() == 2 );
    }

    SECTION("Archive") {
        REQUIRE( sweep.archiveOnce() == 0 );

        mtime += 6 * 24 * 3600; //oldTx: 8 days, recentTx: 6 days
        REQUIRE( sweep.archiveOnce() == 1 );
    }

    SECTION("Background task") {
        sys.tariffs->setGlobalTariff(3500);
        REQUIRE( sys.csms.getContext().getConfiguration().setConfiguration("BillingRetryInterval", "1") );

        sys.csms.startTasks();
        for (int i = 0; i < 300 && getStatus(recentTx) != TransactionStatus::Completed; i++) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        sys.csms.stopTasks();

        REQUIRE( getStatus(recentTx) == TransactionStatus::Completed );
    }
}
