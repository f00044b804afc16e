// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroCsms/Model/Billing/BillingRetrySweep.h>
#include <MicroCsms/Model/Billing/BillingService.h>
#include <MicroCsms/Model/Transactions/TransactionStore.h>
#include <MicroCsms/Core/Configuration.h>
#include <MicroCsms/Core/Time.h>
#include <MicroCsms/Debug.h>

#define MC_BILLINGRETRY_INTERVAL_DEFAULT (30 * 60)
#define MC_BILLINGRETRY_WINDOW_DEFAULT (24 * 3600)
#define MC_BILLINGRETRY_PAUSE_DEFAULT 100
#define MC_BILLINGARCHIVE_AGE_DEFAULT (7 * 24 * 3600)
#define MC_BILLINGARCHIVE_PERIOD (24UL * 3600UL * 1000UL)

using namespace MicroCsms;

namespace MicroCsms {
namespace BillingRetry {

//the retry window and the archive age count from the first failure
const Timestamp& getFailedSince(const Transaction& tx) {
    return tx.billingFailedAt.isDefined() ? tx.billingFailedAt : tx.updatedAt;
}

} //namespace BillingRetry
} //namespace MicroCsms

BillingRetrySweep::BillingRetrySweep(Clock& clock, ConfigurationService& configuration, TransactionStore& transactionStore, BillingService& billingService) :
        clock(clock), transactionStore(transactionStore), billingService(billingService),
        retryTask("BillingRetry", [this] () {runOnce();}),
        archiveTask("BillingArchive", [this] () {archiveOnce();}) {

    retryIntervalInt = configuration.declareConfiguration<int>("BillingRetryInterval", MC_BILLINGRETRY_INTERVAL_DEFAULT);
    retryWindowInt = configuration.declareConfiguration<int>("BillingRetryWindow", MC_BILLINGRETRY_WINDOW_DEFAULT);
    retryPauseInt = configuration.declareConfiguration<int>("BillingRetryPause", MC_BILLINGRETRY_PAUSE_DEFAULT);
    archiveAgeInt = configuration.declareConfiguration<int>("BillingArchiveAge", MC_BILLINGARCHIVE_AGE_DEFAULT);

    configuration.registerValidator("BillingRetryInterval", VALIDATE_UNSIGNED_INT);
    configuration.registerValidator("BillingRetryWindow", VALIDATE_UNSIGNED_INT);
    configuration.registerValidator("BillingRetryPause", VALIDATE_UNSIGNED_INT);
    configuration.registerValidator("BillingArchiveAge", VALIDATE_UNSIGNED_INT);
}

BillingRetrySweep::~BillingRetrySweep() {
    stop();
}

unsigned long BillingRetrySweep::getRetryIntervalMs() {
    int interval = retryIntervalInt->getInt();
    if (interval < 1) {
        interval = 1;
    }
    return (unsigned long) interval * 1000UL;
}

SweepStats BillingRetrySweep::runOnce() {

    SweepStats stats;

    auto now = clock.now();
    int32_t window = retryWindowInt->getInt();
    int pause = retryPauseInt->getInt();

    auto failed = transactionStore.findByStatus(TransactionStatus::BillingFailed);

    bool first = true;
    for (auto& tx : failed) {

        int32_t age;
        if (!clock.delta(now, BillingRetry::getFailedSince(tx), age)) {
            MC_DBG_WARN("transaction %i has no failure time", tx.id);
            continue;
        }
        if (age > window) {
            continue; //left for archival
        }

        if (!first && pause > 0 && retryTask.isRunning()) {
            if (!retryTask.waitFor((unsigned long) pause)) {
                MC_DBG_INFO("billing retry interrupted");
                break;
            }
        }
        first = false;

        auto res = billingService.retryFailedBilling(tx.id);
        if (res.isSuccess()) {
            stats.successful++;
        } else {
            stats.failed++;
        }
    }

    MC_DBG_INFO("billing retry: %u successful, %u failed", stats.successful, stats.failed);
    return stats;
}

unsigned int BillingRetrySweep::archiveOnce() {

    auto now = clock.now();
    int32_t archiveAge = archiveAgeInt->getInt();

    unsigned int count = 0;

    auto failed = transactionStore.findByStatus(TransactionStatus::BillingFailed);
    for (auto& tx : failed) {
        int32_t age;
        if (clock.delta(now, BillingRetry::getFailedSince(tx), age) && age > archiveAge) {
            MC_DBG_WARN("transaction %i in BILLING_FAILED for %i s, manual resolution required", tx.id, age);
            count++;
        }
    }

    if (count > 0) {
        MC_DBG_WARN("%u transactions with unresolved billing", count);
    }
    return count;
}

void BillingRetrySweep::start() {
    retryTask.start([this] () {return getRetryIntervalMs();}, getRetryIntervalMs());
    archiveTask.start([] () {return MC_BILLINGARCHIVE_PERIOD;}, MC_BILLINGARCHIVE_PERIOD);
}

void BillingRetrySweep::stop() {
    retryTask.stop();
    archiveTask.stop();
}
