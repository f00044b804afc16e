// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_BILLINGRETRYSWEEP_H
#define MC_BILLINGRETRYSWEEP_H

#include <memory>

#include <MicroCsms/Core/ScheduledTask.h>

namespace MicroCsms {

class Clock;
class ConfigurationService;
class Configuration;
class TransactionStore;
class BillingService;

struct SweepStats {
    unsigned int successful = 0;
    unsigned int failed = 0;
};

/*
 * Periodically retries the billing of recently failed transactions and reports failures which are
 * too old to be retried.
 */
class BillingRetrySweep {
private:
    Clock& clock;
    TransactionStore& transactionStore;
    BillingService& billingService;

    std::shared_ptr<Configuration> retryIntervalInt; //in s
    std::shared_ptr<Configuration> retryWindowInt; //in s
    std::shared_ptr<Configuration> retryPauseInt; //in ms
    std::shared_ptr<Configuration> archiveAgeInt; //in s

    ScheduledTask retryTask;
    ScheduledTask archiveTask;

    unsigned long getRetryIntervalMs();
public:
    BillingRetrySweep(Clock& clock, ConfigurationService& configuration, TransactionStore& transactionStore, BillingService& billingService);
    ~BillingRetrySweep();

    /*
     * Retries all BILLING_FAILED transactions which have been updated within the retry window. The
     * transactions are processed one after another with a short pause in between
     */
    SweepStats runOnce();

    /*
     * Counts the BILLING_FAILED transactions older than the archive age. They are left for manual
     * resolution and not retried anymore
     */
    unsigned int archiveOnce();

    void start();
    void stop();
};

} //namespace MicroCsms

#endif
