// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_TRANSACTION_H
#define MC_TRANSACTION_H

#include <string>
#include <stdint.h>

#include <MicroCsms/Core/Time.h>

#define MC_REASON_LEN_MAX 40

namespace MicroCsms {

enum class TransactionStatus : uint8_t {
    Started,
    PendingStart,
    Running,
    PendingStop,
    Stopped,
    Completed,
    Cancelled,
    Failed,
    BillingFailed
};

const char *serializeTransactionStatus(TransactionStatus status);

/*
 * Active transactions occupy the charger. A charger has at most one of them
 */
bool isActiveStatus(TransactionStatus status);

/*
 * Transactions which have not been stopped yet (active ones and those awaiting their stop)
 */
bool isOngoingStatus(TransactionStatus status);

/*
 * Charging transaction as recorded by the server. Meter readings are kept in Wh as the charge point
 * reports them
 */
struct Transaction {
    int id = 0;
    int userId = 0;
    int chargerId = 0;
    int connectorId = 0;
    int vehicleId = 0; //0 if not known
    std::string idTag;

    int32_t startMeterWh = 0;
    int32_t endMeterWh = 0;
    bool endMeterDefined = false;
    int32_t energyConsumedWh = 0;
    bool energyDefined = false; //energy is set when the stop has been processed

    Timestamp startTime;
    Timestamp endTime;
    Timestamp updatedAt;
    Timestamp billingFailedAt; //first time billing failed. Retries don't move it
    std::string stopReason;

    TransactionStatus status = TransactionStatus::Started;
};

/*
 * One sampled meter value group of a MeterValues message
 */
struct MeterValue {
    int transactionId = 0;
    int32_t energyWh = 0; //Energy.Active.Import.Register
    double currentA = 0.;
    bool currentDefined = false;
    double voltageV = 0.;
    bool voltageDefined = false;
    double powerKw = 0.;
    bool powerDefined = false;
    Timestamp timestamp;
};

} //namespace MicroCsms

#endif
