// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_STOPTRANSACTION_H
#define MC_STOPTRANSACTION_H

#include <string>

#include <MicroCsms/Core/Operation.h>
#include <MicroCsms/Model/Transactions/TransactionService.h>

namespace MicroCsms {

class Model;

/*
 * Completes the transaction. Billing runs after the confirmation has been sent, so that the charge
 * point is not kept waiting by the wallet
 */
class StopTransaction : public Operation {
private:
    Model& model;
    std::string chargePointId;
    int transactionId = 0;
    AuthorizationStatus status = AuthorizationStatus::Invalid;
    bool billingDue = false;
    const char *errorCode = nullptr;
public:
    StopTransaction(Model& model, const char *chargePointId);

    const char* getOperationType() override;

    void processReq(JsonObject payload) override;

    std::unique_ptr<JsonDoc> createConf() override;

    void onConfSent() override;

    const char *getErrorCode() override {return errorCode;}
};

} //namespace MicroCsms

#endif
