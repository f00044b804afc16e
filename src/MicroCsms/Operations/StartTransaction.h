// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_STARTTRANSACTION_H
#define MC_STARTTRANSACTION_H

#include <string>

#include <MicroCsms/Core/Operation.h>
#include <MicroCsms/Model/Transactions/TransactionService.h>

namespace MicroCsms {

class Context;
class Model;

class StartTransaction : public Operation {
private:
    Context& context;
    Model& model;
    std::string chargePointId;
    StartTxResult result;
    const char *errorCode = nullptr;
public:
    StartTransaction(Context& context, Model& model, const char *chargePointId);

    const char* getOperationType() override;

    void processReq(JsonObject payload) override;

    std::unique_ptr<JsonDoc> createConf() override;

    const char *getErrorCode() override {return errorCode;}
};

} //namespace MicroCsms

#endif
