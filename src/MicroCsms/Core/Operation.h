// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

/**
 * This framework considers OCPP operations to be a combination of two things: first, ensure that the message reaches its
 * destination properly (the "Remote procedure call" header, e.g. message Id). Second, transmit the application data
 * as specified in the OCPP 1.6 document.
 *
 * The remote procedure call (RPC) part is implemented by the Session. The application data part is implemented by
 * the respective Operation subclasses, e.g. BootNotification, StartTransaction, RemoteStopTransaction, ect.
 *
 * Operations initiated by a charge point are processed with processReq() and answered with createConf(). Operations
 * initiated by the server are created with createReq() and their answer is processed with processConf().
 */

#ifndef MC_OPERATION_H
#define MC_OPERATION_H

#include <memory>

#include <MicroCsms/Core/Json.h>

namespace MicroCsms {

class Operation {
public:
    Operation();

    virtual ~Operation();

    virtual const char* getOperationType();

    /**
     * Create the payload for the respective OCPP message
     *
     * For instance operation RemoteStopTransaction: creates RemoteStopTransaction.req(transactionId)
     */
    virtual std::unique_ptr<JsonDoc> createReq();

    virtual void processConf(JsonObject payload);

    /*
     * The charge point responded with a CallError
     */
    virtual void processErr(const char *code, const char *description, JsonObject details) { }

    /**
     * Processes the request in the JSON document.
     */
    virtual void processReq(JsonObject payload);

    /**
     * After successfully processing a request sent by the communication counterpart, this function creates the payload for a confirmation
     * message.
     */
    virtual std::unique_ptr<JsonDoc> createConf();

    /*
     * Executed after the confirmation has been handed over to the transport. Work which must not delay
     * the confirmation goes here
     */
    virtual void onConfSent() { }

    virtual const char *getErrorCode() {return nullptr;} //nullptr means no error
    virtual const char *getErrorDescription() {return "";}
    virtual std::unique_ptr<JsonDoc> getErrorDetails() {return createEmptyDocument();}
};

} //namespace MicroCsms

#endif
