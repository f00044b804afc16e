// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_SESSION_H
#define MC_SESSION_H

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <MicroCsms/Core/Frame.h>
#include <MicroCsms/Core/Request.h>
#include <MicroCsms/Model/Audit/AuditLog.h>

namespace MicroCsms {

class Context;
class Connection;
class Operation;

/*
 * OCPP-J session with one charge point. Runs the receive loop on the thread of the caller and processes
 * the incoming Calls in the order of receipt. Any other thread can send Calls to the charge point using
 * call(), which blocks the caller until the response arrives or the timeout expires.
 *
 * Lifecycle: Connecting -> Active -> Closing -> Closed
 */
class Session {
public:
    enum class State : uint8_t {
        Connecting,
        Active,
        Closing,
        Closed
    };
private:
    Context& context;
    std::string chargePointId;
    std::shared_ptr<Connection> connection;

    std::mutex mutex;
    State state = State::Connecting;
    bool activated = false;
    Timestamp connectedAt;
    std::map<std::string, std::shared_ptr<Request>> pendingRequests;
    unsigned long callSeq = 0;

    bool sendFrame(const Frame& frame);
    void audit(MessageDirection direction, const char *payload, size_t length, const std::string& correlationId);

    void receiveCall(Frame& frame);
    void receiveResponse(Frame& frame);

    void cleanup();
public:
    Session(Context& context, const char *chargePointId, std::shared_ptr<Connection> connection);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const char *getChargePointId() const;
    State getState();

    /*
     * Connecting -> Active. The caller must have admitted the session at the SessionManager. Records
     * the connection in the ConnectionRegistry
     */
    bool activate();

    /*
     * Reads and processes frames until the connection is closed, then cleans up the session
     */
    void receiveLoop();

    /*
     * Processes one incoming frame. Returns false if the frame was dropped
     */
    bool receiveMessage(const char *payload, size_t length);

    /*
     * Sends a Call and blocks until the response arrives or `timeoutMs` (0 = configured default) elapsed
     */
    CommandResult call(const char *action, const JsonDoc& payload, unsigned long timeoutMs = 0);

    /*
     * Same as above, but creates the payload with operation.createReq() and hands the response over to
     * operation.processConf() or operation.processErr()
     */
    CommandResult call(Operation& operation, unsigned long timeoutMs = 0);

    /*
     * Active -> Closing. Closes the transport, which ends the receive loop
     */
    void close(uint16_t code, const char *reason);

    size_t getPendingCount();

    Timestamp getConnectedAt(); //undefined before activate()
};

const char *serializeSessionState(Session::State state);

} //namespace MicroCsms

#endif
