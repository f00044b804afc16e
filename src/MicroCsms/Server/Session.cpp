// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <vector>

#include <MicroCsms/Server/Session.h>
#include <MicroCsms/Server/SessionManager.h>
#include <MicroCsms/Core/Context.h>
#include <MicroCsms/Core/Connection.h>
#include <MicroCsms/Core/Operation.h>
#include <MicroCsms/Core/OcppError.h>
#include <MicroCsms/Model/Registry/ConnectionRegistry.h>
#include <MicroCsms/Debug.h>

namespace MicroCsms {
const char *serializeSessionState(Session::State state) {
    switch (state) {
        case Session::State::Connecting:
            return "Connecting";
        case Session::State::Active:
            return "Active";
        case Session::State::Closing:
            return "Closing";
        case Session::State::Closed:
            return "Closed";
    }
    return "_Undefined";
}
} //namespace MicroCsms

using namespace MicroCsms;

Session::Session(Context& context, const char *chargePointId, std::shared_ptr<Connection> connection) :
        context(context), chargePointId(chargePointId), connection(connection) {

}

Session::~Session() {
    MC_DBG_DEBUG("destroy session %s", chargePointId.c_str());
}

const char *Session::getChargePointId() const {
    return chargePointId.c_str();
}

Session::State Session::getState() {
    std::lock_guard<std::mutex> lock(mutex);
    return state;
}

bool Session::activate() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (state != State::Connecting) {
            MC_DBG_ERR("cannot activate session %s in state %s", chargePointId.c_str(), serializeSessionState(state));
            return false;
        }
        state = State::Active;
        activated = true;
        connectedAt = context.getClock().now();
    }

    if (auto registry = context.getConnectionRegistry()) {
        if (!registry->put(chargePointId.c_str(), connectedAt)) {
            MC_DBG_WARN("%s connected, but connection registry not updated", chargePointId.c_str());
        }
    }

    MC_DBG_INFO("%s connected", chargePointId.c_str());
    return true;
}

void Session::receiveLoop() {
    std::string msg;
    while (connection->readTXT(msg)) {
        receiveMessage(msg.c_str(), msg.length());
    }
    cleanup();
}

void Session::audit(MessageDirection direction, const char *payload, size_t length, const std::string& correlationId) {
    auto auditLog = context.getAuditLog();
    if (!auditLog) {
        return;
    }

    AuditRecord record;
    record.chargePointId = chargePointId;
    record.direction = direction;
    record.payload.assign(payload, length);
    record.correlationId = correlationId;
    record.timestamp = context.getClock().now();
    record.status = direction == MessageDirection::In ? "received" : "sent";

    if (!auditLog->record(record)) {
        MC_DBG_WARN("audit record of %s lost", chargePointId.c_str());
    }
}

bool Session::sendFrame(const Frame& frame) {
    std::string out;
    if (!encodeFrame(frame, out)) {
        MC_DBG_ERR("could not encode frame for %s", chargePointId.c_str());
        return false;
    }

    MC_DBG_DEBUG("Send %s: %s", chargePointId.c_str(), out.c_str());

    if (!connection->sendTXT(out.c_str(), out.length())) {
        MC_DBG_WARN("could not send frame to %s", chargePointId.c_str());
        return false;
    }

    audit(MessageDirection::Out, out.c_str(), out.length(), frame.messageId);
    return true;
}

bool Session::receiveMessage(const char *payload, size_t length) {

    MC_DBG_DEBUG("Recv %s: %.*s", chargePointId.c_str(), (int)length, payload);

    Frame frame;
    auto status = decodeFrame(payload, length, frame);

    audit(MessageDirection::In, payload, length, frame.messageId);

    if (status != DecodeStatus::Ok) {
        if (frame.messageId.empty()) {
            MC_DBG_WARN("drop malformed frame from %s", chargePointId.c_str());
        } else if (frame.type == MessageType::Call) {
            MC_DBG_WARN("malformed Call from %s. Reply with FormationViolation", chargePointId.c_str());
            sendFrame(makeCallError(frame.messageId.c_str(), "FormationViolation", "Malformed OCPP-J message"));
        } else {
            //never answer a response. Release the waiting caller instead
            MC_DBG_WARN("malformed response from %s. Reject pending Call %s", chargePointId.c_str(), frame.messageId.c_str());
            frame.type = MessageType::CallError;
            frame.errorCode = "FormationViolation";
            frame.errorDescription = "Malformed OCPP-J response";
            receiveResponse(frame);
        }
        return false;
    }

    switch (frame.type) {
        case MessageType::Call:
            receiveCall(frame);
            return true;
        case MessageType::CallResult:
        case MessageType::CallError:
            receiveResponse(frame);
            return true;
    }

    return false;
}

void Session::receiveCall(Frame& frame) {

    auto operation = context.getOperationRegistry().createOperation(frame.action.c_str(), chargePointId.c_str());

    JsonObject payload = frame.payload->as<JsonObject>();
    operation->processReq(payload);

    bool confirmed = false;

    if (auto errorCode = operation->getErrorCode()) {
        MC_DBG_WARN("%s from %s failed: %s", frame.action.c_str(), chargePointId.c_str(), errorCode);
        sendFrame(makeCallError(frame.messageId.c_str(), errorCode, operation->getErrorDescription(), operation->getErrorDetails()));
    } else {
        auto conf = operation->createConf();
        if (!conf) {
            MC_DBG_ERR("%s: could not create confirmation", frame.action.c_str());
            sendFrame(makeCallError(frame.messageId.c_str(), "InternalError", "Could not create confirmation"));
        } else {
            sendFrame(makeCallResult(frame.messageId.c_str(), std::move(conf)));
            confirmed = true;
        }
    }

    if (confirmed) {
        //executed even if the transport failed. The charge point will resend the Call and the handlers are idempotent
        operation->onConfSent();
    }
}

void Session::receiveResponse(Frame& frame) {

    std::shared_ptr<Request> request;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto entry = pendingRequests.find(frame.messageId);
        if (entry != pendingRequests.end()) {
            request = entry->second;
            pendingRequests.erase(entry);
        }
    }

    if (!request) {
        MC_DBG_WARN("%s: no pending Call with messageId %s (timed out or unknown). Drop response",
                chargePointId.c_str(), frame.messageId.c_str());
        return;
    }

    if (frame.type == MessageType::CallResult) {
        request->resolve(std::move(frame.payload));
    } else {
        MC_DBG_INFO("%s rejected %s: %s, %s", chargePointId.c_str(), request->getOperationType(),
                frame.errorCode.c_str(), frame.errorDescription.c_str());
        request->reject(frame.errorCode.c_str(), frame.errorDescription.c_str());
    }
}

CommandResult Session::call(const char *action, const JsonDoc& payload, unsigned long timeoutMs) {

    if (timeoutMs == 0) {
        timeoutMs = context.getCallTimeoutMs();
    }

    std::shared_ptr<Request> request;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (state != State::Active) {
            MC_DBG_INFO("cannot send %s: session %s is %s", action, chargePointId.c_str(), serializeSessionState(state));
            CommandResult res;
            res.error = CommandError::NotConnected;
            return res;
        }

        auto messageId = std::to_string(++callSeq);
        request = std::make_shared<Request>(messageId.c_str(), action);
        pendingRequests[messageId] = request;
    }

    auto payloadCopy = copyJsonDoc(payload.as<JsonVariantConst>(), payload.memoryUsage() + JSON_OBJECT_SIZE(0));
    if (!payloadCopy) {
        std::lock_guard<std::mutex> lock(mutex);
        pendingRequests.erase(request->getMessageId());
        CommandResult res;
        res.error = CommandError::CommandRejected;
        res.errorCode = "FormationViolation";
        res.errorDescription = "payload exceeds max capacity";
        return res;
    }
    if (payloadCopy->isNull()) {
        payloadCopy->to<JsonObject>();
    }

    if (!sendFrame(makeCall(request->getMessageId(), action, std::move(payloadCopy)))) {
        std::lock_guard<std::mutex> lock(mutex);
        pendingRequests.erase(request->getMessageId());
        CommandResult res;
        res.error = CommandError::NotConnected;
        return res;
    }

    if (!request->await(timeoutMs)) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            pendingRequests.erase(request->getMessageId());
        }

        if (!request->isCompleted()) {
            //the response arrived while removing the waiter otherwise
            MC_DBG_WARN("%s to %s timed out after %lu ms", action, chargePointId.c_str(), timeoutMs);
            request->abort(CommandError::CommandTimeout);
        }
    }

    return request->takeResult();
}

CommandResult Session::call(Operation& operation, unsigned long timeoutMs) {
    auto req = operation.createReq();
    if (!req) {
        MC_DBG_ERR("could not create %s", operation.getOperationType());
        CommandResult res;
        res.error = CommandError::CommandRejected;
        res.errorCode = "InternalError";
        res.errorDescription = "could not create request";
        return res;
    }

    auto res = call(operation.getOperationType(), *req, timeoutMs);

    if (res.error == CommandError::None) {
        JsonObject conf = res.payload ? res.payload->as<JsonObject>() : JsonObject();
        operation.processConf(conf);
    } else if (res.error == CommandError::CommandRejected) {
        operation.processErr(res.errorCode.c_str(), res.errorDescription.c_str(), JsonObject());
    }

    return res;
}

void Session::close(uint16_t code, const char *reason) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (state == State::Closing || state == State::Closed) {
            return;
        }
        state = State::Closing;
    }

    MC_DBG_INFO("close session %s: %u %s", chargePointId.c_str(), code, reason ? reason : "");
    connection->close(code, reason);
}

void Session::cleanup() {

    std::map<std::string, std::shared_ptr<Request>> aborted;
    bool wasActivated;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (state == State::Closed) {
            return;
        }
        state = State::Closing;
        aborted.swap(pendingRequests);
        wasActivated = activated;
    }

    for (auto& entry : aborted) {
        entry.second->abort(CommandError::NotConnected);
    }

    if (wasActivated) {
        //registry first, then the SessionManager. A new session of the same charge point can only be
        //admitted after the SessionManager entry is gone, so this doesn't delete its registry record
        if (auto registry = context.getConnectionRegistry()) {
            if (!registry->remove(chargePointId.c_str())) {
                MC_DBG_WARN("stale connection record of %s remains", chargePointId.c_str());
            }
        }

        context.getSessionManager().remove(chargePointId.c_str(), this);
    }

    {
        std::lock_guard<std::mutex> lock(mutex);
        state = State::Closed;
    }

    MC_DBG_INFO("%s disconnected", chargePointId.c_str());
}

Timestamp Session::getConnectedAt() {
    std::lock_guard<std::mutex> lock(mutex);
    return connectedAt;
}

size_t Session::getPendingCount() {
    std::lock_guard<std::mutex> lock(mutex);
    return pendingRequests.size();
}
