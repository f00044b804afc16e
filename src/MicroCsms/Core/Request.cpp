// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <chrono>

#include <MicroCsms/Core/Request.h>
#include <MicroCsms/Debug.h>

namespace MicroCsms {
const char *serializeCommandError(CommandError error) {
    switch (error) {
        case CommandError::None:
            return "None";
        case CommandError::NotConnected:
            return "NotConnected";
        case CommandError::CommandTimeout:
            return "CommandTimeout";
        case CommandError::CommandRejected:
            return "CommandRejected";
    }
    return "_Undefined";
}
} //namespace MicroCsms

using namespace MicroCsms;

Request::Request(const char *messageId, const char *operationType) : messageId(messageId), operationType(operationType) {

}

const char *Request::getMessageId() const {
    return messageId.c_str();
}

const char *Request::getOperationType() const {
    return operationType.c_str();
}

void Request::complete(CommandResult&& res) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (completed) {
            MC_DBG_WARN("%s (%s) already completed", operationType.c_str(), messageId.c_str());
            return;
        }
        result = std::move(res);
        completed = true;
    }
    cv.notify_all();
}

void Request::resolve(std::unique_ptr<JsonDoc> payload) {
    CommandResult res;
    res.error = CommandError::None;
    res.payload = std::move(payload);
    complete(std::move(res));
}

void Request::reject(const char *errorCode, const char *errorDescription) {
    CommandResult res;
    res.error = CommandError::CommandRejected;
    res.errorCode = errorCode ? errorCode : "";
    res.errorDescription = errorDescription ? errorDescription : "";
    complete(std::move(res));
}

void Request::abort(CommandError error) {
    CommandResult res;
    res.error = error;
    complete(std::move(res));
}

bool Request::await(unsigned long timeoutMs) {
    std::unique_lock<std::mutex> lock(mutex);
    return cv.wait_for(lock, std::chrono::milliseconds(timeoutMs), [this] () {
        return completed;
    });
}

bool Request::isCompleted() {
    std::lock_guard<std::mutex> lock(mutex);
    return completed;
}

CommandResult Request::takeResult() {
    std::lock_guard<std::mutex> lock(mutex);
    if (!completed) {
        MC_DBG_ERR("%s (%s) not completed yet", operationType.c_str(), messageId.c_str());
        CommandResult res;
        res.error = CommandError::CommandTimeout;
        return res;
    }
    return std::move(result);
}
