// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_REQUEST_H
#define MC_REQUEST_H

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

#include <MicroCsms/Core/Json.h>

namespace MicroCsms {

/*
 * Outcome of a server-initiated Call. The REST layer maps the errors to HTTP status codes:
 *
 *     NotConnected     -> 409 Conflict (no live session to the charge point in this process)
 *     CommandTimeout   -> 504 Gateway Timeout
 *     CommandRejected  -> 502 Bad Gateway (charge point answered with a CallError)
 */
enum class CommandError : uint8_t {
    None,
    NotConnected,
    CommandTimeout,
    CommandRejected
};

const char *serializeCommandError(CommandError error);

struct CommandResult {
    CommandError error = CommandError::None;
    std::string errorCode; //CallError code if CommandRejected
    std::string errorDescription;
    std::unique_ptr<JsonDoc> payload; //CallResult payload if successful

    bool isSuccess() const {return error == CommandError::None;}
};

/*
 * A Call which the server has sent and which awaits its CallResult or CallError. The session thread
 * which receives the response completes the Request, the thread which issued the Call blocks in await()
 */
class Request {
private:
    std::string messageId;
    std::string operationType;

    std::mutex mutex;
    std::condition_variable cv;
    bool completed = false;
    CommandResult result;

    void complete(CommandResult&& result);
public:
    Request(const char *messageId, const char *operationType);

    const char *getMessageId() const;
    const char *getOperationType() const;

    void resolve(std::unique_ptr<JsonDoc> payload); //CallResult received
    void reject(const char *errorCode, const char *errorDescription); //CallError received
    void abort(CommandError error); //the Call cannot be answered anymore, e.g. connection lost

    /*
     * Blocks until the Request is completed or `timeoutMs` elapsed. Returns true if completed
     */
    bool await(unsigned long timeoutMs);

    bool isCompleted();

    /*
     * Moves the result out of the Request. Only valid after completion
     */
    CommandResult takeResult();
};

} //namespace MicroCsms

#endif
