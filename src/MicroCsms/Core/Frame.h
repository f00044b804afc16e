// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

/*
 * OCPP-J frame codec. A frame is one of the three RPC message types of OCPP 1.6-J:
 *
 *     Call        [2, "<messageId>", "<action>", {payload}]
 *     CallResult  [3, "<messageId>", {payload}]
 *     CallError   [4, "<messageId>", "<errorCode>", "<errorDescription>", {errorDetails}]
 *
 * The payload is owned by the frame as a separate JSON document, so that a decoded frame outlives the
 * input buffer and encodeFrame(decodeFrame(raw)) reproduces the same JSON value.
 */

#ifndef MC_FRAME_H
#define MC_FRAME_H

#include <memory>
#include <string>

#include <MicroCsms/Core/Json.h>

#define MESSAGE_TYPE_CALL 2
#define MESSAGE_TYPE_CALLRESULT 3
#define MESSAGE_TYPE_CALLERROR 4

namespace MicroCsms {

enum class MessageType : uint8_t {
    Call = MESSAGE_TYPE_CALL,
    CallResult = MESSAGE_TYPE_CALLRESULT,
    CallError = MESSAGE_TYPE_CALLERROR
};

struct Frame {
    MessageType type = MessageType::Call;
    std::string messageId;

    std::string action; //Call only

    std::string errorCode; //CallError only
    std::string errorDescription; //CallError only

    std::unique_ptr<JsonDoc> payload; //Call / CallResult payload, or the errorDetails of a CallError
};

enum class DecodeStatus : uint8_t {
    Ok,
    MalformedFrame
};

/*
 * Decodes the raw text frame into `out`. Returns MalformedFrame if the input is not JSON, not an array,
 * has no valid message type tag or is too short for its message type. In the malformed case,
 * `out.messageId` is still set if the frame carries a string at index 1, so that the caller can reply
 * with a CallError. `out.type` is CallResult or CallError only if the tag says so, otherwise Call
 */
DecodeStatus decodeFrame(const char *raw, size_t length, Frame& out);

/*
 * Serializes the frame into `out`. Returns false if the frame lacks required fields or the result
 * exceeds MC_MAX_JSON_CAPACITY
 */
bool encodeFrame(const Frame& frame, std::string& out);

Frame makeCall(const char *messageId, const char *action, std::unique_ptr<JsonDoc> payload);
Frame makeCallResult(const char *messageId, std::unique_ptr<JsonDoc> payload);
Frame makeCallError(const char *messageId, const char *errorCode, const char *errorDescription, std::unique_ptr<JsonDoc> errorDetails = nullptr);

} //namespace MicroCsms

#endif
