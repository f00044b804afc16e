// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroCsms/Core/Frame.h>
#include <MicroCsms/Debug.h>

using namespace MicroCsms;

namespace MicroCsms {

DecodeStatus decodeFrame(const char *raw, size_t length, Frame& out) {

    out.type = MessageType::Call;
    out.messageId.clear();
    out.action.clear();
    out.errorCode.clear();
    out.errorDescription.clear();
    out.payload.reset();

    if (!raw || length == 0) {
        MC_DBG_WARN("empty frame");
        return DecodeStatus::MalformedFrame;
    }

    auto doc = initJsonDoc();
    auto err = deserializeJsonDoc(raw, length, doc);
    if (err) {
        MC_DBG_WARN("Invalid input! Not a JSON: %s", err.c_str());
        return DecodeStatus::MalformedFrame;
    }

    if (!doc.is<JsonArray>()) {
        MC_DBG_WARN("Invalid OCPP message! Not a JSON array");
        return DecodeStatus::MalformedFrame;
    }

    JsonArray frame = doc.as<JsonArray>();

    if (frame.size() >= 2 && frame[1].is<const char*>()) {
        out.messageId = frame[1].as<const char*>();
    }

    //the type tag decides how a malformed frame is answered, so read it before the length check
    bool typeValid = true;
    int messageTypeId = frame[0].is<int>() ? frame[0].as<int>() : -1;
    if (messageTypeId == MESSAGE_TYPE_CALL) {
        out.type = MessageType::Call;
    } else if (messageTypeId == MESSAGE_TYPE_CALLRESULT) {
        out.type = MessageType::CallResult;
    } else if (messageTypeId == MESSAGE_TYPE_CALLERROR) {
        out.type = MessageType::CallError;
    } else {
        typeValid = false;
    }

    if (frame.size() < 3) {
        MC_DBG_WARN("malformed frame: insufficient elements (size=%zu, expected>=3)", frame.size());
        return DecodeStatus::MalformedFrame;
    }

    if (!frame[0].is<int>()) {
        MC_DBG_WARN("malformed frame: message type is not an integer");
        return DecodeStatus::MalformedFrame;
    }

    if (!typeValid) {
        MC_DBG_WARN("malformed frame: unknown message type %i", messageTypeId);
        return DecodeStatus::MalformedFrame;
    }

    if (!frame[1].is<const char*>()) {
        MC_DBG_WARN("malformed frame: messageId is not a string");
        return DecodeStatus::MalformedFrame;
    }

    size_t capacity = doc.memoryUsage();

    switch (out.type) {
        case MessageType::Call: {
            // CALL format: [2, messageId, action, payload] - requires 4 elements
            if (frame.size() < 4) {
                MC_DBG_WARN("malformed CALL: insufficient elements (size=%zu, expected>=4)", frame.size());
                return DecodeStatus::MalformedFrame;
            }
            if (!frame[2].is<const char*>()) {
                MC_DBG_WARN("malformed CALL: action is not a string");
                return DecodeStatus::MalformedFrame;
            }
            out.action = frame[2].as<const char*>();
            out.payload = copyJsonDoc(frame[3], capacity);
            break;
        }
        case MessageType::CallResult: {
            out.payload = copyJsonDoc(frame[2], capacity);
            break;
        }
        case MessageType::CallError: {
            // CALLERROR format: [4, messageId, errorCode, errorDescription, errorDetails]. Tolerate missing errorDetails
            if (frame.size() < 4) {
                MC_DBG_WARN("malformed CALLERROR: insufficient elements (size=%zu, expected>=4)", frame.size());
                return DecodeStatus::MalformedFrame;
            }
            if (!frame[2].is<const char*>()) {
                MC_DBG_WARN("malformed CALLERROR: errorCode is not a string");
                return DecodeStatus::MalformedFrame;
            }
            out.errorCode = frame[2].as<const char*>();
            out.errorDescription = frame[3] | "";
            if (frame.size() >= 5) {
                out.payload = copyJsonDoc(frame[4], capacity);
            } else {
                out.payload = createEmptyDocument();
            }
            break;
        }
    }

    if (!out.payload) {
        MC_DBG_ERR("payload exceeds max capacity");
        return DecodeStatus::MalformedFrame;
    }

    return DecodeStatus::Ok;
}

bool encodeFrame(const Frame& frame, std::string& out) {

    if (frame.messageId.empty()) {
        MC_DBG_ERR("missing messageId");
        return false;
    }

    size_t payloadCapacity = frame.payload ? frame.payload->memoryUsage() : 0;

    size_t capacity = JSON_ARRAY_SIZE(5) + JSON_OBJECT_SIZE(0) + payloadCapacity;

    auto doc = initJsonDoc(capacity);
    JsonArray json = doc.to<JsonArray>();

    switch (frame.type) {
        case MessageType::Call:
            if (frame.action.empty()) {
                MC_DBG_ERR("missing action");
                return false;
            }
            json.add(MESSAGE_TYPE_CALL);
            json.add(frame.messageId.c_str());
            json.add(frame.action.c_str());
            if (frame.payload) {
                json.add(frame.payload->as<JsonVariantConst>());
            } else {
                json.createNestedObject();
            }
            break;
        case MessageType::CallResult:
            json.add(MESSAGE_TYPE_CALLRESULT);
            json.add(frame.messageId.c_str());
            if (frame.payload) {
                json.add(frame.payload->as<JsonVariantConst>());
            } else {
                json.createNestedObject();
            }
            break;
        case MessageType::CallError:
            json.add(MESSAGE_TYPE_CALLERROR);
            json.add(frame.messageId.c_str());
            json.add(frame.errorCode.c_str());
            json.add(frame.errorDescription.c_str());
            if (frame.payload && !frame.payload->isNull()) {
                json.add(frame.payload->as<JsonVariantConst>());
            } else {
                json.createNestedObject();
            }
            break;
    }

    if (doc.overflowed()) {
        MC_DBG_ERR("frame exceeds JSON capacity");
        return false;
    }

    out.clear();
    serializeJson(doc, out);
    return true;
}

Frame makeCall(const char *messageId, const char *action, std::unique_ptr<JsonDoc> payload) {
    Frame frame;
    frame.type = MessageType::Call;
    frame.messageId = messageId;
    frame.action = action;
    frame.payload = std::move(payload);
    return frame;
}

Frame makeCallResult(const char *messageId, std::unique_ptr<JsonDoc> payload) {
    Frame frame;
    frame.type = MessageType::CallResult;
    frame.messageId = messageId;
    frame.payload = std::move(payload);
    return frame;
}

Frame makeCallError(const char *messageId, const char *errorCode, const char *errorDescription, std::unique_ptr<JsonDoc> errorDetails) {
    Frame frame;
    frame.type = MessageType::CallError;
    frame.messageId = messageId;
    frame.errorCode = errorCode;
    frame.errorDescription = errorDescription ? errorDescription : "";
    frame.payload = errorDetails ? std::move(errorDetails) : createEmptyDocument();
    return frame;
}

} //namespace MicroCsms
