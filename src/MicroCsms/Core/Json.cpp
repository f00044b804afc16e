// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroCsms/Core/Json.h>
#include <MicroCsms/Debug.h>

namespace MicroCsms {

JsonDoc initJsonDoc(size_t capacity) {
    return JsonDoc(capacity);
}

std::unique_ptr<JsonDoc> makeJsonDoc(size_t capacity) {
    return std::unique_ptr<JsonDoc>(new JsonDoc(capacity));
}

std::unique_ptr<JsonDoc> createEmptyDocument() {
    auto emptyDoc = makeJsonDoc(JSON_OBJECT_SIZE(0));
    emptyDoc->to<JsonObject>();
    return emptyDoc;
}

DeserializationError deserializeJsonDoc(const char *json, size_t length, JsonDoc& doc) {

    size_t capacity_init = (3 * length) / 2;

    //capacity = ceil capacity_init to the next power of two; should be at least 128

    size_t capacity = 128;
    while (capacity < capacity_init && capacity < MC_MAX_JSON_CAPACITY) {
        capacity *= 2;
    }
    if (capacity > MC_MAX_JSON_CAPACITY) {
        capacity = MC_MAX_JSON_CAPACITY;
    }

    DeserializationError err = DeserializationError::NoMemory;

    while (err == DeserializationError::NoMemory && capacity <= MC_MAX_JSON_CAPACITY) {

        doc = initJsonDoc(capacity);
        if (doc.capacity() < capacity) {
            MC_DBG_ERR("OOM");
            return DeserializationError::NoMemory;
        }
        err = deserializeJson(doc, json, length);

        capacity *= 2;
    }

    return err;
}

std::unique_ptr<JsonDoc> copyJsonDoc(JsonVariantConst src, size_t capacityHint) {
    size_t capacity = capacityHint > 0 ? capacityHint : 128;

    while (capacity <= MC_MAX_JSON_CAPACITY) {
        auto doc = makeJsonDoc(capacity);
        if (doc->set(src) && !doc->overflowed()) {
            return doc;
        }
        capacity *= 2;
    }

    MC_DBG_ERR("JSON value exceeds max capacity");
    return nullptr;
}

} //namespace MicroCsms
