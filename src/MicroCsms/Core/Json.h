// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_JSON_H
#define MC_JSON_H

#include <memory>
#include <string>

#include <ArduinoJson.h>

#include <MicroCsms/Platform.h>

namespace MicroCsms {

using JsonDoc = DynamicJsonDocument;

JsonDoc initJsonDoc(size_t capacity = 0);
std::unique_ptr<JsonDoc> makeJsonDoc(size_t capacity = 0);

std::unique_ptr<JsonDoc> createEmptyDocument(); //returns document with an empty JSON object

/*
 * Deserializes `json` into `doc`. Starts with a capacity in the order of the input length and doubles
 * it until the document fits or MC_MAX_JSON_CAPACITY is exceeded
 */
DeserializationError deserializeJsonDoc(const char *json, size_t length, JsonDoc& doc);

/*
 * Deep copy of `src` into a new document
 */
std::unique_ptr<JsonDoc> copyJsonDoc(JsonVariantConst src, size_t capacityHint = 0);

} //namespace MicroCsms

#endif
