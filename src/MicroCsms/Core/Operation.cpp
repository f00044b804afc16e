// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroCsms/Core/Operation.h>
#include <MicroCsms/Debug.h>

using namespace MicroCsms;

Operation::Operation() {}

Operation::~Operation() {}

const char* Operation::getOperationType() {
    MC_DBG_ERR("Unsupported operation: getOperationType() is not implemented");
    return "CustomOperation";
}

std::unique_ptr<JsonDoc> Operation::createReq() {
    MC_DBG_ERR("Unsupported operation: createReq() is not implemented");
    return createEmptyDocument();
}

void Operation::processConf(JsonObject payload) {
    MC_DBG_ERR("Unsupported operation: processConf() is not implemented");
}

void Operation::processReq(JsonObject payload) {
    MC_DBG_ERR("Unsupported operation: processReq() is not implemented");
}

std::unique_ptr<JsonDoc> Operation::createConf() {
    MC_DBG_ERR("Unsupported operation: createConf() is not implemented");
    return createEmptyDocument();
}
