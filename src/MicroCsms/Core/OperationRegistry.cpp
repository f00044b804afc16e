// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <algorithm>

#include <MicroCsms/Core/OperationRegistry.h>
#include <MicroCsms/Core/Operation.h>
#include <MicroCsms/Core/OcppError.h>
#include <MicroCsms/Debug.h>

using namespace MicroCsms;

OperationRegistry::OperationRegistry() {

}

void OperationRegistry::registerOperation(const char *operationType, OperationCreator creator) {
    std::lock_guard<std::mutex> lock(mutex);

    registry.erase(std::remove_if(registry.begin(), registry.end(),
                [operationType] (const Entry& el) {
                    return el.operationType == operationType;
                }),
            registry.end());

    registry.push_back(Entry{operationType, creator});

    MC_DBG_DEBUG("registered operation %s", operationType);
}

bool OperationRegistry::isRegistered(const char *operationType) {
    std::lock_guard<std::mutex> lock(mutex);
    for (auto& entry : registry) {
        if (entry.operationType == operationType) {
            return true;
        }
    }
    return false;
}

std::unique_ptr<Operation> OperationRegistry::createOperation(const char *operationType, const char *chargePointId) {

    OperationCreator creator;
    {
        std::lock_guard<std::mutex> lock(mutex);
        for (auto& entry : registry) {
            if (entry.operationType == operationType) {
                creator = entry.creator;
                break;
            }
        }
    }

    if (creator) {
        if (auto operation = creator(chargePointId)) {
            return std::unique_ptr<Operation>(operation);
        }
        MC_DBG_ERR("could not create %s", operationType);
        return std::unique_ptr<Operation>(new InternalError("handler not available"));
    }

    return std::unique_ptr<Operation>(new UnsupportedAction(operationType));
}

void OperationRegistry::debugPrint() {
    std::lock_guard<std::mutex> lock(mutex);
    for (auto& entry : registry) {
        MC_DBG_INFO("    > %s", entry.operationType.c_str());
    }
}
