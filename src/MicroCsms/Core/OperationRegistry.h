// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_OPERATIONREGISTRY_H
#define MC_OPERATIONREGISTRY_H

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace MicroCsms {

class Operation;

/*
 * Creates the handler of an incoming Call. `chargePointId` is the charge point which sent the Call
 */
using OperationCreator = std::function<Operation*(const char *chargePointId)>;

class OperationRegistry {
private:
    struct Entry {
        std::string operationType;
        OperationCreator creator;
    };
    std::vector<Entry> registry;
    std::mutex mutex;

public:
    OperationRegistry();

    void registerOperation(const char *operationType, OperationCreator creator);

    bool isRegistered(const char *operationType);

    /*
     * Returns the handler for the action. Unknown actions yield an UnsupportedAction handler which
     * answers with an empty confirmation
     */
    std::unique_ptr<Operation> createOperation(const char *operationType, const char *chargePointId);

    void debugPrint();
};

} //namespace MicroCsms

#endif
