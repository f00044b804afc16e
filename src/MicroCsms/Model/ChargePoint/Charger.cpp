// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <string.h>

#include <MicroCsms/Model/ChargePoint/Charger.h>
#include <MicroCsms/Debug.h>

namespace MicroCsms {

const char *serializeChargePointStatus(ChargePointStatus status) {
    switch (status) {
        case ChargePointStatus::Available:
            return "Available";
        case ChargePointStatus::Preparing:
            return "Preparing";
        case ChargePointStatus::Charging:
            return "Charging";
        case ChargePointStatus::SuspendedEVSE:
            return "SuspendedEVSE";
        case ChargePointStatus::SuspendedEV:
            return "SuspendedEV";
        case ChargePointStatus::Finishing:
            return "Finishing";
        case ChargePointStatus::Reserved:
            return "Reserved";
        case ChargePointStatus::Unavailable:
            return "Unavailable";
        case ChargePointStatus::Faulted:
            return "Faulted";
    }
    return "_Undefined";
}

bool deserializeChargePointStatus(const char *serialized, ChargePointStatus& out) {
    if (!serialized) {
        return false;
    }

    const ChargePointStatus statuses [] = {
        ChargePointStatus::Available,
        ChargePointStatus::Preparing,
        ChargePointStatus::Charging,
        ChargePointStatus::SuspendedEVSE,
        ChargePointStatus::SuspendedEV,
        ChargePointStatus::Finishing,
        ChargePointStatus::Reserved,
        ChargePointStatus::Unavailable,
        ChargePointStatus::Faulted
    };

    for (auto status : statuses) {
        if (!strcmp(serialized, serializeChargePointStatus(status))) {
            out = status;
            return true;
        }
    }
    return false;
}

bool isChargingStatus(ChargePointStatus status) {
    return status == ChargePointStatus::Charging ||
           status == ChargePointStatus::Preparing ||
           status == ChargePointStatus::SuspendedEVSE ||
           status == ChargePointStatus::SuspendedEV ||
           status == ChargePointStatus::Finishing;
}

} //namespace MicroCsms

using namespace MicroCsms;

int VolatileChargerStore::add(const char *chargePointId) {
    std::lock_guard<std::mutex> lock(mutex);
    if (chargers.find(chargePointId) != chargers.end()) {
        MC_DBG_ERR("duplicate chargePointId %s", chargePointId);
        return 0;
    }
    Charger charger;
    charger.id = nextId++;
    charger.chargePointId = chargePointId;
    chargers[chargePointId] = charger;
    return charger.id;
}

bool VolatileChargerStore::get(const char *chargePointId, Charger& out) {
    std::lock_guard<std::mutex> lock(mutex);
    auto entry = chargers.find(chargePointId);
    if (entry == chargers.end()) {
        return false;
    }
    out = entry->second;
    return true;
}

bool VolatileChargerStore::getById(int chargerId, Charger& out) {
    std::lock_guard<std::mutex> lock(mutex);
    for (auto& entry : chargers) {
        if (entry.second.id == chargerId) {
            out = entry.second;
            return true;
        }
    }
    return false;
}

bool VolatileChargerStore::update(const Charger& charger) {
    std::lock_guard<std::mutex> lock(mutex);
    auto entry = chargers.find(charger.chargePointId);
    if (entry == chargers.end() || entry->second.id != charger.id) {
        MC_DBG_ERR("charger %s not found", charger.chargePointId.c_str());
        return false;
    }
    entry->second = charger;
    return true;
}
