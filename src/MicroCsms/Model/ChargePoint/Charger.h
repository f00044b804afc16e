// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_CHARGER_H
#define MC_CHARGER_H

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <MicroCsms/Core/Time.h>

namespace MicroCsms {

enum class ChargePointStatus : uint8_t {
    Available,
    Preparing,
    Charging,
    SuspendedEVSE,
    SuspendedEV,
    Finishing,
    Reserved,
    Unavailable,
    Faulted
};

const char *serializeChargePointStatus(ChargePointStatus status);
bool deserializeChargePointStatus(const char *serialized, ChargePointStatus& out);

/*
 * Statuses in which an energy transfer is in progress or about to start / end. Any other status ends
 * ongoing transactions of the charger
 */
bool isChargingStatus(ChargePointStatus status);

struct Charger {
    int id = 0;
    std::string chargePointId;
    ChargePointStatus status = ChargePointStatus::Unavailable;
    Timestamp lastHeartbeat; //undefined if the charger never sent a Heartbeat

    //reported in BootNotification
    std::string vendor;
    std::string model;
    std::string serialNumber;
    std::string firmwareVersion;
};

/*
 * Directory of the chargers which are registered in the system. Only registered chargers are allowed
 * to connect
 */
class ChargerStore {
public:
    virtual ~ChargerStore() = default;

    virtual bool get(const char *chargePointId, Charger& out) = 0;
    virtual bool getById(int chargerId, Charger& out) = 0;
    virtual bool update(const Charger& charger) = 0;
};

class VolatileChargerStore : public ChargerStore {
private:
    std::map<std::string, Charger> chargers;
    int nextId = 1;
    std::mutex mutex;
public:
    /*
     * Registers a charger with status Unavailable. Returns its id or 0 if chargePointId is taken
     */
    int add(const char *chargePointId);

    bool get(const char *chargePointId, Charger& out) override;
    bool getById(int chargerId, Charger& out) override;
    bool update(const Charger& charger) override;
};

} //namespace MicroCsms

#endif
