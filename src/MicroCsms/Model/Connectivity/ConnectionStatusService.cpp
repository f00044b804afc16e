// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroCsms/Model/Connectivity/ConnectionStatusService.h>
#include <MicroCsms/Model/ChargePoint/Charger.h>
#include <MicroCsms/Model/Registry/ConnectionRegistry.h>
#include <MicroCsms/Core/Context.h>
#include <MicroCsms/Debug.h>

#define MC_STALENESS_THRESHOLD_DEFAULT 90

using namespace MicroCsms;

ConnectionStatusService::ConnectionStatusService(Context& context, ChargerStore& chargerStore) :
        context(context), chargerStore(chargerStore) {

    stalenessThresholdInt = context.getConfiguration().declareConfiguration<int>("StalenessThreshold", MC_STALENESS_THRESHOLD_DEFAULT);
    context.getConfiguration().registerValidator("StalenessThreshold", VALIDATE_UNSIGNED_INT);
}

bool ConnectionStatusService::isConnected(const Charger& charger, const std::set<std::string>& registered) {
    if (registered.find(charger.chargePointId) == registered.end()) {
        return false;
    }

    if (!charger.lastHeartbeat.isDefined()) {
        MC_DBG_DEBUG("%s registered, but never sent a Heartbeat", charger.chargePointId.c_str());
        return false;
    }

    int32_t dt;
    if (!context.getClock().delta(context.getClock().now(), charger.lastHeartbeat, dt)) {
        return false;
    }

    if (dt > getStalenessThreshold()) {
        MC_DBG_DEBUG("%s registered, but last Heartbeat is %i s old", charger.chargePointId.c_str(), dt);
        return false;
    }

    return true;
}

std::map<std::string, bool> ConnectionStatusService::bulkConnectionStatus(const std::vector<std::string>& chargePointIds) {

    std::set<std::string> registered;
    if (auto registry = context.getConnectionRegistry()) {
        auto ids = registry->listAll();
        registered.insert(ids.begin(), ids.end());
    } else {
        MC_DBG_WARN("no connection registry");
    }

    std::map<std::string, bool> res;
    for (auto& id : chargePointIds) {
        Charger charger;
        if (!chargerStore.get(id.c_str(), charger)) {
            res[id] = false;
            continue;
        }
        res[id] = isConnected(charger, registered);
    }

    return res;
}

bool ConnectionStatusService::isConnected(const char *chargePointId) {
    std::vector<std::string> ids;
    ids.push_back(chargePointId);
    return bulkConnectionStatus(ids)[chargePointId];
}

int ConnectionStatusService::getStalenessThreshold() {
    int threshold = stalenessThresholdInt->getInt();
    return threshold >= 0 ? threshold : 0;
}
