// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <stdio.h>

#include <MicroCsms/Model/Connectivity/HeartbeatMonitor.h>
#include <MicroCsms/Model/Connectivity/ConnectionStatusService.h>
#include <MicroCsms/Model/ChargePoint/Charger.h>
#include <MicroCsms/Server/Session.h>
#include <MicroCsms/Server/SessionManager.h>
#include <MicroCsms/Core/Context.h>
#include <MicroCsms/Debug.h>

using namespace MicroCsms;

HeartbeatMonitor::HeartbeatMonitor(Context& context, ChargerStore& chargerStore, ConnectionStatusService& connectionStatusService) :
        context(context), chargerStore(chargerStore), connectionStatusService(connectionStatusService),
        monitorTask("HeartbeatMonitor", [this] () {runOnce();}) {

}

HeartbeatMonitor::~HeartbeatMonitor() {
    stop();
}

unsigned int HeartbeatMonitor::runOnce() {

    auto& clock = context.getClock();
    auto& sessionManager = context.getSessionManager();

    auto now = clock.now();
    int threshold = connectionStatusService.getStalenessThreshold();

    char reason [64];
    snprintf(reason, sizeof(reason), "Heartbeat timeout (%is)", threshold);

    unsigned int evicted = 0;

    for (auto& id : sessionManager.getConnectedIds()) {
        auto session = sessionManager.get(id.c_str());
        if (!session) {
            continue; //disconnected in the meantime
        }

        Timestamp lastSeen = session->getConnectedAt();

        Charger charger;
        if (chargerStore.get(id.c_str(), charger) && charger.lastHeartbeat.isDefined() &&
                (!lastSeen.isDefined() || lastSeen < charger.lastHeartbeat)) {
            lastSeen = charger.lastHeartbeat;
        }

        if (!lastSeen.isDefined()) {
            continue; //not active yet
        }

        int32_t dt;
        if (!clock.delta(now, lastSeen, dt) || dt <= threshold) {
            continue;
        }

        MC_DBG_WARN("%s silent for %i s", id.c_str(), dt);
        if (sessionManager.evict(id.c_str(), reason)) {
            evicted++;
        }
    }

    if (evicted > 0) {
        MC_DBG_INFO("heartbeat monitor: evicted %u sessions", evicted);
    }
    return evicted;
}

void HeartbeatMonitor::start() {
    monitorTask.start([] () {return MC_HEARTBEATMONITOR_PERIOD;}, MC_HEARTBEATMONITOR_PERIOD);
}

void HeartbeatMonitor::stop() {
    monitorTask.stop();
}
