// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_HEARTBEATMONITOR_H
#define MC_HEARTBEATMONITOR_H

#include <MicroCsms/Core/ScheduledTask.h>

#define MC_HEARTBEATMONITOR_PERIOD 15000UL //in ms

namespace MicroCsms {

class Context;
class ChargerStore;
class ConnectionStatusService;

/*
 * Drops sessions of charge points which went silent, e.g. behind a half-open TCP connection. A session
 * is silent if neither the connect nor the last Heartbeat is within the StalenessThreshold
 */
class HeartbeatMonitor {
private:
    Context& context;
    ChargerStore& chargerStore;
    ConnectionStatusService& connectionStatusService;

    ScheduledTask monitorTask;
public:
    HeartbeatMonitor(Context& context, ChargerStore& chargerStore, ConnectionStatusService& connectionStatusService);
    ~HeartbeatMonitor();

    /*
     * Checks all connected charge points once and evicts the silent ones. Returns the number of
     * evicted sessions
     */
    unsigned int runOnce();

    void start();
    void stop();
};

} //namespace MicroCsms

#endif
