// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_CONNECTIONSTATUSSERVICE_H
#define MC_CONNECTIONSTATUSSERVICE_H

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace MicroCsms {

class Context;
class Configuration;
class ChargerStore;
struct Charger;

/*
 * Resolves if chargers are online. The connection registry alone can be stale (e.g. after a crashed
 * server process), so a charger only counts as connected if it is registered AND its last Heartbeat is
 * recent
 */
class ConnectionStatusService {
private:
    Context& context;
    ChargerStore& chargerStore;

    std::shared_ptr<Configuration> stalenessThresholdInt; //in s

    bool isConnected(const Charger& charger, const std::set<std::string>& registered);
public:
    ConnectionStatusService(Context& context, ChargerStore& chargerStore);

    /*
     * Connection status of each charger. Reads the registry only once for the whole batch. Unknown
     * chargers map to false
     */
    std::map<std::string, bool> bulkConnectionStatus(const std::vector<std::string>& chargePointIds);

    bool isConnected(const char *chargePointId);

    int getStalenessThreshold(); //in s
};

} //namespace MicroCsms

#endif
