// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_SESSIONMANAGER_H
#define MC_SESSIONMANAGER_H

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <MicroCsms/Core/Json.h>
#include <MicroCsms/Core/Request.h>

namespace MicroCsms {

class Session;
class Operation;

enum class AdmitResult : uint8_t {
    Admitted,
    AlreadyConnected
};

/*
 * Sessions which are live in this process, by chargePointId. The only authority for deciding if the
 * server can send a command to a charge point right now
 */
class SessionManager {
private:
    std::map<std::string, std::shared_ptr<Session>> sessions;
    std::mutex mutex;
public:
    SessionManager();

    /*
     * Check-and-insert. At most one session per chargePointId
     */
    AdmitResult admit(const char *chargePointId, std::shared_ptr<Session> session);

    /*
     * Removes the entry of chargePointId. Idempotent
     */
    bool remove(const char *chargePointId);

    /*
     * Removes the entry of chargePointId only if it still belongs to `session`. A closing session uses
     * this to avoid evicting a newer session of the same charge point
     */
    bool remove(const char *chargePointId, const Session *session);

    std::shared_ptr<Session> get(const char *chargePointId);

    bool isConnected(const char *chargePointId);

    std::vector<std::string> getConnectedIds();
    size_t size();

    /*
     * Sends a Call to the charge point and waits for its response. `timeoutMs = 0` selects the
     * configured default
     */
    CommandResult sendCommand(const char *chargePointId, const char *action, const JsonDoc& payload, unsigned long timeoutMs = 0);
    CommandResult sendCommand(const char *chargePointId, Operation& operation, unsigned long timeoutMs = 0);

    /*
     * Force-disconnects the session of chargePointId with close code 1001. Returns false if there is none
     */
    bool evict(const char *chargePointId, const char *reason);

    void closeAll();
};

} //namespace MicroCsms

#endif
