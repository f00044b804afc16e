// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_MICROCSMS_H
#define MC_MICROCSMS_H

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <MicroCsms/Core/Context.h>
#include <MicroCsms/Core/Connection.h>
#include <MicroCsms/Core/FilesystemAdapter.h>
#include <MicroCsms/Core/Request.h>
#include <MicroCsms/Model/Model.h>
#include <MicroCsms/Model/Billing/BillingService.h>
#include <MicroCsms/Model/FirmwareManagement/FirmwareService.h>
#include <MicroCsms/Model/RemoteControl/RemoteControlDefs.h>
#include <MicroCsms/Server/Session.h>
#include <MicroCsms/Version.h>

namespace MicroCsms {

/*
 * OCPP 1.6 central system. Owns the server infrastructure (Context) and the domain state (Model) and
 * exposes the calls of the admin / REST layer.
 *
 * Lifecycle:
 *     1. construct, optionally inject stores with getModel().setXStore(...)
 *     2. setup()
 *     3. for each WebSocket connection: openSession(), then session->receiveLoop() on a dedicated thread
 *     4. shutdown()
 */
class CentralSystem {
private:
    std::unique_ptr<Context> context;
    std::unique_ptr<Model> model;
    bool isSetUp = false;

    void registerOperations();
public:
    /*
     * `filesystem` is used for the configuration, the connection registry and the audit log. If nullptr,
     * they are volatile
     */
    CentralSystem(std::shared_ptr<FilesystemAdapter> filesystem = nullptr);
    ~CentralSystem();

    CentralSystem(const CentralSystem&) = delete;
    CentralSystem& operator=(const CentralSystem&) = delete;

    Context& getContext();
    Model& getModel();

    bool setup();

    /*
     * Starts / stops the background tasks (billing retry sweep, heartbeat monitor, audit retention)
     */
    void startTasks();
    void stopTasks();

    /*
     * Closes all sessions and stops the background tasks
     */
    void shutdown();

    /*
     * Admits a new charge point connection. Returns nullptr and closes the connection with 1008 if the
     * charge point is not registered or already connected to this process. The caller runs the receive
     * loop of the returned session
     */
    std::shared_ptr<Session> openSession(const char *chargePointId, std::shared_ptr<Connection> connection);

    /*
     * REST-facing operations
     */

    bool isConnected(const char *chargePointId);

    CommandResult sendCommand(const char *chargePointId, const char *action, const JsonDoc& payload, unsigned long timeoutMs = 0);

    std::map<std::string, bool> bulkConnectionStatus(const std::vector<std::string>& chargePointIds);

    RemoteCommandResult remoteStartTransaction(const char *chargePointId, int connectorId, const char *idTag);
    RemoteCommandResult remoteStopTransaction(const char *chargePointId, int transactionId);
    RemoteCommandResult changeAvailability(const char *chargePointId, int connectorId, AvailabilityType type);
    RemoteCommandResult reset(const char *chargePointId, ResetType type);

    FirmwareUpdateResult updateFirmware(const char *chargePointId, int firmwareFileId, const char *targetVersion, const char *location);

    BillingResult retryFailedBilling(int transactionId);

    bool evict(const char *chargePointId, const char *reason);
};

} //namespace MicroCsms

#endif
