// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <string>

#include <MicroCsms.h>
#include <MicroCsms/Server/SessionManager.h>
#include <MicroCsms/Model/ChargePoint/Charger.h>
#include <MicroCsms/Model/Billing/BillingRetrySweep.h>
#include <MicroCsms/Model/Connectivity/ConnectionStatusService.h>
#include <MicroCsms/Model/Connectivity/HeartbeatMonitor.h>
#include <MicroCsms/Model/Audit/AuditLogRetention.h>
#include <MicroCsms/Model/RemoteControl/RemoteControlService.h>
#include <MicroCsms/Operations/BootNotification.h>
#include <MicroCsms/Operations/Heartbeat.h>
#include <MicroCsms/Operations/StatusNotification.h>
#include <MicroCsms/Operations/StartTransaction.h>
#include <MicroCsms/Operations/StopTransaction.h>
#include <MicroCsms/Operations/MeterValues.h>
#include <MicroCsms/Operations/FirmwareStatusNotification.h>
#include <MicroCsms/Debug.h>

using namespace MicroCsms;

CentralSystem::CentralSystem(std::shared_ptr<FilesystemAdapter> filesystem) {
    context.reset(new Context(filesystem));
    model.reset(new Model(*context));
}

CentralSystem::~CentralSystem() {
    shutdown();
    model.reset();
    context.reset();
}

Context& CentralSystem::getContext() {
    return *context;
}

Model& CentralSystem::getModel() {
    return *model;
}

void CentralSystem::registerOperations() {
    auto& registry = context->getOperationRegistry();
    auto& ctx = *context;
    auto& mdl = *model;

    registry.registerOperation("BootNotification", [&ctx, &mdl] (const char *chargePointId) {
        return new BootNotification(ctx, mdl, chargePointId);});
    registry.registerOperation("Heartbeat", [&ctx, &mdl] (const char *chargePointId) {
        return new Heartbeat(ctx, mdl, chargePointId);});
    registry.registerOperation("StatusNotification", [&ctx, &mdl] (const char *chargePointId) {
        return new StatusNotification(ctx, mdl, chargePointId);});
    registry.registerOperation("StartTransaction", [&ctx, &mdl] (const char *chargePointId) {
        return new StartTransaction(ctx, mdl, chargePointId);});
    registry.registerOperation("StopTransaction", [&mdl] (const char *chargePointId) {
        return new StopTransaction(mdl, chargePointId);});
    registry.registerOperation("MeterValues", [&ctx, &mdl] (const char *chargePointId) {
        return new MeterValues(ctx, mdl, chargePointId);});
    registry.registerOperation("FirmwareStatusNotification", [&mdl] (const char *chargePointId) {
        return new FirmwareStatusNotification(mdl, chargePointId);});
}

bool CentralSystem::setup() {
    if (isSetUp) {
        MC_DBG_WARN("already set up");
        return true;
    }

    //declared configs take the stored values as soon as they are declared
    if (!context->getConfiguration().load()) {
        MC_DBG_WARN("could not load configuration. Continue with defaults");
    }

    if (!model->setup()) {
        MC_DBG_ERR("could not set up model");
        return false;
    }

    registerOperations();

    if (!context->getConfiguration().save()) {
        MC_DBG_WARN("could not store configuration");
    }

    isSetUp = true;

    MC_DBG_INFO("MicroCsms %s (OCPP %s) set up", MC_VERSION, MC_OCPP_VERSION);
    return true;
}

void CentralSystem::startTasks() {
    if (auto sweep = model->getBillingRetrySweep()) {
        sweep->start();
    }
    if (auto monitor = model->getHeartbeatMonitor()) {
        monitor->start();
    }
    if (auto retention = model->getAuditLogRetention()) {
        retention->start();
    }
}

void CentralSystem::stopTasks() {
    if (auto sweep = model->getBillingRetrySweep()) {
        sweep->stop();
    }
    if (auto monitor = model->getHeartbeatMonitor()) {
        monitor->stop();
    }
    if (auto retention = model->getAuditLogRetention()) {
        retention->stop();
    }
}

void CentralSystem::shutdown() {
    stopTasks();
    if (context) {
        context->getSessionManager().closeAll();
    }
}

std::shared_ptr<Session> CentralSystem::openSession(const char *chargePointId, std::shared_ptr<Connection> connection) {

    if (!chargePointId || !*chargePointId || !connection) {
        MC_DBG_ERR("invalid args");
        return nullptr;
    }

    auto chargerStore = model->getChargerStore();

    Charger charger;
    if (!chargerStore || !chargerStore->get(chargePointId, charger)) {
        std::string reason = std::string("Charger ") + chargePointId + " not registered in system";
        MC_DBG_WARN("reject connection: %s", reason.c_str());
        connection->close(MC_CLOSE_POLICY_VIOLATION, reason.c_str());
        return nullptr;
    }

    auto session = std::make_shared<Session>(*context, chargePointId, connection);

    if (context->getSessionManager().admit(chargePointId, session) != AdmitResult::Admitted) {
        std::string reason = std::string("Charger ") + chargePointId + " is already connected";
        MC_DBG_WARN("reject connection: %s", reason.c_str());
        connection->close(MC_CLOSE_POLICY_VIOLATION, reason.c_str());
        return nullptr;
    }

    if (!session->activate()) {
        context->getSessionManager().remove(chargePointId, session.get());
        connection->close(MC_CLOSE_TRY_AGAIN_LATER, "Session setup failed");
        return nullptr;
    }

    return session;
}

bool CentralSystem::isConnected(const char *chargePointId) {
    return context->getSessionManager().isConnected(chargePointId);
}

CommandResult CentralSystem::sendCommand(const char *chargePointId, const char *action, const JsonDoc& payload, unsigned long timeoutMs) {
    return context->getSessionManager().sendCommand(chargePointId, action, payload, timeoutMs);
}

std::map<std::string, bool> CentralSystem::bulkConnectionStatus(const std::vector<std::string>& chargePointIds) {
    auto connectionStatus = model->getConnectionStatusService();
    if (!connectionStatus) {
        MC_DBG_ERR("not set up");
        std::map<std::string, bool> res;
        for (auto& id : chargePointIds) {
            res[id] = false;
        }
        return res;
    }
    return connectionStatus->bulkConnectionStatus(chargePointIds);
}

RemoteCommandResult CentralSystem::remoteStartTransaction(const char *chargePointId, int connectorId, const char *idTag) {
    //TODO: the idTag is not reserved until the StartTransaction arrives, so two concurrent remote starts with the same idTag can both be accepted
    return model->getRemoteControlService()->remoteStartTransaction(chargePointId, connectorId, idTag);
}

RemoteCommandResult CentralSystem::remoteStopTransaction(const char *chargePointId, int transactionId) {
    return model->getRemoteControlService()->remoteStopTransaction(chargePointId, transactionId);
}

RemoteCommandResult CentralSystem::changeAvailability(const char *chargePointId, int connectorId, AvailabilityType type) {
    return model->getRemoteControlService()->changeAvailability(chargePointId, connectorId, type);
}

RemoteCommandResult CentralSystem::reset(const char *chargePointId, ResetType type) {
    return model->getRemoteControlService()->reset(chargePointId, type);
}

FirmwareUpdateResult CentralSystem::updateFirmware(const char *chargePointId, int firmwareFileId, const char *targetVersion, const char *location) {
    return model->getFirmwareService()->startUpdate(chargePointId, firmwareFileId, targetVersion, location);
}

BillingResult CentralSystem::retryFailedBilling(int transactionId) {
    return model->getBillingService()->retryFailedBilling(transactionId);
}

bool CentralSystem::evict(const char *chargePointId, const char *reason) {
    return context->getSessionManager().evict(chargePointId, reason);
}
