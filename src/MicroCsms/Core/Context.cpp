// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroCsms/Core/Context.h>
#include <MicroCsms/Core/FilesystemAdapter.h>
#include <MicroCsms/Model/Registry/ConnectionRegistry.h>
#include <MicroCsms/Model/Audit/AuditLog.h>
#include <MicroCsms/Debug.h>

#define MC_CALLTIMEOUT_DEFAULT 10 //in seconds
#define MC_HEARTBEATINTERVAL_DEFAULT 300 //in seconds

using namespace MicroCsms;

Context::Context(std::shared_ptr<FilesystemAdapter> filesystem) : filesystem(filesystem), configuration(filesystem) {

    callTimeoutInt = configuration.declareConfiguration<int>("CallTimeout", MC_CALLTIMEOUT_DEFAULT);
    configuration.registerValidator("CallTimeout", VALIDATE_UNSIGNED_INT);

    heartbeatIntervalInt = configuration.declareConfiguration<int>("HeartbeatInterval", MC_HEARTBEATINTERVAL_DEFAULT);
    configuration.registerValidator("HeartbeatInterval", VALIDATE_UNSIGNED_INT);

    if (filesystem) {
        connectionRegistry.reset(new FileConnectionRegistry(filesystem, clock));
        auditLog.reset(new FileAuditLog(filesystem, clock));
    } else {
        connectionRegistry.reset(new VolatileConnectionRegistry());
        auditLog.reset(new VolatileAuditLog());
    }
}

Context::~Context() {

}

std::shared_ptr<FilesystemAdapter> Context::getFilesystem() {
    return filesystem;
}

Clock& Context::getClock() {
    return clock;
}

ConfigurationService& Context::getConfiguration() {
    return configuration;
}

OperationRegistry& Context::getOperationRegistry() {
    return operationRegistry;
}

SessionManager& Context::getSessionManager() {
    return sessionManager;
}

void Context::setConnectionRegistry(std::unique_ptr<ConnectionRegistry> connectionRegistry) {
    this->connectionRegistry = std::move(connectionRegistry);
}

ConnectionRegistry *Context::getConnectionRegistry() {
    return connectionRegistry.get();
}

void Context::setAuditLog(std::unique_ptr<AuditLog> auditLog) {
    this->auditLog = std::move(auditLog);
}

AuditLog *Context::getAuditLog() {
    return auditLog.get();
}

unsigned long Context::getCallTimeoutMs() {
    int timeout = callTimeoutInt ? callTimeoutInt->getInt() : MC_CALLTIMEOUT_DEFAULT;
    if (timeout <= 0) {
        timeout = MC_CALLTIMEOUT_DEFAULT;
    }
    return (unsigned long) timeout * 1000UL;
}

int Context::getHeartbeatInterval() {
    int interval = heartbeatIntervalInt ? heartbeatIntervalInt->getInt() : MC_HEARTBEATINTERVAL_DEFAULT;
    if (interval < 0) {
        interval = MC_HEARTBEATINTERVAL_DEFAULT;
    }
    return interval;
}
