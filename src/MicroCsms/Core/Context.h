// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_CONTEXT_H
#define MC_CONTEXT_H

#include <memory>

#include <MicroCsms/Core/Time.h>
#include <MicroCsms/Core/Configuration.h>
#include <MicroCsms/Core/OperationRegistry.h>
#include <MicroCsms/Server/SessionManager.h>

namespace MicroCsms {

class FilesystemAdapter;
class ConnectionRegistry;
class AuditLog;

/*
 * Infrastructure shared by all sessions of the server process
 */
class Context {
private:
    std::shared_ptr<FilesystemAdapter> filesystem;

    Clock clock;
    ConfigurationService configuration;
    OperationRegistry operationRegistry;
    SessionManager sessionManager;

    std::unique_ptr<ConnectionRegistry> connectionRegistry;
    std::unique_ptr<AuditLog> auditLog;

    std::shared_ptr<Configuration> callTimeoutInt;
    std::shared_ptr<Configuration> heartbeatIntervalInt;
public:
    Context(std::shared_ptr<FilesystemAdapter> filesystem);
    ~Context();

    std::shared_ptr<FilesystemAdapter> getFilesystem();

    Clock& getClock();
    ConfigurationService& getConfiguration();
    OperationRegistry& getOperationRegistry();
    SessionManager& getSessionManager();

    void setConnectionRegistry(std::unique_ptr<ConnectionRegistry> connectionRegistry);
    ConnectionRegistry *getConnectionRegistry();

    void setAuditLog(std::unique_ptr<AuditLog> auditLog);
    AuditLog *getAuditLog();

    unsigned long getCallTimeoutMs();
    int getHeartbeatInterval(); //in s, announced to the charge points in BootNotification
};

} //namespace MicroCsms

#endif
