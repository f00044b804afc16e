// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_MODEL_H
#define MC_MODEL_H

#include <memory>

namespace MicroCsms {

class Context;

class ChargerStore;
class UserStore;
class TransactionStore;
class TariffStore;
class WalletStore;
class FirmwareUpdateStore;

class BillingService;
class BillingRetrySweep;
class TransactionService;
class ConnectionStatusService;
class HeartbeatMonitor;
class AuditLogRetention;
class RemoteControlService;
class FirmwareService;

/*
 * Domain state of the server. The stores are the persistence interfaces, the services implement the
 * behavior on top of them. Stores which are not set before setup() default to the volatile
 * implementations
 */
class Model {
private:
    Context& context;

    std::unique_ptr<ChargerStore> chargerStore;
    std::unique_ptr<UserStore> userStore;
    std::unique_ptr<TransactionStore> transactionStore;
    std::unique_ptr<TariffStore> tariffStore;
    std::unique_ptr<WalletStore> walletStore;
    std::unique_ptr<FirmwareUpdateStore> firmwareUpdateStore;

    std::unique_ptr<BillingService> billingService;
    std::unique_ptr<BillingRetrySweep> billingRetrySweep;
    std::unique_ptr<TransactionService> transactionService;
    std::unique_ptr<ConnectionStatusService> connectionStatusService;
    std::unique_ptr<HeartbeatMonitor> heartbeatMonitor;
    std::unique_ptr<AuditLogRetention> auditLogRetention;
    std::unique_ptr<RemoteControlService> remoteControlService;
    std::unique_ptr<FirmwareService> firmwareService;
public:
    Model(Context& context);
    ~Model();

    void setChargerStore(std::unique_ptr<ChargerStore> chargerStore);
    void setUserStore(std::unique_ptr<UserStore> userStore);
    void setTransactionStore(std::unique_ptr<TransactionStore> transactionStore);
    void setTariffStore(std::unique_ptr<TariffStore> tariffStore);
    void setWalletStore(std::unique_ptr<WalletStore> walletStore);
    void setFirmwareUpdateStore(std::unique_ptr<FirmwareUpdateStore> firmwareUpdateStore);

    bool setup();

    ChargerStore *getChargerStore();
    UserStore *getUserStore();
    TransactionStore *getTransactionStore();
    TariffStore *getTariffStore();
    WalletStore *getWalletStore();
    FirmwareUpdateStore *getFirmwareUpdateStore();

    BillingService *getBillingService();
    BillingRetrySweep *getBillingRetrySweep();
    TransactionService *getTransactionService();
    ConnectionStatusService *getConnectionStatusService();
    HeartbeatMonitor *getHeartbeatMonitor();
    AuditLogRetention *getAuditLogRetention();
    RemoteControlService *getRemoteControlService();
    FirmwareService *getFirmwareService();
};

} //namespace MicroCsms

#endif
