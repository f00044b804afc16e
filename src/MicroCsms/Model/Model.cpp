// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroCsms/Model/Model.h>
#include <MicroCsms/Core/Context.h>
#include <MicroCsms/Model/ChargePoint/Charger.h>
#include <MicroCsms/Model/Authorization/UserStore.h>
#include <MicroCsms/Model/Transactions/TransactionStore.h>
#include <MicroCsms/Model/Transactions/TransactionService.h>
#include <MicroCsms/Model/Billing/TariffStore.h>
#include <MicroCsms/Model/Billing/WalletStore.h>
#include <MicroCsms/Model/Billing/BillingService.h>
#include <MicroCsms/Model/Billing/BillingRetrySweep.h>
#include <MicroCsms/Model/Connectivity/ConnectionStatusService.h>
#include <MicroCsms/Model/Connectivity/HeartbeatMonitor.h>
#include <MicroCsms/Model/Audit/AuditLogRetention.h>
#include <MicroCsms/Model/RemoteControl/RemoteControlService.h>
#include <MicroCsms/Model/FirmwareManagement/FirmwareUpdate.h>
#include <MicroCsms/Model/FirmwareManagement/FirmwareService.h>
#include <MicroCsms/Debug.h>

using namespace MicroCsms;

Model::Model(Context& context) : context(context) {

}

Model::~Model() {
    //the periodic tasks must not outlive the services they call
    billingRetrySweep.reset();
    heartbeatMonitor.reset();
    auditLogRetention.reset();
}

void Model::setChargerStore(std::unique_ptr<ChargerStore> chargerStore) {
    this->chargerStore = std::move(chargerStore);
}

void Model::setUserStore(std::unique_ptr<UserStore> userStore) {
    this->userStore = std::move(userStore);
}

void Model::setTransactionStore(std::unique_ptr<TransactionStore> transactionStore) {
    this->transactionStore = std::move(transactionStore);
}

void Model::setTariffStore(std::unique_ptr<TariffStore> tariffStore) {
    this->tariffStore = std::move(tariffStore);
}

void Model::setWalletStore(std::unique_ptr<WalletStore> walletStore) {
    this->walletStore = std::move(walletStore);
}

void Model::setFirmwareUpdateStore(std::unique_ptr<FirmwareUpdateStore> firmwareUpdateStore) {
    this->firmwareUpdateStore = std::move(firmwareUpdateStore);
}

bool Model::setup() {
    if (billingService) {
        MC_DBG_ERR("already set up");
        return false;
    }

    if (!chargerStore) {
        chargerStore.reset(new VolatileChargerStore());
    }
    if (!userStore) {
        userStore.reset(new VolatileUserStore());
    }
    if (!transactionStore) {
        transactionStore.reset(new VolatileTransactionStore());
    }
    if (!tariffStore) {
        tariffStore.reset(new VolatileTariffStore());
    }
    if (!walletStore) {
        walletStore.reset(new VolatileWalletStore());
    }
    if (!firmwareUpdateStore) {
        firmwareUpdateStore.reset(new VolatileFirmwareUpdateStore());
    }

    auto& clock = context.getClock();
    auto& configuration = context.getConfiguration();

    billingService.reset(new BillingService(clock, configuration, *transactionStore, *tariffStore, *walletStore));
    billingRetrySweep.reset(new BillingRetrySweep(clock, configuration, *transactionStore, *billingService));
    transactionService.reset(new TransactionService(clock, *chargerStore, *userStore, *transactionStore, *billingService));
    connectionStatusService.reset(new ConnectionStatusService(context, *chargerStore));
    heartbeatMonitor.reset(new HeartbeatMonitor(context, *chargerStore, *connectionStatusService));
    auditLogRetention.reset(new AuditLogRetention(context));
    remoteControlService.reset(new RemoteControlService(context));
    firmwareService.reset(new FirmwareService(clock, *chargerStore, *firmwareUpdateStore, *connectionStatusService, *transactionService, *remoteControlService));

    return true;
}

ChargerStore *Model::getChargerStore() {
    return chargerStore.get();
}

UserStore *Model::getUserStore() {
    return userStore.get();
}

TransactionStore *Model::getTransactionStore() {
    return transactionStore.get();
}

TariffStore *Model::getTariffStore() {
    return tariffStore.get();
}

WalletStore *Model::getWalletStore() {
    return walletStore.get();
}

FirmwareUpdateStore *Model::getFirmwareUpdateStore() {
    return firmwareUpdateStore.get();
}

BillingService *Model::getBillingService() {
    return billingService.get();
}

BillingRetrySweep *Model::getBillingRetrySweep() {
    return billingRetrySweep.get();
}

TransactionService *Model::getTransactionService() {
    return transactionService.get();
}

ConnectionStatusService *Model::getConnectionStatusService() {
    return connectionStatusService.get();
}

HeartbeatMonitor *Model::getHeartbeatMonitor() {
    return heartbeatMonitor.get();
}

AuditLogRetention *Model::getAuditLogRetention() {
    return auditLogRetention.get();
}

RemoteControlService *Model::getRemoteControlService() {
    return remoteControlService.get();
}

FirmwareService *Model::getFirmwareService() {
    return firmwareService.get();
}
