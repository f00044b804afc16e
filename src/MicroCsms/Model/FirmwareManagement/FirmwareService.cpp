// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroCsms/Model/FirmwareManagement/FirmwareService.h>
#include <MicroCsms/Model/ChargePoint/Charger.h>
#include <MicroCsms/Model/Connectivity/ConnectionStatusService.h>
#include <MicroCsms/Model/Transactions/TransactionService.h>
#include <MicroCsms/Model/RemoteControl/RemoteControlService.h>
#include <MicroCsms/Core/Time.h>
#include <MicroCsms/Debug.h>

namespace MicroCsms {
const char *serializeFirmwareUpdateRequestStatus(FirmwareUpdateRequestStatus status) {
    switch (status) {
        case FirmwareUpdateRequestStatus::Initiated:
            return "Initiated";
        case FirmwareUpdateRequestStatus::ChargerNotFound:
            return "ChargerNotFound";
        case FirmwareUpdateRequestStatus::ChargerOffline:
            return "ChargerOffline";
        case FirmwareUpdateRequestStatus::ActiveTransaction:
            return "ActiveTransaction";
        case FirmwareUpdateRequestStatus::SameVersion:
            return "SameVersion";
        case FirmwareUpdateRequestStatus::SendFailed:
            return "SendFailed";
    }
    return "_Undefined";
}
} //namespace MicroCsms

using namespace MicroCsms;

FirmwareService::FirmwareService(Clock& clock, ChargerStore& chargerStore, FirmwareUpdateStore& updateStore, ConnectionStatusService& connectionStatus, TransactionService& transactionService, RemoteControlService& remoteControl) :
        clock(clock), chargerStore(chargerStore), updateStore(updateStore), connectionStatus(connectionStatus), transactionService(transactionService), remoteControl(remoteControl) {

}

FirmwareUpdateResult FirmwareService::startUpdate(const char *chargePointId, int firmwareFileId, const char *targetVersion, const char *location) {

    FirmwareUpdateResult res;

    Charger charger;
    if (!chargerStore.get(chargePointId, charger)) {
        MC_DBG_ERR("charger %s not found", chargePointId);
        res.status = FirmwareUpdateRequestStatus::ChargerNotFound;
        return res;
    }

    if (!connectionStatus.isConnected(chargePointId)) {
        MC_DBG_WARN("charger %s is offline", chargePointId);
        res.status = FirmwareUpdateRequestStatus::ChargerOffline;
        return res;
    }

    Transaction activeTx;
    if (transactionService.findActive(charger.id, activeTx)) {
        MC_DBG_WARN("charger %s has active transaction %i", chargePointId, activeTx.id);
        res.status = FirmwareUpdateRequestStatus::ActiveTransaction;
        return res;
    }

    if (targetVersion && charger.firmwareVersion == targetVersion) {
        MC_DBG_WARN("charger %s already has firmware version %s", chargePointId, targetVersion);
        res.status = FirmwareUpdateRequestStatus::SameVersion;
        return res;
    }

    FirmwareUpdate update;
    update.chargerId = charger.id;
    update.firmwareFileId = firmwareFileId;
    update.targetVersion = targetVersion ? targetVersion : "";
    update.location = location ? location : "";
    update.status = FirmwareUpdateStatus::Pending;
    update.startedAt = clock.now();

    if (!updateStore.create(update)) {
        MC_DBG_ERR("could not record firmware update");
        res.status = FirmwareUpdateRequestStatus::SendFailed;
        return res;
    }
    res.updateId = update.id;

    MC_DBG_INFO("initiating firmware update %i for %s to version %s", update.id, chargePointId, update.targetVersion.c_str());

    auto commandResult = remoteControl.updateFirmware(chargePointId, update.location.c_str(), clock.now(), MC_FW_RETRIES, MC_FW_RETRY_INTERVAL);
    res.commandError = commandResult.error;

    if (!commandResult.isAccepted()) {
        update.status = FirmwareUpdateStatus::DownloadFailed;
        update.errorMessage = "Failed to send OCPP command: ";
        update.errorMessage += serializeCommandError(commandResult.error);
        if (!commandResult.errorCode.empty()) {
            update.errorMessage += " ";
            update.errorMessage += commandResult.errorCode;
        }
        update.completedAt = clock.now();
        if (!updateStore.update(update)) {
            MC_DBG_ERR("could not record failure of firmware update %i", update.id);
        }
        MC_DBG_ERR("UpdateFirmware to %s failed: %s", chargePointId, update.errorMessage.c_str());
        res.status = FirmwareUpdateRequestStatus::SendFailed;
        return res;
    }

    res.status = FirmwareUpdateRequestStatus::Initiated;
    return res;
}

bool FirmwareService::notifyStatus(const char *chargePointId, FirmwareStatus status) {

    if (status == FirmwareStatus::Idle) {
        return false;
    }

    Charger charger;
    if (!chargerStore.get(chargePointId, charger)) {
        MC_DBG_ERR("charger %s not found", chargePointId);
        return false;
    }

    FirmwareUpdate update;
    if (!updateStore.getLatestOngoing(charger.id, update)) {
        MC_DBG_WARN("no ongoing firmware update for %s", chargePointId);
        return false;
    }

    switch (status) {
        case FirmwareStatus::Downloading:
            update.status = FirmwareUpdateStatus::Downloading;
            break;
        case FirmwareStatus::Downloaded:
            update.status = FirmwareUpdateStatus::Downloaded;
            break;
        case FirmwareStatus::DownloadFailed:
            update.status = FirmwareUpdateStatus::DownloadFailed;
            update.errorMessage = "Download failed";
            break;
        case FirmwareStatus::Installing:
            update.status = FirmwareUpdateStatus::Installing;
            break;
        case FirmwareStatus::Installed:
            update.status = FirmwareUpdateStatus::Installed;
            break;
        case FirmwareStatus::InstallationFailed:
            update.status = FirmwareUpdateStatus::InstallationFailed;
            update.errorMessage = "Installation failed";
            break;
        case FirmwareStatus::Idle:
            return false;
    }

    if (isTerminalStatus(update.status)) {
        update.completedAt = clock.now();
    }

    if (!updateStore.update(update)) {
        return false;
    }

    MC_DBG_INFO("firmware update %i of %s: %s", update.id, chargePointId, serializeFirmwareUpdateStatus(update.status));

    if (update.status == FirmwareUpdateStatus::Installed && !update.targetVersion.empty()) {
        charger.firmwareVersion = update.targetVersion;
        if (!chargerStore.update(charger)) {
            MC_DBG_ERR("could not update firmware version of %s", chargePointId);
        }
    }

    return true;
}
