// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_FIRMWARESERVICE_H
#define MC_FIRMWARESERVICE_H

#include <string>

#include <MicroCsms/Model/FirmwareManagement/FirmwareUpdate.h>
#include <MicroCsms/Core/Request.h>

#define MC_FW_RETRIES 3
#define MC_FW_RETRY_INTERVAL 300 //in s

namespace MicroCsms {

class Clock;
class ChargerStore;
class ConnectionStatusService;
class TransactionService;
class RemoteControlService;

enum class FirmwareUpdateRequestStatus : uint8_t {
    Initiated,          //UpdateFirmware has been accepted by the charge point
    ChargerNotFound,
    ChargerOffline,
    ActiveTransaction,
    SameVersion,        //the charge point already runs the target version
    SendFailed          //the update has been recorded as DOWNLOAD_FAILED
};

const char *serializeFirmwareUpdateRequestStatus(FirmwareUpdateRequestStatus status);

struct FirmwareUpdateResult {
    FirmwareUpdateRequestStatus status = FirmwareUpdateRequestStatus::ChargerNotFound;
    int updateId = 0; //0 if no FirmwareUpdate was created
    CommandError commandError = CommandError::None;
};

class FirmwareService {
private:
    Clock& clock;
    ChargerStore& chargerStore;
    FirmwareUpdateStore& updateStore;
    ConnectionStatusService& connectionStatus;
    TransactionService& transactionService;
    RemoteControlService& remoteControl;
public:
    FirmwareService(Clock& clock, ChargerStore& chargerStore, FirmwareUpdateStore& updateStore, ConnectionStatusService& connectionStatus, TransactionService& transactionService, RemoteControlService& remoteControl);

    /*
     * Checks that the charger can be updated now (online, idle, not already on `targetVersion`), records
     * a PENDING FirmwareUpdate and sends UpdateFirmware
     */
    FirmwareUpdateResult startUpdate(const char *chargePointId, int firmwareFileId, const char *targetVersion, const char *location);

    /*
     * Applies a FirmwareStatusNotification to the latest ongoing update of the charger. Returns false if
     * there is nothing to update
     */
    bool notifyStatus(const char *chargePointId, FirmwareStatus status);
};

} //namespace MicroCsms

#endif
