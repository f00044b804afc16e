// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_FIRMWAREUPDATE_H
#define MC_FIRMWAREUPDATE_H

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <stdint.h>

#include <MicroCsms/Core/Time.h>

namespace MicroCsms {

//as reported in FirmwareStatusNotification
enum class FirmwareStatus : uint8_t {
    Downloaded,
    DownloadFailed,
    Downloading,
    Idle,
    InstallationFailed,
    Installing,
    Installed
};

bool deserializeFirmwareStatus(const char *serialized, FirmwareStatus& out);

enum class FirmwareUpdateStatus : uint8_t {
    Pending,
    Downloading,
    Downloaded,
    Installing,
    Installed,
    DownloadFailed,
    InstallationFailed
};

const char *serializeFirmwareUpdateStatus(FirmwareUpdateStatus status);

//Installed, DownloadFailed and InstallationFailed end an update
bool isTerminalStatus(FirmwareUpdateStatus status);

struct FirmwareUpdate {
    int id = 0;
    int chargerId = 0;
    int firmwareFileId = 0;
    std::string targetVersion;
    std::string location;
    FirmwareUpdateStatus status = FirmwareUpdateStatus::Pending;
    std::string errorMessage;
    Timestamp startedAt;
    Timestamp completedAt;
};

class FirmwareUpdateStore {
public:
    virtual ~FirmwareUpdateStore() = default;

    virtual bool create(FirmwareUpdate& update) = 0; //assigns the id
    virtual bool get(int updateId, FirmwareUpdate& out) = 0;
    virtual bool update(const FirmwareUpdate& update) = 0;

    /*
     * Most recent update of the charger which has not ended yet
     */
    virtual bool getLatestOngoing(int chargerId, FirmwareUpdate& out) = 0;

    virtual std::vector<FirmwareUpdate> findByCharger(int chargerId) = 0;
};

class VolatileFirmwareUpdateStore : public FirmwareUpdateStore {
private:
    std::map<int, FirmwareUpdate> updates;
    int nextId = 1;
    std::mutex mutex;
public:
    bool create(FirmwareUpdate& update) override;
    bool get(int updateId, FirmwareUpdate& out) override;
    bool update(const FirmwareUpdate& update) override;
    bool getLatestOngoing(int chargerId, FirmwareUpdate& out) override;
    std::vector<FirmwareUpdate> findByCharger(int chargerId) override;
};

} //namespace MicroCsms

#endif
