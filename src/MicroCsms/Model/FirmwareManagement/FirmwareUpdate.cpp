// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <string.h>

#include <MicroCsms/Model/FirmwareManagement/FirmwareUpdate.h>
#include <MicroCsms/Debug.h>

namespace MicroCsms {

bool deserializeFirmwareStatus(const char *serialized, FirmwareStatus& out) {
    if (!serialized) {
        return false;
    } else if (!strcmp(serialized, "Downloaded")) {
        out = FirmwareStatus::Downloaded;
    } else if (!strcmp(serialized, "DownloadFailed")) {
        out = FirmwareStatus::DownloadFailed;
    } else if (!strcmp(serialized, "Downloading")) {
        out = FirmwareStatus::Downloading;
    } else if (!strcmp(serialized, "Idle")) {
        out = FirmwareStatus::Idle;
    } else if (!strcmp(serialized, "InstallationFailed")) {
        out = FirmwareStatus::InstallationFailed;
    } else if (!strcmp(serialized, "Installing")) {
        out = FirmwareStatus::Installing;
    } else if (!strcmp(serialized, "Installed")) {
        out = FirmwareStatus::Installed;
    } else {
        return false;
    }
    return true;
}

const char *serializeFirmwareUpdateStatus(FirmwareUpdateStatus status) {
    switch (status) {
        case FirmwareUpdateStatus::Pending:
            return "PENDING";
        case FirmwareUpdateStatus::Downloading:
            return "DOWNLOADING";
        case FirmwareUpdateStatus::Downloaded:
            return "DOWNLOADED";
        case FirmwareUpdateStatus::Installing:
            return "INSTALLING";
        case FirmwareUpdateStatus::Installed:
            return "INSTALLED";
        case FirmwareUpdateStatus::DownloadFailed:
            return "DOWNLOAD_FAILED";
        case FirmwareUpdateStatus::InstallationFailed:
            return "INSTALLATION_FAILED";
    }
    return "_Undefined";
}

bool isTerminalStatus(FirmwareUpdateStatus status) {
    return status == FirmwareUpdateStatus::Installed ||
           status == FirmwareUpdateStatus::DownloadFailed ||
           status == FirmwareUpdateStatus::InstallationFailed;
}

} //namespace MicroCsms

using namespace MicroCsms;

bool VolatileFirmwareUpdateStore::create(FirmwareUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex);
    update.id = nextId++;
    updates[update.id] = update;
    return true;
}

bool VolatileFirmwareUpdateStore::get(int updateId, FirmwareUpdate& out) {
    std::lock_guard<std::mutex> lock(mutex);
    auto entry = updates.find(updateId);
    if (entry == updates.end()) {
        return false;
    }
    out = entry->second;
    return true;
}

bool VolatileFirmwareUpdateStore::update(const FirmwareUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex);
    auto entry = updates.find(update.id);
    if (entry == updates.end()) {
        MC_DBG_ERR("firmware update %i not found", update.id);
        return false;
    }
    entry->second = update;
    return true;
}

bool VolatileFirmwareUpdateStore::getLatestOngoing(int chargerId, FirmwareUpdate& out) {
    std::lock_guard<std::mutex> lock(mutex);
    //ids are ascending, so the last match is the latest
    bool found = false;
    for (auto& entry : updates) {
        if (entry.second.chargerId == chargerId && !isTerminalStatus(entry.second.status)) {
            out = entry.second;
            found = true;
        }
    }
    return found;
}

std::vector<FirmwareUpdate> VolatileFirmwareUpdateStore::findByCharger(int chargerId) {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<FirmwareUpdate> res;
    for (auto& entry : updates) {
        if (entry.second.chargerId == chargerId) {
            res.push_back(entry.second);
        }
    }
    return res;
}
