// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <string.h>
#include <stdio.h>

#include <MicroCsms/Model/Registry/ConnectionRegistry.h>
#include <MicroCsms/Core/FilesystemUtils.h>
#include <MicroCsms/Debug.h>

using namespace MicroCsms;

FileConnectionRegistry::FileConnectionRegistry(std::shared_ptr<FilesystemAdapter> filesystem, const Clock& clock) :
        filesystem(filesystem), clock(clock) {

}

bool FileConnectionRegistry::printFn(const char *chargePointId, char *fn, size_t size) {
    if (!chargePointId || *chargePointId == '\0' || strchr(chargePointId, '/')) {
        MC_DBG_ERR("invalid chargePointId");
        return false;
    }
    auto ret = snprintf(fn, size, MC_CONNECTIONRECORD_FN_PREFIX "%s" MC_CONNECTIONRECORD_FN_SUFFIX, chargePointId);
    if (ret < 0 || (size_t)ret >= size) {
        MC_DBG_ERR("fn error: %i", ret);
        return false;
    }
    return true;
}

bool FileConnectionRegistry::put(const char *chargePointId, const Timestamp& connectedAt) {
    if (!filesystem) {
        MC_DBG_WARN("connection registry unavailable. Cannot record %s", chargePointId);
        return false;
    }

    char fn [MC_MAX_PATH_SIZE];
    if (!printFn(chargePointId, fn, sizeof(fn))) {
        return false;
    }

    char connectedAtStr [MC_JSONDATE_SIZE] = {'\0'};
    if (!clock.toJsonString(connectedAt, connectedAtStr, sizeof(connectedAtStr))) {
        MC_DBG_ERR("invalid timestamp");
        return false;
    }

    auto doc = initJsonDoc(JSON_OBJECT_SIZE(2));
    doc["chargePointId"] = chargePointId;
    doc["connectedAt"] = (const char*) connectedAtStr;

    std::lock_guard<std::mutex> lock(mutex);
    if (!FilesystemUtils::storeJson(filesystem, fn, doc)) {
        MC_DBG_WARN("connection registry unavailable. Cannot record %s", chargePointId);
        return false;
    }

    MC_DBG_DEBUG("registered connection of %s", chargePointId);
    return true;
}

bool FileConnectionRegistry::remove(const char *chargePointId) {
    if (!filesystem) {
        MC_DBG_WARN("connection registry unavailable. Cannot remove %s", chargePointId);
        return false;
    }

    char fn [MC_MAX_PATH_SIZE];
    if (!printFn(chargePointId, fn, sizeof(fn))) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex);

    size_t size;
    if (filesystem->stat(fn, &size) != 0) {
        //nothing to remove
        return true;
    }

    if (!filesystem->remove(fn)) {
        MC_DBG_WARN("connection registry unavailable. Cannot remove %s", chargePointId);
        return false;
    }

    MC_DBG_DEBUG("removed connection record of %s", chargePointId);
    return true;
}

bool FileConnectionRegistry::exists(const char *chargePointId) {
    if (!filesystem) {
        return false;
    }

    char fn [MC_MAX_PATH_SIZE];
    if (!printFn(chargePointId, fn, sizeof(fn))) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex);

    size_t size;
    return filesystem->stat(fn, &size) == 0;
}

bool FileConnectionRegistry::getConnectedAt(const char *chargePointId, Timestamp& out) {
    if (!filesystem) {
        return false;
    }

    char fn [MC_MAX_PATH_SIZE];
    if (!printFn(chargePointId, fn, sizeof(fn))) {
        return false;
    }

    std::unique_ptr<JsonDoc> doc;
    {
        std::lock_guard<std::mutex> lock(mutex);
        doc = FilesystemUtils::loadJson(filesystem, fn);
    }

    if (!doc) {
        return false;
    }

    if (!clock.parseString((*doc)["connectedAt"] | "", out)) {
        MC_DBG_ERR("corrupt connection record %s", fn);
        return false;
    }

    return true;
}

std::vector<std::string> FileConnectionRegistry::listAll() {
    std::vector<std::string> res;

    if (!filesystem) {
        MC_DBG_WARN("connection registry unavailable");
        return res;
    }

    const size_t prefixLen = strlen(MC_CONNECTIONRECORD_FN_PREFIX);
    const size_t suffixLen = strlen(MC_CONNECTIONRECORD_FN_SUFFIX);

    std::lock_guard<std::mutex> lock(mutex);

    auto ret = filesystem->ftw_root([&res, prefixLen, suffixLen] (const char *fname) -> int {
        size_t len = strlen(fname);
        if (len > prefixLen + suffixLen &&
                !strncmp(fname, MC_CONNECTIONRECORD_FN_PREFIX, prefixLen) &&
                !strcmp(fname + len - suffixLen, MC_CONNECTIONRECORD_FN_SUFFIX)) {
            res.emplace_back(fname + prefixLen, len - prefixLen - suffixLen);
        }
        return 0;
    });

    if (ret != 0) {
        MC_DBG_WARN("connection registry unavailable");
        res.clear();
    }

    return res;
}

bool VolatileConnectionRegistry::put(const char *chargePointId, const Timestamp& connectedAt) {
    std::lock_guard<std::mutex> lock(mutex);
    records[chargePointId] = connectedAt;
    return true;
}

bool VolatileConnectionRegistry::remove(const char *chargePointId) {
    std::lock_guard<std::mutex> lock(mutex);
    records.erase(chargePointId);
    return true;
}

bool VolatileConnectionRegistry::exists(const char *chargePointId) {
    std::lock_guard<std::mutex> lock(mutex);
    return records.find(chargePointId) != records.end();
}

bool VolatileConnectionRegistry::getConnectedAt(const char *chargePointId, Timestamp& out) {
    std::lock_guard<std::mutex> lock(mutex);
    auto record = records.find(chargePointId);
    if (record == records.end()) {
        return false;
    }
    out = record->second;
    return true;
}

std::vector<std::string> VolatileConnectionRegistry::listAll() {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<std::string> res;
    for (auto& record : records) {
        res.push_back(record.first);
    }
    return res;
}
