// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroCsms/Operations/UpdateFirmware.h>
#include <MicroCsms/Debug.h>

using namespace MicroCsms;

UpdateFirmware::UpdateFirmware(const Clock& clock, const char *location, const Timestamp& retrieveDate, int retries, int retryInterval)
        : clock(clock), location(location ? location : ""), retrieveDate(retrieveDate), retries(retries), retryInterval(retryInterval) {

}

const char* UpdateFirmware::getOperationType() {
    return "UpdateFirmware";
}

std::unique_ptr<JsonDoc> UpdateFirmware::createReq() {
    char retrieveDateStr [MC_JSONDATE_SIZE];
    if (!clock.toJsonString(retrieveDate, retrieveDateStr, sizeof(retrieveDateStr))) {
        MC_DBG_ERR("invalid retrieveDate");
        return nullptr;
    }

    auto doc = makeJsonDoc(JSON_OBJECT_SIZE(4) + MC_JSONDATE_SIZE);
    JsonObject payload = doc->to<JsonObject>();
    payload["location"] = location.c_str();
    payload["retrieveDate"] = retrieveDateStr;
    if (retries > 0) {
        payload["retries"] = retries;
    }
    if (retryInterval > 0) {
        payload["retryInterval"] = retryInterval;
    }
    return doc;
}

void UpdateFirmware::processConf(JsonObject payload) {
    //UpdateFirmware.conf has no fields
    status = RemoteStatus::Accepted;
}
