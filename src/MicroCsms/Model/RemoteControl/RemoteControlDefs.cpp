// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <string.h>

#include <MicroCsms/Model/RemoteControl/RemoteControlDefs.h>

namespace MicroCsms {

const char *serializeRemoteStatus(RemoteStatus status) {
    switch (status) {
        case RemoteStatus::Accepted:
            return "Accepted";
        case RemoteStatus::Rejected:
            return "Rejected";
        case RemoteStatus::Scheduled:
            return "Scheduled";
        case RemoteStatus::ERR_INTERNAL:
            break;
    }
    return "_Undefined";
}

RemoteStatus deserializeRemoteStatus(const char *serialized) {
    if (!serialized) {
        return RemoteStatus::ERR_INTERNAL;
    } else if (!strcmp(serialized, "Accepted")) {
        return RemoteStatus::Accepted;
    } else if (!strcmp(serialized, "Rejected")) {
        return RemoteStatus::Rejected;
    } else if (!strcmp(serialized, "Scheduled")) {
        return RemoteStatus::Scheduled;
    }
    return RemoteStatus::ERR_INTERNAL;
}

const char *serializeAvailabilityType(AvailabilityType type) {
    return type == AvailabilityType::Operative ? "Operative" : "Inoperative";
}

const char *serializeResetType(ResetType type) {
    return type == ResetType::Hard ? "Hard" : "Soft";
}

} //namespace MicroCsms
