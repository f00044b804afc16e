// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_REMOTECONTROLDEFS_H
#define MC_REMOTECONTROLDEFS_H

#include <string>
#include <stdint.h>

#include <MicroCsms/Core/Request.h>

namespace MicroCsms {

//status field of the charge point's confirmation
enum class RemoteStatus : uint8_t {
    ERR_INTERNAL, //no confirmation or unknown status
    Accepted,
    Rejected,
    Scheduled
};

const char *serializeRemoteStatus(RemoteStatus status);
RemoteStatus deserializeRemoteStatus(const char *serialized);

enum class AvailabilityType : uint8_t {
    Operative,
    Inoperative
};

const char *serializeAvailabilityType(AvailabilityType type);

enum class ResetType : uint8_t {
    Hard,
    Soft
};

const char *serializeResetType(ResetType type);

/*
 * Outcome of a remote command. `error` tells if the charge point answered at all, `status` what it
 * answered
 */
struct RemoteCommandResult {
    CommandError error = CommandError::None;
    std::string errorCode; //CallError code if CommandRejected
    RemoteStatus status = RemoteStatus::ERR_INTERNAL;

    bool isAccepted() const {
        return error == CommandError::None &&
                (status == RemoteStatus::Accepted || status == RemoteStatus::Scheduled);
    }
};

} //namespace MicroCsms

#endif
