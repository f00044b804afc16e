// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_CONNECTIONREGISTRY_H
#define MC_CONNECTIONREGISTRY_H

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <MicroCsms/Core/Time.h>
#include <MicroCsms/Core/FilesystemAdapter.h>

#define MC_CONNECTIONRECORD_FN_PREFIX "cr-"
#define MC_CONNECTIONRECORD_FN_SUFFIX ".jsn"

namespace MicroCsms {

/*
 * Record of the charge points which are connected to any server process sharing the same store. The
 * record is a hint about the connection state, not a proof of liveness: a crashed process leaves its
 * records behind.
 *
 * All operations degrade gracefully. If the store is unavailable, they log the failure and return
 * false, an empty list or "not connected"
 */
class ConnectionRegistry {
public:
    virtual ~ConnectionRegistry() = default;

    virtual bool put(const char *chargePointId, const Timestamp& connectedAt) = 0;
    virtual bool remove(const char *chargePointId) = 0;
    virtual bool exists(const char *chargePointId) = 0;
    virtual bool getConnectedAt(const char *chargePointId, Timestamp& out) = 0;
    virtual std::vector<std::string> listAll() = 0;
};

/*
 * One JSON record per charge point in the store folder, e.g. "cr-CP001.jsn" with content
 * {"chargePointId":"CP001","connectedAt":"2025-01-01T12:00:00Z"}
 */
class FileConnectionRegistry : public ConnectionRegistry {
private:
    std::shared_ptr<FilesystemAdapter> filesystem;
    const Clock& clock;
    std::mutex mutex;

    bool printFn(const char *chargePointId, char *fn, size_t size);
public:
    FileConnectionRegistry(std::shared_ptr<FilesystemAdapter> filesystem, const Clock& clock);

    bool put(const char *chargePointId, const Timestamp& connectedAt) override;
    bool remove(const char *chargePointId) override;
    bool exists(const char *chargePointId) override;
    bool getConnectedAt(const char *chargePointId, Timestamp& out) override;
    std::vector<std::string> listAll() override;
};

class VolatileConnectionRegistry : public ConnectionRegistry {
private:
    std::map<std::string, Timestamp> records;
    std::mutex mutex;
public:
    bool put(const char *chargePointId, const Timestamp& connectedAt) override;
    bool remove(const char *chargePointId) override;
    bool exists(const char *chargePointId) override;
    bool getConnectedAt(const char *chargePointId, Timestamp& out) override;
    std::vector<std::string> listAll() override;
};

} //namespace MicroCsms

#endif
