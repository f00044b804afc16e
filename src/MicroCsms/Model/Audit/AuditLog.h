// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_AUDITLOG_H
#define MC_AUDITLOG_H

#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <MicroCsms/Core/Time.h>
#include <MicroCsms/Core/FilesystemAdapter.h>

#define MC_AUDITLOG_FN "audit-log.jsn"

#ifndef MC_AUDITLOG_VOLATILE_MAX
#define MC_AUDITLOG_VOLATILE_MAX 10000
#endif

namespace MicroCsms {

enum class MessageDirection : uint8_t {
    In,
    Out
};

const char *serializeMessageDirection(MessageDirection direction);

struct AuditRecord {
    std::string chargePointId;
    MessageDirection direction = MessageDirection::In;
    std::string payload; //raw frame
    std::string correlationId; //empty if the frame didn't carry a messageId
    Timestamp timestamp;
    std::string status; //"received" or "sent"
};

/*
 * Append-only record of all OCPP frames which the server exchanged with the charge points
 */
class AuditLog {
public:
    virtual ~AuditLog() = default;

    virtual bool record(const AuditRecord& record) = 0;

    /*
     * Deletes the records taken before `cutoff`. Records without a readable timestamp are kept.
     * Returns false if the log could not be rewritten
     */
    virtual bool purgeBefore(const Timestamp& cutoff, unsigned int& removed) = 0;
};

/*
 * Writes one JSON object per line into the audit file of the store folder
 */
class FileAuditLog : public AuditLog {
private:
    std::shared_ptr<FilesystemAdapter> filesystem;
    const Clock& clock;
    std::string filename;
    std::mutex mutex;
public:
    FileAuditLog(std::shared_ptr<FilesystemAdapter> filesystem, const Clock& clock, const char *filename = MC_AUDITLOG_FN);

    bool record(const AuditRecord& record) override;
    bool purgeBefore(const Timestamp& cutoff, unsigned int& removed) override;
};

/*
 * In-memory audit log. Keeps the latest `maxRecords` entries, older ones are dropped
 */
class VolatileAuditLog : public AuditLog {
private:
    std::deque<AuditRecord> records;
    size_t maxRecords;
    std::mutex mutex;
public:
    VolatileAuditLog(size_t maxRecords = MC_AUDITLOG_VOLATILE_MAX);

    bool record(const AuditRecord& record) override;
    bool purgeBefore(const Timestamp& cutoff, unsigned int& removed) override;

    std::vector<AuditRecord> getRecords();
    void clear();
};

} //namespace MicroCsms

#endif
