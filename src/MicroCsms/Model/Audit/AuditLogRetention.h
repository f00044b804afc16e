// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_AUDITLOGRETENTION_H
#define MC_AUDITLOGRETENTION_H

#include <memory>

#include <MicroCsms/Core/ScheduledTask.h>

namespace MicroCsms {

class Context;
class Configuration;

/*
 * Deletes audit records older than AuditRetentionAge. Runs once on start, then daily
 */
class AuditLogRetention {
private:
    Context& context;

    std::shared_ptr<Configuration> retentionAgeInt; //in s

    ScheduledTask retentionTask;
public:
    AuditLogRetention(Context& context);
    ~AuditLogRetention();

    /*
     * Returns the number of deleted records
     */
    unsigned int runOnce();

    void start();
    void stop();
};

} //namespace MicroCsms

#endif
