// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroCsms/Model/Audit/AuditLogRetention.h>
#include <MicroCsms/Model/Audit/AuditLog.h>
#include <MicroCsms/Core/Configuration.h>
#include <MicroCsms/Core/Context.h>
#include <MicroCsms/Debug.h>

#define MC_AUDITRETENTION_AGE_DEFAULT (90 * 24 * 3600)
#define MC_AUDITRETENTION_PERIOD (24UL * 3600UL * 1000UL)

using namespace MicroCsms;

AuditLogRetention::AuditLogRetention(Context& context) : context(context),
        retentionTask("AuditRetention", [this] () {runOnce();}) {

    retentionAgeInt = context.getConfiguration().declareConfiguration<int>("AuditRetentionAge", MC_AUDITRETENTION_AGE_DEFAULT);
    context.getConfiguration().registerValidator("AuditRetentionAge", VALIDATE_UNSIGNED_INT);
}

AuditLogRetention::~AuditLogRetention() {
    stop();
}

unsigned int AuditLogRetention::runOnce() {
    auto auditLog = context.getAuditLog();
    if (!auditLog) {
        return 0;
    }

    auto& clock = context.getClock();

    Timestamp cutoff = clock.now();
    if (!clock.add(cutoff, -retentionAgeInt->getInt())) {
        MC_DBG_ERR("cannot determine retention cutoff");
        return 0;
    }

    unsigned int removed = 0;
    if (!auditLog->purgeBefore(cutoff, removed)) {
        MC_DBG_WARN("audit retention failed");
        return 0;
    }

    MC_DBG_INFO("audit retention: deleted %u records", removed);
    return removed;
}

void AuditLogRetention::start() {
    retentionTask.start([] () {return MC_AUDITRETENTION_PERIOD;}, 0);
}

void AuditLogRetention::stop() {
    retentionTask.stop();
}
