// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroCsms/Model/Audit/AuditLog.h>
#include <MicroCsms/Core/FilesystemUtils.h>
#include <MicroCsms/Debug.h>

namespace MicroCsms {
const char *serializeMessageDirection(MessageDirection direction) {
    switch (direction) {
        case MessageDirection::In:
            return "IN";
        case MessageDirection::Out:
            return "OUT";
    }
    return "_Undefined";
}
} //namespace MicroCsms

using namespace MicroCsms;

FileAuditLog::FileAuditLog(std::shared_ptr<FilesystemAdapter> filesystem, const Clock& clock, const char *filename) :
        filesystem(filesystem), clock(clock), filename(filename) {

}

bool FileAuditLog::record(const AuditRecord& record) {
    if (!filesystem) {
        return false;
    }

    char timestamp [MC_JSONDATE_SIZE] = {'\0'};
    if (record.timestamp.isDefined()) {
        clock.toJsonString(record.timestamp, timestamp, sizeof(timestamp));
    }

    auto doc = initJsonDoc(JSON_OBJECT_SIZE(6));
    doc["chargePointId"] = record.chargePointId.c_str();
    doc["direction"] = serializeMessageDirection(record.direction);
    doc["payload"] = record.payload.c_str();
    if (!record.correlationId.empty()) {
        doc["correlationId"] = record.correlationId.c_str();
    } else {
        doc["correlationId"] = nullptr;
    }
    doc["timestamp"] = (const char*) timestamp;
    doc["status"] = record.status.c_str();

    std::lock_guard<std::mutex> lock(mutex);
    if (!FilesystemUtils::appendJsonLine(filesystem, filename.c_str(), doc)) {
        MC_DBG_WARN("could not write audit record of %s", record.chargePointId.c_str());
        return false;
    }
    return true;
}

bool FileAuditLog::purgeBefore(const Timestamp& cutoff, unsigned int& removed) {
    removed = 0;
    if (!filesystem) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex);

    size_t fsize = 0;
    if (filesystem->stat(filename.c_str(), &fsize) != 0) {
        MC_DBG_DEBUG("no audit log yet");
        return true;
    }

    std::string content;
    {
        auto file = filesystem->open(filename.c_str(), "r");
        if (!file) {
            MC_DBG_ERR("could not open file %s", filename.c_str());
            return false;
        }
        char buf [256];
        size_t len;
        while ((len = file->read(buf, sizeof(buf))) > 0) {
            content.append(buf, len);
        }
        (void)file->close();
    }

    StaticJsonDocument<JSON_OBJECT_SIZE(1)> filter;
    filter["timestamp"] = true;

    std::string kept;
    size_t pos = 0;
    while (pos < content.size()) {
        size_t end = content.find('\n', pos);
        if (end == std::string::npos) {
            end = content.size();
        }

        if (end > pos) {
            auto doc = initJsonDoc(JSON_OBJECT_SIZE(1) + 64);
            auto err = deserializeJson(doc, content.c_str() + pos, end - pos, DeserializationOption::Filter(filter));

            Timestamp timestamp;
            if (!err && clock.parseString(doc["timestamp"] | "", timestamp) && timestamp < cutoff) {
                removed++;
            } else {
                kept.append(content, pos, end - pos);
                kept.push_back('\n');
            }
        }

        pos = end + 1;
    }

    if (removed == 0) {
        return true;
    }

    auto file = filesystem->open(filename.c_str(), "w");
    if (!file) {
        MC_DBG_ERR("could not open file %s", filename.c_str());
        removed = 0;
        return false;
    }

    size_t written = kept.empty() ? 0 : file->write(kept.c_str(), kept.length());
    if (!file->close() || written < kept.length()) {
        MC_DBG_ERR("Error writing file %s", filename.c_str());
        removed = 0;
        return false;
    }

    MC_DBG_INFO("purged %u audit records", removed);
    return true;
}

VolatileAuditLog::VolatileAuditLog(size_t maxRecords) : maxRecords(maxRecords) {

}

bool VolatileAuditLog::record(const AuditRecord& record) {
    std::lock_guard<std::mutex> lock(mutex);
    records.push_back(record);
    while (records.size() > maxRecords) {
        records.pop_front();
    }
    return true;
}

bool VolatileAuditLog::purgeBefore(const Timestamp& cutoff, unsigned int& removed) {
    std::lock_guard<std::mutex> lock(mutex);
    removed = 0;
    for (auto it = records.begin(); it != records.end();) {
        if (it->timestamp.isDefined() && it->timestamp < cutoff) {
            it = records.erase(it);
            removed++;
        } else {
            it++;
        }
    }
    return true;
}

std::vector<AuditRecord> VolatileAuditLog::getRecords() {
    std::lock_guard<std::mutex> lock(mutex);
    return std::vector<AuditRecord>(records.begin(), records.end());
}

void VolatileAuditLog::clear() {
    std::lock_guard<std::mutex> lock(mutex);
    records.clear();
}
