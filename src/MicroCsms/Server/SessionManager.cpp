// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <stdio.h>

#include <MicroCsms/Server/SessionManager.h>
#include <MicroCsms/Server/Session.h>
#include <MicroCsms/Core/Connection.h>
#include <MicroCsms/Debug.h>

using namespace MicroCsms;

SessionManager::SessionManager() {

}

AdmitResult SessionManager::admit(const char *chargePointId, std::shared_ptr<Session> session) {
    std::lock_guard<std::mutex> lock(mutex);
    if (sessions.find(chargePointId) != sessions.end()) {
        MC_DBG_WARN("%s is already connected", chargePointId);
        return AdmitResult::AlreadyConnected;
    }
    sessions[chargePointId] = session;
    MC_DBG_INFO("admitted %s (%zu sessions)", chargePointId, sessions.size());
    return AdmitResult::Admitted;
}

bool SessionManager::remove(const char *chargePointId) {
    std::lock_guard<std::mutex> lock(mutex);
    return sessions.erase(chargePointId) > 0;
}

bool SessionManager::remove(const char *chargePointId, const Session *session) {
    std::lock_guard<std::mutex> lock(mutex);
    auto entry = sessions.find(chargePointId);
    if (entry == sessions.end() || entry->second.get() != session) {
        return false;
    }
    sessions.erase(entry);
    MC_DBG_INFO("removed %s (%zu sessions)", chargePointId, sessions.size());
    return true;
}

std::shared_ptr<Session> SessionManager::get(const char *chargePointId) {
    std::lock_guard<std::mutex> lock(mutex);
    auto entry = sessions.find(chargePointId);
    if (entry == sessions.end()) {
        return nullptr;
    }
    return entry->second;
}

bool SessionManager::isConnected(const char *chargePointId) {
    return get(chargePointId) != nullptr;
}

std::vector<std::string> SessionManager::getConnectedIds() {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<std::string> res;
    for (auto& entry : sessions) {
        res.push_back(entry.first);
    }
    return res;
}

size_t SessionManager::size() {
    std::lock_guard<std::mutex> lock(mutex);
    return sessions.size();
}

CommandResult SessionManager::sendCommand(const char *chargePointId, const char *action, const JsonDoc& payload, unsigned long timeoutMs) {
    auto session = get(chargePointId);
    if (!session) {
        MC_DBG_INFO("cannot send %s: %s not connected", action, chargePointId);
        CommandResult res;
        res.error = CommandError::NotConnected;
        return res;
    }
    return session->call(action, payload, timeoutMs);
}

CommandResult SessionManager::sendCommand(const char *chargePointId, Operation& operation, unsigned long timeoutMs) {
    auto session = get(chargePointId);
    if (!session) {
        MC_DBG_INFO("cannot send command: %s not connected", chargePointId);
        CommandResult res;
        res.error = CommandError::NotConnected;
        return res;
    }
    return session->call(operation, timeoutMs);
}

bool SessionManager::evict(const char *chargePointId, const char *reason) {
    auto session = get(chargePointId);
    if (!session) {
        return false;
    }

    char closeReason [128];
    snprintf(closeReason, sizeof(closeReason), "Server cleanup: %s", reason ? reason : "");

    MC_DBG_INFO("evict %s: %s", chargePointId, closeReason);
    session->close(MC_CLOSE_GOING_AWAY, closeReason);
    return true;
}

void SessionManager::closeAll() {
    std::vector<std::shared_ptr<Session>> closing;
    {
        std::lock_guard<std::mutex> lock(mutex);
        for (auto& entry : sessions) {
            closing.push_back(entry.second);
        }
    }

    for (auto& session : closing) {
        session->close(MC_CLOSE_GOING_AWAY, "Server shutdown");
    }
}
