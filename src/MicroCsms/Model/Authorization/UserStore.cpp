// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <string.h>

#include <MicroCsms/Model/Authorization/UserStore.h>
#include <MicroCsms/Debug.h>

using namespace MicroCsms;

int VolatileUserStore::add(const char *idTag, bool active) {
    if (!idTag || *idTag == '\0' || strlen(idTag) > MC_IDTAG_LEN_MAX) {
        MC_DBG_ERR("invalid idTag");
        return 0;
    }

    std::lock_guard<std::mutex> lock(mutex);
    if (users.find(idTag) != users.end()) {
        MC_DBG_ERR("duplicate idTag");
        return 0;
    }

    User user;
    user.id = nextId++;
    user.idTag = idTag;
    user.active = active;
    users[idTag] = user;
    return user.id;
}

bool VolatileUserStore::setActive(int userId, bool active) {
    std::lock_guard<std::mutex> lock(mutex);
    for (auto& entry : users) {
        if (entry.second.id == userId) {
            entry.second.active = active;
            return true;
        }
    }
    return false;
}

bool VolatileUserStore::getByIdTag(const char *idTag, User& out) {
    if (!idTag) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex);
    auto entry = users.find(idTag);
    if (entry == users.end()) {
        return false;
    }
    out = entry->second;
    return true;
}
