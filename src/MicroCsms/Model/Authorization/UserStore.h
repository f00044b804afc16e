// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_USERSTORE_H
#define MC_USERSTORE_H

#include <map>
#include <mutex>
#include <string>

#define MC_IDTAG_LEN_MAX 20

namespace MicroCsms {

struct User {
    int id = 0;
    std::string idTag; //RFID card which identifies the user at the charger
    bool active = true;
};

class UserStore {
public:
    virtual ~UserStore() = default;

    virtual bool getByIdTag(const char *idTag, User& out) = 0;
};

class VolatileUserStore : public UserStore {
private:
    std::map<std::string, User> users;
    int nextId = 1;
    std::mutex mutex;
public:
    /*
     * Returns the id of the new user or 0 if the idTag is invalid or taken
     */
    int add(const char *idTag, bool active = true);

    bool setActive(int userId, bool active);

    bool getByIdTag(const char *idTag, User& out) override;
};

} //namespace MicroCsms

#endif
