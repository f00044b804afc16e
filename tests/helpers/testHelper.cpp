// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <chrono>
#include <string.h>

#include "./testHelper.h"

#include <MicroCsms/Core/Context.h>
#include <MicroCsms/Core/FilesystemUtils.h>
#include <MicroCsms/Model/ChargePoint/Charger.h>
#include <MicroCsms/Model/Authorization/UserStore.h>
#include <MicroCsms/Model/Billing/WalletStore.h>
#include <MicroCsms/Model/Billing/TariffStore.h>
#include <MicroCsms/Debug.h>

std::atomic<int32_t> mtime {BASE_TIME_UNIX};
int32_t custom_timer_cb() {
    return mtime.load();
}

using namespace MicroCsms;

bool TestConnection::sendFrame(const char *msg, size_t length) {
    if (failSend) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(sentMutex);
        sent.emplace_back(msg, length);
    }
    sentCv.notify_all();
    return true;
}

void TestConnection::onClose(uint16_t code, const char *reason) {
    std::lock_guard<std::mutex> lock(sentMutex);
    closeCount++;
}

size_t TestConnection::getSentCount() {
    std::lock_guard<std::mutex> lock(sentMutex);
    return sent.size();
}

std::string TestConnection::getSent(size_t index) {
    std::lock_guard<std::mutex> lock(sentMutex);
    if (index >= sent.size()) {
        return std::string();
    }
    return sent[index];
}

bool TestConnection::awaitSent(size_t count, unsigned long timeoutMs) {
    std::unique_lock<std::mutex> lock(sentMutex);
    return sentCv.wait_for(lock, std::chrono::milliseconds(timeoutMs), [this, count] () {
        return sent.size() >= count;
    });
}

bool TestConnection::decodeSent(size_t index, Frame& out) {
    auto msg = getSent(index);
    if (msg.empty()) {
        return false;
    }
    return decodeFrame(msg.c_str(), msg.length(), out) == DecodeStatus::Ok;
}

int TestConnection::getCloseCount() {
    std::lock_guard<std::mutex> lock(sentMutex);
    return closeCount;
}

namespace MicroCsms {

std::shared_ptr<FilesystemAdapter> makeTestFilesystem() {
    auto filesystem = makeDefaultFilesystemAdapter(TEST_STORE_DIR);
    if (filesystem) {
        FilesystemUtils::remove_if(filesystem, [] (const char*) {return true;});
    }
    return filesystem;
}

} //namespace MicroCsms

TestSystem::TestSystem(std::shared_ptr<FilesystemAdapter> filesystem) : csms(filesystem) {

    mtime = BASE_TIME_UNIX;
    csms.getContext().getClock().setUnixTimeCb(custom_timer_cb);

    chargers = new VolatileChargerStore();
    users = new VolatileUserStore();
    wallets = new VolatileWalletStore();
    tariffs = new VolatileTariffStore();
    csms.getModel().setChargerStore(std::unique_ptr<ChargerStore>(chargers));
    csms.getModel().setUserStore(std::unique_ptr<UserStore>(users));
    csms.getModel().setWalletStore(std::unique_ptr<WalletStore>(wallets));
    csms.getModel().setTariffStore(std::unique_ptr<TariffStore>(tariffs));

    if (!csms.setup()) {
        MC_DBG_ERR("test system setup failed");
    }
}

TestSystem::~TestSystem() {
    csms.shutdown();
    for (auto& loop : receiveLoops) {
        loop.join();
    }
}

std::shared_ptr<Session> TestSystem::connect(const char *chargePointId, std::shared_ptr<TestConnection> connection, bool runLoop) {
    auto session = csms.openSession(chargePointId, connection);
    if (session && runLoop) {
        receiveLoops.emplace_back([session] () {
            session->receiveLoop();
        });
    }
    return session;
}

bool TestSystem::sendCall(Session& session, TestConnection& connection, const char *call, Frame& response) {
    size_t count = connection.getSentCount();
    session.receiveMessage(call, strlen(call));
    if (!connection.awaitSent(count + 1)) {
        return false;
    }
    return connection.decodeSent(count, response);
}
