// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_TESTHELPER_H
#define MC_TESTHELPER_H

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <MicroCsms.h>
#include <MicroCsms/Core/Connection.h>
#include <MicroCsms/Core/FilesystemAdapter.h>
#include <MicroCsms/Core/Frame.h>

#define BASE_TIME_UNIX 1672531200 //2023-01-01T00:00:00Z
#define BASE_TIME "2023-01-01T00:00:00Z"

#define TEST_STORE_DIR "./mc_test_store/"

extern std::atomic<int32_t> mtime; //unix time of the test clock
int32_t custom_timer_cb();

namespace MicroCsms {

class VolatileChargerStore;
class VolatileUserStore;
class VolatileWalletStore;
class VolatileTariffStore;

/*
 * Transport stub. The server's frames are recorded, the test plays the charge point and pushes its
 * frames with receiveTXT()
 */
class TestConnection : public BufferedConnection {
private:
    std::mutex sentMutex;
    std::condition_variable sentCv;
    std::vector<std::string> sent;
    int closeCount = 0;
protected:
    bool sendFrame(const char *msg, size_t length) override;
    void onClose(uint16_t code, const char *reason) override;
public:
    std::atomic<bool> failSend {false};

    size_t getSentCount();
    std::string getSent(size_t index);

    /*
     * Waits until at least `count` frames have been sent
     */
    bool awaitSent(size_t count, unsigned long timeoutMs = 2000);

    bool decodeSent(size_t index, Frame& out);

    int getCloseCount();
};

/*
 * Store folder which is not accessible, e.g. an unmounted volume
 */
class FailingFilesystemAdapter : public FilesystemAdapter {
public:
    int stat(const char *fn, size_t *size) override {return -1;}
    std::unique_ptr<FileAdapter> open(const char *fn, const char *mode) override {return nullptr;}
    bool remove(const char *fn) override {return false;}
    int ftw_root(std::function<int(const char *fname)> fn) override {return -1;}
};

/*
 * Empties the test store folder and returns an adapter on it
 */
std::shared_ptr<FilesystemAdapter> makeTestFilesystem();

/*
 * CentralSystem with volatile stores on the test clock. Charge points are simulated with TestConnections
 */
class TestSystem {
private:
    std::vector<std::thread> receiveLoops;
public:
    CentralSystem csms;

    VolatileChargerStore *chargers = nullptr;
    VolatileUserStore *users = nullptr;
    VolatileWalletStore *wallets = nullptr;
    VolatileTariffStore *tariffs = nullptr;

    TestSystem(std::shared_ptr<FilesystemAdapter> filesystem = nullptr);
    ~TestSystem();

    /*
     * Opens a session for the charge point. The receive loop runs on a background thread if
     * `runLoop` is set, otherwise the test hands the frames over with session->receiveMessage()
     */
    std::shared_ptr<Session> connect(const char *chargePointId, std::shared_ptr<TestConnection> connection, bool runLoop = false);

    /*
     * Hands the Call over to the session and returns the decoded response
     */
    bool sendCall(Session& session, TestConnection& connection, const char *call, Frame& response);
};

} //namespace MicroCsms

#endif
