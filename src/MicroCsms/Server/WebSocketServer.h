// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_WEBSOCKETSERVER_H
#define MC_WEBSOCKETSERVER_H

#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#define MC_WS_PATH_PREFIX "/ocpp/"

namespace MicroCsms {

class CentralSystem;
class Configuration;
class Session;

namespace WebSocket {

/*
 * Extracts the chargePointId from a request target like "/ocpp/CP001". Returns false if the target
 * doesn't address the OCPP endpoint
 */
bool parseChargePointId(const std::string& target, std::string& chargePointId);

/*
 * Checks if the client offered the OCPP 1.6 subprotocol in its Sec-WebSocket-Protocol header
 */
bool offersOcppSubprotocol(const std::string& secWebSocketProtocol);

/*
 * Idle timeout of the WebSocket in s. Covers two heartbeat periods so that a charge point which
 * doesn't answer the keep-alive pings is still dropped only after missing a Heartbeat
 */
int getIdleTimeout(int heartbeatInterval);

} //namespace WebSocket

/*
 * WebSocket endpoint for the charge points. The Boost.Asio worker threads run the network I/O, each
 * admitted session runs its receive loop on a dedicated thread.
 */
class WebSocketServer {
private:
    CentralSystem& centralSystem;

    std::shared_ptr<Configuration> listenPortInt;
    std::shared_ptr<Configuration> serverThreadsInt;

    boost::asio::io_context ioc;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor;
    std::vector<std::thread> ioThreads;
    std::atomic<bool> running {false};

    struct SessionThread {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };
    std::list<SessionThread> sessionThreads;
    std::mutex sessionThreadsMutex;

    void doAccept();
    void reapSessionThreads(bool joinAll);
public:
    WebSocketServer(CentralSystem& centralSystem);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    /*
     * Binds the listen port and starts the I/O threads. `port = 0` takes the configured ListenPort
     */
    bool start(unsigned short port = 0);

    /*
     * Closes all sessions, waits for their receive loops and stops the I/O threads
     */
    void stop();

    //called by the upgrade handler
    void runSession(std::shared_ptr<Session> session);

    CentralSystem& getCentralSystem() {return centralSystem;}
    bool isRunning() {return running;}
};

} //namespace MicroCsms

#endif
