// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <deque>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <MicroCsms/Server/WebSocketServer.h>
#include <MicroCsms/Server/Session.h>
#include <MicroCsms/Core/Connection.h>
#include <MicroCsms/Core/Configuration.h>
#include <MicroCsms/Core/Context.h>
#include <MicroCsms/Version.h>
#include <MicroCsms/Debug.h>
#include <MicroCsms.h>

#define MC_LISTENPORT_DEFAULT 8180
#define MC_SERVERTHREADS_DEFAULT 2
#define MC_HTTP_TIMEOUT 30 //in s, for the upgrade request
#define MC_WS_IDLE_TIMEOUT_MIN 300 //in s

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace MicroCsms {
namespace WebSocket {

bool parseChargePointId(const std::string& target, std::string& chargePointId) {
    std::string path = target.substr(0, target.find('?'));

    const size_t prefixLen = sizeof(MC_WS_PATH_PREFIX) - 1;
    if (path.compare(0, prefixLen, MC_WS_PATH_PREFIX) != 0) {
        return false;
    }

    std::string id = path.substr(prefixLen);
    if (id.empty() || id.find('/') != std::string::npos) {
        return false;
    }

    chargePointId = id;
    return true;
}

int getIdleTimeout(int heartbeatInterval) {
    int timeout = 2 * heartbeatInterval;
    return timeout > MC_WS_IDLE_TIMEOUT_MIN ? timeout : MC_WS_IDLE_TIMEOUT_MIN;
}

bool offersOcppSubprotocol(const std::string& secWebSocketProtocol) {
    size_t pos = 0;
    while (pos <= secWebSocketProtocol.size()) {
        size_t end = secWebSocketProtocol.find(',', pos);
        if (end == std::string::npos) {
            end = secWebSocketProtocol.size();
        }
        std::string token = secWebSocketProtocol.substr(pos, end - pos);
        size_t first = token.find_first_not_of(" \t");
        size_t last = token.find_last_not_of(" \t");
        if (first != std::string::npos && token.substr(first, last - first + 1) == MC_OCPP_SUBPROTOCOL) {
            return true;
        }
        pos = end + 1;
    }
    return false;
}

/*
 * Connection to one charge point on top of a Beast WebSocket stream. All stream operations run on
 * the strand of the socket. The session thread hands frames over by posting them to the write queue
 */
class WsConnection : public BufferedConnection, public std::enable_shared_from_this<WsConnection> {
private:
    WebSocketServer& server;
    websocket::stream<beast::tcp_stream> ws;
    std::string chargePointId;
    beast::flat_buffer buffer;

    //only accessed on the strand
    std::deque<std::shared_ptr<std::string>> writeQueue;
    bool closePending = false;
    bool closeSent = false;
    websocket::close_reason closeReason;

    void doRead() {
        auto self = shared_from_this();
        ws.async_read(buffer, [self] (beast::error_code ec, std::size_t) {
            if (ec) {
                if (ec != websocket::error::closed) {
                    MC_DBG_DEBUG("%s: read: %s", self->chargePointId.c_str(), ec.message().c_str());
                }
                self->closeByPeer();
                return;
            }

            if (self->ws.got_text()) {
                auto msg = beast::buffers_to_string(self->buffer.data());
                self->receiveTXT(msg.c_str(), msg.length());
            } else {
                MC_DBG_WARN("%s: drop binary frame", self->chargePointId.c_str());
            }
            self->buffer.consume(self->buffer.size());

            self->doRead();
        });
    }

    void doWrite() {
        auto self = shared_from_this();
        ws.async_write(net::buffer(*writeQueue.front()), [self] (beast::error_code ec, std::size_t) {
            self->writeQueue.pop_front();

            if (ec) {
                MC_DBG_WARN("%s: write: %s", self->chargePointId.c_str(), ec.message().c_str());
                self->closeByPeer();
                return;
            }

            if (!self->writeQueue.empty()) {
                self->doWrite();
            } else if (self->closePending) {
                self->doClose();
            }
        });
    }

    void doClose() {
        if (closeSent) {
            return;
        }
        closeSent = true;

        auto self = shared_from_this();
        ws.async_close(closeReason, [self] (beast::error_code ec) {
            if (ec) {
                MC_DBG_DEBUG("%s: close: %s", self->chargePointId.c_str(), ec.message().c_str());
            }
        });
    }

    void onAccepted() {
        auto self = shared_from_this();

        doRead();

        auto session = server.getCentralSystem().openSession(chargePointId.c_str(), self);
        if (session) {
            server.runSession(session);
        }
    }
protected:
    bool sendFrame(const char *msg, size_t length) override {
        auto self = shared_from_this();
        auto data = std::make_shared<std::string>(msg, length);
        net::post(ws.get_executor(), [self, data] () {
            if (self->closeSent) {
                return;
            }
            self->writeQueue.push_back(data);
            if (self->writeQueue.size() == 1) {
                self->doWrite();
            }
        });
        return true;
    }

    void onClose(uint16_t code, const char *reason) override {
        auto self = shared_from_this();
        std::string reasonStr = reason ? reason : "";
        if (reasonStr.size() > websocket::close_reason::reason_type::static_capacity) {
            reasonStr.resize(websocket::close_reason::reason_type::static_capacity);
        }
        websocket::close_reason cr {code, beast::string_view(reasonStr)};
        net::post(ws.get_executor(), [self, cr] () {
            self->closePending = true;
            self->closeReason = cr;
            if (self->writeQueue.empty()) {
                self->doClose();
            }
        });
    }
public:
    WsConnection(WebSocketServer& server, tcp::socket&& socket, const std::string& chargePointId)
            : server(server), ws(std::move(socket)), chargePointId(chargePointId) {

    }

    void accept(http::request<http::string_body> req) {
        bool subprotocol = offersOcppSubprotocol(std::string(req[http::field::sec_websocket_protocol]));
        if (!subprotocol) {
            MC_DBG_WARN("%s didn't offer subprotocol %s", chargePointId.c_str(), MC_OCPP_SUBPROTOCOL);
        }

        //Beast pings after half the idle time and drops the peer if it stays silent for the full idle time
        auto timeout = websocket::stream_base::timeout::suggested(beast::role_type::server);
        timeout.idle_timeout = std::chrono::seconds(WebSocket::getIdleTimeout(server.getCentralSystem().getContext().getHeartbeatInterval()));
        timeout.keep_alive_pings = true;
        ws.set_option(timeout);
        ws.set_option(websocket::stream_base::decorator([subprotocol] (websocket::response_type& res) {
            res.set(http::field::server, "MicroCsms/" MC_VERSION);
            if (subprotocol) {
                res.set(http::field::sec_websocket_protocol, MC_OCPP_SUBPROTOCOL);
            }
        }));
        ws.text(true);

        auto self = shared_from_this();
        ws.async_accept(req, [self] (beast::error_code ec) {
            if (ec) {
                MC_DBG_WARN("%s: WebSocket handshake failed: %s", self->chargePointId.c_str(), ec.message().c_str());
                self->closeByPeer();
                return;
            }
            self->onAccepted();
        });
    }
};

/*
 * Reads the HTTP upgrade request. Requests which don't address the OCPP endpoint get a 404
 */
class HttpSession : public std::enable_shared_from_this<HttpSession> {
private:
    WebSocketServer& server;
    beast::tcp_stream stream;
    beast::flat_buffer buffer;
    http::request<http::string_body> req;

    void doRead() {
        req = {};
        stream.expires_after(std::chrono::seconds(MC_HTTP_TIMEOUT));

        auto self = shared_from_this();
        http::async_read(stream, buffer, req, [self] (beast::error_code ec, std::size_t) {
            if (ec) {
                MC_DBG_DEBUG("http read: %s", ec.message().c_str());
                return;
            }
            self->onRead();
        });
    }

    void onRead() {
        std::string target (req.target().data(), req.target().size());
        std::string chargePointId;

        if (!websocket::is_upgrade(req) || !parseChargePointId(target, chargePointId)) {
            MC_DBG_INFO("reject request to %s", target.c_str());
            sendNotFound();
            return;
        }

        MC_DBG_DEBUG("upgrade request from %s", chargePointId.c_str());

        stream.expires_never();
        auto connection = std::make_shared<WsConnection>(server, stream.release_socket(), chargePointId);
        connection->accept(std::move(req));
    }

    void sendNotFound() {
        auto res = std::make_shared<http::response<http::string_body>>(http::status::not_found, req.version());
        res->set(http::field::server, "MicroCsms/" MC_VERSION);
        res->set(http::field::content_type, "text/plain");
        res->keep_alive(false);
        res->body() = "Not Found";
        res->prepare_payload();

        auto self = shared_from_this();
        http::async_write(stream, *res, [self, res] (beast::error_code ec, std::size_t) {
            self->stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        });
    }
public:
    HttpSession(WebSocketServer& server, tcp::socket&& socket) : server(server), stream(std::move(socket)) {

    }

    void run() {
        auto self = shared_from_this();
        net::dispatch(stream.get_executor(), [self] () {
            self->doRead();
        });
    }
};

} //namespace WebSocket
} //namespace MicroCsms

using namespace MicroCsms;

WebSocketServer::WebSocketServer(CentralSystem& centralSystem) : centralSystem(centralSystem) {
    auto& configuration = centralSystem.getContext().getConfiguration();
    listenPortInt = configuration.declareConfiguration<int>("ListenPort", MC_LISTENPORT_DEFAULT);
    serverThreadsInt = configuration.declareConfiguration<int>("ServerThreads", MC_SERVERTHREADS_DEFAULT);
    configuration.registerValidator("ListenPort", VALIDATE_UNSIGNED_INT);
    configuration.registerValidator("ServerThreads", VALIDATE_UNSIGNED_INT);
}

WebSocketServer::~WebSocketServer() {
    stop();
}

bool WebSocketServer::start(unsigned short port) {
    if (running) {
        MC_DBG_WARN("already running");
        return false;
    }

    if (port == 0) {
        int configured = listenPortInt->getInt();
        if (configured <= 0 || configured > 65535) {
            MC_DBG_ERR("invalid ListenPort %i", configured);
            return false;
        }
        port = (unsigned short) configured;
    }

    tcp::endpoint endpoint {tcp::v4(), port};
    beast::error_code ec;

    acceptor.reset(new tcp::acceptor(net::make_strand(ioc)));
    acceptor->open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor->set_option(net::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor->bind(endpoint, ec);
    }
    if (!ec) {
        acceptor->listen(net::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        MC_DBG_ERR("cannot listen on port %u: %s", port, ec.message().c_str());
        acceptor.reset();
        return false;
    }

    running = true;
    doAccept();

    int numThreads = serverThreadsInt->getInt();
    if (numThreads < 1) {
        numThreads = 1;
    }
    for (int i = 0; i < numThreads; i++) {
        ioThreads.emplace_back([this] () {
            ioc.run();
        });
    }

    MC_DBG_INFO("listening on port %u, endpoint " MC_WS_PATH_PREFIX "{chargePointId}", port);
    return true;
}

void WebSocketServer::doAccept() {
    acceptor->async_accept(net::make_strand(ioc), [this] (beast::error_code ec, tcp::socket socket) {
        if (!running) {
            return;
        }

        if (ec) {
            MC_DBG_WARN("accept: %s", ec.message().c_str());
        } else {
            std::make_shared<WebSocket::HttpSession>(*this, std::move(socket))->run();
        }

        reapSessionThreads(false);
        doAccept();
    });
}

void WebSocketServer::runSession(std::shared_ptr<Session> session) {
    std::lock_guard<std::mutex> lock(sessionThreadsMutex);

    auto finished = std::make_shared<std::atomic<bool>>(false);

    sessionThreads.emplace_back();
    auto& sessionThread = sessionThreads.back();
    sessionThread.finished = finished;
    sessionThread.thread = std::thread([session, finished] () {
        session->receiveLoop();
        *finished = true;
    });
}

void WebSocketServer::reapSessionThreads(bool joinAll) {
    std::lock_guard<std::mutex> lock(sessionThreadsMutex);
    for (auto it = sessionThreads.begin(); it != sessionThreads.end();) {
        if (joinAll || *it->finished) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = sessionThreads.erase(it);
        } else {
            ++it;
        }
    }
}

void WebSocketServer::stop() {
    if (!running) {
        return;
    }
    running = false;

    if (acceptor) {
        beast::error_code ec;
        acceptor->close(ec);
    }

    centralSystem.getContext().getSessionManager().closeAll();
    reapSessionThreads(true);

    ioc.stop();
    for (auto& thread : ioThreads) {
        thread.join();
    }
    ioThreads.clear();
    ioc.restart();
    acceptor.reset();

    MC_DBG_INFO("server stopped");
}
