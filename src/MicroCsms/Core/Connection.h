// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#ifndef MC_CONNECTION_H
#define MC_CONNECTION_H

#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <stdint.h>

//WebSocket close codes (RFC 6455)
#define MC_CLOSE_NORMAL 1000
#define MC_CLOSE_GOING_AWAY 1001
#define MC_CLOSE_POLICY_VIOLATION 1008
#define MC_CLOSE_TRY_AGAIN_LATER 1013

#ifndef MC_CONNECTION_INBOX_MAX
#define MC_CONNECTION_INBOX_MAX 100 //frames received but not processed yet
#endif

namespace MicroCsms {

/*
 * Text-frame transport between the server and one charge point.
 */
class Connection {
public:
    Connection() = default;
    virtual ~Connection() = default;

    /*
     * The OCPP library calls this function for sending an OCPP message to the charge point. Returns
     * true on success, false otherwise
     */
    virtual bool sendTXT(const char *msg, size_t length) = 0;

    /*
     * Blocks until the next text frame from the charge point is available and writes it into `out`.
     * Returns false once the connection has been closed and no further frames are buffered
     */
    virtual bool readTXT(std::string& out) = 0;

    /*
     * Closes the WebSocket with the given close code. Unblocks pending readTXT calls
     */
    virtual void close(uint16_t code, const char *reason) = 0;

    virtual bool isConnected() = 0;
};

/*
 * Connection with an inbound message queue. The transport pushes received frames with receiveTXT()
 * and readTXT() pops them in the order of receipt.
 */
class BufferedConnection : public Connection {
private:
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::string> inbox;
    bool closed = false;
    uint16_t closeCode = 0;
    std::string closeReason;
protected:
    virtual bool sendFrame(const char *msg, size_t length) = 0;
    virtual void onClose(uint16_t code, const char *reason) = 0; //called once when the connection gets closed
public:
    bool sendTXT(const char *msg, size_t length) override;

    bool readTXT(std::string& out) override;

    void close(uint16_t code, const char *reason) override;

    bool isConnected() override;

    /*
     * Hands a received frame over to the reader. Returns false if the connection is already closed.
     * If the reader falls behind by more than MC_CONNECTION_INBOX_MAX frames, the connection is closed
     * with 1008 and the frame is dropped
     */
    bool receiveTXT(const char *msg, size_t length);

    /*
     * Marks the connection as closed by the remote side
     */
    void closeByPeer();

    uint16_t getCloseCode();
    const char *getCloseReason();
};

} //namespace MicroCsms

#endif
