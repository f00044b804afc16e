// matth-x/MicroOcpp
// Copyright Matthias Akstaller 2019 - 2025
// MIT License

#include <MicroCsms/Core/Connection.h>
#include <MicroCsms/Debug.h>

using namespace MicroCsms;

bool BufferedConnection::sendTXT(const char *msg, size_t length) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed) {
            MC_DBG_DEBUG("connection closed, drop %.*s", (int)length, msg);
            return false;
        }
    }
    return sendFrame(msg, length);
}

bool BufferedConnection::readTXT(std::string& out) {
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait(lock, [this] () {
        return !inbox.empty() || closed;
    });

    if (inbox.empty()) {
        return false;
    }

    out = std::move(inbox.front());
    inbox.pop_front();
    return true;
}

void BufferedConnection::close(uint16_t code, const char *reason) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed) {
            return;
        }
        closed = true;
        closeCode = code;
        closeReason = reason ? reason : "";
        inbox.clear();
    }
    cv.notify_all();

    onClose(code, reason ? reason : "");
}

bool BufferedConnection::isConnected() {
    std::lock_guard<std::mutex> lock(mutex);
    return !closed;
}

bool BufferedConnection::receiveTXT(const char *msg, size_t length) {
    bool overflow = false;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed) {
            return false;
        }
        if (inbox.size() >= MC_CONNECTION_INBOX_MAX) {
            overflow = true;
        } else {
            inbox.emplace_back(msg, length);
        }
    }

    if (overflow) {
        MC_DBG_ERR("inbox full (%zu frames). Close connection", (size_t) MC_CONNECTION_INBOX_MAX);
        close(MC_CLOSE_POLICY_VIOLATION, "Message queue overflow");
        return false;
    }

    cv.notify_all();
    return true;
}

void BufferedConnection::closeByPeer() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed) {
            return;
        }
        closed = true;
        closeCode = MC_CLOSE_NORMAL;
        closeReason = "closed by peer";
    }
    cv.notify_all();
}

uint16_t BufferedConnection::getCloseCode() {
    std::lock_guard<std::mutex> lock(mutex);
    return closeCode;
}

const char *BufferedConnection::getCloseReason() {
    std::lock_guard<std::mutex> lock(mutex);
    return closeReason.c_str();
}
