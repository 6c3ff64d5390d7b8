#include "dvs/dvs_client.hpp"

#include "dvs/control_protocol.hpp"
#include "link/socket_utils.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <utility>

#ifdef __linux__
#include <poll.h>
#include <sys/socket.h>
#endif

namespace durin::dvs {

DvsClient::DvsClient(std::string server_host, int server_port, int connect_timeout_ms)
    : server_host_(std::move(server_host)), server_port_(server_port), connect_timeout_ms_(connect_timeout_ms) {}

DvsClient::~DvsClient() {
    disconnect();
}

bool DvsClient::connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fd_ >= 0;
}

void DvsClient::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    closeSocket(fd_);
}

bool DvsClient::sendStart(const std::string& host, uint16_t port, std::string& error) {
    Bytes message;
    if (!encodeStart(host, port, message, error)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return sendLocked(message, error);
}

bool DvsClient::sendStop(std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fd_ < 0) {
        error.clear();
        return true;
    }
    const bool ok = sendLocked(encodeStop(), error);
    closeSocket(fd_);
    return ok;
}

void DvsClient::startStream(const std::string& host, uint16_t port) {
    std::string error;
    if (!sendStart(host, port, error)) {
        std::cerr << "warning: dvs client: start failed: " << error << "\n";
    }
}

void DvsClient::stopStream() {
    std::string error;
    if (!sendStop(error)) {
        std::cerr << "warning: dvs client: stop failed: " << error << "\n";
    }
}

bool DvsClient::ensureConnectedLocked(std::string& error) {
    if (fd_ >= 0) {
        return true;
    }
    int fd = -1;
    if (!connectTcp(server_host_, server_port_, connect_timeout_ms_, fd, error)) {
        return false;
    }
    fd_ = fd;
    return true;
}

bool DvsClient::sendLocked(const Bytes& message, std::string& error) {
    if (!ensureConnectedLocked(error)) {
        return false;
    }
    if (writeAllLocked(message, error)) {
        return true;
    }
    // Server may have dropped us after a preemption; one fresh connection.
    closeSocket(fd_);
    if (!ensureConnectedLocked(error)) {
        return false;
    }
    if (writeAllLocked(message, error)) {
        return true;
    }
    closeSocket(fd_);
    return false;
}

bool DvsClient::writeAllLocked(const Bytes& message, std::string& error) {
#ifdef __linux__
    std::size_t sent = 0;
    while (sent < message.size()) {
        const ssize_t n = ::send(fd_, message.data() + sent, message.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                pollfd pfd{};
                pfd.fd = fd_;
                pfd.events = POLLOUT;
                if (poll(&pfd, 1, connect_timeout_ms_) > 0) {
                    continue;
                }
            }
            error = std::string("send to dvs server failed: ") + std::strerror(errno);
            return false;
        }
        sent += static_cast<std::size_t>(n);
    }
    error.clear();
    return true;
#else
    (void)message;
    error = "DvsClient requires Linux";
    return false;
#endif
}

}  // namespace durin::dvs
