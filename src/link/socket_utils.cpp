#include "link/socket_utils.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>

#ifdef __linux__
#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace durin {

#ifdef __linux__
namespace {

bool makeAddress(const std::string& host, int port, sockaddr_in& addr, std::string& error) {
    if (port < 0 || port > 65535) {
        error = "port out of range: " + std::to_string(port);
        return false;
    }
    addr = sockaddr_in{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (host.empty() || host == "0.0.0.0") {
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
        return true;
    }
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        error = "invalid IPv4 address: " + host;
        return false;
    }
    return true;
}

std::string errnoText(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

}  // namespace
#endif

bool setNonBlocking(int fd, std::string& error) {
#ifdef __linux__
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        error = errnoText("fcntl O_NONBLOCK failed");
        return false;
    }
    return true;
#else
    (void)fd;
    error = "non-blocking sockets require Linux";
    return false;
#endif
}

bool connectTcp(const std::string& host, int port, int timeout_ms, int& out_fd, std::string& error) {
#ifdef __linux__
    const std::string target = host + ":" + std::to_string(port);
    sockaddr_in addr{};
    if (!makeAddress(host, port, addr, error)) {
        return false;
    }
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        error = errnoText("socket failed");
        return false;
    }
    if (!setNonBlocking(fd, error)) {
        ::close(fd);
        return false;
    }
    int rc = connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (rc < 0 && errno == EINPROGRESS) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;
        rc = poll(&pfd, 1, timeout_ms);
        if (rc == 0) {
            ::close(fd);
            error = "cannot reach durin at " + target + ": connect timed out";
            return false;
        }
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (rc < 0 || getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
            error = "cannot reach durin at " + target + ": " + std::strerror(errno);
            ::close(fd);
            return false;
        }
        if (so_error != 0) {
            ::close(fd);
            error = "cannot reach durin at " + target + ": " + std::strerror(so_error);
            return false;
        }
    } else if (rc < 0) {
        error = "cannot reach durin at " + target + ": " + std::strerror(errno);
        ::close(fd);
        return false;
    }
    out_fd = fd;
    error.clear();
    return true;
#else
    (void)host;
    (void)port;
    (void)timeout_ms;
    (void)out_fd;
    error = "TCP links require Linux";
    return false;
#endif
}

bool bindUdp(const std::string& host, int port, int& out_fd, std::string& error) {
#ifdef __linux__
    sockaddr_in addr{};
    if (!makeAddress(host, port, addr, error)) {
        return false;
    }
    int fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        error = errnoText("socket failed");
        return false;
    }
    int yes = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        error = errnoText(("bind udp " + host + ":" + std::to_string(port) + " failed").c_str());
        ::close(fd);
        return false;
    }
    if (!setNonBlocking(fd, error)) {
        ::close(fd);
        return false;
    }
    out_fd = fd;
    error.clear();
    return true;
#else
    (void)host;
    (void)port;
    (void)out_fd;
    error = "UDP links require Linux";
    return false;
#endif
}

bool listenTcp(const std::string& host, int port, int backlog, int& out_fd, std::string& error) {
#ifdef __linux__
    sockaddr_in addr{};
    if (!makeAddress(host, port, addr, error)) {
        return false;
    }
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        error = errnoText("socket failed");
        return false;
    }
    int yes = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        error = errnoText(("bind tcp " + host + ":" + std::to_string(port) + " failed").c_str());
        ::close(fd);
        return false;
    }
    if (listen(fd, backlog) < 0) {
        error = errnoText("listen failed");
        ::close(fd);
        return false;
    }
    out_fd = fd;
    error.clear();
    return true;
#else
    (void)host;
    (void)port;
    (void)backlog;
    (void)out_fd;
    error = "TCP listeners require Linux";
    return false;
#endif
}

SendOutcome sendMessage(int fd, const uint8_t* data, std::size_t size, int poll_ms) {
#ifdef __linux__
    std::size_t sent = 0;
    while (sent < size) {
        const ssize_t n = ::send(fd, data + sent, size - sent, MSG_NOSIGNAL | MSG_DONTWAIT);
        if (n > 0) {
            sent += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            if (sent == 0U) {
                return SendOutcome::WouldBlock;
            }
            pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLOUT;
            const int rc = poll(&pfd, 1, poll_ms);
            if (rc < 0 && errno != EINTR) {
                return SendOutcome::Failed;
            }
            if (rc > 0 && (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0) {
                return SendOutcome::Failed;
            }
            continue;
        }
        return SendOutcome::Failed;
    }
    return SendOutcome::Sent;
#else
    (void)fd;
    (void)data;
    (void)size;
    (void)poll_ms;
    return SendOutcome::Failed;
#endif
}

bool setSendBuffer(int fd, int bytes, std::string& error) {
#ifdef __linux__
    if (bytes <= 0) {
        return true;
    }
    if (setsockopt(fd, SOL_SOCKET, SO_SNDBUF, &bytes, sizeof(bytes)) < 0) {
        error = errnoText("setsockopt SO_SNDBUF failed");
        return false;
    }
    return true;
#else
    (void)fd;
    (void)bytes;
    error = "socket options require Linux";
    return false;
#endif
}

uint16_t localPort(int fd) {
#ifdef __linux__
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (fd < 0 || getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return 0U;
    }
    return ntohs(addr.sin_port);
#else
    (void)fd;
    return 0U;
#endif
}

void shutdownSocket(int fd) {
#ifdef __linux__
    if (fd < 0) {
        return;
    }
    if (shutdown(fd, SHUT_RDWR) < 0 && errno != ENOTCONN) {
        std::cerr << "warning: socket shutdown failed: " << std::strerror(errno) << "\n";
    }
#else
    (void)fd;
#endif
}

void closeSocket(int& fd) {
#ifdef __linux__
    if (fd >= 0 && ::close(fd) < 0) {
        std::cerr << "warning: socket close failed: " << std::strerror(errno) << "\n";
    }
#endif
    fd = -1;
}

std::string guessLocalIpv4(const std::string& peer) {
#ifdef __linux__
    sockaddr_in addr{};
    std::string error;
    if (!makeAddress(peer, 1, addr, error)) {
        return "127.0.0.1";
    }
    int fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        return "127.0.0.1";
    }
    std::string out = "127.0.0.1";
    if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) {
        sockaddr_in local{};
        socklen_t len = sizeof(local);
        char buf[INET_ADDRSTRLEN] = {0};
        if (getsockname(fd, reinterpret_cast<sockaddr*>(&local), &len) == 0 &&
            inet_ntop(AF_INET, &local.sin_addr, buf, sizeof(buf)) != nullptr) {
            out = buf;
        }
    }
    ::close(fd);
    return out;
#else
    (void)peer;
    return "127.0.0.1";
#endif
}

}  // namespace durin
