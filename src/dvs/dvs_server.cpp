#include "dvs/dvs_server.hpp"

#include "link/socket_utils.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <utility>

#ifdef __linux__
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace durin::dvs {

namespace {
constexpr std::size_t kRecvBytes = 512;
}

DvsServer::DvsServer(const DvsConfig& cfg, std::shared_ptr<Streamer> streamer)
    : cfg_(cfg), session_(std::make_shared<DvsSession>(std::move(streamer))) {}

DvsServer::~DvsServer() {
    stop();
}

bool DvsServer::start(const std::string& host, int port, std::string& error) {
    if (running_.load()) {
        error = "dvs server already running";
        return false;
    }
#ifdef __linux__
    int fd = -1;
    if (!listenTcp(host, port, 1, fd, error)) {
        return false;
    }
    listen_fd_ = fd;
    bound_port_ = localPort(fd);
    running_.store(true);
    accept_thread_ = std::thread(&DvsServer::acceptLoop, this);
    std::cerr << "dvs: listening on " << (host.empty() ? "0.0.0.0" : host) << ":" << bound_port_ << "\n";
    error.clear();
    return true;
#else
    (void)host;
    (void)port;
    error = "DvsServer requires Linux";
    return false;
#endif
}

void DvsServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    shutdownSocket(listen_fd_);
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    closeSocket(listen_fd_);
    retireCurrent();
    session_->shutdown();
}

void DvsServer::acceptLoop() {
#ifdef __linux__
    while (running_.load()) {
        const int client_fd = accept(listen_fd_, nullptr, nullptr);
        if (client_fd < 0) {
            if (running_.load() && (errno == EINTR || errno == ECONNABORTED)) {
                continue;
            }
            if (running_.load()) {
                std::cerr << "dvs: accept failed: " << std::strerror(errno) << "\n";
            }
            break;
        }
        if (!running_.load()) {
            ::close(client_fd);
            break;
        }

        const uint64_t id = accepted_.fetch_add(1U) + 1U;
        std::cerr << "dvs: new client connection " << id << "\n";
        session_->preempt(id);
        retireCurrent();

        auto conn = std::make_shared<Connection>();
        conn->id = id;
        conn->fd = client_fd;
        current_ = conn;
        current_thread_ = std::thread(&DvsServer::clientLoop, conn, session_, cfg_.recv_poll_ms);
    }
#endif
}

void DvsServer::retireCurrent() {
    if (!current_) {
        return;
    }
    auto conn = std::move(current_);
    current_.reset();
    conn->running.store(false);
    bool exited = false;
    {
        std::unique_lock<std::mutex> lock(conn->mutex);
        shutdownSocket(conn->fd);
        exited = conn->done.wait_for(
            lock, std::chrono::milliseconds(cfg_.client_join_timeout_ms), [&conn]() { return conn->finished; });
    }
    if (!current_thread_.joinable()) {
        return;
    }
    if (exited) {
        current_thread_.join();
    } else {
        std::cerr << "warning: dvs client " << conn->id << " did not exit within "
                  << cfg_.client_join_timeout_ms << " ms, detaching\n";
        current_thread_.detach();
    }
}

void DvsServer::clientLoop(std::shared_ptr<Connection> conn, std::shared_ptr<DvsSession> session, int poll_ms) {
#ifdef __linux__
    uint8_t buf[kRecvBytes];
    while (conn->running.load()) {
        pollfd pfd{};
        pfd.fd = conn->fd;
        pfd.events = POLLIN;
        const int rc = poll(&pfd, 1, poll_ms);
        if (rc == 0) {
            continue;
        }
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::cerr << "dvs: poll failed on client " << conn->id << ": " << std::strerror(errno) << "\n";
            break;
        }
        const ssize_t n = recv(conn->fd, buf, sizeof(buf), 0);
        if (n <= 0) {
            if (n < 0 && conn->running.load()) {
                std::cerr << "dvs: error when receiving data: " << std::strerror(errno) << "\n";
            }
            break;
        }
        ControlMessage msg;
        std::string error;
        if (parseControlMessage(buf, static_cast<std::size_t>(n), msg, error)) {
            session->handle(conn->id, msg);
        } else if (!error.empty()) {
            std::cerr << "dvs: ignoring " << error << "\n";
        }
    }
    session->onDisconnect(conn->id);
#else
    (void)poll_ms;
    (void)session;
#endif
    {
        std::lock_guard<std::mutex> lock(conn->mutex);
        closeSocket(conn->fd);
        conn->finished = true;
    }
    conn->done.notify_all();
}

}  // namespace durin::dvs
