#pragma once

#include "core/config.hpp"
#include "dvs/dvs_session.hpp"
#include "dvs/streamer.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace durin::dvs {

// Accepts DVS control connections one at a time. Every accepted connection
// preempts the previous one: its stream is stopped and its thread is shut
// down and joined (detached after client_join_timeout_ms) before the new
// connection is served.
class DvsServer {
public:
    DvsServer(const DvsConfig& cfg, std::shared_ptr<Streamer> streamer);
    ~DvsServer();

    DvsServer(const DvsServer&) = delete;
    DvsServer& operator=(const DvsServer&) = delete;

    bool start(const std::string& host, int port, std::string& error);
    void stop();
    bool isRunning() const { return running_.load(); }
    uint16_t boundPort() const { return bound_port_; }

    SessionSnapshot session() const { return session_->snapshot(); }
    uint64_t connectionsAccepted() const { return accepted_.load(); }

private:
    struct Connection {
        uint64_t id{0};
        std::mutex mutex;
        std::condition_variable done;
        std::atomic<bool> running{true};
        bool finished{false};
        int fd{-1};
    };

    void acceptLoop();
    void retireCurrent();
    static void clientLoop(std::shared_ptr<Connection> conn, std::shared_ptr<DvsSession> session, int poll_ms);

    DvsConfig cfg_;
    std::shared_ptr<DvsSession> session_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> accepted_{0};
    int listen_fd_{-1};
    uint16_t bound_port_{0};
    std::thread accept_thread_;
    std::shared_ptr<Connection> current_;
    std::thread current_thread_;
};

}  // namespace durin::dvs
