#pragma once

#include "dvs/streamer.hpp"
#include "protocol/command_codec.hpp"

#include <mutex>
#include <string>

namespace durin::dvs {

// Streamer that forwards start/stop to a remote DVS server. Connects on
// first use and reconnects once when a send fails.
class DvsClient : public Streamer {
public:
    DvsClient(std::string server_host, int server_port, int connect_timeout_ms);
    ~DvsClient() override;

    DvsClient(const DvsClient&) = delete;
    DvsClient& operator=(const DvsClient&) = delete;

    bool sendStart(const std::string& host, uint16_t port, std::string& error);
    bool sendStop(std::string& error);

    void startStream(const std::string& host, uint16_t port) override;
    void stopStream() override;

    bool connected() const;
    void disconnect();

private:
    bool ensureConnectedLocked(std::string& error);
    bool sendLocked(const Bytes& message, std::string& error);
    bool writeAllLocked(const Bytes& message, std::string& error);

    std::string server_host_;
    int server_port_;
    int connect_timeout_ms_;
    mutable std::mutex mutex_;
    int fd_{-1};
};

}  // namespace durin::dvs
