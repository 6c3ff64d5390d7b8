#pragma once

#include "core/config.hpp"
#include "dvs/streamer.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <thread>

#include <sys/types.h>

namespace durin::dvs {

// Runs the event-camera streamer binary as a child process:
//   <binary> input <camera_input> output udp <host> <port>
// Child stdout/stderr are forwarded to std::cerr line by line.
class ProcessStreamer : public Streamer {
public:
    explicit ProcessStreamer(const DvsConfig& cfg);
    ~ProcessStreamer() override;

    ProcessStreamer(const ProcessStreamer&) = delete;
    ProcessStreamer& operator=(const ProcessStreamer&) = delete;

    void startStream(const std::string& host, uint16_t port) override;
    void stopStream() override;

    bool available() const { return !binary_path_.empty(); }
    bool isStreaming() const;
    pid_t pid() const;

private:
    void stopLocked();
    static void forwardOutput(int fd, const std::atomic<bool>* stop);

    DvsConfig cfg_;
    std::string binary_path_;
    mutable std::mutex mutex_;
    pid_t child_{-1};
    int output_fd_{-1};
    std::atomic<bool> log_stop_{false};
    std::thread log_thread_;
};

// Absolute path of name on PATH, or empty. Names containing '/' are checked as-is.
std::string findOnPath(const std::string& name);

}  // namespace durin::dvs
