#pragma once

#include "core/config.hpp"
#include "ipc/bounded_queue.hpp"
#include "ipc/link_worker.hpp"
#include "protocol/command_codec.hpp"
#include "protocol/telemetry_codec.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace durin {

using ByteQueue = ipc::BoundedQueue<Bytes>;

struct TcpLinkStats {
    uint64_t sent{0};
    uint64_t send_dropped{0};
    uint64_t send_failed{0};
    uint64_t send_blocked{0};  // dropped whole: socket buffer full
    uint64_t noop{0};
    uint64_t received{0};
    uint64_t receive_dropped{0};
    uint64_t malformed{0};
    std::size_t send_depth{0};
    std::size_t receive_depth{0};
};

// Command channel to the robot. Outbound bytes go through a small queue
// drained by a sender worker; replies are read by a receiver worker into a
// second queue. Full queues drop, so send() never blocks past its timeout.
class TcpLink {
public:
    TcpLink(const LinkConfig& cfg, const SensorIdTable& ids, const WorkerConfig& worker_cfg);
    ~TcpLink();

    TcpLink(const TcpLink&) = delete;
    TcpLink& operator=(const TcpLink&) = delete;

    // Connects synchronously; no retry.
    bool open(const std::string& host, int port, std::string& error);
    bool isOpen() const { return fd_ >= 0; }

    bool start(std::string& error);
    void stop();

    ipc::PushResult send(const Bytes& bytes, std::chrono::milliseconds timeout);
    std::optional<SensorPacket> read();
    std::optional<Bytes> readRaw();

    TcpLinkStats stats() const;

private:
    struct Counters {
        std::atomic<uint64_t> sent{0};
        std::atomic<uint64_t> send_failed{0};
        std::atomic<uint64_t> send_blocked{0};
    };

    LinkConfig cfg_;
    SensorIdTable ids_;
    WorkerConfig worker_cfg_;
    int fd_{-1};
    std::atomic<bool> stopped_{false};
    std::atomic<uint64_t> noop_{0};
    std::atomic<uint64_t> malformed_{0};
    std::shared_ptr<Counters> counters_;
    std::shared_ptr<ByteQueue> send_queue_;
    std::shared_ptr<ByteQueue> receive_queue_;
    std::unique_ptr<ipc::ConsumerWorker<Bytes>> sender_;
    std::unique_ptr<ipc::ProducerWorker<Bytes>> receiver_;
};

}  // namespace durin
