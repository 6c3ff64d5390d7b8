#pragma once

#include "core/config.hpp"
#include "ipc/link_worker.hpp"
#include "protocol/telemetry_codec.hpp"
#include "sensor/sensor_aggregator.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace durin {

struct UdpLinkStats {
    uint64_t received{0};
    uint64_t malformed{0};
    uint64_t dropped{0};
    std::size_t depth{0};
};

// Telemetry receiver: one producer worker decodes datagrams into the queue
// returned by queue(). A full queue drops the decoded packet.
class UdpLink {
public:
    UdpLink(const LinkConfig& cfg, const SensorIdTable& ids, const WorkerConfig& worker_cfg);
    ~UdpLink();

    UdpLink(const UdpLink&) = delete;
    UdpLink& operator=(const UdpLink&) = delete;

    bool open(const std::string& bind_host, int port, std::string& error);
    bool isOpen() const { return fd_ >= 0; }
    uint16_t boundPort() const;

    bool start(std::string& error);
    void stop();

    std::shared_ptr<SensorQueue> queue() const { return queue_; }
    std::optional<SensorPacket> read() { return queue_->tryPop(); }

    UdpLinkStats stats() const;

private:
    struct Counters {
        std::atomic<uint64_t> received{0};
        std::atomic<uint64_t> malformed{0};
    };

    LinkConfig cfg_;
    SensorIdTable ids_;
    WorkerConfig worker_cfg_;
    int fd_{-1};
    std::atomic<bool> stopped_{false};
    std::shared_ptr<Counters> counters_;
    std::shared_ptr<SensorQueue> queue_;
    std::unique_ptr<ipc::ProducerWorker<SensorPacket>> receiver_;
};

}  // namespace durin
