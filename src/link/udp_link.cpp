#include "link/udp_link.hpp"

#include "link/socket_utils.hpp"

#ifdef __linux__
#include <sys/socket.h>
#endif

namespace durin {

UdpLink::UdpLink(const LinkConfig& cfg, const SensorIdTable& ids, const WorkerConfig& worker_cfg)
    : cfg_(cfg),
      ids_(ids),
      worker_cfg_(worker_cfg),
      counters_(std::make_shared<Counters>()),
      queue_(std::make_shared<SensorQueue>(static_cast<std::size_t>(cfg.udp_queue_capacity))) {}

UdpLink::~UdpLink() {
    stop();
}

bool UdpLink::open(const std::string& bind_host, int port, std::string& error) {
    if (stopped_.load()) {
        error = "udp link already stopped";
        return false;
    }
    if (isOpen()) {
        error = "udp link already open";
        return false;
    }
    int fd = -1;
    if (!bindUdp(bind_host, port, fd, error)) {
        return false;
    }
    fd_ = fd;

#ifdef __linux__
    receiver_ = std::make_unique<ipc::ProducerWorker<SensorPacket>>(
        "udp-receiver",
        queue_,
        [fd, ids = ids_, size = static_cast<std::size_t>(cfg_.udp_packet_size), counters = counters_]()
            -> std::optional<SensorPacket> {
            Bytes buf(size);
            const ssize_t n = ::recvfrom(fd, buf.data(), buf.size(), MSG_DONTWAIT, nullptr, nullptr);
            if (n <= 0) {
                return std::nullopt;
            }
            counters->received.fetch_add(1U, std::memory_order_relaxed);
            SensorPacket packet;
            std::string decode_error;
            if (!decodeTelemetry(buf.data(), static_cast<std::size_t>(n), ids, packet, decode_error)) {
                counters->malformed.fetch_add(1U, std::memory_order_relaxed);
                return std::nullopt;
            }
            return packet;
        },
        worker_cfg_);
#endif
    error.clear();
    return true;
}

uint16_t UdpLink::boundPort() const {
    return localPort(fd_);
}

bool UdpLink::start(std::string& error) {
    if (stopped_.load()) {
        error = "udp link already stopped";
        return false;
    }
    if (!isOpen() || !receiver_) {
        error = "udp link not open";
        return false;
    }
    return receiver_->start(error);
}

void UdpLink::stop() {
    if (stopped_.exchange(true)) {
        return;
    }
    shutdownSocket(fd_);
    queue_->close();
    if (receiver_) {
        receiver_->stop();
    }
    closeSocket(fd_);
}

UdpLinkStats UdpLink::stats() const {
    UdpLinkStats out;
    out.received = counters_->received.load(std::memory_order_relaxed);
    out.malformed = counters_->malformed.load(std::memory_order_relaxed);
    out.dropped = queue_->dropCount();
    out.depth = queue_->size();
    return out;
}

}  // namespace durin
