#include "link/tcp_link.hpp"

#include "link/socket_utils.hpp"

#include <algorithm>

#ifdef __linux__
#include <sys/socket.h>
#endif

namespace durin {

TcpLink::TcpLink(const LinkConfig& cfg, const SensorIdTable& ids, const WorkerConfig& worker_cfg)
    : cfg_(cfg),
      ids_(ids),
      worker_cfg_(worker_cfg),
      counters_(std::make_shared<Counters>()),
      send_queue_(std::make_shared<ByteQueue>(static_cast<std::size_t>(cfg.tcp_send_capacity))),
      receive_queue_(std::make_shared<ByteQueue>(static_cast<std::size_t>(cfg.tcp_receive_capacity))) {}

TcpLink::~TcpLink() {
    stop();
}

bool TcpLink::open(const std::string& host, int port, std::string& error) {
    if (stopped_.load()) {
        error = "tcp link already stopped";
        return false;
    }
    if (isOpen()) {
        error = "tcp link already open";
        return false;
    }
    int fd = -1;
    if (!connectTcp(host, port, cfg_.connect_timeout_ms, fd, error)) {
        return false;
    }
    if (!setSendBuffer(fd, cfg_.tcp_send_buffer_bytes, error)) {
        closeSocket(fd);
        return false;
    }
    fd_ = fd;

#ifdef __linux__
    const int poll_ms = std::max(1, cfg_.send_timeout_ms);
    const std::size_t chunk = static_cast<std::size_t>(cfg_.tcp_receive_chunk);
    sender_ = std::make_unique<ipc::ConsumerWorker<Bytes>>(
        "tcp-sender",
        send_queue_,
        [fd, poll_ms, counters = counters_](Bytes& bytes) {
            // A command is either written whole or not at all; a partial write
            // would shift every later command on the firmware side.
            switch (sendMessage(fd, bytes.data(), bytes.size(), poll_ms)) {
            case SendOutcome::Sent:
                counters->sent.fetch_add(1U, std::memory_order_relaxed);
                break;
            case SendOutcome::WouldBlock:
                counters->send_blocked.fetch_add(1U, std::memory_order_relaxed);
                break;
            case SendOutcome::Failed:
                counters->send_failed.fetch_add(1U, std::memory_order_relaxed);
                break;
            }
        },
        worker_cfg_);
    receiver_ = std::make_unique<ipc::ProducerWorker<Bytes>>(
        "tcp-receiver",
        receive_queue_,
        [fd, chunk]() -> std::optional<Bytes> {
            Bytes buf(chunk);
            const ssize_t n = ::recv(fd, buf.data(), buf.size(), MSG_DONTWAIT);
            if (n <= 0) {
                return std::nullopt;
            }
            buf.resize(static_cast<std::size_t>(n));
            return buf;
        },
        worker_cfg_);
#endif
    error.clear();
    return true;
}

bool TcpLink::start(std::string& error) {
    if (stopped_.load()) {
        error = "tcp link already stopped";
        return false;
    }
    if (!isOpen() || !sender_ || !receiver_) {
        error = "tcp link not open";
        return false;
    }
    if (!sender_->start(error)) {
        return false;
    }
    if (!receiver_->start(error)) {
        sender_->stop();
        return false;
    }
    return true;
}

void TcpLink::stop() {
    if (stopped_.exchange(true)) {
        return;
    }
    // Shut down first so both workers see a dead socket, release the
    // descriptor number only once neither worker can touch it again.
    shutdownSocket(fd_);
    receive_queue_->close();
    send_queue_->close();
    if (sender_) {
        sender_->stop();
    }
    if (receiver_) {
        receiver_->stop();
    }
    closeSocket(fd_);
}

ipc::PushResult TcpLink::send(const Bytes& bytes, std::chrono::milliseconds timeout) {
    if (isNoopEncoding(bytes)) {
        noop_.fetch_add(1U, std::memory_order_relaxed);
        return ipc::PushResult::Ok;
    }
    return send_queue_->pushFor(bytes, std::chrono::duration_cast<std::chrono::microseconds>(timeout));
}

std::optional<Bytes> TcpLink::readRaw() {
    return receive_queue_->tryPop();
}

std::optional<SensorPacket> TcpLink::read() {
    const auto raw = readRaw();
    if (!raw) {
        return std::nullopt;
    }
    SensorPacket packet;
    std::string error;
    if (!decodeTelemetry(*raw, ids_, packet, error)) {
        malformed_.fetch_add(1U, std::memory_order_relaxed);
        return std::nullopt;
    }
    return packet;
}

TcpLinkStats TcpLink::stats() const {
    TcpLinkStats out;
    out.sent = counters_->sent.load(std::memory_order_relaxed);
    out.send_failed = counters_->send_failed.load(std::memory_order_relaxed);
    out.send_blocked = counters_->send_blocked.load(std::memory_order_relaxed);
    out.send_dropped = send_queue_->dropCount();
    out.noop = noop_.load(std::memory_order_relaxed);
    out.received = receive_queue_->pushCount();
    out.receive_dropped = receive_queue_->dropCount();
    out.malformed = malformed_.load(std::memory_order_relaxed);
    out.send_depth = send_queue_->size();
    out.receive_depth = receive_queue_->size();
    return out;
}

}  // namespace durin
