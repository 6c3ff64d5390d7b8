#include "link/actuator.hpp"
#include "link/socket_utils.hpp"
#include "link/tcp_link.hpp"

#include <chrono>
#include <iostream>
#include <thread>

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

durin::Bytes recvFor(int fd, std::size_t want, int timeout_ms) {
    durin::Bytes out;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (out.size() < want && std::chrono::steady_clock::now() < deadline) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        if (poll(&pfd, 1, 10) <= 0) {
            continue;
        }
        uint8_t buf[512];
        const ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) {
            break;
        }
        out.insert(out.end(), buf, buf + n);
    }
    return out;
}

}  // namespace

int main() {
    durin::LinkConfig cfg;
    cfg.connect_timeout_ms = 500;
    durin::WorkerConfig worker_cfg;
    durin::SensorIdTable ids;
    std::string error;

    int listen_fd = -1;
    if (!durin::listenTcp("127.0.0.1", 0, 1, listen_fd, error)) {
        std::cerr << "listen failed: " << error << "\n";
        return 1;
    }
    const uint16_t port = durin::localPort(listen_fd);

    durin::TcpLink link(cfg, ids, worker_cfg);
    if (!link.open("127.0.0.1", port, error) || !link.start(error)) {
        std::cerr << "tcp link open/start failed: " << error << "\n";
        return 1;
    }
    int peer = -1;
    for (int i = 0; i < 100 && peer < 0; ++i) {
        peer = accept(listen_fd, nullptr, nullptr);
        if (peer < 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }
    if (peer < 0) {
        std::cerr << "accept failed\n";
        return 1;
    }

    durin::Actuator actuate(link, std::chrono::milliseconds(50));
    if (actuate(durin::Move{300, -150, 90})) {
        std::cerr << "fire-and-forget command should return nullopt\n";
        return 1;
    }
    const durin::Bytes got = recvFor(peer, 7, 1000);
    if (got != durin::Bytes{0x02, 0x2C, 0x01, 0x6A, 0xFF, 0xA6, 0xFF}) {
        std::cerr << "peer did not receive the Move encoding (" << got.size() << " bytes)\n";
        return 1;
    }

    if (link.send(durin::Bytes{}, std::chrono::milliseconds(10)) != durin::ipc::PushResult::Ok ||
        link.stats().noop != 1U) {
        std::cerr << "empty encoding should be a counted no-op\n";
        return 1;
    }

    durin::SensorPacket reply;
    reply.kind = durin::SensorKind::Tof;
    reply.sensor_id = static_cast<uint8_t>(ids.tof_b);
    durin::TofPayload tof{};
    tof.depth[3] = 321.0F;
    reply.payload = tof;
    const durin::Bytes reply_bytes = durin::encodeTelemetry(reply);
    if (send(peer, reply_bytes.data(), reply_bytes.size(), 0) != static_cast<ssize_t>(reply_bytes.size())) {
        std::cerr << "peer send failed\n";
        return 1;
    }
    std::optional<durin::SensorPacket> in;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);
    while (!(in = actuate.read()) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    if (!in || in->sensor_id != ids.tof_b || std::get<durin::TofPayload>(in->payload).depth[3] != 321.0F) {
        std::cerr << "reply was not delivered through read()\n";
        return 1;
    }
    if (link.read()) {
        std::cerr << "empty receive queue should return nullopt\n";
        return 1;
    }

    link.stop();
    link.stop();
    if (link.isOpen()) {
        std::cerr << "descriptor should be released after stop\n";
        return 1;
    }
    if (link.send(durin::encodeCommand(durin::PollAll{}), std::chrono::milliseconds(5)) != durin::ipc::PushResult::Closed) {
        std::cerr << "send after stop should report Closed\n";
        return 1;
    }
    ::close(peer);

    // Outbound queue full: send waits out its timeout, then drops.
    {
        durin::TcpLink idle(cfg, ids, worker_cfg);
        if (!idle.open("127.0.0.1", port, error)) {
            std::cerr << "idle link open failed: " << error << "\n";
            return 1;
        }
        const durin::Bytes poll_all = durin::encodeCommand(durin::PollAll{});
        for (int i = 0; i < cfg.tcp_send_capacity; ++i) {
            if (idle.send(poll_all, std::chrono::milliseconds(0)) != durin::ipc::PushResult::Ok) {
                std::cerr << "send into a queue with room should succeed\n";
                return 1;
            }
        }
        const auto t0 = std::chrono::steady_clock::now();
        const durin::ipc::PushResult full = idle.send(poll_all, std::chrono::milliseconds(30));
        const auto waited = std::chrono::steady_clock::now() - t0;
        if (full != durin::ipc::PushResult::Dropped) {
            std::cerr << "send into a full queue should report Dropped\n";
            return 1;
        }
        if (waited < std::chrono::milliseconds(25) || waited > std::chrono::milliseconds(500)) {
            std::cerr << "full-queue send should return after its timeout\n";
            return 1;
        }
        const durin::TcpLinkStats s = idle.stats();
        if (s.send_dropped != 1U || s.send_depth != static_cast<std::size_t>(cfg.tcp_send_capacity)) {
            std::cerr << "dropped send should be counted, got " << s.send_dropped << "\n";
            return 1;
        }
        idle.stop();
        const int idle_peer = accept(listen_fd, nullptr, nullptr);
        if (idle_peer >= 0) {
            ::close(idle_peer);
        }
    }

    // Nothing listens on the old port any more.
    ::close(listen_fd);
    durin::TcpLink refused(cfg, ids, worker_cfg);
    if (refused.open("127.0.0.1", port, error) || error.empty()) {
        std::cerr << "connect to a closed port should fail with an error\n";
        return 1;
    }
    refused.stop();
    refused.stop();

    if (durin::guessLocalIpv4("127.0.0.1") != "127.0.0.1") {
        std::cerr << "loopback peer should be reached from 127.0.0.1\n";
        return 1;
    }
    if (durin::guessLocalIpv4("not-an-address") != "127.0.0.1") {
        std::cerr << "unparseable peer should fall back to 127.0.0.1\n";
        return 1;
    }
    return 0;
}
