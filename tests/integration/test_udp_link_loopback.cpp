#include "link/udp_link.hpp"
#include "sensor/sensor_aggregator.hpp"

#include <arpa/inet.h>
#include <chrono>
#include <iostream>
#include <netinet/in.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

namespace {

bool sendTo(int fd, uint16_t port, const durin::Bytes& bytes) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    return sendto(fd, bytes.data(), bytes.size(), 0, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) ==
           static_cast<ssize_t>(bytes.size());
}

}  // namespace

int main() {
    durin::LinkConfig cfg;
    durin::SensorConfig sensor_cfg;
    durin::WorkerConfig worker_cfg;
    std::string error;

    durin::UdpLink link(cfg, sensor_cfg.ids, worker_cfg);
    if (!link.open("127.0.0.1", 0, error) || !link.start(error)) {
        std::cerr << "udp link open/start failed: " << error << "\n";
        return 1;
    }
    const uint16_t port = link.boundPort();
    if (port == 0U) {
        std::cerr << "bound port should be reported\n";
        return 1;
    }

    durin::SensorAggregator agg(link.queue(), sensor_cfg, worker_cfg);
    if (!agg.start(error)) {
        std::cerr << "aggregator start failed: " << error << "\n";
        return 1;
    }

    const int tx = socket(AF_INET, SOCK_DGRAM, 0);
    if (tx < 0) {
        std::cerr << "sender socket failed\n";
        return 1;
    }

    durin::SensorPacket tof;
    tof.kind = durin::SensorKind::Tof;
    tof.sensor_id = static_cast<uint8_t>(sensor_cfg.ids.tof_d);
    durin::TofPayload depth{};
    depth.depth[0] = 777.0F;
    tof.payload = depth;

    durin::SensorPacket misc;
    misc.kind = durin::SensorKind::Misc;
    misc.sensor_id = static_cast<uint8_t>(sensor_cfg.ids.misc);
    durin::MiscPayload m{};
    m.charge = 42.0F;
    m.voltage = 7.4F;
    misc.payload = m;

    const durin::Bytes malformed{static_cast<uint8_t>(sensor_cfg.ids.tof_a), 0x01, 0x02};
    if (!sendTo(tx, port, durin::encodeTelemetry(tof)) || !sendTo(tx, port, malformed) ||
        !sendTo(tx, port, durin::encodeTelemetry(misc))) {
        std::cerr << "sendto failed\n";
        ::close(tx);
        return 1;
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    durin::Observation obs = agg.read();
    while ((obs.updates < 2U || link.stats().malformed < 1U) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        obs = agg.read();
    }
    ::close(tx);

    const int idx[3] = {6, 0, 0};
    if (obs.updates != 2U || obs.depth.at<float>(idx) != 777.0F || obs.charge != 42.0F) {
        std::cerr << "telemetry did not reach the sensor state (updates=" << obs.updates << ")\n";
        return 1;
    }
    const durin::UdpLinkStats stats = link.stats();
    if (stats.received != 3U || stats.malformed != 1U) {
        std::cerr << "expected 3 received / 1 malformed, got " << stats.received << " / " << stats.malformed << "\n";
        return 1;
    }

    agg.stop();
    link.stop();
    link.stop();
    if (link.isOpen() || !link.queue()->closed()) {
        std::cerr << "stop should release the socket and close the queue\n";
        return 1;
    }
    if (link.start(error)) {
        std::cerr << "stopped link should not restart\n";
        return 1;
    }
    return 0;
}
