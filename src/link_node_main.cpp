#include "core/config.hpp"
#include "core/time_utils.hpp"
#include "dvs/dvs_client.hpp"
#include "link/actuator.hpp"
#include "link/socket_utils.hpp"
#include "link/tcp_link.hpp"
#include "link/udp_link.hpp"
#include "sensor/sensor_aggregator.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {
std::atomic<bool> g_running{true};

void onSignal(int) {
    g_running.store(false);
}

double meanDepth(const durin::Observation& obs) {
    if (obs.depth.empty()) {
        return 0.0;
    }
    return cv::mean(obs.depth)[0];
}
}

int main(int argc, char** argv) {
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    const std::string config_path = (argc > 1) ? argv[1] : "config/durin.yaml";

    durin::AppConfig config;
    std::string error;
    if (!durin::loadConfig(config_path, config, error)) {
        std::cerr << "Config load failed: " << error << '\n';
        return 1;
    }

    durin::TcpLink tcp(config.link, config.sensor.ids, config.worker);
    if (!tcp.open(config.link.durin_host, config.link.durin_port, error) || !tcp.start(error)) {
        std::cerr << "tcp: " << error << '\n';
        return 1;
    }

    durin::UdpLink udp(config.link, config.sensor.ids, config.worker);
    if (!udp.open(config.link.udp_bind_host, config.link.udp_port, error) || !udp.start(error)) {
        std::cerr << "udp: " << error << '\n';
        tcp.stop();
        return 1;
    }

    durin::SensorAggregator aggregator(udp.queue(), config.sensor, config.worker);
    if (!aggregator.start(error)) {
        std::cerr << "aggregator: " << error << '\n';
        udp.stop();
        tcp.stop();
        return 1;
    }

    durin::Actuator actuate(tcp, std::chrono::milliseconds(config.link.send_timeout_ms));

    const std::string stream_host = config.link.stream_host.empty()
                                        ? durin::guessLocalIpv4(config.link.durin_host)
                                        : config.link.stream_host;
    durin::StreamOn stream_on;
    if (!durin::makeStreamOn(stream_host, udp.boundPort(), config.link.stream_period_ms, stream_on, error)) {
        std::cerr << "stream: " << error << '\n';
    } else {
        std::cerr << "link: requesting telemetry to " << stream_host << ":" << udp.boundPort() << " every "
                  << config.link.stream_period_ms << " ms\n";
        (void)actuate(stream_on);
    }

    // Event camera frames go to the port right after the telemetry port.
    std::unique_ptr<durin::dvs::DvsClient> dvs;
    if (!config.dvs.server_host.empty()) {
        dvs = std::make_unique<durin::dvs::DvsClient>(
            config.dvs.server_host, config.dvs.server_port, config.link.connect_timeout_ms);
        const uint16_t dvs_port = static_cast<uint16_t>(udp.boundPort() + 1U);
        if (!dvs->sendStart(stream_host, dvs_port, error)) {
            std::cerr << "dvs: " << error << '\n';
        }
    }

    int64_t last_log_ns = durin::nowSteadyNs();
    while (g_running.load()) {
        while (const auto reply = actuate.read()) {
            std::cerr << "tcp: reply from sensor " << static_cast<int>(reply->sensor_id) << "\n";
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));

        const int64_t now_ns = durin::nowSteadyNs();
        if (now_ns - last_log_ns >= 1000000000LL) {
            const durin::Observation obs = aggregator.read();
            const durin::TcpLinkStats ts = tcp.stats();
            const durin::UdpLinkStats us = udp.stats();
            std::cerr << std::fixed << std::setprecision(2) << "[link] hz=" << obs.update_frequency
                      << " updates=" << obs.updates << " charge=" << obs.charge << " voltage=" << obs.voltage
                      << " depth_mean=" << meanDepth(obs) << " udp_rx=" << us.received << " udp_bad=" << us.malformed
                      << " udp_drop=" << us.dropped << " tcp_tx=" << ts.sent << " tcp_drop=" << ts.send_dropped << " tcp_blocked=" << ts.send_blocked
                      << " tcp_rx=" << ts.received << "\n";
            last_log_ns = now_ns;
        }
    }

    std::cerr << "link: shutting down\n";
    if (dvs) {
        dvs->stopStream();
    }
    (void)actuate(durin::StreamOff{});
    // Give the sender a moment to flush StreamOff before the socket goes away.
    std::this_thread::sleep_for(std::chrono::milliseconds(config.link.send_timeout_ms));
    aggregator.stop();
    udp.stop();
    tcp.stop();
    return 0;
}
