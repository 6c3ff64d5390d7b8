#pragma once

#include <string>

namespace durin {

struct LinkConfig {
    std::string durin_host{"10.0.0.2"};
    int durin_port{2300};
    std::string udp_bind_host{"0.0.0.0"};
    int udp_port{4300};
    int udp_packet_size{512};
    int tcp_receive_chunk{512};
    int tcp_send_buffer_bytes{0};  // SO_SNDBUF, 0 keeps the kernel default
    int tcp_send_capacity{2};
    int tcp_receive_capacity{100};
    int udp_queue_capacity{100};
    int connect_timeout_ms{1000};
    int send_timeout_ms{50};
    int stream_period_ms{50};
    std::string stream_host{};  // empty: guess the local address facing durin_host
};

// Ids carried in byte 0 of every telemetry datagram. tof_a..tof_d must be consecutive.
struct SensorIdTable {
    int tof_a{128};
    int tof_b{129};
    int tof_c{130};
    int tof_d{131};
    int misc{132};
};

struct SensorConfig {
    SensorIdTable ids;
    int frequency_window{50};
    double frequency_epsilon{1e-7};
};

struct DvsConfig {
    int listen_port{2301};
    int client_join_timeout_ms{500};
    int recv_poll_ms{50};
    std::string streamer_binary{"aestream"};
    std::string camera_input{"inivation"};
    int streamer_stop_grace_ms{1000};
    // Remote DVS server driven by the link node; empty host disables it.
    std::string server_host{};
    int server_port{2301};
};

struct WorkerConfig {
    int idle_sleep_us{1000};
    int stop_timeout_ms{1000};
};

struct AppConfig {
    LinkConfig link;
    SensorConfig sensor;
    DvsConfig dvs;
    WorkerConfig worker;
};

bool loadConfig(const std::string& path, AppConfig& out, std::string& error);
bool validateConfig(const AppConfig& cfg, std::string& error);

}  // namespace durin
