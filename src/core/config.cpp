#include "core/config.hpp"

#include <fstream>

#include <opencv2/core.hpp>

namespace durin {

namespace {

template <typename T>
void readOrDefault(const cv::FileNode& node, const char* key, T& out) {
    const cv::FileNode child = node[key];
    if (!child.empty()) {
        child >> out;
    }
}

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) {
        return {};
    }
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string unquote(std::string v) {
    v = trim(v);
    if (v.size() >= 2) {
        if ((v.front() == '"' && v.back() == '"') || (v.front() == '\'' && v.back() == '\'')) {
            v = v.substr(1, v.size() - 2);
        }
    }
    return v;
}

bool validPort(int port) {
    return port > 0 && port <= 65535;
}

bool loadConfigPlainYaml(const std::string& path, AppConfig& out, std::string& error) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        error = "failed to open config file: " + path;
        return false;
    }

    std::string section;
    std::string line;
    while (std::getline(ifs, line)) {
        std::string t = trim(line);
        if (t.empty() || t[0] == '#') {
            continue;
        }

        // section header, e.g. "link:"
        if (t.back() == ':' && t.find(' ') == std::string::npos) {
            section = t.substr(0, t.size() - 1);
            continue;
        }

        const auto colon = t.find(':');
        if (colon == std::string::npos || section.empty()) {
            continue;
        }

        const std::string key = trim(t.substr(0, colon));
        std::string value = trim(t.substr(colon + 1));
        const auto hash = value.find(" #");
        if (hash != std::string::npos) {
            value = trim(value.substr(0, hash));
        }
        value = unquote(value);

        try {
            if (section == "link") {
                if (key == "durin_host") out.link.durin_host = value;
                else if (key == "durin_port") out.link.durin_port = std::stoi(value);
                else if (key == "udp_bind_host") out.link.udp_bind_host = value;
                else if (key == "udp_port") out.link.udp_port = std::stoi(value);
                else if (key == "udp_packet_size") out.link.udp_packet_size = std::stoi(value);
                else if (key == "tcp_receive_chunk") out.link.tcp_receive_chunk = std::stoi(value);
                else if (key == "tcp_send_buffer_bytes") out.link.tcp_send_buffer_bytes = std::stoi(value);
                else if (key == "tcp_send_capacity") out.link.tcp_send_capacity = std::stoi(value);
                else if (key == "tcp_receive_capacity") out.link.tcp_receive_capacity = std::stoi(value);
                else if (key == "udp_queue_capacity") out.link.udp_queue_capacity = std::stoi(value);
                else if (key == "connect_timeout_ms") out.link.connect_timeout_ms = std::stoi(value);
                else if (key == "send_timeout_ms") out.link.send_timeout_ms = std::stoi(value);
                else if (key == "stream_period_ms") out.link.stream_period_ms = std::stoi(value);
                else if (key == "stream_host") out.link.stream_host = value;
            } else if (section == "sensor") {
                if (key == "tof_a") out.sensor.ids.tof_a = std::stoi(value);
                else if (key == "tof_b") out.sensor.ids.tof_b = std::stoi(value);
                else if (key == "tof_c") out.sensor.ids.tof_c = std::stoi(value);
                else if (key == "tof_d") out.sensor.ids.tof_d = std::stoi(value);
                else if (key == "misc") out.sensor.ids.misc = std::stoi(value);
                else if (key == "frequency_window") out.sensor.frequency_window = std::stoi(value);
                else if (key == "frequency_epsilon") out.sensor.frequency_epsilon = std::stod(value);
            } else if (section == "dvs") {
                if (key == "listen_port") out.dvs.listen_port = std::stoi(value);
                else if (key == "client_join_timeout_ms") out.dvs.client_join_timeout_ms = std::stoi(value);
                else if (key == "recv_poll_ms") out.dvs.recv_poll_ms = std::stoi(value);
                else if (key == "streamer_binary") out.dvs.streamer_binary = value;
                else if (key == "camera_input") out.dvs.camera_input = value;
                else if (key == "streamer_stop_grace_ms") out.dvs.streamer_stop_grace_ms = std::stoi(value);
                else if (key == "server_host") out.dvs.server_host = value;
                else if (key == "server_port") out.dvs.server_port = std::stoi(value);
            } else if (section == "worker") {
                if (key == "idle_sleep_us") out.worker.idle_sleep_us = std::stoi(value);
                else if (key == "stop_timeout_ms") out.worker.stop_timeout_ms = std::stoi(value);
            }
        } catch (const std::exception&) {
            // keep defaults/previous values on parse failure
        }
    }

    return validateConfig(out, error);
}

}  // namespace

bool validateConfig(const AppConfig& cfg, std::string& error) {
    if (cfg.link.durin_host.empty()) {
        error = "link.durin_host must not be empty";
        return false;
    }
    if (!validPort(cfg.link.durin_port) || !validPort(cfg.link.udp_port)) {
        error = "link ports must be in [1, 65535]";
        return false;
    }
    if (cfg.link.udp_packet_size <= 0 || cfg.link.tcp_receive_chunk <= 0) {
        error = "link packet/chunk sizes must be > 0";
        return false;
    }
    if (cfg.link.tcp_send_buffer_bytes < 0) {
        error = "link.tcp_send_buffer_bytes must be >= 0";
        return false;
    }
    if (cfg.link.tcp_send_capacity <= 0 || cfg.link.tcp_receive_capacity <= 0 || cfg.link.udp_queue_capacity <= 0) {
        error = "link queue capacities must be > 0";
        return false;
    }
    if (cfg.link.connect_timeout_ms <= 0 || cfg.link.send_timeout_ms < 0) {
        error = "link.connect_timeout_ms must be > 0 and link.send_timeout_ms >= 0";
        return false;
    }
    if (cfg.link.stream_period_ms <= 0 || cfg.link.stream_period_ms > 65535) {
        error = "link.stream_period_ms must be in [1, 65535]";
        return false;
    }
    const auto& ids = cfg.sensor.ids;
    auto inByteRange = [](int id) { return id >= 1 && id <= 255; };
    if (!inByteRange(ids.tof_a) || !inByteRange(ids.tof_d) || !inByteRange(ids.misc)) {
        error = "sensor ids must be in [1, 255]";
        return false;
    }
    if (ids.tof_b != ids.tof_a + 1 || ids.tof_c != ids.tof_a + 2 || ids.tof_d != ids.tof_a + 3) {
        error = "sensor.tof_a..tof_d must be consecutive";
        return false;
    }
    if (ids.misc >= ids.tof_a && ids.misc <= ids.tof_d) {
        error = "sensor.misc must not overlap the tof id range";
        return false;
    }
    if (cfg.sensor.frequency_window <= 0) {
        error = "sensor.frequency_window must be > 0";
        return false;
    }
    if (!(cfg.sensor.frequency_epsilon > 0.0)) {
        error = "sensor.frequency_epsilon must be > 0";
        return false;
    }
    if (cfg.dvs.listen_port < 0 || cfg.dvs.listen_port > 65535) {
        error = "dvs.listen_port must be in [0, 65535]";
        return false;
    }
    if (!cfg.dvs.server_host.empty() && !validPort(cfg.dvs.server_port)) {
        error = "dvs.server_port must be in [1, 65535]";
        return false;
    }
    if (cfg.dvs.client_join_timeout_ms <= 0 || cfg.dvs.recv_poll_ms <= 0 || cfg.dvs.streamer_stop_grace_ms <= 0) {
        error = "dvs timeouts must be > 0";
        return false;
    }
    if (cfg.dvs.streamer_binary.empty()) {
        error = "dvs.streamer_binary must not be empty";
        return false;
    }
    if (cfg.worker.idle_sleep_us <= 0 || cfg.worker.stop_timeout_ms <= 0) {
        error = "worker idle/stop timings must be > 0";
        return false;
    }
    error.clear();
    return true;
}

bool loadConfig(const std::string& path, AppConfig& out, std::string& error) {
    try {
        const cv::FileStorage fs(path, cv::FileStorage::READ);
        if (fs.isOpened()) {
            const cv::FileNode link = fs["link"];
            const cv::FileNode sensor = fs["sensor"];
            const cv::FileNode dvs = fs["dvs"];
            const cv::FileNode worker = fs["worker"];

            readOrDefault(link, "durin_host", out.link.durin_host);
            readOrDefault(link, "durin_port", out.link.durin_port);
            readOrDefault(link, "udp_bind_host", out.link.udp_bind_host);
            readOrDefault(link, "udp_port", out.link.udp_port);
            readOrDefault(link, "udp_packet_size", out.link.udp_packet_size);
            readOrDefault(link, "tcp_receive_chunk", out.link.tcp_receive_chunk);
            readOrDefault(link, "tcp_send_buffer_bytes", out.link.tcp_send_buffer_bytes);
            readOrDefault(link, "tcp_send_capacity", out.link.tcp_send_capacity);
            readOrDefault(link, "tcp_receive_capacity", out.link.tcp_receive_capacity);
            readOrDefault(link, "udp_queue_capacity", out.link.udp_queue_capacity);
            readOrDefault(link, "connect_timeout_ms", out.link.connect_timeout_ms);
            readOrDefault(link, "send_timeout_ms", out.link.send_timeout_ms);
            readOrDefault(link, "stream_period_ms", out.link.stream_period_ms);
            readOrDefault(link, "stream_host", out.link.stream_host);

            readOrDefault(sensor, "tof_a", out.sensor.ids.tof_a);
            readOrDefault(sensor, "tof_b", out.sensor.ids.tof_b);
            readOrDefault(sensor, "tof_c", out.sensor.ids.tof_c);
            readOrDefault(sensor, "tof_d", out.sensor.ids.tof_d);
            readOrDefault(sensor, "misc", out.sensor.ids.misc);
            readOrDefault(sensor, "frequency_window", out.sensor.frequency_window);
            readOrDefault(sensor, "frequency_epsilon", out.sensor.frequency_epsilon);

            readOrDefault(dvs, "listen_port", out.dvs.listen_port);
            readOrDefault(dvs, "client_join_timeout_ms", out.dvs.client_join_timeout_ms);
            readOrDefault(dvs, "recv_poll_ms", out.dvs.recv_poll_ms);
            readOrDefault(dvs, "streamer_binary", out.dvs.streamer_binary);
            readOrDefault(dvs, "camera_input", out.dvs.camera_input);
            readOrDefault(dvs, "streamer_stop_grace_ms", out.dvs.streamer_stop_grace_ms);
            readOrDefault(dvs, "server_host", out.dvs.server_host);
            readOrDefault(dvs, "server_port", out.dvs.server_port);

            readOrDefault(worker, "idle_sleep_us", out.worker.idle_sleep_us);
            readOrDefault(worker, "stop_timeout_ms", out.worker.stop_timeout_ms);

            return validateConfig(out, error);
        }
    } catch (const cv::Exception&) {
        // fall through to plain YAML parser below
    }

    return loadConfigPlainYaml(path, out, error);
}

}  // namespace durin
