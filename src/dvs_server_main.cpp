#include "core/config.hpp"
#include "dvs/dvs_server.hpp"
#include "dvs/process_streamer.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {
std::atomic<bool> g_running{true};

void onSignal(int) {
    g_running.store(false);
}

const char* stateName(durin::dvs::SessionState s) {
    return s == durin::dvs::SessionState::Streaming ? "streaming" : "idle";
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

    auto streamer = std::make_shared<durin::dvs::ProcessStreamer>(config.dvs);
    durin::dvs::DvsServer server(config.dvs, streamer);
    if (!server.start("0.0.0.0", config.dvs.listen_port, error)) {
        std::cerr << "dvs: start failed: " << error << '\n';
        return 1;
    }

    durin::dvs::SessionState last = durin::dvs::SessionState::Idle;
    while (g_running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        const durin::dvs::SessionSnapshot snap = server.session();
        if (snap.state != last) {
            std::cerr << "[dvs] state=" << stateName(snap.state) << " owner=" << snap.owner
                      << " connections=" << server.connectionsAccepted() << "\n";
            last = snap.state;
        }
    }

    std::cerr << "dvs: shutting down\n";
    server.stop();
    streamer->stopStream();
    return 0;
}
