#pragma once

#include "dvs/control_protocol.hpp"
#include "dvs/streamer.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace durin::dvs {

enum class SessionState {
    Idle,
    Streaming,
};

struct SessionSnapshot {
    SessionState state{SessionState::Idle};
    std::string host{};
    uint16_t port{0};
    uint64_t owner{0};
};

// Idle/Streaming state machine shared by all connections of one server.
// Only the connection that currently owns the session may drive it; input
// from a preempted connection is ignored.
class DvsSession {
public:
    explicit DvsSession(std::shared_ptr<Streamer> streamer);

    void handle(uint64_t connection_id, const ControlMessage& msg);
    void onDisconnect(uint64_t connection_id);

    // A new connection takes over: any active stream is stopped first.
    void preempt(uint64_t new_connection_id);
    void shutdown();

    SessionSnapshot snapshot() const;

private:
    void stopLocked();

    std::shared_ptr<Streamer> streamer_;
    mutable std::mutex mutex_;
    SessionState state_{SessionState::Idle};
    std::string host_{};
    uint16_t port_{0};
    uint64_t owner_{0};
};

}  // namespace durin::dvs
