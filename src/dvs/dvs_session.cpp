#include "dvs/dvs_session.hpp"

#include <iostream>
#include <utility>

namespace durin::dvs {

DvsSession::DvsSession(std::shared_ptr<Streamer> streamer)
    : streamer_(std::move(streamer)) {}

void DvsSession::handle(uint64_t connection_id, const ControlMessage& msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connection_id != owner_) {
        return;
    }
    if (msg.type == ControlType::Stop) {
        if (state_ == SessionState::Streaming) {
            std::cerr << "dvs: terminating stream to " << host_ << ":" << port_ << "\n";
            stopLocked();
        }
        return;
    }
    if (state_ == SessionState::Streaming) {
        stopLocked();
    }
    host_ = formatIpv4(msg.host);
    port_ = msg.port;
    std::cerr << "dvs: streaming to " << host_ << ":" << port_ << "\n";
    streamer_->startStream(host_, port_);
    state_ = SessionState::Streaming;
}

void DvsSession::onDisconnect(uint64_t connection_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connection_id != owner_) {
        return;
    }
    if (state_ == SessionState::Streaming) {
        std::cerr << "dvs: client " << connection_id << " disconnected, stopping stream\n";
        stopLocked();
    }
}

void DvsSession::preempt(uint64_t new_connection_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::Streaming) {
        stopLocked();
    }
    owner_ = new_connection_id;
}

void DvsSession::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::Streaming) {
        stopLocked();
    }
    owner_ = 0;
}

SessionSnapshot DvsSession::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SessionSnapshot out;
    out.state = state_;
    out.host = host_;
    out.port = port_;
    out.owner = owner_;
    return out;
}

void DvsSession::stopLocked() {
    streamer_->stopStream();
    state_ = SessionState::Idle;
    host_.clear();
    port_ = 0;
}

}  // namespace durin::dvs
