#pragma once

#include "link/tcp_link.hpp"
#include "protocol/command_codec.hpp"

#include <chrono>
#include <optional>
#include <vector>

namespace durin {

using Reply = std::vector<SensorPacket>;

// Encodes commands onto a TcpLink. No-op encodings return an empty reply
// without touching the link; everything else is fire-and-forget and returns
// std::nullopt, whether or not the queue accepted it.
class Actuator {
public:
    Actuator(TcpLink& link, std::chrono::milliseconds default_timeout);

    std::optional<Reply> operator()(const Command& command);
    std::optional<Reply> operator()(const Command& command, std::chrono::milliseconds timeout);

    std::optional<SensorPacket> read() { return link_.read(); }

private:
    TcpLink& link_;
    std::chrono::milliseconds default_timeout_;
};

}  // namespace durin
