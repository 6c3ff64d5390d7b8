#pragma once

#include "protocol/command_codec.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace durin::dvs {

// Start: 0x00, IPv4 as a little-endian u32, port as little-endian u16.
// Any other first byte is Stop. Trailing bytes are ignored.
constexpr uint8_t kStartTag = 0x00;
constexpr uint8_t kStopTag = 0x01;
constexpr std::size_t kStartMessageBytes = 7;

enum class ControlType {
    Start,
    Stop,
};

struct ControlMessage {
    ControlType type{ControlType::Stop};
    std::array<uint8_t, 4> host{};  // dotted order
    uint16_t port{0};
};

// Returns false for empty input (nothing to do) and for truncated Start
// messages (error is set only in the latter case).
bool parseControlMessage(const uint8_t* data, std::size_t size, ControlMessage& out, std::string& error);

Bytes encodeStart(const std::array<uint8_t, 4>& host, uint16_t port);
bool encodeStart(const std::string& host, int port, Bytes& out, std::string& error);
Bytes encodeStop();

}  // namespace durin::dvs
