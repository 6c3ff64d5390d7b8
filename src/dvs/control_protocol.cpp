#include "dvs/control_protocol.hpp"

namespace durin::dvs {

bool parseControlMessage(const uint8_t* data, std::size_t size, ControlMessage& out, std::string& error) {
    error.clear();
    if (data == nullptr || size == 0U) {
        return false;
    }
    if (data[0] != kStartTag) {
        out = ControlMessage{};
        out.type = ControlType::Stop;
        return true;
    }
    if (size < kStartMessageBytes) {
        error = "truncated start message: " + std::to_string(size) + " bytes";
        return false;
    }
    ControlMessage msg{};
    msg.type = ControlType::Start;
    // u32 little-endian: the last octet of the dotted address comes first.
    msg.host[0] = data[4];
    msg.host[1] = data[3];
    msg.host[2] = data[2];
    msg.host[3] = data[1];
    msg.port = static_cast<uint16_t>(static_cast<uint16_t>(data[5]) | (static_cast<uint16_t>(data[6]) << 8));
    out = msg;
    return true;
}

Bytes encodeStart(const std::array<uint8_t, 4>& host, uint16_t port) {
    Bytes out(kStartMessageBytes, 0U);
    out[0] = kStartTag;
    out[1] = host[3];
    out[2] = host[2];
    out[3] = host[1];
    out[4] = host[0];
    out[5] = static_cast<uint8_t>(port & 0xFFU);
    out[6] = static_cast<uint8_t>((port >> 8) & 0xFFU);
    return out;
}

bool encodeStart(const std::string& host, int port, Bytes& out, std::string& error) {
    std::array<uint8_t, 4> octets{};
    if (!parseIpv4(host, octets)) {
        error = "invalid IPv4 stream host: " + host;
        return false;
    }
    if (port <= 0 || port > 65535) {
        error = "stream port out of range: " + std::to_string(port);
        return false;
    }
    out = encodeStart(octets, static_cast<uint16_t>(port));
    error.clear();
    return true;
}

Bytes encodeStop() {
    return Bytes{kStopTag};
}

}  // namespace durin::dvs
