#include "protocol/command_codec.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace {

std::string hex(const durin::Bytes& b) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < b.size(); ++i) {
        if (i > 0) {
            oss << ' ';
        }
        oss << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b[i]);
    }
    return oss.str();
}

bool expectBytes(const char* what, const durin::Bytes& got, const durin::Bytes& want) {
    if (got != want) {
        std::cerr << what << ": got [" << hex(got) << "] want [" << hex(want) << "]\n";
        return false;
    }
    return true;
}

}  // namespace

int main() {
    using durin::Bytes;

    if (!expectBytes("Move", durin::encodeCommand(durin::Move{300, -150, 90}),
                     Bytes{0x02, 0x2C, 0x01, 0x6A, 0xFF, 0xA6, 0xFF})) {
        return 1;
    }
    // se, sw, ne, nw with the east wheels negated.
    if (!expectBytes("MoveWheels", durin::encodeCommand(durin::MoveWheels{1, 2, 3, 4}),
                     Bytes{0x03, 0xFC, 0xFF, 0x03, 0x00, 0xFF, 0xFF, 0x02, 0x00})) {
        return 1;
    }
    if (!expectBytes("PollSensor", durin::encodeCommand(durin::PollSensor{5}), Bytes{0x11, 0x05})) {
        return 1;
    }
    if (!expectBytes("PowerOff", durin::encodeCommand(durin::PowerOff{}), Bytes{0x01}) ||
        !expectBytes("PollAll", durin::encodeCommand(durin::PollAll{}), Bytes{0x10}) ||
        !expectBytes("StreamOff", durin::encodeCommand(durin::StreamOff{}), Bytes{0x13})) {
        return 1;
    }

    durin::StreamOn on;
    std::string error;
    if (!durin::makeStreamOn("192.168.1.10", 4300, 50, on, error)) {
        std::cerr << "makeStreamOn failed: " << error << "\n";
        return 1;
    }
    if (!expectBytes("StreamOn", durin::encodeCommand(on),
                     Bytes{0x12, 0xC0, 0xA8, 0x01, 0x0A, 0xCC, 0x10, 0x32, 0x00})) {
        return 1;
    }
    if (durin::formatIpv4(on.host) != "192.168.1.10") {
        std::cerr << "formatIpv4 mismatch: " << durin::formatIpv4(on.host) << "\n";
        return 1;
    }

    if (durin::makeStreamOn("192.168.1", 4300, 50, on, error) || error.empty()) {
        std::cerr << "short IPv4 should be rejected\n";
        return 1;
    }
    if (durin::makeStreamOn("10.0.0.1", 70000, 50, on, error)) {
        std::cerr << "port > 65535 should be rejected\n";
        return 1;
    }

    // Rotation sign flip must not overflow on the extreme value.
    const Bytes extreme = durin::encodeCommand(durin::Move{0, 0, -32767});
    if (extreme[5] != 0xFF || extreme[6] != 0x7F) {
        std::cerr << "rot=-32767 should encode as 32767\n";
        return 1;
    }

    if (!durin::isNoopEncoding(Bytes{}) || !durin::isNoopEncoding(Bytes{0x00, 0x01})) {
        std::cerr << "empty and id-0 encodings are no-ops\n";
        return 1;
    }
    if (durin::isNoopEncoding(durin::encodeCommand(durin::PowerOff{}))) {
        std::cerr << "PowerOff must be transmitted\n";
        return 1;
    }

    if (durin::commandId(durin::Command{durin::StreamOff{}}) != durin::CommandId::StreamOff) {
        std::cerr << "commandId mismatch\n";
        return 1;
    }
    if (durin::describeCommand(durin::Command{durin::Move{1, 2, 3}}).empty()) {
        std::cerr << "describeCommand returned empty text\n";
        return 1;
    }
    return 0;
}
