#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace durin {

using Bytes = std::vector<uint8_t>;

enum class CommandId : uint8_t {
    Noop = 0,
    PowerOff = 1,
    Move = 2,
    MoveWheels = 3,
    PollAll = 16,
    PollSensor = 17,
    StreamOn = 18,
    StreamOff = 19,
};

struct PowerOff {};

// vel_x/vel_y in mm/s, rot in deg/s.
struct Move {
    int16_t vel_x{0};
    int16_t vel_y{0};
    int16_t rot{0};
};

struct MoveWheels {
    int16_t ne{0};
    int16_t nw{0};
    int16_t sw{0};
    int16_t se{0};
};

struct PollAll {};

struct PollSensor {
    uint8_t sensor_id{0};
};

// Asks the robot to push telemetry datagrams to host:port every period_ms.
struct StreamOn {
    std::array<uint8_t, 4> host{};  // dotted order, host[0] is the first octet
    uint16_t port{0};
    uint16_t period_ms{0};
};

struct StreamOff {};

using Command = std::variant<PowerOff, Move, MoveWheels, PollAll, PollSensor, StreamOn, StreamOff>;

CommandId commandId(const Command& command);
Bytes encodeCommand(const Command& command);

// Empty encodings and id 0 mean "do nothing": no network I/O, empty reply.
bool isNoopEncoding(const Bytes& encoded);

bool parseIpv4(const std::string& text, std::array<uint8_t, 4>& out);
std::string formatIpv4(const std::array<uint8_t, 4>& octets);
bool makeStreamOn(const std::string& host, int port, int period_ms, StreamOn& out, std::string& error);

std::string describeCommand(const Command& command);

}  // namespace durin
