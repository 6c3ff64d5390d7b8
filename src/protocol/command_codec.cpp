#include "protocol/command_codec.hpp"

#include <sstream>
#include <type_traits>

#ifdef __linux__
#include <arpa/inet.h>
#endif

namespace durin {

namespace {

template <class>
inline constexpr bool kAlwaysFalse = false;

void putI16Le(Bytes& out, std::size_t offset, int16_t value) {
    const uint16_t bits = static_cast<uint16_t>(value);
    out[offset] = static_cast<uint8_t>(bits & 0xFFU);
    out[offset + 1] = static_cast<uint8_t>((bits >> 8) & 0xFFU);
}

void putU16Le(Bytes& out, std::size_t offset, uint16_t value) {
    out[offset] = static_cast<uint8_t>(value & 0xFFU);
    out[offset + 1] = static_cast<uint8_t>((value >> 8) & 0xFFU);
}

int16_t negate(int16_t v) {
    return static_cast<int16_t>(-static_cast<int32_t>(v));
}

Bytes withId(CommandId id, std::size_t size) {
    Bytes out(size, 0U);
    out[0] = static_cast<uint8_t>(id);
    return out;
}

}  // namespace

CommandId commandId(const Command& command) {
    return std::visit(
        [](const auto& c) -> CommandId {
            using C = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<C, PowerOff>) return CommandId::PowerOff;
            else if constexpr (std::is_same_v<C, Move>) return CommandId::Move;
            else if constexpr (std::is_same_v<C, MoveWheels>) return CommandId::MoveWheels;
            else if constexpr (std::is_same_v<C, PollAll>) return CommandId::PollAll;
            else if constexpr (std::is_same_v<C, PollSensor>) return CommandId::PollSensor;
            else if constexpr (std::is_same_v<C, StreamOn>) return CommandId::StreamOn;
            else if constexpr (std::is_same_v<C, StreamOff>) return CommandId::StreamOff;
            else static_assert(kAlwaysFalse<C>, "unhandled command");
        },
        command);
}

Bytes encodeCommand(const Command& command) {
    return std::visit(
        [](const auto& c) -> Bytes {
            using C = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<C, Move>) {
                Bytes out = withId(CommandId::Move, 7);
                putI16Le(out, 1, c.vel_x);
                putI16Le(out, 3, c.vel_y);
                // Firmware expects clockwise-positive rotation.
                putI16Le(out, 5, negate(c.rot));
                return out;
            } else if constexpr (std::is_same_v<C, MoveWheels>) {
                // Firmware wheel order is se, sw, ne, nw with the east side mirrored.
                Bytes out = withId(CommandId::MoveWheels, 9);
                putI16Le(out, 1, negate(c.se));
                putI16Le(out, 3, c.sw);
                putI16Le(out, 5, negate(c.ne));
                putI16Le(out, 7, c.nw);
                return out;
            } else if constexpr (std::is_same_v<C, PollSensor>) {
                Bytes out = withId(CommandId::PollSensor, 2);
                out[1] = c.sensor_id;
                return out;
            } else if constexpr (std::is_same_v<C, StreamOn>) {
                Bytes out = withId(CommandId::StreamOn, 9);
                for (std::size_t i = 0; i < c.host.size(); ++i) {
                    out[1 + i] = c.host[i];
                }
                putU16Le(out, 5, c.port);
                putU16Le(out, 7, c.period_ms);
                return out;
            } else {
                return withId(commandId(Command{c}), 1);
            }
        },
        command);
}

bool isNoopEncoding(const Bytes& encoded) {
    return encoded.empty() || encoded[0] == static_cast<uint8_t>(CommandId::Noop);
}

bool parseIpv4(const std::string& text, std::array<uint8_t, 4>& out) {
#ifdef __linux__
    in_addr addr{};
    if (inet_pton(AF_INET, text.c_str(), &addr) != 1) {
        return false;
    }
    const auto* bytes = reinterpret_cast<const uint8_t*>(&addr.s_addr);
    for (std::size_t i = 0; i < out.size(); ++i) {
        out[i] = bytes[i];
    }
    return true;
#else
    (void)text;
    (void)out;
    return false;
#endif
}

std::string formatIpv4(const std::array<uint8_t, 4>& octets) {
    std::ostringstream oss;
    oss << static_cast<int>(octets[0]) << '.' << static_cast<int>(octets[1]) << '.'
        << static_cast<int>(octets[2]) << '.' << static_cast<int>(octets[3]);
    return oss.str();
}

bool makeStreamOn(const std::string& host, int port, int period_ms, StreamOn& out, std::string& error) {
    StreamOn cmd{};
    if (!parseIpv4(host, cmd.host)) {
        error = "invalid IPv4 stream host: " + host;
        return false;
    }
    if (port <= 0 || port > 65535) {
        error = "stream port out of range: " + std::to_string(port);
        return false;
    }
    if (period_ms < 0 || period_ms > 65535) {
        error = "stream period out of range: " + std::to_string(period_ms);
        return false;
    }
    cmd.port = static_cast<uint16_t>(port);
    cmd.period_ms = static_cast<uint16_t>(period_ms);
    out = cmd;
    error.clear();
    return true;
}

std::string describeCommand(const Command& command) {
    std::ostringstream oss;
    std::visit(
        [&oss](const auto& c) {
            using C = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<C, PowerOff>) {
                oss << "PowerOff()";
            } else if constexpr (std::is_same_v<C, Move>) {
                oss << "Move(" << c.vel_x << ", " << c.vel_y << ", " << c.rot << ")";
            } else if constexpr (std::is_same_v<C, MoveWheels>) {
                oss << "MoveWheels(" << c.ne << ", " << c.nw << ", " << c.sw << ", " << c.se << ")";
            } else if constexpr (std::is_same_v<C, PollAll>) {
                oss << "PollAll()";
            } else if constexpr (std::is_same_v<C, PollSensor>) {
                oss << "PollSensor(" << static_cast<int>(c.sensor_id) << ")";
            } else if constexpr (std::is_same_v<C, StreamOn>) {
                oss << "StreamOn(" << formatIpv4(c.host) << ", " << c.port << ", " << c.period_ms << ")";
            } else {
                oss << "StreamOff()";
            }
        },
        command);
    return oss.str();
}

}  // namespace durin
