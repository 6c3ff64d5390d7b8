#pragma once

#include "core/config.hpp"
#include "core/types.hpp"
#include "protocol/command_codec.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

namespace durin {

enum class SensorKind : uint8_t {
    Tof = 0,
    Misc = 1,
};

struct SensorPacket {
    SensorKind kind{SensorKind::Misc};
    uint8_t sensor_id{0};
    std::variant<TofPayload, MiscPayload> payload{};
};

// Datagram layout, byte 0 is the sensor id:
//   tof:  128 x uint16 LE depth (mm), two 8x8 layers row-major
//   misc: uint8 charge (%), uint16 LE voltage (mV), 9 x float32 LE imu row-major
// Trailing bytes are ignored.
constexpr std::size_t kTofPacketBytes = 1U + 2U * kTofValuesPerPacket;
constexpr std::size_t kMiscPacketBytes = 1U + 1U + 2U + 4U * kImuCells;

bool isTofSensor(const SensorIdTable& ids, int sensor_id);

// First depth layer written by a tof packet, (id - tof_a) * 2; -1 for non-tof ids.
int tofLayerOffset(const SensorIdTable& ids, int sensor_id);

bool decodeTelemetry(
    const uint8_t* data,
    std::size_t size,
    const SensorIdTable& ids,
    SensorPacket& out,
    std::string& error);

inline bool decodeTelemetry(const Bytes& data, const SensorIdTable& ids, SensorPacket& out, std::string& error) {
    return decodeTelemetry(data.data(), data.size(), ids, out, error);
}

// Firmware-side layout, used by the loopback tests and replay tools.
Bytes encodeTelemetry(const SensorPacket& packet);

}  // namespace durin
