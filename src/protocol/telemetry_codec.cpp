#include "protocol/telemetry_codec.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace durin {

namespace {

uint16_t readU16Le(const uint8_t* p) {
    return static_cast<uint16_t>(static_cast<uint16_t>(p[0]) | (static_cast<uint16_t>(p[1]) << 8));
}

float readF32Le(const uint8_t* p) {
    const uint32_t bits = static_cast<uint32_t>(p[0]) |
                          (static_cast<uint32_t>(p[1]) << 8) |
                          (static_cast<uint32_t>(p[2]) << 16) |
                          (static_cast<uint32_t>(p[3]) << 24);
    float v = 0.0F;
    static_assert(sizeof(bits) == sizeof(v), "float/u32 size mismatch");
    std::memcpy(&v, &bits, sizeof(v));
    return v;
}

void writeU16Le(Bytes& out, std::size_t offset, uint16_t v) {
    out[offset] = static_cast<uint8_t>(v & 0xFFU);
    out[offset + 1] = static_cast<uint8_t>((v >> 8) & 0xFFU);
}

void writeF32Le(Bytes& out, std::size_t offset, float v) {
    uint32_t bits = 0U;
    std::memcpy(&bits, &v, sizeof(bits));
    for (std::size_t i = 0; i < 4; ++i) {
        out[offset + i] = static_cast<uint8_t>((bits >> (8U * i)) & 0xFFU);
    }
}

uint16_t clampToU16(double v) {
    if (!(v > 0.0)) {
        return 0U;
    }
    if (v >= 65535.0) {
        return 65535U;
    }
    return static_cast<uint16_t>(std::lround(v));
}

}  // namespace

bool isTofSensor(const SensorIdTable& ids, int sensor_id) {
    return sensor_id >= ids.tof_a && sensor_id <= ids.tof_d;
}

int tofLayerOffset(const SensorIdTable& ids, int sensor_id) {
    if (!isTofSensor(ids, sensor_id)) {
        return -1;
    }
    return (sensor_id - ids.tof_a) * kTofLayersPerPacket;
}

bool decodeTelemetry(
    const uint8_t* data,
    std::size_t size,
    const SensorIdTable& ids,
    SensorPacket& out,
    std::string& error) {
    if (data == nullptr || size == 0U) {
        error = "empty telemetry packet";
        return false;
    }
    const int sensor_id = data[0];

    if (isTofSensor(ids, sensor_id)) {
        if (size < kTofPacketBytes) {
            error = "short tof packet: " + std::to_string(size) + " < " + std::to_string(kTofPacketBytes) + " bytes";
            return false;
        }
        TofPayload tof{};
        for (int i = 0; i < kTofValuesPerPacket; ++i) {
            tof.depth[static_cast<std::size_t>(i)] =
                static_cast<float>(readU16Le(data + 1 + 2 * static_cast<std::size_t>(i)));
        }
        out.kind = SensorKind::Tof;
        out.sensor_id = static_cast<uint8_t>(sensor_id);
        out.payload = tof;
        error.clear();
        return true;
    }

    if (sensor_id == ids.misc) {
        if (size < kMiscPacketBytes) {
            error = "short misc packet: " + std::to_string(size) + " < " + std::to_string(kMiscPacketBytes) + " bytes";
            return false;
        }
        MiscPayload misc{};
        misc.charge = static_cast<float>(data[1]);
        misc.voltage = static_cast<float>(readU16Le(data + 2)) / 1000.0F;
        for (int i = 0; i < kImuCells; ++i) {
            misc.imu[static_cast<std::size_t>(i)] = readF32Le(data + 4 + 4 * static_cast<std::size_t>(i));
        }
        out.kind = SensorKind::Misc;
        out.sensor_id = static_cast<uint8_t>(sensor_id);
        out.payload = misc;
        error.clear();
        return true;
    }

    error = "unknown sensor id " + std::to_string(sensor_id);
    return false;
}

Bytes encodeTelemetry(const SensorPacket& packet) {
    if (const auto* tof = std::get_if<TofPayload>(&packet.payload)) {
        Bytes out(kTofPacketBytes, 0U);
        out[0] = packet.sensor_id;
        for (int i = 0; i < kTofValuesPerPacket; ++i) {
            writeU16Le(out, 1 + 2 * static_cast<std::size_t>(i), clampToU16(tof->depth[static_cast<std::size_t>(i)]));
        }
        return out;
    }
    const auto& misc = std::get<MiscPayload>(packet.payload);
    Bytes out(kMiscPacketBytes, 0U);
    out[0] = packet.sensor_id;
    out[1] = static_cast<uint8_t>(std::min(255.0F, std::max(0.0F, misc.charge)));
    writeU16Le(out, 2, clampToU16(static_cast<double>(misc.voltage) * 1000.0));
    for (int i = 0; i < kImuCells; ++i) {
        writeF32Le(out, 4 + 4 * static_cast<std::size_t>(i), static_cast<float>(misc.imu[static_cast<std::size_t>(i)]));
    }
    return out;
}

}  // namespace durin
