#include "protocol/telemetry_codec.hpp"

#include <cmath>
#include <iostream>
#include <variant>

int main() {
    const durin::SensorIdTable ids;
    std::string error;

    durin::Bytes tof(durin::kTofPacketBytes, 0U);
    tof[0] = static_cast<uint8_t>(ids.tof_c);
    tof[1] = 0xE8;  // 1000 mm
    tof[2] = 0x03;
    tof[255] = 0x34;  // last value, 0x1234 mm
    tof[256] = 0x12;

    durin::SensorPacket packet;
    if (!durin::decodeTelemetry(tof, ids, packet, error)) {
        std::cerr << "tof decode failed: " << error << "\n";
        return 1;
    }
    const auto* depth = std::get_if<durin::TofPayload>(&packet.payload);
    if (packet.kind != durin::SensorKind::Tof || depth == nullptr) {
        std::cerr << "tof packet decoded as wrong kind\n";
        return 1;
    }
    if (depth->depth[0] != 1000.0F || depth->depth[127] != 4660.0F || depth->depth[1] != 0.0F) {
        std::cerr << "tof values mismatch\n";
        return 1;
    }
    if (durin::tofLayerOffset(ids, ids.tof_c) != 4 || durin::tofLayerOffset(ids, ids.misc) != -1) {
        std::cerr << "tofLayerOffset mismatch\n";
        return 1;
    }

    // Trailing bytes are ignored.
    tof.push_back(0xAA);
    if (!durin::decodeTelemetry(tof, ids, packet, error)) {
        std::cerr << "oversized tof packet should decode: " << error << "\n";
        return 1;
    }

    durin::Bytes short_tof(durin::kTofPacketBytes - 1U, 0U);
    short_tof[0] = static_cast<uint8_t>(ids.tof_a);
    if (durin::decodeTelemetry(short_tof, ids, packet, error) || error.empty()) {
        std::cerr << "short tof packet should be malformed\n";
        return 1;
    }

    durin::SensorPacket misc_in;
    misc_in.kind = durin::SensorKind::Misc;
    misc_in.sensor_id = static_cast<uint8_t>(ids.misc);
    durin::MiscPayload misc{};
    misc.charge = 87.0F;
    misc.voltage = 11.1F;
    for (int i = 0; i < durin::kImuCells; ++i) {
        misc.imu[static_cast<std::size_t>(i)] = 0.5 * i - 1.0;
    }
    misc_in.payload = misc;
    const durin::Bytes misc_bytes = durin::encodeTelemetry(misc_in);
    if (misc_bytes.size() != durin::kMiscPacketBytes || misc_bytes[2] != 0x5C || misc_bytes[3] != 0x2B) {
        std::cerr << "misc encoding should carry 11100 mV little-endian\n";
        return 1;
    }
    if (!durin::decodeTelemetry(misc_bytes, ids, packet, error)) {
        std::cerr << "misc decode failed: " << error << "\n";
        return 1;
    }
    const auto* out = std::get_if<durin::MiscPayload>(&packet.payload);
    if (out == nullptr || out->charge != 87.0F || std::fabs(out->voltage - 11.1F) > 1e-3F) {
        std::cerr << "misc scalar mismatch\n";
        return 1;
    }
    if (out->imu[0] != -1.0 || out->imu[8] != 3.0) {
        std::cerr << "misc imu mismatch\n";
        return 1;
    }

    const durin::Bytes unknown{7, 1, 2, 3};
    if (durin::decodeTelemetry(unknown, ids, packet, error)) {
        std::cerr << "unknown sensor id should be rejected\n";
        return 1;
    }
    if (durin::decodeTelemetry(durin::Bytes{}, ids, packet, error)) {
        std::cerr << "empty packet should be rejected\n";
        return 1;
    }
    return 0;
}
