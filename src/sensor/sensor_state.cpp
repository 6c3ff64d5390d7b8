#include "sensor/sensor_state.hpp"

#include <cstring>

namespace durin {

namespace {

uint32_t packFloatBits(float v) {
    uint32_t bits = 0U;
    static_assert(sizeof(bits) == sizeof(v), "float/u32 size mismatch");
    std::memcpy(&bits, &v, sizeof(bits));
    return bits;
}

float unpackFloatBits(uint32_t bits) {
    float v = 0.0F;
    std::memcpy(&v, &bits, sizeof(v));
    return v;
}

uint64_t packDoubleBits(double v) {
    uint64_t bits = 0U;
    static_assert(sizeof(bits) == sizeof(v), "double/u64 size mismatch");
    std::memcpy(&bits, &v, sizeof(bits));
    return bits;
}

double unpackDoubleBits(uint64_t bits) {
    double v = 0.0;
    std::memcpy(&v, &bits, sizeof(v));
    return v;
}

}  // namespace

SensorState::SensorState() {
    reset();
}

void SensorState::reset() {
    const uint32_t zero_f = packFloatBits(0.0F);
    const uint64_t zero_d = packDoubleBits(0.0);
    for (auto& cell : block_.depth_bits) {
        cell.store(zero_f, std::memory_order_release);
    }
    for (auto& cell : block_.imu_bits) {
        cell.store(zero_d, std::memory_order_release);
    }
    block_.charge_bits.store(zero_f, std::memory_order_release);
    block_.voltage_bits.store(zero_f, std::memory_order_release);
    block_.frequency_bits.store(zero_d, std::memory_order_release);
    block_.last_update_ns.store(0, std::memory_order_release);
    block_.updates.store(0U, std::memory_order_release);
    block_.malformed.store(0U, std::memory_order_release);
}

bool SensorState::publishTof(int layer_offset, const TofPayload& tof) {
    if (layer_offset < 0 || layer_offset + kTofLayersPerPacket > kDepthLayers) {
        countMalformed();
        return false;
    }
    const int base = layer_offset * kDepthLayerCells;
    for (int i = 0; i < kTofValuesPerPacket; ++i) {
        block_.depth_bits[base + i].store(
            packFloatBits(tof.depth[static_cast<std::size_t>(i)]), std::memory_order_release);
    }
    return true;
}

void SensorState::publishMisc(const MiscPayload& misc) {
    block_.charge_bits.store(packFloatBits(misc.charge), std::memory_order_release);
    block_.voltage_bits.store(packFloatBits(misc.voltage), std::memory_order_release);
    for (int i = 0; i < kImuCells; ++i) {
        block_.imu_bits[i].store(packDoubleBits(misc.imu[static_cast<std::size_t>(i)]), std::memory_order_release);
    }
}

void SensorState::publishFrequency(double hz, int64_t now_ns) {
    block_.frequency_bits.store(packDoubleBits(hz), std::memory_order_release);
    block_.last_update_ns.store(now_ns, std::memory_order_release);
    block_.updates.fetch_add(1U, std::memory_order_acq_rel);
}

void SensorState::countMalformed() {
    block_.malformed.fetch_add(1U, std::memory_order_acq_rel);
}

Observation SensorState::snapshot() const {
    Observation out;
    const int dims[3] = {kDepthLayers, kDepthRows, kDepthCols};
    out.depth = cv::Mat(3, dims, CV_32F);
    auto* depth = out.depth.ptr<float>();
    for (int i = 0; i < kDepthCells; ++i) {
        depth[i] = unpackFloatBits(block_.depth_bits[i].load(std::memory_order_acquire));
    }
    for (int i = 0; i < kImuCells; ++i) {
        out.imu.val[i] = unpackDoubleBits(block_.imu_bits[i].load(std::memory_order_acquire));
    }
    out.charge = unpackFloatBits(block_.charge_bits.load(std::memory_order_acquire));
    out.voltage = unpackFloatBits(block_.voltage_bits.load(std::memory_order_acquire));
    out.update_frequency = updateFrequency();
    out.updates = updateCount();
    out.last_update_ns = block_.last_update_ns.load(std::memory_order_acquire);
    return out;
}

double SensorState::updateFrequency() const {
    return unpackDoubleBits(block_.frequency_bits.load(std::memory_order_acquire));
}

uint64_t SensorState::updateCount() const {
    return block_.updates.load(std::memory_order_acquire);
}

uint64_t SensorState::malformedCount() const {
    return block_.malformed.load(std::memory_order_acquire);
}

}  // namespace durin
