#pragma once

#include "core/types.hpp"

#include <atomic>
#include <cstdint>

namespace durin {

// Per-field atomics: every cell is last-writer-wins on its own, and a
// snapshot taken during an update may mix old and new values across fields.
struct SensorStateBlock {
    std::atomic<uint32_t> depth_bits[kDepthCells];
    std::atomic<uint64_t> imu_bits[kImuCells];
    std::atomic<uint32_t> charge_bits;
    std::atomic<uint32_t> voltage_bits;
    std::atomic<uint64_t> frequency_bits;
    std::atomic<int64_t> last_update_ns;
    std::atomic<uint64_t> updates;
    std::atomic<uint64_t> malformed;
};

class SensorState {
public:
    SensorState();

    SensorState(const SensorState&) = delete;
    SensorState& operator=(const SensorState&) = delete;

    void reset();

    // False (and counted as malformed) when the two layers do not fit the volume.
    bool publishTof(int layer_offset, const TofPayload& tof);
    void publishMisc(const MiscPayload& misc);
    void publishFrequency(double hz, int64_t now_ns);
    void countMalformed();

    Observation snapshot() const;
    double updateFrequency() const;
    uint64_t updateCount() const;
    uint64_t malformedCount() const;

private:
    SensorStateBlock block_;
};

}  // namespace durin
