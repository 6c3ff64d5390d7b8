#include "core/time_utils.hpp"
#include "sensor/sensor_aggregator.hpp"

#include <chrono>
#include <cmath>
#include <iostream>
#include <thread>

namespace {

durin::SensorPacket tofPacket(int id, float base) {
    durin::SensorPacket p;
    p.kind = durin::SensorKind::Tof;
    p.sensor_id = static_cast<uint8_t>(id);
    durin::TofPayload tof{};
    for (int i = 0; i < durin::kTofValuesPerPacket; ++i) {
        tof.depth[static_cast<std::size_t>(i)] = base + static_cast<float>(i);
    }
    p.payload = tof;
    return p;
}

float depthAt(const durin::Observation& obs, int layer, int row, int col) {
    const int idx[3] = {layer, row, col};
    return obs.depth.at<float>(idx);
}

}  // namespace

int main() {
    durin::SensorConfig cfg;
    durin::WorkerConfig worker_cfg;
    auto queue = std::make_shared<durin::SensorQueue>(100);
    durin::SensorAggregator agg(queue, cfg, worker_cfg);

    const durin::Observation empty = agg.read();
    if (empty.depth.dims != 3 || empty.depth.size[0] != durin::kDepthLayers || empty.update_frequency != 0.0) {
        std::cerr << "initial observation should be zeroed 8x8x8 with frequency 0\n";
        return 1;
    }

    int64_t now = durin::nowSteadyNs();
    if (!agg.apply(tofPacket(cfg.ids.tof_a, 1000.0F), now)) {
        std::cerr << "tof_a apply failed\n";
        return 1;
    }
    if (!agg.apply(tofPacket(cfg.ids.tof_b, 2000.0F), now + 1000000)) {
        std::cerr << "tof_b apply failed\n";
        return 1;
    }

    const durin::Observation obs = agg.read();
    if (depthAt(obs, 0, 0, 0) != 1000.0F || depthAt(obs, 1, 7, 7) != 1127.0F) {
        std::cerr << "tof_a should fill layers 0..1\n";
        return 1;
    }
    if (depthAt(obs, 2, 0, 0) != 2000.0F || depthAt(obs, 3, 0, 1) != 2065.0F) {
        std::cerr << "tof_b should fill layers 2..3\n";
        return 1;
    }
    for (int layer = 4; layer < durin::kDepthLayers; ++layer) {
        if (depthAt(obs, layer, 3, 3) != 0.0F) {
            std::cerr << "layer " << layer << " should be untouched\n";
            return 1;
        }
    }
    if (obs.updates != 2U) {
        std::cerr << "expected 2 updates, got " << obs.updates << "\n";
        return 1;
    }

    durin::SensorPacket misc;
    misc.kind = durin::SensorKind::Misc;
    misc.sensor_id = static_cast<uint8_t>(cfg.ids.misc);
    durin::MiscPayload payload{};
    payload.charge = 55.0F;
    payload.voltage = 12.0F;
    payload.imu[4] = 9.81;
    misc.payload = payload;
    (void)agg.apply(misc, now + 2000000);
    const durin::Observation with_misc = agg.read();
    if (with_misc.charge != 55.0F || with_misc.voltage != 12.0F || with_misc.imu(1, 1) != 9.81) {
        std::cerr << "misc fields not published\n";
        return 1;
    }
    if (depthAt(with_misc, 0, 0, 0) != 1000.0F) {
        std::cerr << "misc update should keep depth\n";
        return 1;
    }

    // A packet whose kind disagrees with its id is dropped and counted.
    durin::SensorPacket bad = tofPacket(cfg.ids.misc, 0.0F);
    if (agg.apply(bad, now + 3000000) || agg.state()->malformedCount() != 1U) {
        std::cerr << "mismatched packet should be counted as malformed\n";
        return 1;
    }

    // K updates spaced 10 ms apart converge to ~100 Hz.
    now += 10000000;
    for (int k = 0; k < 120; ++k) {
        now += 10000000;
        (void)agg.apply(tofPacket(cfg.ids.tof_d, 0.0F), now);
    }
    const double hz = agg.read().update_frequency;
    if (std::fabs(hz - 100.0) > 0.01) {
        std::cerr << "expected ~100 Hz, got " << hz << "\n";
        return 1;
    }

    // An unvalidated id table can map a tof id past the last layer pair; such a
    // packet is malformed only, never also an accepted update.
    {
        durin::SensorConfig wide;
        wide.ids.tof_d = 133;
        wide.ids.misc = 140;
        durin::SensorAggregator loose(std::make_shared<durin::SensorQueue>(4), wide, worker_cfg);
        const int64_t t = durin::nowSteadyNs();
        if (loose.apply(tofPacket(132, 1.0F), t)) {
            std::cerr << "tof packet beyond the depth volume should be rejected\n";
            return 1;
        }
        const durin::Observation o = loose.read();
        if (loose.state()->malformedCount() != 1U || o.updates != 0U || o.update_frequency != 0.0) {
            std::cerr << "rejected tof packet must not count as an update\n";
            return 1;
        }
        if (!loose.apply(tofPacket(131, 1.0F), t + 1000000) || loose.read().updates != 1U) {
            std::cerr << "last in-range tof id should still be accepted\n";
            return 1;
        }
    }

    // Running worker drains the queue into the state.
    std::string error;
    if (!agg.start(error)) {
        std::cerr << "aggregator start failed: " << error << "\n";
        return 1;
    }
    const uint64_t before = agg.read().updates;
    for (int i = 0; i < 10; ++i) {
        (void)queue->tryPush(tofPacket(cfg.ids.tof_c, 500.0F));
    }
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (agg.read().updates < before + 10U && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    const durin::Observation drained = agg.read();
    agg.stop();
    agg.stop();
    if (drained.updates < before + 10U || depthAt(drained, 4, 0, 0) != 500.0F) {
        std::cerr << "worker did not drain the queue\n";
        return 1;
    }
    return 0;
}
