#pragma once

#include "core/config.hpp"
#include "core/types.hpp"
#include "ipc/bounded_queue.hpp"
#include "ipc/link_worker.hpp"
#include "protocol/telemetry_codec.hpp"
#include "sensor/frequency_estimator.hpp"
#include "sensor/sensor_state.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace durin {

using SensorQueue = ipc::BoundedQueue<SensorPacket>;

// Consumer side of the telemetry path. Owns the only writable handle to the
// sensor state; everybody else reads snapshots through read() or state().
class SensorAggregator {
public:
    SensorAggregator(std::shared_ptr<SensorQueue> queue, const SensorConfig& cfg, const WorkerConfig& worker_cfg);
    ~SensorAggregator();

    bool start(std::string& error);
    void stop();
    bool isRunning() const { return worker_.isRunning(); }

    Observation read() const;
    std::shared_ptr<const SensorState> state() const { return core_->state; }
    ipc::WorkerStats stats() const { return worker_.stats(); }

    // Folds one packet as if it arrived at now_ns. Only valid while the
    // worker is stopped; the running worker is the single writer otherwise.
    bool apply(const SensorPacket& packet, int64_t now_ns);

private:
    struct Core {
        Core(const SensorConfig& cfg, int64_t start_ns);
        bool apply(const SensorPacket& packet, int64_t now_ns);

        SensorIdTable ids;
        std::shared_ptr<SensorState> state;
        FrequencyEstimator frequency;
    };

    std::shared_ptr<Core> core_;
    ipc::ConsumerWorker<SensorPacket> worker_;
};

}  // namespace durin
