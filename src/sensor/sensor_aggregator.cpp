#include "sensor/sensor_aggregator.hpp"

#include "core/time_utils.hpp"

#include <variant>

namespace durin {

SensorAggregator::Core::Core(const SensorConfig& cfg, int64_t start_ns)
    : ids(cfg.ids),
      state(std::make_shared<SensorState>()),
      frequency(static_cast<std::size_t>(cfg.frequency_window), cfg.frequency_epsilon) {
    frequency.reset(start_ns);
}

bool SensorAggregator::Core::apply(const SensorPacket& packet, int64_t now_ns) {
    if (packet.kind == SensorKind::Tof) {
        const auto* tof = std::get_if<TofPayload>(&packet.payload);
        const int offset = tofLayerOffset(ids, packet.sensor_id);
        if (tof == nullptr || offset < 0) {
            state->countMalformed();
            return false;
        }
        if (!state->publishTof(offset, *tof)) {
            return false;
        }
    } else {
        const auto* misc = std::get_if<MiscPayload>(&packet.payload);
        if (misc == nullptr || packet.sensor_id != ids.misc) {
            state->countMalformed();
            return false;
        }
        state->publishMisc(*misc);
    }
    state->publishFrequency(frequency.update(now_ns), now_ns);
    return true;
}

SensorAggregator::SensorAggregator(
    std::shared_ptr<SensorQueue> queue,
    const SensorConfig& cfg,
    const WorkerConfig& worker_cfg)
    : core_(std::make_shared<Core>(cfg, nowSteadyNs())),
      worker_(
          "aggregator",
          std::move(queue),
          [core = core_](SensorPacket& packet) { (void)core->apply(packet, nowSteadyNs()); },
          worker_cfg) {}

SensorAggregator::~SensorAggregator() {
    stop();
}

bool SensorAggregator::start(std::string& error) {
    return worker_.start(error);
}

void SensorAggregator::stop() {
    worker_.stop();
}

Observation SensorAggregator::read() const {
    return core_->state->snapshot();
}

bool SensorAggregator::apply(const SensorPacket& packet, int64_t now_ns) {
    return core_->apply(packet, now_ns);
}

}  // namespace durin
