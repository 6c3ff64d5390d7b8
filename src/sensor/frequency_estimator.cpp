#include "sensor/frequency_estimator.hpp"

#include <algorithm>

#include "core/time_utils.hpp"

namespace durin {

FrequencyEstimator::FrequencyEstimator(std::size_t capacity, double epsilon)
    : deltas_(std::max<std::size_t>(1U, capacity), 0.0), epsilon_(epsilon) {}

void FrequencyEstimator::reset(int64_t now_ns) {
    std::fill(deltas_.begin(), deltas_.end(), 0.0);
    next_ = 0;
    count_ = 0;
    last_update_ns_ = now_ns;
}

double FrequencyEstimator::update(int64_t now_ns) {
    pushDelta(nsToSeconds(now_ns - last_update_ns_));
    last_update_ns_ = now_ns;
    return frequency();
}

void FrequencyEstimator::pushDelta(double delta_s) {
    deltas_[next_] = std::max(0.0, delta_s);
    next_ = (next_ + 1U) % deltas_.size();
    count_ = std::min(count_ + 1U, deltas_.size());
}

double FrequencyEstimator::meanDelta() const {
    if (count_ == 0U) {
        return 0.0;
    }
    double sum = 0.0;
    for (std::size_t i = 0; i < count_; ++i) {
        sum += deltas_[i];
    }
    return sum / static_cast<double>(count_);
}

double FrequencyEstimator::frequency() const {
    if (count_ == 0U) {
        return 0.0;
    }
    return 1.0 / (meanDelta() + epsilon_);
}

}  // namespace durin
