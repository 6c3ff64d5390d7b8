#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace durin {

// Update-rate estimate over the last `capacity` inter-update deltas:
// 1 / (mean(delta_s) + epsilon). Reports 0 before the first delta.
class FrequencyEstimator {
public:
    FrequencyEstimator(std::size_t capacity, double epsilon);

    void reset(int64_t now_ns);
    double update(int64_t now_ns);
    void pushDelta(double delta_s);

    double frequency() const;
    double meanDelta() const;
    std::size_t size() const { return count_; }
    std::size_t capacity() const { return deltas_.size(); }
    int64_t lastUpdateNs() const { return last_update_ns_; }

private:
    std::vector<double> deltas_;
    std::size_t next_{0};
    std::size_t count_{0};
    double epsilon_{1e-7};
    int64_t last_update_ns_{0};
};

}  // namespace durin
