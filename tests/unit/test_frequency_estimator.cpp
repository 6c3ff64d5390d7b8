#include "sensor/frequency_estimator.hpp"

#include <cmath>
#include <iostream>

int main() {
    durin::FrequencyEstimator est(50, 1e-7);
    est.reset(0);
    if (est.frequency() != 0.0 || est.size() != 0U) {
        std::cerr << "frequency before the first delta should be 0\n";
        return 1;
    }

    const int64_t step_ns = 20000000;  // 50 Hz
    double hz = 0.0;
    for (int k = 1; k <= 80; ++k) {
        hz = est.update(static_cast<int64_t>(k) * step_ns);
    }
    if (est.size() != 50U) {
        std::cerr << "window should be full\n";
        return 1;
    }
    if (std::fabs(hz - 50.0) > 1e-3) {
        std::cerr << "expected ~50 Hz, got " << hz << "\n";
        return 1;
    }

    // Partially filled window averages only the deltas seen so far.
    durin::FrequencyEstimator partial(50, 1e-7);
    partial.reset(0);
    partial.pushDelta(0.1);
    partial.pushDelta(0.3);
    if (std::fabs(partial.meanDelta() - 0.2) > 1e-12 || std::fabs(partial.frequency() - 5.0) > 1e-4) {
        std::cerr << "partial window mean mismatch\n";
        return 1;
    }

    // Identical timestamps stay finite thanks to epsilon.
    durin::FrequencyEstimator burst(4, 1e-7);
    burst.reset(1000);
    for (int i = 0; i < 4; ++i) {
        hz = burst.update(1000);
    }
    if (!std::isfinite(hz) || hz <= 0.0) {
        std::cerr << "zero deltas should give a finite frequency\n";
        return 1;
    }
    return 0;
}
