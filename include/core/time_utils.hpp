#pragma once

#include <cstdint>

namespace durin {

int64_t nowSteadyNs();

inline double nsToSeconds(int64_t ns) {
    return static_cast<double>(ns) * 1e-9;
}

}  // namespace durin
