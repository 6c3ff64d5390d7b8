#pragma once

#include <array>
#include <cstdint>
#include <opencv2/core.hpp>

namespace durin {

constexpr int kDepthLayers = 8;
constexpr int kDepthRows = 8;
constexpr int kDepthCols = 8;
constexpr int kDepthLayerCells = kDepthRows * kDepthCols;
constexpr int kDepthCells = kDepthLayers * kDepthLayerCells;
constexpr int kTofLayersPerPacket = 2;
constexpr int kTofValuesPerPacket = kTofLayersPerPacket * kDepthLayerCells;
constexpr int kImuCells = 9;

// Two consecutive 8x8 depth layers, row-major.
struct TofPayload {
    std::array<float, kTofValuesPerPacket> depth{};
};

struct MiscPayload {
    float charge{0.0F};
    float voltage{0.0F};
    std::array<double, kImuCells> imu{};  // 3x3 row-major
};

struct Observation {
    cv::Mat depth;  // kDepthLayers x kDepthRows x kDepthCols, CV_32F
    cv::Matx33d imu{cv::Matx33d::zeros()};
    float charge{0.0F};
    float voltage{0.0F};
    double update_frequency{0.0};
    uint64_t updates{0};
    int64_t last_update_ns{0};
};

}  // namespace durin
