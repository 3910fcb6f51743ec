#pragma once

#include <cstdint>

#include <opencv2/core.hpp>

#include "vigil/detection_types.hpp"

namespace vigil {

struct FrameResult {
    cv::Mat frame;                  // BGR image
    double timestamp_sec{0.0};      // monotonic seconds for live sources, media position for files
    std::uint64_t index{0};         // capture order
    DetectionResult detection;      // filled by the worker
};

// BGR colours used for overlays, keyed by alert level.
inline cv::Scalar alert_level_color(AlertLevel level) {
    switch (level) {
        case AlertLevel::HIGH: return cv::Scalar(0, 0, 255);
        case AlertLevel::MEDIUM: return cv::Scalar(0, 215, 255);
        default: return cv::Scalar(60, 180, 75);
    }
}

}  // namespace vigil
